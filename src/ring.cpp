/**
 * MIT License
 *
 * Copyright (c) 2021 Jeroen van Straten
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/** \file
 * Circular neighbor access for closed paths.
 */

#include <stdexcept>
#include "clipgrad/ring.hpp"

namespace clipgrad {
namespace ring {

/**
 * Creates a circular view of the given path.
 */
Ring::Ring(const shape::Path &path) : path(path) {
}

/**
 * Returns the number of vertices.
 */
size_t Ring::size() const {
    return path.size();
}

/**
 * Reduces any index to the range [0, size()). Throws a runtime error for
 * an empty path.
 */
size_t Ring::index(long long i) const {
    if (path.empty()) {
        throw std::runtime_error("cannot index into an empty path");
    }
    long long n = (long long)path.size();
    return (size_t)(((i % n) + n) % n);
}

/**
 * Returns the vertex at the given index, modulo size().
 */
const shape::Vertex &Ring::at(long long i) const {
    return path[index(i)];
}

/**
 * Returns the index preceding i.
 */
size_t Ring::prev(long long i) const {
    return index(i - 1);
}

/**
 * Returns the index following i.
 */
size_t Ring::next(long long i) const {
    return index(i + 1);
}

/**
 * Returns the index of the nearest preceding vertex that does not
 * coincide with vertex i, skipping zero-length edges. Throws a runtime
 * error when all vertices coincide.
 */
size_t Ring::prev_distinct(long long i) const {
    size_t start = index(i);
    size_t j = prev(start);
    while (j != start) {
        if (!path[j].coincides(path[start])) {
            return j;
        }
        j = prev(j);
    }
    throw std::runtime_error("path has no two distinct vertices");
}

/**
 * Returns the index of the nearest following vertex that does not
 * coincide with vertex i, skipping zero-length edges. Throws a runtime
 * error when all vertices coincide.
 */
size_t Ring::next_distinct(long long i) const {
    size_t start = index(i);
    size_t j = next(start);
    while (j != start) {
        if (!path[j].coincides(path[start])) {
            return j;
        }
        j = next(j);
    }
    throw std::runtime_error("path has no two distinct vertices");
}

/**
 * Returns a copy of the path with the last vertex prepended and the first
 * vertex appended, such that every original vertex has a neighbor on both
 * sides. An empty path wraps to an empty path.
 */
shape::Path wrap(const shape::Path &path) {
    shape::Path wrapped;
    if (path.empty()) {
        return wrapped;
    }
    wrapped.reserve(path.size() + 2);
    wrapped.push_back(path.back());
    wrapped.insert(wrapped.end(), path.begin(), path.end());
    wrapped.push_back(path.front());
    return wrapped;
}

/**
 * Undoes wrap() by dropping the first and last vertex.
 */
shape::Path unwrap(const shape::Path &wrapped) {
    if (wrapped.size() < 2) {
        return {};
    }
    return shape::Path(wrapped.begin() + 1, wrapped.end() - 1);
}

/**
 * Returns the path with every vertex that coincides with its (cyclic)
 * predecessor removed. At least one vertex remains for a nonempty path.
 */
shape::Path distinct(const shape::Path &path) {
    shape::Path result;
    for (const auto &v : path) {
        if (result.empty() || !result.back().coincides(v)) {
            result.push_back(v);
        }
    }
    while (result.size() > 1 && result.back().coincides(result.front())) {
        result.pop_back();
    }
    return result;
}

/**
 * Returns the number of vertices that remain after distinct().
 */
size_t usable_vertices(const shape::Path &path) {
    return distinct(path).size();
}

} // namespace ring
} // namespace clipgrad
