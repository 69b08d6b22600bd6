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

#pragma once

#include <cstddef>
#include "clipgrad/shape.hpp"

namespace clipgrad {

/**
 * Contains tools for treating a closed path as if it had no start or end.
 */
namespace ring {

/**
 * Index based circular view over a path. Indices passed to this class may be
 * any integer; they are taken modulo the size of the path. The view does not
 * own the path, so it must not outlive it.
 */
class Ring {
private:

    /**
     * The viewed path.
     */
    const shape::Path &path;

public:

    /**
     * Creates a circular view of the given path.
     */
    explicit Ring(const shape::Path &path);

    /**
     * Returns the number of vertices.
     */
    size_t size() const;

    /**
     * Reduces any index to the range [0, size()). Throws a runtime error for
     * an empty path.
     */
    size_t index(long long i) const;

    /**
     * Returns the vertex at the given index, modulo size().
     */
    const shape::Vertex &at(long long i) const;

    /**
     * Returns the index preceding i.
     */
    size_t prev(long long i) const;

    /**
     * Returns the index following i.
     */
    size_t next(long long i) const;

    /**
     * Returns the index of the nearest preceding vertex that does not
     * coincide with vertex i, skipping zero-length edges. Throws a runtime
     * error when all vertices coincide.
     */
    size_t prev_distinct(long long i) const;

    /**
     * Returns the index of the nearest following vertex that does not
     * coincide with vertex i, skipping zero-length edges. Throws a runtime
     * error when all vertices coincide.
     */
    size_t next_distinct(long long i) const;

};

/**
 * Returns a copy of the path with the last vertex prepended and the first
 * vertex appended, such that every original vertex has a neighbor on both
 * sides. An empty path wraps to an empty path.
 */
shape::Path wrap(const shape::Path &path);

/**
 * Undoes wrap() by dropping the first and last vertex.
 */
shape::Path unwrap(const shape::Path &wrapped);

/**
 * Returns the path with every vertex that coincides with its (cyclic)
 * predecessor removed. At least one vertex remains for a nonempty path.
 */
shape::Path distinct(const shape::Path &path);

/**
 * Returns the number of vertices that remain after distinct().
 */
size_t usable_vertices(const shape::Path &path);

} // namespace ring
} // namespace clipgrad
