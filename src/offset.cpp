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
 * Mitered offsetting of closed clip paths.
 */

#include <cmath>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>
#include "clipgrad/offset.hpp"
#include "clipgrad/path.hpp"
#include "clipgrad/ring.hpp"

namespace clipgrad {
namespace offset {

/**
 * Converts radians to degrees.
 */
static double to_degrees(double rad) {
    return rad * 180.0 / M_PI;
}

/**
 * Converts degrees to radians.
 */
static double to_radians(double deg) {
    return deg * M_PI / 180.0;
}

/**
 * Floored modulo; the result has the sign of the divisor.
 */
static double modulo(double a, double b) {
    return a - b * std::floor(a / b);
}

/**
 * One or more offset vertices that have been merged into a single coordinate
 * while resolving crossovers. Buckets cover a contiguous (cyclic) range of
 * input vertices.
 */
struct MergeBucket {

    /**
     * Coordinate of the bucket, the average of the offset positions of all
     * vertices merged into it.
     */
    double x, y;

    /**
     * Classes of the merged vertices, in path order. The size of this list is
     * the multiplicity of the bucket.
     */
    std::vector<shape::VertexClass> classes;

    /**
     * Index of the first and last input vertex covered by this bucket.
     */
    size_t first, last;

};

/**
 * Returns whether the offset edge from bucket a to bucket b runs against the
 * original edge between from and to along either axis.
 */
static bool is_crossover(
    const shape::Vertex &from, const shape::Vertex &to,
    const MergeBucket &a, const MergeBucket &b
) {
    double dx = (double)(to.x - from.x);
    double dy = (double)(to.y - from.y);
    double ndx = b.x - a.x;
    double ndy = b.y - a.y;
    return dx * ndx < 0.0 || dy * ndy < 0.0;
}

/**
 * Merges the bucket following dest into dest.
 */
static void merge(MergeBucket &dest, const MergeBucket &src) {
    double c1 = (double)dest.classes.size();
    double c2 = (double)src.classes.size();
    dest.x = (c1 * dest.x + c2 * src.x) / (c1 + c2);
    dest.y = (c1 * dest.y + c2 * src.y) / (c1 + c2);
    dest.classes.insert(dest.classes.end(), src.classes.begin(), src.classes.end());
    dest.last = src.last;
}

/**
 * Runs a single crossover resolution pass over all cyclically adjacent
 * bucket pairs. A merged bucket is immediately compared with its new
 * successor. Returns the number of merges.
 */
static size_t merge_pass(std::vector<MergeBucket> &buckets, const shape::Path &original) {
    size_t merges = 0;
    size_t k = 0;
    while (buckets.size() > 1 && k < buckets.size()) {
        size_t next = (k + 1) % buckets.size();
        auto &a = buckets[k];
        const auto &b = buckets[next];
        if (!is_crossover(original[a.last], original[b.first], a, b)) {
            k++;
            continue;
        }
        merge(a, b);
        buckets.erase(buckets.begin() + next);
        merges++;
        if (next == 0) {
            break;
        }
    }
    return merges;
}

/**
 * Grows a closed path outward by radius (inward when negative), with the
 * result multiplied by scale.
 */
shape::Path grow(const shape::Path &path, double radius, coord::CInt scale) {
    if (scale < 1) {
        throw std::runtime_error("offset scale must be positive");
    }
    if (ring::usable_vertices(path) < 3) {
        SPDLOG_DEBUG("cannot offset a path with fewer than three usable vertices");
        return {};
    }

    // The bisector branch is picked in the y-down frame of the clip, where
    // the handedness reported by signed_winding() is mirrored.
    const int ch = -path::signed_winding(path);
    const ring::Ring r(path);

    std::vector<MergeBucket> buckets;
    buckets.reserve(path.size());
    for (size_t i = 0; i < path.size(); i++) {
        const auto &v = path[i];
        const auto &p = path[r.prev_distinct((long long)i)];
        const auto &n = path[r.next_distinct((long long)i)];
        double rot1 = to_degrees(std::atan2((double)(v.y - p.y), (double)(v.x - p.x)));
        double rot2 = to_degrees(std::atan2((double)(n.y - v.y), (double)(n.x - v.x)));
        double drot = modulo(rot2 - rot1, 360.0);

        // Direction to move in, relative to the incoming edge.
        double bisector = modulo(0.5 * drot + 90.0, 180.0);
        if (ch < 0) {
            bisector += 180.0;
        }

        // Miter correction.
        double cosine = std::cos(to_radians(ch * 90.0 - bisector));
        double adjusted = radius;
        if (std::abs(cosine) >= MITER_EPSILON) {
            adjusted = radius / std::abs(cosine);
        }

        double x = (double)(v.x * scale);
        double y = (double)(v.y * scale);
        if (radius != 0.0) {
            x += scale * shape::round_to(adjusted * std::cos(to_radians(bisector + rot1)));
            y += scale * shape::round_to(adjusted * std::sin(to_radians(bisector + rot1)));
        }
        buckets.push_back({x, y, {v.cls}, i, i});
    }

    size_t merges = 0;
    for (;;) {
        size_t pass = merge_pass(buckets, path);
        if (!pass) break;
        merges += pass;
    }
    if (merges) {
        SPDLOG_DEBUG("resolved crossovers by merging {} of {} vertices", merges, path.size());
    }

    shape::Path result(path.size());
    for (const auto &b : buckets) {
        auto x = (coord::CInt)shape::round_to(b.x);
        auto y = (coord::CInt)shape::round_to(b.y);
        size_t index = b.first;
        for (auto cls : b.classes) {
            result[index] = {cls, x, y};
            index = (index + 1) % path.size();
        }
    }
    return result;
}

} // namespace offset
} // namespace clipgrad
