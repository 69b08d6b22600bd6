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
 * Orientation, reversal, and polygon operations on clip paths.
 */

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "clipgrad/path.hpp"
#include "clipgrad/ring.hpp"

namespace clipgrad {
namespace path {

/**
 * Returns the winding direction of a closed path: +1 when the total turning
 * angle is positive (counterclockwise in a y-up frame, so for instance
 * m 0 0 l 10 0 10 10 0 10), -1 when it is negative. Each turn is normalized
 * to (-180, 180] degrees, and a full reversal counts as no turn at all.
 * Coincident consecutive vertices are ignored. Throws a runtime error when
 * the path has fewer than two distinct vertices.
 */
int signed_winding(const shape::Path &path) {
    auto pts = ring::distinct(path);
    if (pts.size() < 2) {
        throw std::runtime_error("cannot determine winding of a path with fewer than two distinct vertices");
    }
    ring::Ring r(pts);
    double total = 0.0;
    for (size_t i = 0; i < r.size(); i++) {
        const auto &p = r.at((long long)i - 1);
        const auto &c = r.at((long long)i);
        const auto &n = r.at((long long)i + 1);
        double rot1 = std::atan2((double)(c.y - p.y), (double)(c.x - p.x));
        double rot2 = std::atan2((double)(n.y - c.y), (double)(n.x - c.x));
        double turn = (rot2 - rot1) * 180.0 / M_PI;
        turn -= 360.0 * std::floor(turn / 360.0);
        if (std::abs(turn - 180.0) < 1e-9) {
            turn = 0.0;
        } else if (turn > 180.0) {
            turn -= 360.0;
        }
        total += turn;
    }
    if (std::abs(total) < 1e-9) {
        SPDLOG_WARN("path has no net turning, assuming positive winding");
        return 1;
    }
    return total > 0.0 ? 1 : -1;
}

/**
 * Reverses the vertex order of a path, shifting the vertex classes along so
 * the drawing commands describe the same segments traversed backward. The
 * result always starts with a move vertex. Trailing move vertices of the
 * input are dropped. Throws a runtime error when the path consists of move
 * vertices only.
 */
shape::Path reverse(const shape::Path &path) {
    shape::Path result;
    if (path.empty()) {
        return result;
    }
    size_t last = path.size();
    while (last > 0 && path[last - 1].cls == shape::VertexClass::MOVE) {
        last--;
    }
    if (last == 0) {
        throw std::runtime_error("cannot reverse a path that consists of move vertices only");
    }
    last--;
    result.reserve(last + 1);
    result.push_back(path[last]);
    auto cls = result.back().cls;
    result.back().cls = shape::VertexClass::MOVE;
    for (size_t i = last; i-- > 0;) {
        result.push_back(path[i]);
        std::swap(cls, result.back().cls);
    }
    return result;
}

/**
 * Converts a single contour to a ClipperLib polygon, dropping vertex classes.
 */
coord::Path to_clipper(const shape::Path &path) {
    coord::Path result;
    result.reserve(path.size());
    for (const auto &v : path) {
        result.emplace_back(v.x, v.y);
    }
    return result;
}

/**
 * Converts a path that may contain multiple contours (each starting with a
 * move vertex) to ClipperLib polygons.
 */
coord::Paths to_clipper_paths(const shape::Path &path) {
    coord::Paths result;
    for (const auto &contour : shape::split(path)) {
        result.push_back(to_clipper(contour));
    }
    return result;
}

/**
 * Returns the region enclosed by the contours of a path using the nonzero
 * fill rule, which is how a renderer interprets a vector clip. A ring made of
 * an outer contour and a reversed inner contour thus becomes a polygon with a
 * hole.
 */
coord::Paths region(const shape::Path &path) {
    ClipperLib::Clipper c;
    c.AddPaths(to_clipper_paths(path), ClipperLib::ptSubject, true);
    coord::Paths result;
    c.Execute(ClipperLib::ctUnion, result, ClipperLib::pftNonZero, ClipperLib::pftNonZero);
    return result;
}

/**
 * Performs a polygon operation.
 */
static coord::Paths path_op(const coord::Paths &lhs, const coord::Paths &rhs, ClipperLib::ClipType op) {
    ClipperLib::Clipper c;
    c.AddPaths(lhs, ClipperLib::ptSubject, true);
    c.AddPaths(rhs, ClipperLib::ptClip, true);
    coord::Paths result;
    c.Execute(op, result, ClipperLib::pftNonZero, ClipperLib::pftNonZero);
    return result;
}

/**
 * Computes the union of two sets of polygons.
 */
coord::Paths add(const coord::Paths &lhs, const coord::Paths &rhs) {
    return path_op(lhs, rhs, ClipperLib::ctUnion);
}

/**
 * Subtracts a set of polygons from another set of polygons.
 */
coord::Paths subtract(const coord::Paths &lhs, const coord::Paths &rhs) {
    return path_op(lhs, rhs, ClipperLib::ctDifference);
}

/**
 * Computes the intersection of two sets of polygons.
 */
coord::Paths intersect(const coord::Paths &lhs, const coord::Paths &rhs) {
    return path_op(lhs, rhs, ClipperLib::ctIntersection);
}

/**
 * Returns the net area of the given polygons, holes counting negatively.
 */
double area(const coord::Paths &paths) {
    double total = 0.0;
    for (const auto &p : paths) {
        total += ClipperLib::Area(p);
    }
    return total;
}

/**
 * Returns the axis-aligned bounds of the given polygons. All zeros when there
 * are no vertices.
 */
coord::CRect bounds(const coord::Paths &paths) {
    coord::CRect r;
    r.left = r.top = std::numeric_limits<coord::CInt>::max();
    r.right = r.bottom = std::numeric_limits<coord::CInt>::min();
    bool any = false;
    for (const auto &p : paths) {
        for (const auto &pt : p) {
            r.left = std::min(r.left, pt.X);
            r.top = std::min(r.top, pt.Y);
            r.right = std::max(r.right, pt.X);
            r.bottom = std::max(r.bottom, pt.Y);
            any = true;
        }
    }
    if (!any) {
        r.left = r.top = r.right = r.bottom = 0;
    }
    return r;
}

/**
 * Returns the given bounds expanded by margin on all sides, as a polygon.
 */
coord::Path rectangle(const coord::CRect &bounds, coord::CInt margin) {
    return {
        {bounds.left - margin, bounds.top - margin},
        {bounds.right + margin, bounds.top - margin},
        {bounds.right + margin, bounds.bottom + margin},
        {bounds.left - margin, bounds.bottom + margin}
    };
}

} // namespace path
} // namespace clipgrad
