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

#pragma once

#include "clipgrad/coord.hpp"
#include "clipgrad/shape.hpp"

namespace clipgrad {

/**
 * Contains orientation, reversal, and polygon operations on clip paths.
 */
namespace path {

/**
 * Returns the winding direction of a closed path: +1 when the total turning
 * angle is positive (counterclockwise in a y-up frame, so for instance
 * m 0 0 l 10 0 10 10 0 10), -1 when it is negative. Each turn is normalized
 * to (-180, 180] degrees, and a full reversal counts as no turn at all.
 * Coincident consecutive vertices are ignored. Throws a runtime error when
 * the path has fewer than two distinct vertices.
 */
int signed_winding(const shape::Path &path);

/**
 * Reverses the vertex order of a path, shifting the vertex classes along so
 * the drawing commands describe the same segments traversed backward. The
 * result always starts with a move vertex. Trailing move vertices of the
 * input are dropped. Throws a runtime error when the path consists of move
 * vertices only.
 */
shape::Path reverse(const shape::Path &path);

/**
 * Converts a single contour to a ClipperLib polygon, dropping vertex classes.
 */
coord::Path to_clipper(const shape::Path &path);

/**
 * Converts a path that may contain multiple contours (each starting with a
 * move vertex) to ClipperLib polygons.
 */
coord::Paths to_clipper_paths(const shape::Path &path);

/**
 * Returns the region enclosed by the contours of a path using the nonzero
 * fill rule, which is how a renderer interprets a vector clip. A ring made of
 * an outer contour and a reversed inner contour thus becomes a polygon with a
 * hole.
 */
coord::Paths region(const shape::Path &path);

/**
 * Computes the union of two sets of polygons.
 */
coord::Paths add(const coord::Paths &lhs, const coord::Paths &rhs);

/**
 * Subtracts a set of polygons from another set of polygons.
 */
coord::Paths subtract(const coord::Paths &lhs, const coord::Paths &rhs);

/**
 * Computes the intersection of two sets of polygons.
 */
coord::Paths intersect(const coord::Paths &lhs, const coord::Paths &rhs);

/**
 * Returns the net area of the given polygons, holes counting negatively.
 */
double area(const coord::Paths &paths);

/**
 * Returns the axis-aligned bounds of the given polygons. All zeros when there
 * are no vertices.
 */
coord::CRect bounds(const coord::Paths &paths);

/**
 * Returns the given bounds expanded by margin on all sides, as a polygon.
 */
coord::Path rectangle(const coord::CRect &bounds, coord::CInt margin=0);

} // namespace path
} // namespace clipgrad
