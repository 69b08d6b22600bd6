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

#pragma once

#include "clipgrad/coord.hpp"
#include "clipgrad/shape.hpp"

namespace clipgrad {

/**
 * Contains the polygon offset engine.
 */
namespace offset {

/**
 * Cosine below which a miter is considered degenerate. The radius is then
 * used as is, instead of being divided by the cosine.
 */
static const double MITER_EPSILON = 0.00001;

/**
 * Grows a closed path outward by radius (inward when negative), with the
 * result multiplied by scale.
 *
 * Each vertex is moved along the bisector of its two adjacent edges. The
 * distance is corrected for the miter so that the offset edges run parallel
 * to the original edges at distance radius, and the offset itself is rounded
 * to integer units before scaling. Zero-length edges are skipped when looking
 * for a vertex's neighbors. With radius 0 the path is only multiplied by
 * scale.
 *
 * Offsetting inward by more than the local feature size makes offset edges
 * point against their original direction. Such crossovers are resolved by
 * merging the two offending vertices into their multiplicity-weighted
 * average, repeatedly, until no edge is inverted anymore. The result always
 * has one vertex for each vertex of the input, with the same vertex class,
 * although merged vertices share a coordinate.
 *
 * Returns an empty path when the input has fewer than three usable (distinct)
 * vertices. Throws a runtime error when scale is not positive.
 */
shape::Path grow(const shape::Path &path, double radius, coord::CInt scale=1);

} // namespace offset
} // namespace clipgrad
