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
 * Types and conversions for clip shape coordinates.
 */

#pragma once

#include <string>
#include "clipper.hpp"

namespace clipgrad {
namespace coord {

/**
 * Integer coordinate representation, shared with ClipperLib so shapes can be
 * handed to polygon operations without conversion.
 */
using CInt = ClipperLib::cInt;

/**
 * 2D point, consisting of two CInts.
 */
using CPt = ClipperLib::IntPoint;

/**
 * 2D bound box.
 */
using CRect = ClipperLib::IntRect;

/**
 * Represents a single closed polygon for ClipperLib.
 */
using Path = ClipperLib::Path;

/**
 * Represents multiple polygons.
 */
using Paths = ClipperLib::Paths;

/**
 * Smallest scale exponent a vector clip may carry.
 */
static const int MIN_EXPONENT = 1;

/**
 * Largest scale exponent a vector clip may carry.
 */
static const int MAX_EXPONENT = 4;

/**
 * Scale exponent handling. A vector clip of exponent e stores its coordinates
 * in units of 1/2^(e-1) pixel. This class converts between pixel distances
 * (which is what gradient sizes are configured in) and the native integer
 * coordinates of the clip.
 */
class Format {
private:

    /**
     * Scale exponent, between MIN_EXPONENT and MAX_EXPONENT.
     */
    int exponent;

public:

    /**
     * Constructs a coordinate format for the given scale exponent. Throws a
     * runtime error when the exponent is out of range.
     */
    explicit Format(int exponent=1);

    /**
     * Returns the scale exponent.
     */
    int get_exponent() const;

    /**
     * Returns the number of native units per pixel, 2^(exponent-1).
     */
    CInt multiplier() const;

    /**
     * Converts a distance in pixels to native units. The result is not
     * rounded.
     */
    double to_native(double pixels) const;

    /**
     * Converts a native coordinate to pixels.
     */
    double to_pixels(CInt native) const;

    /**
     * Returns whether the given exponent is valid.
     */
    static bool is_valid_exponent(int exponent);

};

} // namespace coord
} // namespace clipgrad
