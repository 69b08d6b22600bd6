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

#include <stdexcept>
#include "clipgrad/coord.hpp"

namespace clipgrad {
namespace coord {

/**
 * Constructs a coordinate format for the given scale exponent. Throws a
 * runtime error when the exponent is out of range.
 */
Format::Format(int exponent) : exponent(exponent) {
    if (!is_valid_exponent(exponent)) {
        throw std::runtime_error(
            "invalid scale exponent " + std::to_string(exponent) +
            ", expected 1 to 4"
        );
    }
}

/**
 * Returns the scale exponent.
 */
int Format::get_exponent() const {
    return exponent;
}

/**
 * Returns the number of native units per pixel, 2^(exponent-1).
 */
CInt Format::multiplier() const {
    return (CInt)1 << (exponent - 1);
}

/**
 * Converts a distance in pixels to native units. The result is not
 * rounded.
 */
double Format::to_native(double pixels) const {
    return pixels * multiplier();
}

/**
 * Converts a native coordinate to pixels.
 */
double Format::to_pixels(CInt native) const {
    return (double)native / multiplier();
}

/**
 * Returns whether the given exponent is valid.
 */
bool Format::is_valid_exponent(int exponent) {
    return exponent >= MIN_EXPONENT && exponent <= MAX_EXPONENT;
}

} // namespace coord
} // namespace clipgrad
