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
 * Stuff related to colors.
 */

#pragma once

#include <string>

namespace clipgrad {

/**
 * Contains stuff related to colors.
 */
namespace color {

/**
 * A solid RGB color.
 */
struct Color {

    /**
     * Red channel, between 0 and 255.
     */
    int r;

    /**
     * Green channel, between 0 and 255.
     */
    int g;

    /**
     * Blue channel, between 0 and 255.
     */
    int b;

    bool operator==(const Color &other) const;
    bool operator!=(const Color &other) const;

};

/**
 * Start and end color of a gradient for one of the color channels of a line.
 */
struct ColorStop {

    /**
     * Channel index: 1 for the primary fill, 2 for the secondary fill, 3 for
     * the border and 4 for the shadow.
     */
    int channel;

    /**
     * Color at the start (innermost side) of the gradient.
     */
    Color start;

    /**
     * Color at the end (outermost side) of the gradient.
     */
    Color end;

};

/**
 * Number of color channels a line has.
 */
static const int NUM_CHANNELS = 4;

static const Color BLACK = {0, 0, 0};
static const Color WHITE = {255, 255, 255};
static const Color RED = {255, 0, 0};
static const Color BLUE = {0, 0, 255};

/**
 * Default preview color for layers that have no active color stop.
 */
static const Color GREY = {128, 128, 128};

/**
 * Linearly interpolates between start (factor 0) and end (factor 1), each
 * channel independently, rounding half up. The factor is clamped to [0, 1].
 */
Color interpolate(double factor, const Color &start, const Color &end);

/**
 * Parses #RRGGBB, RRGGBB, or the ASS &HBBGGRR& form. An alpha byte in an
 * 8-digit ASS color (&HAABBGGRR&) is ignored. Throws a runtime error for
 * anything else.
 */
Color parse(const std::string &s);

/**
 * Formats as #RRGGBB.
 */
std::string to_hex(const Color &c);

/**
 * Formats as an ASS color override value, &HBBGGRR&.
 */
std::string to_ass(const Color &c);

/**
 * Formats as an SVG/CSS rgb() value.
 */
std::string to_svg(const Color &c);

} // namespace color
} // namespace clipgrad
