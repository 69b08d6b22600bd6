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

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include "clipgrad/color.hpp"

namespace clipgrad {
namespace color {

bool Color::operator==(const Color &other) const {
    return r == other.r && g == other.g && b == other.b;
}

bool Color::operator!=(const Color &other) const {
    return !(*this == other);
}

/**
 * Interpolates a single channel.
 */
static int interpolate_channel(double factor, int start, int end) {
    return (int)std::floor(start + (end - start) * factor + 0.5);
}

/**
 * Linearly interpolates between start (factor 0) and end (factor 1), each
 * channel independently, rounding half up. The factor is clamped to [0, 1].
 */
Color interpolate(double factor, const Color &start, const Color &end) {
    factor = std::min(1.0, std::max(0.0, factor));
    return {
        interpolate_channel(factor, start.r, end.r),
        interpolate_channel(factor, start.g, end.g),
        interpolate_channel(factor, start.b, end.b)
    };
}

/**
 * Parses a two-digit hexadecimal byte.
 */
static int parse_byte(const std::string &s, size_t offset) {
    return std::stoi(s.substr(offset, 2), nullptr, 16);
}

/**
 * Parses #RRGGBB, RRGGBB, or the ASS &HBBGGRR& form. An alpha byte in an
 * 8-digit ASS color (&HAABBGGRR&) is ignored. Throws a runtime error for
 * anything else.
 */
Color parse(const std::string &s) {
    std::string digits = s;
    bool ass = false;
    if (digits.size() >= 2 && digits[0] == '&' && (digits[1] == 'H' || digits[1] == 'h')) {
        ass = true;
        digits = digits.substr(2);
        if (!digits.empty() && digits.back() == '&') {
            digits.pop_back();
        }
    } else if (!digits.empty() && digits[0] == '#') {
        digits = digits.substr(1);
    }
    bool valid = !digits.empty() && std::all_of(
        digits.begin(), digits.end(),
        [](char c) { return std::isxdigit((unsigned char)c) != 0; }
    );
    if (valid && ass && digits.size() == 8) {
        digits = digits.substr(2);
    }
    if (!valid || digits.size() != 6) {
        throw std::runtime_error("invalid color: " + s);
    }
    if (ass) {
        return {parse_byte(digits, 4), parse_byte(digits, 2), parse_byte(digits, 0)};
    }
    return {parse_byte(digits, 0), parse_byte(digits, 2), parse_byte(digits, 4)};
}

/**
 * Formats as #RRGGBB.
 */
std::string to_hex(const Color &c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", c.r & 0xFF, c.g & 0xFF, c.b & 0xFF);
    return buf;
}

/**
 * Formats as an ASS color override value, &HBBGGRR&.
 */
std::string to_ass(const Color &c) {
    char buf[11];
    std::snprintf(buf, sizeof(buf), "&H%02X%02X%02X&", c.b & 0xFF, c.g & 0xFF, c.r & 0xFF);
    return buf;
}

/**
 * Formats as an SVG/CSS rgb() value.
 */
std::string to_svg(const Color &c) {
    return "rgb(" + std::to_string(c.r) + "," + std::to_string(c.g) + "," + std::to_string(c.b) + ")";
}

} // namespace color
} // namespace clipgrad
