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
 * Vector clip shapes and their textual drawing command representation.
 */

#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "clipgrad/shape.hpp"

namespace clipgrad {
namespace shape {

bool Vertex::operator==(const Vertex &other) const {
    return cls == other.cls && x == other.x && y == other.y;
}

bool Vertex::operator!=(const Vertex &other) const {
    return !(*this == other);
}

/**
 * Returns whether this vertex lies at the same coordinate as other,
 * regardless of class.
 */
bool Vertex::coincides(const Vertex &other) const {
    return x == other.x && y == other.y;
}

/**
 * Returns the coordinate format for this shape's exponent.
 */
coord::Format Shape::get_format() const {
    return coord::Format(exponent);
}

/**
 * Returns the drawing command letter for a vertex class.
 */
char to_char(VertexClass cls) {
    switch (cls) {
        case VertexClass::MOVE: return 'm';
        case VertexClass::LINE: return 'l';
        case VertexClass::CURVE: return 'b';
    }
    throw std::runtime_error("unknown vertex class");
}

/**
 * Maps a drawing command letter to its vertex class. Returns false if the
 * letter is not a supported command.
 */
static bool from_char(char c, VertexClass &cls) {
    switch (c) {
        case 'm': cls = VertexClass::MOVE; return true;
        case 'l': cls = VertexClass::LINE; return true;
        case 'b': cls = VertexClass::CURVE; return true;
        default: return false;
    }
}

/**
 * Parses an integer token consisting of an optional minus sign and digits.
 */
static bool parse_int(const std::string &token, coord::CInt &value) {
    size_t start = (!token.empty() && token[0] == '-') ? 1 : 0;
    if (start >= token.size()) {
        return false;
    }
    for (size_t i = start; i < token.size(); i++) {
        if (!std::isdigit((unsigned char)token[i])) {
            return false;
        }
    }
    try {
        value = std::stoll(token);
    } catch (const std::out_of_range &) {
        return false;
    }
    return true;
}

/**
 * Does the actual parsing for parse(); returns false on malformed input.
 */
static bool parse_drawing(const std::string &text, size_t pos, Path &path) {
    bool have_class = false;
    VertexClass cls = VertexClass::MOVE;
    std::vector<coord::CInt> pending;
    auto flush = [&]() -> bool {
        if (!have_class) {
            return pending.empty();
        }
        if (pending.empty() || pending.size() % 2) {
            return false;
        }
        for (size_t i = 0; i < pending.size(); i += 2) {
            path.push_back({cls, pending[i], pending[i + 1]});
        }
        pending.clear();
        return true;
    };
    while (pos < text.size()) {
        char c = text[pos];
        if (std::isspace((unsigned char)c)) {
            pos++;
            continue;
        }
        VertexClass next;
        if (from_char(c, next)) {
            if (!flush()) {
                return false;
            }
            have_class = true;
            cls = next;
            pos++;
            continue;
        }
        size_t end = pos;
        while (end < text.size() && (std::isdigit((unsigned char)text[end]) || text[end] == '-')) {
            end++;
        }
        coord::CInt value;
        if (end == pos || !parse_int(text.substr(pos, end - pos), value)) {
            return false;
        }
        pending.push_back(value);
        pos = end;
    }
    return have_class && flush();
}

/**
 * Parses a vector drawing, optionally prefixed with a scale exponent and
 * comma ("2,m 0 0 l ..."). Malformed input does not throw; it results in a
 * shape with an empty path, which callers must treat as unusable.
 */
Shape parse(const std::string &text) {
    Shape shape;
    shape.exponent = 1;
    size_t pos = 0;
    if (text.size() >= 2 && text[1] == ',' && text[0] >= '1' && text[0] <= '4') {
        shape.exponent = text[0] - '0';
        pos = 2;
    }
    if (!parse_drawing(text, pos, shape.path)) {
        SPDLOG_DEBUG("malformed vector drawing: {}", text);
        shape.path.clear();
    }
    return shape;
}

/**
 * Serializes a path. The drawing command letter is only written when it
 * differs from that of the previous vertex. Every coordinate is followed by a
 * space, including the last.
 */
std::string serialize(const Path &path) {
    std::ostringstream ss;
    bool first = true;
    VertexClass cls = VertexClass::MOVE;
    for (const auto &v : path) {
        if (first || v.cls != cls) {
            ss << to_char(v.cls) << " ";
            cls = v.cls;
            first = false;
        }
        ss << v.x << " " << v.y << " ";
    }
    return ss.str();
}

/**
 * Serializes a shape in the form used within a clip tag, i.e. the exponent,
 * a comma, and the path.
 */
std::string serialize(const Shape &shape) {
    return std::to_string(shape.exponent) + "," + serialize(shape.path);
}

/**
 * Rounds half up to the given number of decimals.
 */
double round_to(double value, int decimals) {
    double mult = std::pow(10.0, decimals);
    return std::floor(value * mult + 0.5) / mult;
}

/**
 * Recognizes the rectangular clip shorthand "x1,y1,x2,y2". If text matches,
 * path is replaced by the equivalent four-vertex move/line path and true is
 * returned. Fractional coordinates are truncated toward zero.
 */
bool parse_rectangle(const std::string &text, Path &path) {
    std::vector<coord::CInt> values;
    std::istringstream ss(text);
    std::string field;
    while (std::getline(ss, field, ',')) {
        size_t start = field.find_first_not_of(" \t");
        size_t end = field.find_last_not_of(" \t");
        if (start == std::string::npos) {
            return false;
        }
        field = field.substr(start, end - start + 1);
        for (char c : field) {
            if (!std::isdigit((unsigned char)c) && c != '-' && c != '.') {
                return false;
            }
        }
        size_t used = 0;
        double value;
        try {
            value = std::stod(field, &used);
        } catch (const std::logic_error &) {
            return false;
        }
        if (used != field.size()) {
            return false;
        }
        values.push_back((coord::CInt)std::trunc(value));
    }
    if (values.size() != 4 || (!text.empty() && text.back() == ',')) {
        return false;
    }
    auto x1 = values[0], y1 = values[1], x2 = values[2], y2 = values[3];
    path = {
        {VertexClass::MOVE, x1, y1},
        {VertexClass::LINE, x2, y1},
        {VertexClass::LINE, x2, y2},
        {VertexClass::LINE, x1, y2}
    };
    return true;
}

/**
 * Parses the argument of a clip or iclip tag, which is either the rectangle
 * shorthand or a vector drawing.
 */
Shape parse_clip(const std::string &argument) {
    Shape shape;
    shape.exponent = 1;
    if (parse_rectangle(argument, shape.path)) {
        return shape;
    }
    return parse(argument);
}

/**
 * Splits a path into contours at every move vertex. Vertices before the
 * first move vertex form a contour of their own.
 */
std::vector<Path> split(const Path &path) {
    std::vector<Path> contours;
    for (const auto &v : path) {
        if (contours.empty() || v.cls == VertexClass::MOVE) {
            contours.emplace_back();
        }
        contours.back().push_back(v);
    }
    return contours;
}

} // namespace shape
} // namespace clipgrad
