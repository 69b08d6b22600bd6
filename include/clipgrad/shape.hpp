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

#pragma once

#include <string>
#include <vector>
#include "clipgrad/coord.hpp"

namespace clipgrad {

/**
 * Contains the vertex path representation of vector clips, and the codec for
 * the m/l/b drawing command syntax.
 */
namespace shape {

/**
 * How a vertex connects to its predecessor.
 */
enum class VertexClass {

    /**
     * Starts a new contour (m).
     */
    MOVE,

    /**
     * Straight line from the previous vertex (l).
     */
    LINE,

    /**
     * Bezier control or end point (b). Carried through as a tag only; offsets
     * treat it like any other vertex.
     */
    CURVE

};

/**
 * A single vertex of a clip shape.
 */
struct Vertex {
    VertexClass cls;
    coord::CInt x;
    coord::CInt y;

    bool operator==(const Vertex &other) const;
    bool operator!=(const Vertex &other) const;

    /**
     * Returns whether this vertex lies at the same coordinate as other,
     * regardless of class.
     */
    bool coincides(const Vertex &other) const;
};

/**
 * An ordered list of vertices. The path is implicitly closed: the last vertex
 * connects back to the first.
 */
using Path = std::vector<Vertex>;

/**
 * A path together with the scale exponent it was written in.
 */
struct Shape {

    /**
     * The vertices.
     */
    Path path;

    /**
     * Scale exponent, 1 to 4. Coordinates are in units of 1/2^(exponent-1)
     * pixel.
     */
    int exponent;

    /**
     * Returns the coordinate format for this shape's exponent.
     */
    coord::Format get_format() const;

};

/**
 * Returns the drawing command letter for a vertex class.
 */
char to_char(VertexClass cls);

/**
 * Parses a vector drawing, optionally prefixed with a scale exponent and
 * comma ("2,m 0 0 l ..."). Malformed input does not throw; it results in a
 * shape with an empty path, which callers must treat as unusable.
 */
Shape parse(const std::string &text);

/**
 * Serializes a path. The drawing command letter is only written when it
 * differs from that of the previous vertex. Every coordinate is followed by a
 * space, including the last.
 */
std::string serialize(const Path &path);

/**
 * Serializes a shape in the form used within a clip tag, i.e. the exponent,
 * a comma, and the path.
 */
std::string serialize(const Shape &shape);

/**
 * Rounds half up to the given number of decimals.
 */
double round_to(double value, int decimals=0);

/**
 * Recognizes the rectangular clip shorthand "x1,y1,x2,y2". If text matches,
 * path is replaced by the equivalent four-vertex move/line path and true is
 * returned. Fractional coordinates are truncated toward zero.
 */
bool parse_rectangle(const std::string &text, Path &path);

/**
 * Parses the argument of a clip or iclip tag, which is either the rectangle
 * shorthand or a vector drawing.
 */
Shape parse_clip(const std::string &argument);

/**
 * Splits a path into contours at every move vertex. Vertices before the
 * first move vertex form a contour of their own.
 */
std::vector<Path> split(const Path &path);

} // namespace shape
} // namespace clipgrad
