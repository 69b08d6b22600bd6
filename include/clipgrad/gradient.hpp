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
 * Generation of color gradients that follow the edge of a clip shape.
 */

#pragma once

#include <string>
#include <vector>
#include "clipgrad/color.hpp"
#include "clipgrad/shape.hpp"

namespace clipgrad {

/**
 * Contains the band generator, which turns a clip shape into a stack of
 * concentric, differently colored clip regions.
 */
namespace gradient {

/**
 * Where the gradient lies relative to the edge of the clip shape.
 */
enum class Position {

    /**
     * The gradient starts at the edge and extends outward.
     */
    OUTSIDE,

    /**
     * The gradient is centered on the edge.
     */
    MIDDLE,

    /**
     * The gradient ends at the edge, extending inward.
     */
    INSIDE

};

/**
 * Whether a clip region selects what lies inside (clip) or outside (iclip)
 * its path.
 */
enum class ClipKind {
    CLIP,
    INVERSE_CLIP
};

/**
 * Returns "outside", "middle", or "inside".
 */
std::string to_string(Position position);

/**
 * Returns "clip" or "iclip".
 */
std::string to_string(ClipKind kind);

/**
 * Parses "clip" or "iclip". Throws a runtime error for anything else.
 */
ClipKind parse_clip_kind(const std::string &s);

/**
 * Smallest allowed step size.
 */
static const int MIN_STEP = 1;

/**
 * Largest allowed step size.
 */
static const int MAX_STEP = 20;

/**
 * Largest allowed gradient size in pixels.
 */
static const double MAX_SIZE = 10000.0;

/**
 * Gradient configuration: size and position of the gradient, step size, and
 * color stops. Invalid values are rejected with a runtime error when they
 * are configured.
 */
class Settings {
private:

    /**
     * Thickness of the gradient in pixels. Non-negative, at most MAX_SIZE,
     * multiple of 0.5.
     */
    double size;

    /**
     * Position of the gradient relative to the edge of the clip.
     */
    Position position;

    /**
     * Distance between successive bands in pixels.
     */
    int step;

    /**
     * The active color stops, ordered by channel.
     */
    std::vector<color::ColorStop> stops;

public:

    /**
     * Constructs the default configuration: a 20 pixel gradient outside the
     * clip with a step size of 1, and no active color stops.
     */
    Settings();

    /**
     * Configures the thickness of the gradient in pixels. Throws a runtime
     * error if size is negative, above MAX_SIZE, or not a multiple of 0.5.
     */
    void configure_size(double size);

    /**
     * Configures the position of the gradient relative to the clip edge.
     */
    void configure_position(Position position);

    /**
     * Configures the position of the gradient from its name.
     */
    void configure_position(const std::string &position);

    /**
     * Configures the step size in pixels, 1 to 20.
     */
    void configure_step(int step);

    /**
     * Configures the start and end color for a channel (1 to 4). Equal colors
     * deactivate the channel.
     */
    void configure_color(int channel, const color::Color &start, const color::Color &end);

    /**
     * Configures a setting from a key/value string pair: size, position,
     * step, or color1 to color4 with a "<start>:<end>" value.
     */
    void configure(const std::string &key, const std::string &value);

    double get_size() const;
    Position get_position() const;
    int get_step() const;

    /**
     * Returns the active color stops, ordered by channel.
     */
    const std::vector<color::ColorStop> &get_color_stops() const;

    /**
     * Returns how far the gradient is shifted inward relative to the clip
     * edge: 0 outside, half the size in the middle, the full size inside.
     */
    double get_offset() const;

    /**
     * Returns the number of ring bands, ceil(size / step).
     */
    int get_step_count() const;

};

/**
 * The color a band assigns to one color channel.
 */
struct BandColor {
    int channel;
    color::Color color;
};

/**
 * A single clip region of the gradient along with its colors.
 */
struct Band {

    /**
     * Whether the region is the inside or outside of path.
     */
    ClipKind kind;

    /**
     * The outer boundary.
     */
    shape::Path outer;

    /**
     * The reversed inner boundary, excluding the region of the previous band.
     * Empty when nothing is excluded.
     */
    shape::Path inner;

    /**
     * The complete clip path, outer followed by inner.
     */
    shape::Path path;

    /**
     * Interpolation factor between the start (0) and end (1) colors.
     */
    double factor;

    /**
     * Color for each active color stop.
     */
    std::vector<BandColor> colors;

};

/**
 * A complete gradient.
 */
struct Gradient {

    /**
     * Scale exponent of all band paths.
     */
    int exponent;

    /**
     * The innermost band followed by the ring bands, from the inside out.
     */
    std::vector<Band> bands;

    /**
     * The complementary band covering everything beyond the last ring. For a
     * regular clip this is an inverse clip outside the gradient, for an
     * inverse clip it is a clip inside of it. Always colored with the end
     * colors.
     */
    Band exterior;

    /**
     * Returns all bands in render order, i.e. bands followed by exterior.
     */
    std::vector<Band> layers() const;

};

/**
 * Generates the bands of a gradient for the given clip shape. kind specifies
 * whether the shape was used as a regular or an inverse clip; in the latter
 * case the gradient direction is mirrored. Throws a runtime error when the
 * shape is unusable, i.e. has fewer than three distinct vertices.
 */
Gradient generate(const shape::Shape &shape, ClipKind kind, const Settings &settings);

} // namespace gradient
} // namespace clipgrad
