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

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "clipgrad/gradient.hpp"
#include "clipgrad/offset.hpp"
#include "clipgrad/path.hpp"
#include "clipgrad/ring.hpp"

namespace clipgrad {
namespace gradient {

/**
 * Returns "outside", "middle", or "inside".
 */
std::string to_string(Position position) {
    switch (position) {
        case Position::OUTSIDE: return "outside";
        case Position::MIDDLE: return "middle";
        case Position::INSIDE: return "inside";
    }
    throw std::runtime_error("unknown gradient position");
}

/**
 * Returns "clip" or "iclip".
 */
std::string to_string(ClipKind kind) {
    return kind == ClipKind::CLIP ? "clip" : "iclip";
}

/**
 * Parses "clip" or "iclip". Throws a runtime error for anything else.
 */
ClipKind parse_clip_kind(const std::string &s) {
    if (s == "clip") return ClipKind::CLIP;
    if (s == "iclip") return ClipKind::INVERSE_CLIP;
    throw std::runtime_error("invalid clip kind: " + s);
}

/**
 * Constructs the default configuration: a 20 pixel gradient outside the
 * clip with a step size of 1, and no active color stops.
 */
Settings::Settings() :
    size(20.0),
    position(Position::OUTSIDE),
    step(1)
{
}

/**
 * Configures the thickness of the gradient in pixels.
 */
void Settings::configure_size(double size) {
    if (!std::isfinite(size) || size < 0.0) {
        throw std::runtime_error("gradient size must be a non-negative number");
    }
    if (size > MAX_SIZE) {
        throw std::runtime_error("gradient size must not exceed " + std::to_string((int)MAX_SIZE));
    }
    if (std::fmod(size * 2.0, 1.0) != 0.0) {
        throw std::runtime_error("gradient size must be a multiple of 0.5");
    }
    this->size = size;
}

/**
 * Configures the position of the gradient relative to the clip edge.
 */
void Settings::configure_position(Position position) {
    this->position = position;
}

/**
 * Configures the position of the gradient from its name.
 */
void Settings::configure_position(const std::string &position) {
    if (position == "outside") {
        configure_position(Position::OUTSIDE);
    } else if (position == "middle") {
        configure_position(Position::MIDDLE);
    } else if (position == "inside") {
        configure_position(Position::INSIDE);
    } else {
        throw std::runtime_error("invalid gradient position: " + position);
    }
}

/**
 * Configures the step size in pixels, 1 to 20.
 */
void Settings::configure_step(int step) {
    if (step < MIN_STEP || step > MAX_STEP) {
        throw std::runtime_error(
            "step size must be between " + std::to_string(MIN_STEP) +
            " and " + std::to_string(MAX_STEP)
        );
    }
    this->step = step;
}

/**
 * Configures the start and end color for a channel (1 to 4). Equal colors
 * deactivate the channel.
 */
void Settings::configure_color(int channel, const color::Color &start, const color::Color &end) {
    if (channel < 1 || channel > color::NUM_CHANNELS) {
        throw std::runtime_error("color channel index out of range: " + std::to_string(channel));
    }
    stops.erase(
        std::remove_if(stops.begin(), stops.end(), [channel](const color::ColorStop &s) {
            return s.channel == channel;
        }),
        stops.end()
    );
    if (start == end) {
        return;
    }
    auto it = std::find_if(stops.begin(), stops.end(), [channel](const color::ColorStop &s) {
        return s.channel > channel;
    });
    stops.insert(it, color::ColorStop{channel, start, end});
}

/**
 * Configures a setting from a key/value string pair: size, position,
 * step, or color1 to color4 with a "<start>:<end>" value.
 */
void Settings::configure(const std::string &key, const std::string &value) {
    try {
        if (key == "size") {
            size_t used = 0;
            double d = std::stod(value, &used);
            if (used != value.size()) {
                throw std::invalid_argument(value);
            }
            configure_size(d);
        } else if (key == "position") {
            configure_position(value);
        } else if (key == "step") {
            size_t used = 0;
            int i = std::stoi(value, &used);
            if (used != value.size()) {
                throw std::invalid_argument(value);
            }
            configure_step(i);
        } else if (key.size() == 6 && key.compare(0, 5, "color") == 0) {
            int channel = key[5] - '0';
            auto sep = value.find(':');
            if (sep == std::string::npos) {
                throw std::runtime_error("expected <start>:<end> for " + key);
            }
            configure_color(
                channel,
                color::parse(value.substr(0, sep)),
                color::parse(value.substr(sep + 1))
            );
        } else {
            throw std::runtime_error("unknown setting: " + key);
        }
    } catch (const std::logic_error &) {
        throw std::runtime_error("invalid value for " + key + ": " + value);
    }
}

double Settings::get_size() const {
    return size;
}

Position Settings::get_position() const {
    return position;
}

int Settings::get_step() const {
    return step;
}

/**
 * Returns the active color stops, ordered by channel.
 */
const std::vector<color::ColorStop> &Settings::get_color_stops() const {
    return stops;
}

/**
 * Returns how far the gradient is shifted inward relative to the clip
 * edge: 0 outside, half the size in the middle, the full size inside.
 */
double Settings::get_offset() const {
    switch (position) {
        case Position::OUTSIDE: return 0.0;
        case Position::MIDDLE: return size / 2.0;
        case Position::INSIDE: return size;
    }
    throw std::runtime_error("unknown gradient position");
}

/**
 * Returns the number of ring bands, ceil(size / step).
 */
int Settings::get_step_count() const {
    return (int)std::ceil(size / step);
}

/**
 * Returns all bands in render order, i.e. bands followed by exterior.
 */
std::vector<Band> Gradient::layers() const {
    auto result = bands;
    result.push_back(exterior);
    return result;
}

/**
 * Returns the band colors for the given interpolation factor.
 */
static std::vector<BandColor> colors_at(const Settings &settings, double factor) {
    std::vector<BandColor> colors;
    for (const auto &stop : settings.get_color_stops()) {
        colors.push_back({stop.channel, color::interpolate(factor, stop.start, stop.end)});
    }
    return colors;
}

/**
 * Builds a band that consists of a single boundary.
 */
static Band make_band(ClipKind kind, const shape::Path &boundary, double factor, const Settings &settings) {
    Band band;
    band.kind = kind;
    band.outer = boundary;
    band.path = boundary;
    band.factor = factor;
    band.colors = colors_at(settings, factor);
    return band;
}

/**
 * Generates the bands of a gradient for the given clip shape. kind specifies
 * whether the shape was used as a regular or an inverse clip; in the latter
 * case the gradient direction is mirrored. Throws a runtime error when the
 * shape is unusable, i.e. has fewer than three distinct vertices.
 */
Gradient generate(const shape::Shape &shape, ClipKind kind, const Settings &settings) {
    if (ring::usable_vertices(shape.path) < 3) {
        throw std::runtime_error("clip shape is unusable: it needs at least three distinct vertices");
    }
    const auto fmt = shape.get_format();
    const bool inverse = kind == ClipKind::INVERSE_CLIP;
    const double size = settings.get_size();
    const double step = settings.get_step();
    const double goffset = settings.get_offset();
    const int steps = settings.get_step_count();

    // Radii are configured in pixels, the shape is in native units.
    auto grow = [&fmt](const shape::Path &p, double pixels) {
        return offset::grow(p, fmt.to_native(pixels));
    };

    Gradient gradient;
    gradient.exponent = shape.exponent;

    auto innermost = grow(shape.path, inverse ? size - goffset - 1.0 : -goffset);
    gradient.bands.push_back(make_band(kind, innermost, 0.0, settings));

    auto previous = innermost;
    for (int j = 1; j <= steps; j++) {
        double factor = (double)j / (steps + 1);
        if (inverse) {
            factor = 1.0 - factor;
        }
        double radius = (j * step < size) ? (j * step - goffset) : (size - goffset);
        auto boundary = grow(shape.path, radius);

        Band band = make_band(ClipKind::CLIP, boundary, factor, settings);
        auto shrunk = grow(previous, -1.0);
        if (!shrunk.empty()) {
            band.inner = path::reverse(shrunk);
            band.path.insert(band.path.end(), band.inner.begin(), band.inner.end());
        }
        gradient.bands.push_back(std::move(band));
        previous = boundary;
    }

    if (inverse) {
        gradient.exterior = make_band(ClipKind::CLIP, grow(shape.path, step - goffset), 1.0, settings);
    } else {
        gradient.exterior = make_band(ClipKind::INVERSE_CLIP, grow(previous, -1.0), 1.0, settings);
    }

    SPDLOG_DEBUG(
        "generated {} bands of {} for a {} gradient of size {}",
        gradient.bands.size() + 1, to_string(kind), to_string(settings.get_position()), size
    );
    return gradient;
}

} // namespace gradient
} // namespace clipgrad
