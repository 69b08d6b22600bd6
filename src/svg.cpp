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
 * Contains tools for rendering SVG previews of gradients.
 */

#include <algorithm>
#include <stdexcept>
#include <clipgrad/path.hpp>
#include <clipgrad/svg.hpp>

namespace clipgrad {
namespace svg {

/**
 * Build function for adding a key/value pair.
 */
Attributes Attributes::with(const std::string &key, const std::string &value) && {
    data << " " << key << "=\"" << value << "\"";
    return std::move(*this);
}

/**
 * Writes the data to a stream.
 */
std::ostream &operator<<(std::ostream &os, const Attributes &attr) {
    os << attr.data.str();
    return os;
}

/**
 * Constructs a layer with the given SVG identifier and an optional set of
 * attributes for the group.
 */
Layer::Layer(const std::string &identifier, const Attributes &attr) {
    data << "<g id=\"" << identifier << "\"" << attr << ">\n";
}

/**
 * Adds a filled path to the layer, using the nonzero fill rule. Coordinates
 * are written in native units. attr may be used to add extra attributes to
 * the path. Nothing is written when paths is empty.
 */
void Layer::add(const coord::Paths &paths, color::Color color, const Attributes &attr) {
    if (paths.empty()) return;
    data << "<path fill=\"" << color::to_svg(color) << "\" fill-rule=\"nonzero\"";
    data << attr;
    data << " d=\"";
    for (const auto &p : paths) {
        if (p.empty()) continue;
        data << "M " << p.back().X << " " << p.back().Y << " ";
        for (const auto &c : p) {
            data << "L " << c.X << " " << c.Y << " ";
        }
        data << "Z ";
    }
    data << "\"/>\n";
}

/**
 * Adds SVG data directly to the layer, in the layer coordinate system.
 */
void Layer::add(const std::string &svg_data) {
    data << svg_data << "\n";
}

/**
 * Returns the SVG data of this layer, including the closing tag.
 */
std::string Layer::str() const {
    return data.str() + "</g>\n";
}

/**
 * Adds SVG data directly to the layer, in the layer coordinate system.
 */
Layer &operator<<(Layer &layer, const std::string &svg_data) {
    layer.add(svg_data);
    return layer;
}

/**
 * Writes the data to a stream.
 */
std::ostream &operator<<(std::ostream &os, const Layer &layer) {
    os << layer.str();
    return os;
}

/**
 * Starts rendering an SVG with the given filename, bounds in native units,
 * and scale factor from native units to SVG pixels.
 */
File::File(const std::string &fname, const coord::CRect &bounds, double scale) : data(fname) {
    if (!data.is_open()) {
        throw std::runtime_error("failed to open " + fname + " for writing");
    }
    auto width = bounds.right - bounds.left;
    auto height = bounds.bottom - bounds.top;
    data << "<svg viewBox=\"" << bounds.left << " " << bounds.top << " " << width << " " << height << "\"";
    data << " width=\"" << width * scale << "\" height=\"" << height * scale << "\"";
    data << " xmlns=\"http://www.w3.org/2000/svg\">\n";
}

/**
 * Destroys this SVG writer, finishing the SVG first.
 */
File::~File() {
    close();
}

/**
 * Adds a layer to the SVG.
 */
void File::add(const Layer &layer) {
    data << layer;
}

/**
 * Adds a layer to the SVG.
 */
File &operator<<(File &file, const Layer &layer) {
    file.add(layer);
    return file;
}

/**
 * Adds SVG data directly to the SVG.
 */
void File::add(const std::string &svg_data) {
    data << svg_data;
}

/**
 * Adds SVG data directly to the SVG.
 */
File &operator<<(File &file, const std::string &svg_data) {
    file.add(svg_data);
    return file;
}

/**
 * Finishes writing the SVG.
 */
void File::close() {
    if (data.is_open()) {
        data << R"(</svg>)" << std::endl;
        data.close();
    }
}

/**
 * Returns the regions of all layers of a gradient, in render order. Inverse
 * clips are resolved against the bounds of the gradient, expanded by the
 * given margin in native units.
 */
std::vector<coord::Paths> resolve(const gradient::Gradient &gradient, coord::CInt margin) {
    auto layers = gradient.layers();
    std::vector<coord::Paths> regions;
    coord::Paths all;
    for (const auto &band : layers) {
        regions.push_back(path::region(band.path));
        all.insert(all.end(), regions.back().begin(), regions.back().end());
    }
    coord::Paths frame = {path::rectangle(path::bounds(all), margin)};
    for (size_t i = 0; i < layers.size(); i++) {
        if (layers[i].kind == gradient::ClipKind::INVERSE_CLIP) {
            regions[i] = path::subtract(frame, regions[i]);
        }
    }
    return regions;
}

/**
 * Returns the color of a band for the given channel.
 */
static color::Color band_color(const gradient::Band &band, int channel) {
    for (const auto &c : band.colors) {
        if (c.channel == channel) {
            return c.color;
        }
    }
    return color::GREY;
}

/**
 * Renders a preview of a gradient, filling every band with its color for the
 * given channel. Bands without an active color stop for that channel are
 * drawn grey. scale is in SVG pixels per clip pixel.
 */
void write(const gradient::Gradient &gradient, const std::string &fname, double scale, int channel) {
    coord::Format fmt(gradient.exponent);
    auto margin = std::max<coord::CInt>(fmt.multiplier() * 4, 1);
    auto regions = resolve(gradient, margin);
    coord::Paths all;
    for (const auto &r : regions) {
        all.insert(all.end(), r.begin(), r.end());
    }
    File file(fname, path::bounds(all), scale / fmt.multiplier());
    auto layers = gradient.layers();
    for (size_t i = 0; i < layers.size(); i++) {
        Layer layer(
            "band" + std::to_string(i),
            Attributes().with("data-clip", gradient::to_string(layers[i].kind))
        );
        layer.add(regions[i], band_color(layers[i], channel));
        file << layer;
    }
    file.close();
}

} // namespace svg
} // namespace clipgrad
