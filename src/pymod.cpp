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
 * PyBind11 module for the project.
 */

#include <map>
#include <tuple>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "clipgrad/color.hpp"
#include "clipgrad/gradient.hpp"
#include "clipgrad/offset.hpp"
#include "clipgrad/path.hpp"
#include "clipgrad/shape.hpp"
#include "clipgrad/svg.hpp"

#define STRINGIFY(x) #x
#define MACRO_STRINGIFY(x) STRINGIFY(x)

using namespace clipgrad;

using Color = std::tuple<int, int, int>;

Color color_to_tuple(const color::Color &c) {
    return Color{c.r, c.g, c.b};
}

color::Color tuple_to_color(const Color &c) {
    return {std::get<0>(c), std::get<1>(c), std::get<2>(c)};
}

/**
 * Python-facing wrapper for a vector clip shape.
 */
class Shape {
private:

    /**
     * Shape data.
     */
    shape::Shape s;

public:

    explicit Shape(const std::string &text = "") : s(shape::parse_clip(text)) {
    }

    explicit Shape(shape::Shape &&s) : s(std::move(s)) {
    }

    const shape::Shape &get() const {
        return s;
    }

    int get_exponent() const {
        return s.exponent;
    }

    int64_t len() const {
        return s.path.size();
    }

    bool empty() const {
        return s.path.empty();
    }

    std::vector<std::tuple<std::string, int64_t, int64_t>> vertices() const {
        std::vector<std::tuple<std::string, int64_t, int64_t>> out;
        for (const auto &v : s.path) {
            out.emplace_back(std::string(1, shape::to_char(v.cls)), v.x, v.y);
        }
        return out;
    }

    std::string str() const {
        return shape::serialize(s.path);
    }

    std::string clip_argument() const {
        return shape::serialize(s);
    }

    Shape grow(double radius, int64_t scale) const {
        shape::Shape out;
        out.exponent = s.exponent;
        out.path = offset::grow(s.path, radius, scale);
        return Shape(std::move(out));
    }

    Shape reverse() const {
        shape::Shape out;
        out.exponent = s.exponent;
        out.path = path::reverse(s.path);
        return Shape(std::move(out));
    }

    int winding() const {
        return path::signed_winding(s.path);
    }

    double area() const {
        return path::area(path::region(s.path));
    }
};

class Settings {
private:
    gradient::Settings settings;
public:

    Settings(double size, const std::string &position, int step) {
        settings.configure_size(size);
        settings.configure_position(position);
        settings.configure_step(step);
    }

    void set_color(int channel, const Color &start, const Color &end) {
        settings.configure_color(channel, tuple_to_color(start), tuple_to_color(end));
    }

    void configure(const std::string &key, const std::string &value) {
        settings.configure(key, value);
    }

    const gradient::Settings &get() const {
        return settings;
    }
};

using PyBand = std::tuple<std::string, std::string, std::map<int, Color>>;

PyBand band_to_tuple(const gradient::Band &band, int exponent) {
    std::map<int, Color> colors;
    for (const auto &c : band.colors) {
        colors[c.channel] = color_to_tuple(c.color);
    }
    shape::Shape s;
    s.exponent = exponent;
    s.path = band.path;
    return PyBand{gradient::to_string(band.kind), shape::serialize(s), colors};
}

class Gradient {
private:
    gradient::Gradient g;
public:

    Gradient(const Shape &shape, const Settings &settings, const std::string &kind) :
        g(gradient::generate(shape.get(), gradient::parse_clip_kind(kind), settings.get()))
    {}

    std::vector<PyBand> bands() const {
        std::vector<PyBand> out;
        for (const auto &band : g.bands) {
            out.push_back(band_to_tuple(band, g.exponent));
        }
        return out;
    }

    PyBand exterior() const {
        return band_to_tuple(g.exterior, g.exponent);
    }

    std::vector<PyBand> layers() const {
        std::vector<PyBand> out;
        for (const auto &band : g.layers()) {
            out.push_back(band_to_tuple(band, g.exponent));
        }
        return out;
    }

    void write_svg(const std::string &fname, double scale, int channel) const {
        svg::write(g, fname, scale, channel);
    }
};

namespace py = pybind11;

PYBIND11_MODULE(_clipgrad, m) {
    py::class_<Shape>(m, "Shape", "A vector clip shape.")
        .def(py::init<std::string>(), py::arg("text") = "",
             "Parses a vector clip (\"[exponent,]m x y l x y ...\") or the x1,y1,x2,y2 rectangle shorthand. "
             "Malformed input results in an empty shape.")
        .def("get_exponent", &Shape::get_exponent, "Returns the scale exponent.")
        .def("__len__", &Shape::len, "Returns the number of vertices.")
        .def("empty", &Shape::empty, "Returns whether the shape has no vertices, i.e. is unusable.")
        .def("vertices", &Shape::vertices, "Returns the vertices as (class, x, y) tuples.")
        .def("__str__", &Shape::str, "Returns the drawing commands.")
        .def("clip_argument", &Shape::clip_argument, "Returns the exponent and drawing commands as used within a clip tag.")
        .def("grow", &Shape::grow, py::arg("radius"), py::arg("scale") = 1,
             "Offsets the shape outward by radius (inward when negative) in native units, multiplying the result by scale.")
        .def("reverse", &Shape::reverse, "Reverses the vertex order.")
        .def("winding", &Shape::winding, "Returns +1 or -1 depending on the winding direction.")
        .def("area", &Shape::area, "Returns the area of the region selected by the shape.");

    py::class_<Settings>(m, "Settings", "Gradient configuration.")
        .def(py::init<double, std::string, int>(),
             py::arg("size") = 20.0, py::arg("position") = "outside", py::arg("step") = 1,
             "Creates a gradient configuration. position is outside, middle, or inside.")
        .def("set_color", &Settings::set_color, py::arg("channel"), py::arg("start"), py::arg("end"),
             "Configures the start and end color of a channel (1 to 4). Equal colors deactivate the channel.")
        .def("configure", &Settings::configure, "Configures a setting from a key/value string pair.");

    py::class_<Gradient>(m, "Gradient", "The bands of a gradient along the edge of a clip.")
        .def(py::init<Shape, Settings, std::string>(), py::arg("shape"), py::arg("settings"), py::arg("kind") = "clip",
             "Generates the gradient. kind is clip or iclip.")
        .def("bands", &Gradient::bands, "Returns the innermost band and the rings as (kind, clip, colors) tuples.")
        .def("exterior", &Gradient::exterior, "Returns the band beyond the last ring.")
        .def("layers", &Gradient::layers, "Returns all bands in render order.")
        .def("write_svg", &Gradient::write_svg, py::arg("fname"), py::arg("scale") = 1.0, py::arg("channel") = 1,
             "Renders a preview of the gradient.");

    m.def("interpolate", [](double factor, const Color &start, const Color &end) {
        return color_to_tuple(color::interpolate(factor, tuple_to_color(start), tuple_to_color(end)));
    }, py::arg("factor"), py::arg("start"), py::arg("end"), "Linearly interpolates between two RGB colors.");

#ifdef VERSION_INFO
    m.attr("__version__") = MACRO_STRINGIFY(VERSION_INFO);
#else
    m.attr("__version__") = "dev";
#endif
}
