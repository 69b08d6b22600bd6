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

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "clipgrad/gradient.hpp"
#include "clipgrad/shape.hpp"
#include "clipgrad/svg.hpp"

using namespace clipgrad;

static void usage(const char *argv0) {
    std::cerr << "Usage: " << argv0 << " [options] [file]\n"
              << "\n"
              << "Reads one clip per line, optionally prefixed with clip: or iclip:, and\n"
              << "prints the override tags of every band of the gradient along its edge.\n"
              << "\n"
              << "Options:\n"
              << "  --size=<pixels>                   gradient thickness, multiple of 0.5 (20)\n"
              << "  --position=outside|middle|inside  gradient position (outside)\n"
              << "  --step=<pixels>                   step size, 1 to 20 (1)\n"
              << "  --color<k>=<start>:<end>          color stop for channel k, 1 to 4\n"
              << "  --svg=<file>                      write a preview of the first line\n"
              << "  --verbose                         enable debug output\n";
}

/**
 * Formats a band as an override block with its colors and clip.
 */
static std::string format_band(const gradient::Band &band, int exponent) {
    std::string tags = "{";
    for (const auto &c : band.colors) {
        tags += "\\" + std::to_string(c.channel) + "c" + color::to_ass(c.color);
    }
    tags += "\\" + gradient::to_string(band.kind) + "(";
    tags += std::to_string(exponent) + "," + shape::serialize(band.path);
    tags += ")}";
    return tags;
}

/**
 * Processes a single input line. Throws on failure.
 */
static gradient::Gradient process(const std::string &line, const gradient::Settings &settings) {
    auto kind = gradient::ClipKind::CLIP;
    auto argument = line;
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        kind = gradient::parse_clip_kind(line.substr(0, colon));
        argument = line.substr(colon + 1);
    }
    auto shape = shape::parse_clip(argument);
    if (shape.path.empty()) {
        throw std::runtime_error("no usable clip shape in \"" + argument + "\"");
    }
    auto result = gradient::generate(shape, kind, settings);
    for (const auto &band : result.layers()) {
        std::cout << format_band(band, result.exponent) << "\n";
    }
    std::cout << std::endl;
    return result;
}

int main(int argc, char *argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("clipgrad"));

    gradient::Settings settings;
    std::string input_fname;
    std::string svg_fname;
    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                usage(argv[0]);
                return 0;
            } else if (arg == "--verbose") {
                spdlog::set_level(spdlog::level::debug);
            } else if (arg.compare(0, 2, "--") == 0) {
                auto eq = arg.find('=');
                if (eq == std::string::npos) {
                    throw std::runtime_error("expected --<key>=<value>, got " + arg);
                }
                auto key = arg.substr(2, eq - 2);
                auto value = arg.substr(eq + 1);
                if (key == "svg") {
                    svg_fname = value;
                } else {
                    settings.configure(key, value);
                }
            } else if (input_fname.empty()) {
                input_fname = arg;
            } else {
                throw std::runtime_error("unexpected argument " + arg);
            }
        }
    } catch (const std::runtime_error &e) {
        spdlog::error("{}", e.what());
        usage(argv[0]);
        return 2;
    }

    std::ifstream file;
    if (!input_fname.empty()) {
        file.open(input_fname);
        if (!file.is_open()) {
            spdlog::error("failed to open {}", input_fname);
            return 2;
        }
    }
    std::istream &input = input_fname.empty() ? std::cin : file;

    bool failed = false;
    bool previewed = svg_fname.empty();
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        line_number++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        try {
            auto result = process(line, settings);
            if (!previewed) {
                svg::write(result, svg_fname);
                previewed = true;
            }
        } catch (const std::exception &e) {
            spdlog::error("line {}: {}", line_number, e.what());
            failed = true;
        }
    }
    return failed ? 1 : 0;
}
