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

#include <gtest/gtest.h>
#include <stdexcept>
#include "clipgrad/color.hpp"

using namespace clipgrad;

TEST(ColorTests, InterpolateEndpoints)
{
	EXPECT_EQ(color::interpolate(0.0, color::RED, color::BLUE), color::RED);
	EXPECT_EQ(color::interpolate(1.0, color::RED, color::BLUE), color::BLUE);
}

TEST(ColorTests, InterpolateRoundsHalfUp)
{
	color::Color mid = color::interpolate(0.5, color::RED, color::BLUE);
	EXPECT_EQ(mid.r, 128);
	EXPECT_EQ(mid.g, 0);
	EXPECT_EQ(mid.b, 128);
	EXPECT_EQ(color::to_hex(mid), "#800080");
}

TEST(ColorTests, InterpolateChannelsIndependently)
{
	color::Color start = {10, 200, 50};
	color::Color end = {30, 100, 50};
	color::Color c = color::interpolate(0.25, start, end);
	EXPECT_EQ(c.r, 15);
	EXPECT_EQ(c.g, 175);
	EXPECT_EQ(c.b, 50);
}

TEST(ColorTests, InterpolateClampsFactor)
{
	EXPECT_EQ(color::interpolate(-1.0, color::BLACK, color::WHITE), color::BLACK);
	EXPECT_EQ(color::interpolate(2.0, color::BLACK, color::WHITE), color::WHITE);
}

TEST(ColorTests, ParseForms)
{
	color::Color expected = {0x12, 0x34, 0x56};
	EXPECT_EQ(color::parse("#123456"), expected);
	EXPECT_EQ(color::parse("123456"), expected);
	EXPECT_EQ(color::parse("&H563412&"), expected);
	EXPECT_EQ(color::parse("&H563412"), expected);
	EXPECT_EQ(color::parse("&H00563412&"), expected);
	EXPECT_EQ(color::parse("#abcdef"), (color::Color{0xAB, 0xCD, 0xEF}));
}

TEST(ColorTests, ParseRejectsGarbage)
{
	EXPECT_THROW(color::parse(""), std::runtime_error);
	EXPECT_THROW(color::parse("#12345"), std::runtime_error);
	EXPECT_THROW(color::parse("#12345G"), std::runtime_error);
	EXPECT_THROW(color::parse("red"), std::runtime_error);
	EXPECT_THROW(color::parse("&H&"), std::runtime_error);
}

TEST(ColorTests, Formatting)
{
	color::Color c = {0x12, 0x34, 0x56};
	EXPECT_EQ(color::to_hex(c), "#123456");
	EXPECT_EQ(color::to_ass(c), "&H563412&");
	EXPECT_EQ(color::to_svg(c), "rgb(18,52,86)");
	EXPECT_EQ(color::parse(color::to_ass(c)), c);
}
