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
#include "clipgrad/coord.hpp"

using namespace clipgrad;

TEST(CoordTests, Multiplier)
{
	EXPECT_EQ(coord::Format().multiplier(), 1);
	EXPECT_EQ(coord::Format(1).multiplier(), 1);
	EXPECT_EQ(coord::Format(2).multiplier(), 2);
	EXPECT_EQ(coord::Format(3).multiplier(), 4);
	EXPECT_EQ(coord::Format(4).multiplier(), 8);
}

TEST(CoordTests, Conversions)
{
	coord::Format fmt(3);
	EXPECT_EQ(fmt.get_exponent(), 3);
	EXPECT_DOUBLE_EQ(fmt.to_native(2.5), 10.0);
	EXPECT_DOUBLE_EQ(fmt.to_native(-1.0), -4.0);
	EXPECT_DOUBLE_EQ(fmt.to_pixels(10), 2.5);
}

TEST(CoordTests, InvalidExponent)
{
	EXPECT_THROW(coord::Format(0), std::runtime_error);
	EXPECT_THROW(coord::Format(5), std::runtime_error);
	EXPECT_FALSE(coord::Format::is_valid_exponent(-1));
	EXPECT_TRUE(coord::Format::is_valid_exponent(4));
}
