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
#include "clipgrad/ring.hpp"

using namespace clipgrad;
using shape::VertexClass;

static shape::Path make_path(const std::vector<std::pair<int, int>> &pts)
{
	shape::Path p;
	for (const auto &pt : pts)
		p.push_back({p.empty() ? VertexClass::MOVE : VertexClass::LINE, pt.first, pt.second});
	return p;
}

TEST(RingTests, WrapAndUnwrap)
{
	auto p = make_path({{0, 0}, {10, 0}, {10, 10}});
	auto w = ring::wrap(p);
	ASSERT_EQ(w.size(), 5u);
	EXPECT_EQ(w.front(), p.back());
	EXPECT_EQ(w.back(), p.front());
	EXPECT_EQ(w[1], p[0]);
	EXPECT_EQ(ring::unwrap(w), p);
	EXPECT_TRUE(ring::wrap(shape::Path()).empty());
}

TEST(RingTests, ModularIndexing)
{
	auto p = make_path({{0, 0}, {10, 0}, {10, 10}, {0, 10}});
	ring::Ring r(p);
	EXPECT_EQ(r.size(), 4u);
	EXPECT_EQ(r.index(-1), 3u);
	EXPECT_EQ(r.index(4), 0u);
	EXPECT_EQ(r.index(-9), 3u);
	EXPECT_EQ(r.prev(0), 3u);
	EXPECT_EQ(r.next(3), 0u);
	EXPECT_EQ(r.at(5), p[1]);
}

TEST(RingTests, EmptyPathThrows)
{
	shape::Path p;
	ring::Ring r(p);
	EXPECT_THROW(r.index(0), std::runtime_error);
}

TEST(RingTests, DistinctNeighborsSkipZeroLengthEdges)
{
	auto p = make_path({{0, 0}, {10, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 10}});
	ring::Ring r(p);
	EXPECT_EQ(r.next_distinct(1), 3u);
	EXPECT_EQ(r.prev_distinct(3), 2u);
	EXPECT_EQ(r.prev_distinct(0), 5u);
	EXPECT_EQ(r.next_distinct(4), 0u);
	EXPECT_EQ(r.prev_distinct(1), 0u);
}

TEST(RingTests, DistinctNeighborsThrowWhenAllCoincide)
{
	auto p = make_path({{3, 3}, {3, 3}, {3, 3}});
	ring::Ring r(p);
	EXPECT_THROW(r.next_distinct(0), std::runtime_error);
	EXPECT_THROW(r.prev_distinct(1), std::runtime_error);
}

TEST(RingTests, UsableVertices)
{
	EXPECT_EQ(ring::usable_vertices(make_path({{0, 0}, {10, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0}})), 4u);
	EXPECT_EQ(ring::usable_vertices(make_path({{3, 3}, {3, 3}, {3, 3}})), 1u);
	EXPECT_EQ(ring::usable_vertices(make_path({{0, 0}, {5, 5}, {0, 0}})), 2u);
	EXPECT_EQ(ring::usable_vertices(shape::Path()), 0u);
}
