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
#include <cmath>
#include <stdexcept>
#include "clipgrad/offset.hpp"
#include "clipgrad/path.hpp"
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

static void expect_point(const shape::Vertex &v, coord::CInt x, coord::CInt y)
{
	EXPECT_EQ(v.x, x);
	EXPECT_EQ(v.y, y);
}

static size_t count_crossovers(const shape::Path &original, const shape::Path &grown)
{
	size_t count = 0;
	ring::Ring r(grown);
	for (size_t i = 0; i < grown.size(); i++) {
		size_t j = r.next(i);
		if (grown[i].coincides(grown[j]))
			continue;
		double dx = (double)(original[j].x - original[i].x);
		double dy = (double)(original[j].y - original[i].y);
		double ndx = (double)(grown[j].x - grown[i].x);
		double ndy = (double)(grown[j].y - grown[i].y);
		if (dx * ndx < 0.0 || dy * ndy < 0.0)
			count++;
	}
	return count;
}

static double outward_distance(const shape::Vertex &a, const shape::Vertex &b, const shape::Vertex &p, double orientation)
{
	double ex = (double)(b.x - a.x);
	double ey = (double)(b.y - a.y);
	double cross = ex * (double)(p.y - a.y) - ey * (double)(p.x - a.x);
	return -orientation * cross / std::sqrt(ex * ex + ey * ey);
}

TEST(OffsetTests, ZeroRadiusIsIdentity)
{
	auto p = shape::parse("m 0 0 l 10 0 b 12 3 12 7 10 10 l 0 10").path;
	EXPECT_EQ(offset::grow(p, 0.0), p);
}

TEST(OffsetTests, ZeroRadiusRescales)
{
	auto p = make_path({{0, 0}, {10, 0}, {10, 10}, {0, 10}});
	auto g = offset::grow(p, 0.0, 4);
	ASSERT_EQ(g.size(), 4u);
	expect_point(g[1], 40, 0);
	expect_point(g[2], 40, 40);
	EXPECT_EQ(g[0].cls, VertexClass::MOVE);
}

TEST(OffsetTests, InvalidScaleThrows)
{
	auto p = make_path({{0, 0}, {10, 0}, {10, 10}});
	EXPECT_THROW(offset::grow(p, 1.0, 0), std::runtime_error);
}

TEST(OffsetTests, GrowSquareOutward)
{
	auto p = make_path({{0, 0}, {10, 0}, {10, 10}, {0, 10}});
	auto g = offset::grow(p, 5.0);
	ASSERT_EQ(g.size(), 4u);
	expect_point(g[0], -5, -5);
	expect_point(g[1], 15, -5);
	expect_point(g[2], 15, 15);
	expect_point(g[3], -5, 15);
}

TEST(OffsetTests, GrowIsIndependentOfOrientation)
{
	auto p = make_path({{0, 0}, {0, 10}, {10, 10}, {10, 0}});
	auto g = offset::grow(p, 5.0);
	ASSERT_EQ(g.size(), 4u);
	expect_point(g[0], -5, -5);
	expect_point(g[1], -5, 15);
	expect_point(g[2], 15, 15);
	expect_point(g[3], 15, -5);
}

TEST(OffsetTests, ShrinkSquare)
{
	auto p = make_path({{0, 0}, {10, 0}, {10, 10}, {0, 10}});
	auto g = offset::grow(p, -2.0);
	ASSERT_EQ(g.size(), 4u);
	expect_point(g[0], 2, 2);
	expect_point(g[1], 8, 2);
	expect_point(g[2], 8, 8);
	expect_point(g[3], 2, 8);
}

TEST(OffsetTests, ShrinkBeyondHalfWidthCollapses)
{
	auto p = make_path({{0, 0}, {10, 0}, {10, 10}, {0, 10}});
	auto g = offset::grow(p, -6.0);
	ASSERT_EQ(g.size(), 4u);
	for (const auto &v : g)
		expect_point(v, 5, 5);
	EXPECT_EQ(g[0].cls, VertexClass::MOVE);
	EXPECT_EQ(g[3].cls, VertexClass::LINE);
}

TEST(OffsetTests, GrowConvexHexagonContainsOriginal)
{
	auto p = make_path({{100, 0}, {200, 50}, {200, 150}, {100, 200}, {0, 150}, {0, 50}});
	auto g = offset::grow(p, 10.0);
	ASSERT_EQ(g.size(), p.size());
	auto original = path::region(p);
	auto grown = path::region(g);
	EXPECT_GT(path::area(grown), path::area(original));
	EXPECT_DOUBLE_EQ(path::area(path::subtract(original, grown)), 0.0);

	// The top and bottom vertices move straight out by the miter length.
	EXPECT_EQ(g[0].x, 100);
	EXPECT_LT(g[0].y, -10);
	EXPECT_EQ(g[3].x, 100);
	EXPECT_GT(g[3].y, 210);

	// The vertical edges move out by exactly the radius.
	EXPECT_EQ(g[1].x, 210);
	EXPECT_EQ(g[2].x, 210);
	EXPECT_EQ(g[4].x, -10);
	EXPECT_EQ(g[5].x, -10);
}

TEST(OffsetTests, ShrinkConvexHexagonStaysInside)
{
	auto p = make_path({{100, 0}, {200, 50}, {200, 150}, {100, 200}, {0, 150}, {0, 50}});
	auto g = offset::grow(p, -10.0);
	auto original = path::region(p);
	auto shrunk = path::region(g);
	EXPECT_LT(path::area(shrunk), path::area(original));
	EXPECT_DOUBLE_EQ(path::area(path::subtract(shrunk, original)), 0.0);
}

TEST(OffsetTests, NotchCrossoverIsMerged)
{
	auto p = make_path({{0, 0}, {100, 0}, {100, 100}, {55, 100}, {50, 20}, {45, 100}, {0, 100}});
	auto g = offset::grow(p, 15.0);
	ASSERT_EQ(g.size(), p.size());
	for (size_t i = 0; i < p.size(); i++)
		EXPECT_EQ(g[i].cls, p[i].cls);

	expect_point(g[0], -15, -15);
	expect_point(g[1], 115, -15);
	expect_point(g[2], 115, 115);
	expect_point(g[6], -15, 115);

	// The notch tip and its neighbors overshoot each other and collapse.
	EXPECT_TRUE(g[3].coincides(g[4]));
	EXPECT_TRUE(g[4].coincides(g[5]));
	EXPECT_GT(g[4].y, 115);
	EXPECT_NEAR((double)g[4].x, 50.0, 1.0);
}

TEST(OffsetTests, NoCrossoversRemain)
{
	auto p = make_path({{0, 0}, {100, 0}, {100, 100}, {55, 100}, {50, 20}, {45, 100}, {0, 100}});
	auto g = offset::grow(p, 15.0);
	EXPECT_EQ(count_crossovers(p, g), 0u);
}

TEST(OffsetTests, InwardSpikeCollapses)
{
	auto p = make_path({{0, 0}, {100, 0}, {100, 100}, {52, 100}, {50, 300}, {48, 100}, {0, 100}});
	auto g = offset::grow(p, -10.0);
	ASSERT_EQ(g.size(), p.size());
	for (size_t i = 0; i < p.size(); i++)
		EXPECT_EQ(g[i].cls, p[i].cls);

	expect_point(g[0], 10, 10);
	expect_point(g[1], 90, 10);
	expect_point(g[2], 90, 90);
	expect_point(g[6], 10, 90);

	// The spike is thinner than the radius, so its three vertices fold into one.
	EXPECT_TRUE(g[3].coincides(g[4]));
	EXPECT_TRUE(g[4].coincides(g[5]));
	EXPECT_EQ(g[4].x, 50);
	EXPECT_LT(g[4].y, 0);
	EXPECT_EQ(count_crossovers(p, g), 0u);
}

TEST(OffsetTests, InwardSpikeMergesAcrossPathStart)
{
	auto p = make_path({{50, 300}, {48, 100}, {0, 100}, {0, 0}, {100, 0}, {100, 100}, {52, 100}});
	auto g = offset::grow(p, -10.0);
	ASSERT_EQ(g.size(), p.size());
	for (size_t i = 0; i < p.size(); i++)
		EXPECT_EQ(g[i].cls, p[i].cls);

	expect_point(g[2], 10, 90);
	expect_point(g[3], 10, 10);
	expect_point(g[4], 90, 10);
	expect_point(g[5], 90, 90);

	// The last vertex merges with the first two.
	EXPECT_TRUE(g[6].coincides(g[0]));
	EXPECT_TRUE(g[0].coincides(g[1]));
	EXPECT_EQ(g[0].x, 50);
	EXPECT_LT(g[0].y, 0);
	EXPECT_EQ(count_crossovers(p, g), 0u);
}

TEST(OffsetTests, SlantedEdgesMoveByRadius)
{
	auto p = make_path({{0, 0}, {300, 40}, {120, 260}});
	ring::Ring r(p);
	const double orientation = 1.0;
	for (double radius : {10.0, -10.0}) {
		auto g = offset::grow(p, radius);
		ASSERT_EQ(g.size(), p.size());
		for (size_t i = 0; i < p.size(); i++) {
			const auto &prev = p[r.prev(i)];
			const auto &next = p[r.next(i)];
			EXPECT_NEAR(outward_distance(prev, p[i], g[i], orientation), radius, 0.75) << "vertex " << i << " radius " << radius;
			EXPECT_NEAR(outward_distance(p[i], next, g[i], orientation), radius, 0.75) << "vertex " << i << " radius " << radius;
		}
	}
}

TEST(OffsetTests, UnusablePathIsEmpty)
{
	EXPECT_TRUE(offset::grow(shape::Path(), 5.0).empty());
	EXPECT_TRUE(offset::grow(make_path({{0, 0}, {10, 0}}), 5.0).empty());
	EXPECT_TRUE(offset::grow(make_path({{0, 0}, {10, 0}, {10, 0}, {0, 0}}), 5.0).empty());
}
