// =============================================================================
//  GridDAE
//  
//  Copyright © 2023-present: The GridDAE Authors
//            Please see the AUTHORS.md file.
//  
//  All rights reserved. This program and the accompanying materials
//  are made available under the terms of the GNU Public License v3.0 (or, at
//  your option, any later version) which accompanies this distribution, and
//  is available at http://www.gnu.org/licenses/gpl.html
// =============================================================================

#include <catch.hpp>

#include "graph/GraphAlgos.hpp"

#include <algorithm>
#include <vector>

namespace
{
	bool contains(const griddae::util::SlicedVector<int>& list, int slice, int val)
	{
		return std::find(list.begin(slice), list.end(slice), val) != list.end(slice);
	}

	void checkColoring(const griddae::util::SlicedVector<int>& pattern, const std::vector<int>& colors)
	{
		// Columns sharing a row must have different colors
		for (std::size_t r = 0; r < pattern.slices(); ++r)
		{
			for (int const* a = pattern.begin(r); a != pattern.end(r); ++a)
			{
				for (int const* b = a + 1; b != pattern.end(r); ++b)
					CHECK(colors[*a] != colors[*b]);
			}
		}
	}
}

TEST_CASE("Incidence list of path graph", "[Graph]")
{
	const std::vector<int> connections = {0, 1, 1, 2, 2, 3};
	const griddae::util::SlicedVector<int> inc = griddae::graph::incidenceListFromConnectionList(connections.data(), 4, 3);

	REQUIRE(inc.slices() == 4);
	CHECK(inc.sliceSize(0) == 1);
	CHECK(inc.sliceSize(1) == 2);
	CHECK(inc.sliceSize(3) == 1);
	CHECK(contains(inc, 1, 0));
	CHECK(contains(inc, 1, 1));
	CHECK(contains(inc, 3, 2));
}

TEST_CASE("Adjacency list removes duplicates and self loops", "[Graph]")
{
	// Parallel lines 0-1, self loop at 2, line 2-0
	const std::vector<int> connections = {0, 1, 1, 0, 2, 2, 2, 0};
	const griddae::util::SlicedVector<int> adj = griddae::graph::adjacencyListFromConnectionList(connections.data(), 3, 4);

	REQUIRE(adj.slices() == 3);
	CHECK(adj.sliceSize(0) == 2);
	CHECK(adj.sliceSize(1) == 1);
	CHECK(adj.sliceSize(2) == 1);
	CHECK(contains(adj, 0, 1));
	CHECK(contains(adj, 0, 2));
	CHECK(contains(adj, 2, 0));
	CHECK_FALSE(contains(adj, 2, 2));

	// Self loops still count as incident
	const griddae::util::SlicedVector<int> inc = griddae::graph::incidenceListFromConnectionList(connections.data(), 3, 4);
	CHECK(inc.sliceSize(2) == 2);
}

TEST_CASE("Isolated nodes have empty lists", "[Graph]")
{
	const std::vector<int> connections = {0, 2};
	const griddae::util::SlicedVector<int> adj = griddae::graph::adjacencyListFromConnectionList(connections.data(), 4, 1);
	REQUIRE(adj.slices() == 4);
	CHECK(adj.sliceSize(1) == 0);
	CHECK(adj.sliceSize(3) == 0);
}

TEST_CASE("Greedy coloring of diagonal pattern uses one color", "[Graph],[Coloring]")
{
	griddae::util::SlicedVector<int> pattern;
	for (int i = 0; i < 5; ++i)
		pattern.pushBackSlice(std::vector<int>(1, i));

	std::vector<int> colors;
	CHECK(griddae::graph::greedyColumnColoring(pattern, 5, colors) == 1);
	CHECK(colors == std::vector<int>(5, 0));
}

TEST_CASE("Greedy coloring of dense pattern uses one color per column", "[Graph],[Coloring]")
{
	griddae::util::SlicedVector<int> pattern;
	const std::vector<int> all = {0, 1, 2, 3};
	for (int i = 0; i < 4; ++i)
		pattern.pushBackSlice(all);

	std::vector<int> colors;
	CHECK(griddae::graph::greedyColumnColoring(pattern, 4, colors) == 4);
	checkColoring(pattern, colors);
}

TEST_CASE("Greedy coloring of tridiagonal pattern", "[Graph],[Coloring]")
{
	const int n = 10;
	griddae::util::SlicedVector<int> pattern;
	for (int i = 0; i < n; ++i)
	{
		std::vector<int> cols;
		for (int j = std::max(0, i - 1); j <= std::min(n - 1, i + 1); ++j)
			cols.push_back(j);
		pattern.pushBackSlice(cols);
	}

	std::vector<int> colors;
	CHECK(griddae::graph::greedyColumnColoring(pattern, n, colors) == 3);
	REQUIRE(colors.size() == n);
	checkColoring(pattern, colors);
}
