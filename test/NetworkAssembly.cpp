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
#include "Approx.hpp"
#include "GridHelper.hpp"

#include "PowerGrid.hpp"
#include "NetworkDynamics.hpp"
#include "griddae/Exceptions.hpp"

#include <cmath>
#include <vector>

#ifdef GRIDDAE_PARALLELIZE
	#include <tbb/global_control.h>
	#include <tbb/task_arena.h>
#endif

TEST_CASE("Grid dimensions and offsets", "[NetworkDynamics]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::swingGridConfig("SwingEqLVS"));

	CHECK(grid.numNodes() == 3);
	CHECK(grid.numLines() == 2);
	CHECK(grid.numDofs() == 7);
	CHECK(grid.offset(1) == 2);
	CHECK(grid.offset(2) == 5);
	CHECK(grid.numParameters() == 5);
	CHECK(grid.slackIndex() == 0);
	CHECK(grid.variableIndex(1, "ω") == 4);
	CHECK_THROWS_AS(grid.variableIndex(1, "θ"), griddae::InvalidParameterException);
	CHECK_THROWS_AS(grid.variableIndex(3, "u_r"), griddae::DimensionError);
}

TEST_CASE("Mass matrix and variable names follow node order", "[NetworkDynamics]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::swingGridConfig("SwingEqLVS"));
	const griddae::NetworkDynamics nd(grid);

	const std::vector<double> expectedMass = {0.0, 0.0, 1.0, 1.0, 1.0, 0.0, 0.0};
	CHECK(nd.massMatrix() == expectedMass);

	const std::vector<bool> diff = nd.differentialVariables();
	REQUIRE(diff.size() == 7);
	CHECK_FALSE(diff[0]);
	CHECK(diff[3]);

	const std::vector<std::string>& names = nd.variableNames();
	REQUIRE(names.size() == 7);
	CHECK(names[0] == "u_r_0");
	CHECK(names[1] == "u_i_0");
	CHECK(names[4] == "ω_1");
	CHECK(names[6] == "u_i_2");

	CHECK(nd.defaultParameters() == grid.defaultParameters());
}

TEST_CASE("Right hand side of a flat grid", "[NetworkDynamics]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::threeNodeLoadGridConfig());
	const griddae::NetworkDynamics nd(grid);

	// Equal voltages everywhere: no line currents
	const std::vector<double> u = {1.0, 0.0, 1.0, 0.0, 1.0, 0.0};
	const std::vector<double> du = nd.rhs(0.0, u);
	REQUIRE(du.size() == 6);

	CHECK(du[0] == 0.0);
	CHECK(du[1] == 0.0);
	CHECK(du[2] == griddae::test::RelApprox(-0.1));
	CHECK(du[3] == griddae::test::RelApprox(-0.02));
	CHECK(du[4] == griddae::test::RelApprox(-0.1));
	CHECK(du[5] == griddae::test::RelApprox(-0.02));
}

TEST_CASE("Right hand side sums line currents at each node", "[NetworkDynamics]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::threeNodeLoadGridConfig());
	const griddae::NetworkDynamics nd(grid);

	// Only node 2 deviates: i_2 = y (u_2 - u_1) = (10 - 30i) * (-0.1) = -1 + 3i
	const std::vector<double> u = {1.0, 0.0, 1.0, 0.0, 0.9, 0.0};
	const std::vector<double> du = nd.rhs(0.0, u);

	// P + iQ - u conj(i) = -0.1 - 0.02i - 0.9 (-1 - 3i) = 0.8 + 2.68i
	CHECK(du[4] == griddae::test::RelApprox(0.8));
	CHECK(du[5] == griddae::test::RelApprox(2.68));

	// Node 1 sees the opposite current 1 - 3i at voltage 1
	CHECK(du[2] == griddae::test::RelApprox(-0.1 - 1.0));
	CHECK(du[3] == griddae::test::RelApprox(-0.02 - 3.0));
}

TEST_CASE("Evaluation is deterministic", "[NetworkDynamics]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::swingGridConfig("SwingEqLVS"));
	const griddae::NetworkDynamics nd(grid);

	const std::vector<double> u = {1.0, 0.0, 0.98, 0.05, 0.1, 0.97, -0.03};
	const std::vector<double> first = nd.rhs(0.3, u);
	for (int i = 0; i < 5; ++i)
		CHECK(nd.rhs(0.3, u) == first);
}

#ifdef GRIDDAE_PARALLELIZE

TEST_CASE("Parallel and sequential evaluation are bit-identical", "[NetworkDynamics],[Parallel]")
{
	const int nNodes = 600;
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::pathGridConfig(nNodes));
	const griddae::NetworkDynamics nd(grid);

	std::vector<double> u(nd.numDofs(), 0.0);
	for (unsigned int i = 0; i < u.size(); ++i)
		u[i] = 1.0 - 1e-4 * i + 0.01 * std::sin(0.7 * i);

	std::vector<double> sequential;
	{
		tbb::global_control serial(tbb::global_control::max_allowed_parallelism, 1);
		sequential = nd.rhs(0.5, u);
	}

	std::vector<double> parallel;
	{
		tbb::global_control wide(tbb::global_control::max_allowed_parallelism, tbb::this_task_arena::max_concurrency());
		parallel = nd.rhs(0.5, u);
	}

	REQUIRE(sequential.size() == nd.numDofs());
	CHECK(parallel == sequential);
}

#endif

TEST_CASE("Explicit parameters override defaults", "[NetworkDynamics]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::threeNodeLoadGridConfig());
	const griddae::NetworkDynamics nd(grid);

	std::vector<double> p = nd.defaultParameters();
	REQUIRE(p.size() == 6);
	p[2] = -0.3;

	const std::vector<double> u = {1.0, 0.0, 1.0, 0.0, 1.0, 0.0};
	const std::vector<double> du = nd.rhs(0.0, u, p);
	CHECK(du[2] == griddae::test::RelApprox(-0.3));
}

TEST_CASE("Wrong vector lengths are rejected", "[NetworkDynamics]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::threeNodeLoadGridConfig());
	const griddae::NetworkDynamics nd(grid);

	CHECK_THROWS_AS(nd.rhs(0.0, std::vector<double>(5, 1.0)), griddae::DimensionError);
	CHECK_THROWS_AS(nd.rhs(0.0, std::vector<double>(6, 1.0), std::vector<double>(2, 0.0)), griddae::DimensionError);
}

TEST_CASE("Line with invalid node index is rejected", "[PowerGrid]")
{
	griddae::JsonParameterProvider jpp = griddae::test::emptyGridConfig(2, 1);
	griddae::test::addSlack(jpp, 0, 1.0, 0.0);
	griddae::test::addPQ(jpp, 1, -0.1, 0.0);
	griddae::test::addStaticLine(jpp, 0, 0, 2, 1.0, -1.0);

	griddae::PowerGrid grid;
	CHECK_THROWS_AS(griddae::test::configureGrid(grid, jpp), griddae::DimensionError);
}

TEST_CASE("Unknown node type is rejected", "[PowerGrid]")
{
	griddae::JsonParameterProvider jpp = griddae::test::emptyGridConfig(1, 0);
	jpp.addScope("node_000");
	jpp.pushScope("node_000");
	jpp.set("NODE_TYPE", "Windmill");
	jpp.popScope();

	griddae::PowerGrid grid;
	CHECK_THROWS_AS(griddae::test::configureGrid(grid, jpp), griddae::InvalidParameterException);
}

TEST_CASE("Sparsity pattern covers own block and neighbor voltages", "[NetworkDynamics]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::threeNodeLoadGridConfig());
	const griddae::NetworkDynamics nd(grid);

	const griddae::util::SlicedVector<int>& pattern = nd.sparsityPattern();
	REQUIRE(pattern.slices() == 6);

	// Node 0 depends on itself and node 1
	CHECK(pattern.sliceSize(0) == 4);
	// Node 1 depends on all three nodes
	CHECK(pattern.sliceSize(2) == 6);
	CHECK(pattern.sliceSize(4) == 4);
}
