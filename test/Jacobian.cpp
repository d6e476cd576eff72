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
#include "Jacobian.hpp"
#include "linalg/DenseMatrix.hpp"

#include <Eigen/SparseCore>

#include <vector>

namespace
{
	void compareDenseAndColored(const griddae::NetworkDynamics& nd, const std::vector<double>& u)
	{
		const unsigned int n = nd.numDofs();
		REQUIRE(u.size() == n);

		griddae::linalg::DenseMatrix dense(n, n);
		griddae::denseJacobian(nd, 0.0, u.data(), nullptr, dense);

		const griddae::ColoredJacobian cj(nd.sparsityPattern(), n);
		CHECK(cj.numColors() <= n);

		double const* const noParams = nullptr;
		Eigen::SparseMatrix<double> sparse;
		cj.compute([&](griddae::active const* x, griddae::active* res) { nd.evaluate(0.0, x, noParams, res); }, u.data(), sparse);

		REQUIRE(sparse.rows() == static_cast<int>(n));
		REQUIRE(sparse.cols() == static_cast<int>(n));

		const Eigen::MatrixXd fromSparse(sparse);
		for (unsigned int r = 0; r < n; ++r)
		{
			for (unsigned int c = 0; c < n; ++c)
			{
				CAPTURE(r);
				CAPTURE(c);
				CHECK(fromSparse(r, c) == griddae::test::makeApprox(dense.native(r, c), 1e-12, 1e-14));
			}
		}
	}
}

TEST_CASE("Colored Jacobian matches dense Jacobian on algebraic grid", "[Jacobian]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::threeNodeLoadGridConfig());
	const griddae::NetworkDynamics nd(grid);

	compareDenseAndColored(nd, std::vector<double>{1.0, 0.0, 0.98, -0.02, 0.95, -0.04});
}

TEST_CASE("Colored Jacobian matches dense Jacobian with swing node", "[Jacobian]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::swingGridConfig("SwingEqLVS"));
	const griddae::NetworkDynamics nd(grid);

	compareDenseAndColored(nd, std::vector<double>{1.0, 0.0, 0.99, 0.05, 0.1, 0.96, -0.03});
}

TEST_CASE("Dense Jacobian of slack rows is identity", "[Jacobian]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::threeNodeLoadGridConfig());
	const griddae::NetworkDynamics nd(grid);

	const std::vector<double> u = {1.0, 0.0, 0.98, -0.02, 0.95, -0.04};
	griddae::linalg::DenseMatrix jac(6, 6);
	griddae::denseJacobian(nd, 0.0, u.data(), nullptr, jac);

	CHECK(jac.native(0, 0) == 1.0);
	CHECK(jac.native(1, 1) == 1.0);
	CHECK(jac.native(0, 1) == 0.0);
	CHECK(jac.native(0, 2) == 0.0);
	// No line between nodes 0 and 2
	CHECK(jac.native(4, 0) == 0.0);
	CHECK(jac.native(4, 1) == 0.0);
}

TEST_CASE("Coloring compresses columns of a long path", "[Jacobian]")
{
	const int nNodes = 8;
	griddae::JsonParameterProvider jpp = griddae::test::emptyGridConfig(nNodes, nNodes - 1);
	griddae::test::addSlack(jpp, 0, 1.0, 0.0);
	for (int i = 1; i < nNodes; ++i)
		griddae::test::addPQ(jpp, i, -0.01, 0.0);
	for (int i = 0; i < nNodes - 1; ++i)
		griddae::test::addStaticLine(jpp, i, i, i + 1, 5.0, -15.0);

	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, jpp);
	const griddae::NetworkDynamics nd(grid);

	const griddae::ColoredJacobian cj(nd.sparsityPattern(), nd.numDofs());
	CHECK(cj.numColors() < nd.numDofs());

	std::vector<double> u(nd.numDofs(), 0.0);
	for (int i = 0; i < nNodes; ++i)
	{
		u[2 * i] = 1.0 - 0.01 * i;
		u[2 * i + 1] = -0.005 * i;
	}
	compareDenseAndColored(nd, u);
}
