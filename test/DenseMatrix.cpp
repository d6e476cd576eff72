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

#include <vector>

#include "linalg/DenseMatrix.hpp"
#include "linalg/Norms.hpp"

namespace
{
	griddae::linalg::DenseMatrix fromRows(unsigned int rows, unsigned int cols, const std::vector<double>& values)
	{
		griddae::linalg::DenseMatrix dm;
		dm.resize(rows, cols);
		for (unsigned int r = 0; r < rows; ++r)
		{
			for (unsigned int c = 0; c < cols; ++c)
				dm.native(r, c) = values[r * cols + c];
		}
		return dm;
	}
}

TEST_CASE("DenseMatrix LU solves square system", "[DenseMatrix],[LinearAlgebra]")
{
	griddae::linalg::DenseMatrix dm = fromRows(3, 3, {4.0, -2.0, 1.0, -2.0, 4.0, -2.0, 1.0, -2.0, 4.0});
	const std::vector<double> x = {1.0, -2.0, 0.5};

	std::vector<double> rhs(3, 0.0);
	dm.multiplyVector(x.data(), rhs.data());

	REQUIRE(dm.factorize());
	REQUIRE(dm.solve(rhs.data()));

	for (unsigned int i = 0; i < 3; ++i)
		CHECK(rhs[i] == griddae::test::makeApprox(x[i], 1e-12, 1e-14));
}

TEST_CASE("DenseMatrix row scaled solve matches unscaled solve", "[DenseMatrix],[LinearAlgebra]")
{
	griddae::linalg::DenseMatrix dm = fromRows(2, 2, {1e6, 2e6, 3.0, -1.0});
	std::vector<double> rhs = {5e6, 1.0};

	std::vector<double> scale(2, 0.0);
	dm.rowScaleFactors(scale.data());
	dm.scaleRows(scale.data());

	REQUIRE(dm.factorize());
	REQUIRE(dm.solve(scale.data(), rhs.data()));

	CHECK(rhs[0] == griddae::test::makeApprox(1.0, 1e-12, 1e-14));
	CHECK(rhs[1] == griddae::test::makeApprox(2.0, 1e-12, 1e-14));
}

TEST_CASE("DenseMatrix factorization of singular matrix fails", "[DenseMatrix],[LinearAlgebra]")
{
	griddae::linalg::DenseMatrix dm = fromRows(2, 2, {1.0, 2.0, 0.0, 0.0});
	CHECK_FALSE(dm.factorize());
}

TEST_CASE("DenseMatrix least squares solves overdetermined system", "[DenseMatrix],[LinearAlgebra]")
{
	// Fit y = a + b x through (0, 1), (1, 3), (2, 5), (3, 7)
	griddae::linalg::DenseMatrix dm = fromRows(4, 2, {1.0, 0.0, 1.0, 1.0, 1.0, 2.0, 1.0, 3.0});
	std::vector<double> rhs = {1.0, 3.0, 5.0, 7.0};
	std::vector<double> workspace(64, 0.0);

	REQUIRE(dm.leastSquaresSolve(rhs.data(), workspace.data(), workspace.size()));
	CHECK(rhs[0] == griddae::test::makeApprox(1.0, 1e-12, 1e-12));
	CHECK(rhs[1] == griddae::test::makeApprox(2.0, 1e-12, 1e-12));
}

TEST_CASE("DenseMatrix transposed multiply", "[DenseMatrix],[LinearAlgebra]")
{
	const griddae::linalg::DenseMatrix dm = fromRows(2, 3, {1.0, 2.0, 3.0, 4.0, 5.0, 6.0});
	const std::vector<double> x = {1.0, -1.0};
	std::vector<double> y(3, 0.0);

	dm.transposedMultiplyVector(x.data(), y.data());
	CHECK(y[0] == -3.0);
	CHECK(y[1] == -3.0);
	CHECK(y[2] == -3.0);
}

TEST_CASE("Vector norms", "[Norms],[LinearAlgebra]")
{
	const std::vector<double> x = {3.0, -4.0};
	CHECK(griddae::linalg::l2Norm(x.data(), 2) == griddae::test::RelApprox(5.0));
	CHECK(griddae::linalg::linfNorm(x.data(), 2) == 4.0);
}
