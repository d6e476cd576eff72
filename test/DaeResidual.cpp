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
#include "LinearField.hpp"

#include "DaeResidual.hpp"
#include "linalg/DenseMatrix.hpp"
#include "griddae/Exceptions.hpp"

#include <vector>

namespace
{
	griddae::test::LinearField upperTriangularField()
	{
		return griddae::test::LinearField({-1.0, 2.0, 0.0, -3.0}, {1.0, 1.0}, {1.0, 0.0});
	}
}

TEST_CASE("DAE residual is derivative minus vector field", "[DaeResidual]")
{
	const griddae::test::LinearField field = upperTriangularField();
	const griddae::DaeResidual dae(field);
	REQUIRE(dae.numDofs() == 2);

	const double u[] = {1.0, 1.0};
	const double du[] = {0.5, 0.5};
	double res[2];
	dae.residual(0.0, u, du, res);

	// f(u) = (2, -2)
	CHECK(res[0] == griddae::test::RelApprox(-1.5));
	CHECK(res[1] == griddae::test::RelApprox(2.5));
}

TEST_CASE("DAE residual allows derivative and result to alias", "[DaeResidual]")
{
	const griddae::test::LinearField field = upperTriangularField();
	const griddae::DaeResidual dae(field);

	const double u[] = {1.0, 1.0};
	double buf[] = {0.5, 0.5};
	dae.residual(0.0, u, buf, buf);

	CHECK(buf[0] == griddae::test::RelApprox(-1.5));
	CHECK(buf[1] == griddae::test::RelApprox(2.5));
}

TEST_CASE("DAE residual with explicit parameters", "[DaeResidual]")
{
	const griddae::test::LinearField field = upperTriangularField();
	const griddae::DaeResidual dae(field, std::vector<double>{0.0, 0.0});

	const double u[] = {1.0, 1.0};
	const double du[] = {0.0, 0.0};
	double res[2];
	dae.residual(0.0, u, du, res);

	CHECK(res[0] == griddae::test::RelApprox(-1.0));
	CHECK(res[1] == griddae::test::RelApprox(3.0));

	CHECK_THROWS_AS(griddae::DaeResidual(field, std::vector<double>(3, 0.0)), griddae::DimensionError);
}

TEST_CASE("DAE residual Jacobian", "[DaeResidual]")
{
	const griddae::test::LinearField field = upperTriangularField();
	const griddae::DaeResidual dae(field);

	const double u[] = {0.3, -0.7};
	griddae::linalg::DenseMatrix jac(2, 2);
	dae.jacobian(0.0, u, 2.0, jac);

	CHECK(jac.native(0, 0) == griddae::test::RelApprox(3.0));
	CHECK(jac.native(0, 1) == griddae::test::RelApprox(-2.0));
	CHECK(jac.native(1, 0) == 0.0);
	CHECK(jac.native(1, 1) == griddae::test::RelApprox(5.0));
}
