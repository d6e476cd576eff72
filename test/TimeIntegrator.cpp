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
#include "LinearField.hpp"

#include "TimeIntegrator.hpp"
#include "OperationPoint.hpp"
#include "NetworkDynamics.hpp"
#include "State.hpp"
#include "griddae/Exceptions.hpp"

#include <cmath>
#include <vector>

TEST_CASE("Exponential decay", "[TimeIntegrator],[CI]")
{
	const griddae::test::LinearField field({-1.0}, {0.0}, {1.0});
	griddae::TimeIntegrator integrator;
	integrator.setTolerances(1e-10, 1e-8);

	const griddae::Trajectory traj = integrator.integrate(field, std::vector<double>{1.0}, 1.0);
	REQUIRE(traj.numTimePoints() == 101);
	CHECK(traj.numDofs == 1);
	CHECK(traj.time.front() == 0.0);
	CHECK(traj.time.back() == griddae::test::RelApprox(1.0));
	CHECK(traj.state(0)[0] == 1.0);

	CHECK(traj.state(50)[0] == griddae::test::makeApprox(std::exp(-0.5), 1e-5, 1e-8));
	CHECK(traj.finalState()[0] == griddae::test::makeApprox(std::exp(-1.0), 1e-5, 1e-8));
}

TEST_CASE("Solution times are clipped to end time", "[TimeIntegrator]")
{
	const griddae::test::LinearField field({-1.0}, {0.0}, {1.0});
	griddae::TimeIntegrator integrator;
	integrator.setSolutionTimes({0.25, 0.5, 2.0});

	const griddae::Trajectory traj = integrator.integrate(field, std::vector<double>{2.0}, 1.0);
	REQUIRE(traj.numTimePoints() == 3);
	CHECK(traj.time[0] == griddae::test::RelApprox(0.25));
	CHECK(traj.time[1] == griddae::test::RelApprox(0.5));
	CHECK(traj.time[2] == griddae::test::RelApprox(1.0));
	CHECK(traj.state(0)[0] == griddae::test::makeApprox(2.0 * std::exp(-0.25), 1e-4, 1e-7));
}

TEST_CASE("Algebraic constraint is maintained during integration", "[TimeIntegrator],[DAE]")
{
	// x' = -x + y, 0 = 0.5 x - y
	const griddae::test::LinearField field({-1.0, 1.0, 0.5, -1.0}, {0.0, 0.0}, {1.0, 0.0});
	griddae::TimeIntegrator integrator;
	integrator.setTolerances(1e-10, 1e-8);

	SECTION("Consistent initial values")
	{
		const griddae::Trajectory traj = integrator.integrate(field, std::vector<double>{1.0, 0.5}, 2.0);
		for (unsigned int i = 0; i < traj.numTimePoints(); ++i)
		{
			CAPTURE(traj.time[i]);
			CHECK(traj.state(i)[1] == griddae::test::makeApprox(0.5 * traj.state(i)[0], 1e-6, 1e-9));
		}

		CHECK(traj.finalState()[0] == griddae::test::makeApprox(std::exp(-1.0), 1e-5, 1e-8));
	}

	SECTION("Inconsistent algebraic initial value")
	{
		const griddae::Trajectory traj = integrator.integrate(field, std::vector<double>{1.0, 0.0}, 2.0);
		const std::vector<double> uEnd = traj.finalState();
		CHECK(uEnd[0] == griddae::test::makeApprox(std::exp(-1.0), 1e-5, 1e-8));
		CHECK(uEnd[1] == griddae::test::makeApprox(0.5 * std::exp(-1.0), 1e-5, 1e-8));
	}
}

TEST_CASE("Explicit parameters drive integration", "[TimeIntegrator]")
{
	const griddae::test::LinearField field({-1.0}, {0.0}, {1.0});
	const griddae::TimeIntegrator integrator;

	const std::vector<double> p = {1.0};
	const griddae::Trajectory traj = integrator.integrate(field, std::vector<double>{0.0}, 3.0, &p);
	CHECK(traj.finalState()[0] == griddae::test::makeApprox(1.0 - std::exp(-3.0), 1e-4, 1e-7));

	const std::vector<double> wrong = {1.0, 2.0};
	CHECK_THROWS_AS(integrator.integrate(field, std::vector<double>{0.0}, 3.0, &wrong), griddae::DimensionError);
}

TEST_CASE("Steady state of relaxation dynamics", "[TimeIntegrator],[SteadyState]")
{
	const griddae::test::LinearField field({-1.0}, {2.0}, {1.0});

	const std::vector<double> uSteady = griddae::findSteadyState(field, std::vector<double>{0.0}, 100.0, 1e-6);
	REQUIRE(uSteady.size() == 1);
	CHECK(std::abs(uSteady[0] - 2.0) <= 1e-5);

	// Already steady
	const std::vector<double> same = griddae::findSteadyState(field, std::vector<double>{2.0}, 100.0, 1e-6);
	CHECK(same[0] == 2.0);

	CHECK_THROWS_AS(griddae::findSteadyState(field, std::vector<double>{0.0}, 0.1, 1e-10), griddae::IntegrationException);
}

TEST_CASE("Perturbed swing generator returns to operation point", "[TimeIntegrator],[SwingEqLVS],[CI]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::swingGridConfig("SwingEqLVS"));
	const griddae::State op = griddae::findOperationPoint(grid);

	griddae::Perturbation pert;
	pert.node = 1;
	pert.variable = "ω";
	pert.mode = griddae::PerturbationMode::Increase;
	pert.value = 0.01;
	const griddae::State perturbed = op.withPerturbation(pert);

	const griddae::NetworkDynamics nd(grid);
	griddae::TimeIntegrator integrator;
	integrator.setTolerances(1e-8, 1e-6);

	const griddae::Trajectory traj = integrator.integrate(nd, perturbed.vector(), 30.0);
	const griddae::State last(grid, traj.finalState());
	CHECK(std::abs(last(1, "ω")) <= 1e-3);
	CHECK(std::abs(last.voltageMagnitude(1) - 1.0) <= 1e-2);
}

TEST_CASE("Integrator configuration", "[TimeIntegrator],[Config]")
{
	griddae::TimeIntegrator integrator;
	CHECK(integrator.absoluteTolerance() == 1e-8);
	CHECK(integrator.relativeTolerance() == 1e-6);
	CHECK(integrator.maxSteps() == 10000);
	CHECK(integrator.solutionTimes().empty());

	griddae::JsonParameterProvider jpp("{}");
	jpp.set("ABSTOL", 1e-9);
	jpp.set("RELTOL", 1e-7);
	jpp.set("MAX_STEPS", 500);
	jpp.set("SOLUTION_TIMES", std::vector<double>{0.0, 1.0, 2.0});
	integrator.configure(jpp);

	CHECK(integrator.absoluteTolerance() == 1e-9);
	CHECK(integrator.relativeTolerance() == 1e-7);
	CHECK(integrator.maxSteps() == 500);
	CHECK(integrator.solutionTimes().size() == 3);

	SECTION("Non-positive tolerance")
	{
		jpp.set("ABSTOL", 0.0);
		CHECK_THROWS_AS(integrator.configure(jpp), griddae::InvalidParameterException);
	}

	SECTION("Decreasing solution times")
	{
		jpp.set("SOLUTION_TIMES", std::vector<double>{0.0, 2.0, 1.0});
		CHECK_THROWS_AS(integrator.configure(jpp), griddae::InvalidParameterException);
	}

	SECTION("Non-positive step limit")
	{
		jpp.set("MAX_STEPS", 0);
		CHECK_THROWS_AS(integrator.configure(jpp), griddae::InvalidParameterException);
	}
}

TEST_CASE("Integrator rejects invalid input", "[TimeIntegrator]")
{
	const griddae::test::LinearField field({-1.0}, {0.0}, {1.0});
	const griddae::TimeIntegrator integrator;

	CHECK_THROWS_AS(integrator.integrate(field, std::vector<double>{1.0, 2.0}, 1.0), griddae::DimensionError);
	CHECK_THROWS_AS(integrator.integrate(field, std::vector<double>{1.0}, 0.0), griddae::InvalidParameterException);
}
