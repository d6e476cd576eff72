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

#include "ControlledPowerGrid.hpp"
#include "NetworkDynamics.hpp"
#include "Jacobian.hpp"
#include "linalg/DenseMatrix.hpp"
#include "griddae/Exceptions.hpp"

#include <vector>

namespace
{
	/**
	 * @brief Proportional frequency control of the mechanical power of one swing node
	 * @details Outputs the open-loop parameters with @f$ P = P_0 - k \omega @f$ at the given slot.
	 */
	class DroopControl : public griddae::IControlLaw
	{
	public:
		DroopControl(const std::vector<double>& openLoopParams, unsigned int slotP, unsigned int idxOmega)
			: _base(openLoopParams), _slot(slotP), _omega(idxOmega), _params(1, 2.0) { }

		virtual unsigned int numParameters() const GRIDDAE_NOEXCEPT { return 1; }
		virtual unsigned int numOutputs() const GRIDDAE_NOEXCEPT { return _base.size(); }
		virtual const std::vector<double>& defaultParameters() const GRIDDAE_NOEXCEPT { return _params; }

		virtual void control(double t, double const* u, double const* p, double* out) const { controlImpl(u, p ? p : _params.data(), out); }
		virtual void control(double t, griddae::active const* u, double const* p, griddae::active* out) const { controlImpl(u, p ? p : _params.data(), out); }
		virtual void control(double t, griddae::active const* u, griddae::active const* p, griddae::active* out) const
		{
			if (p)
				controlImpl(u, p, out);
			else
				controlImpl(u, _params.data(), out);
		}

	protected:
		std::vector<double> _base;
		unsigned int _slot;
		unsigned int _omega;
		std::vector<double> _params;

		template <typename StateType, typename ParamType>
		void controlImpl(StateType const* u, ParamType const* p, StateType* out) const
		{
			for (std::size_t i = 0; i < _base.size(); ++i)
				out[i] = _base[i];
			out[_slot] = _base[_slot] - p[0] * u[_omega];
		}
	};
}

TEST_CASE("Constant control reproduces open loop dynamics", "[ControlledPowerGrid]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::swingGridConfig("SwingEqLVS"));
	const griddae::NetworkDynamics openLoop(grid);

	const griddae::ConstantControl control(openLoop.defaultParameters());
	const griddae::ControlledPowerGrid closedLoop(control, grid);

	CHECK(closedLoop.numDofs() == openLoop.numDofs());
	CHECK(closedLoop.numParameters() == openLoop.numParameters());
	CHECK(closedLoop.massMatrix() == openLoop.massMatrix());
	CHECK(closedLoop.variableNames() == openLoop.variableNames());

	const std::vector<double> u = {1.0, 0.0, 0.99, 0.04, 0.2, 0.97, -0.02};
	CHECK(closedLoop.rhs(0.0, u) == openLoop.rhs(0.0, u));

	// Parameters of a constant control law are the open-loop parameters
	std::vector<double> p = openLoop.defaultParameters();
	p[2] = 0.4;
	CHECK(closedLoop.rhs(0.0, u, p) == openLoop.rhs(0.0, u, p));
}

TEST_CASE("State dependent control changes dynamics", "[ControlledPowerGrid]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::swingGridConfig("SwingEqLVS"));
	const griddae::NetworkDynamics openLoop(grid);

	const unsigned int slotP = grid.parameterOffset(1);
	const unsigned int idxOmega = grid.variableIndex(1, "ω");
	const DroopControl control(openLoop.defaultParameters(), slotP, idxOmega);
	const griddae::ControlledPowerGrid closedLoop(control, grid);

	REQUIRE(closedLoop.numParameters() == 1);

	std::vector<double> u = {1.0, 0.0, 0.99, 0.04, 0.0, 0.97, -0.02};
	CHECK(closedLoop.rhs(0.0, u) == openLoop.rhs(0.0, u));

	u[idxOmega] = 0.1;
	const std::vector<double> fOpen = openLoop.rhs(0.0, u);
	const std::vector<double> fClosed = closedLoop.rhs(0.0, u);

	// Inertia scaling 2 pi Omega / H = 100 pi with H = 1, OMEGA = 50
	const double scaling = 2.0 * 3.14159265358979323846 * 50.0;
	CHECK(fClosed[idxOmega] == griddae::test::RelApprox(fOpen[idxOmega] - 2.0 * 0.1 * scaling));
	CHECK(fClosed[0] == fOpen[0]);

	// Control gain enters Jacobian through the frequency column
	griddae::linalg::DenseMatrix jOpen(7, 7);
	griddae::linalg::DenseMatrix jClosed(7, 7);
	griddae::denseJacobian(openLoop, 0.0, u.data(), nullptr, jOpen);
	griddae::denseJacobian(closedLoop, 0.0, u.data(), nullptr, jClosed);
	CHECK(jClosed.native(idxOmega, idxOmega) == griddae::test::RelApprox(jOpen.native(idxOmega, idxOmega) - 2.0 * scaling));
}

TEST_CASE("Control law output size has to match grid parameters", "[ControlledPowerGrid]")
{
	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, griddae::test::threeNodeLoadGridConfig());

	const griddae::ConstantControl control(std::vector<double>(3, 0.0));
	CHECK_THROWS_AS(griddae::ControlledPowerGrid(control, grid), griddae::DimensionError);
}
