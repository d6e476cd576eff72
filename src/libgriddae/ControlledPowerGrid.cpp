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

#include "ControlledPowerGrid.hpp"
#include "PowerGrid.hpp"
#include "griddae/Exceptions.hpp"
#include "Logging.hpp"

#include <algorithm>

namespace griddae
{

void ConstantControl::control(double t, double const* u, double const* p, double* out) const
{
	double const* const src = p ? p : _value.data();
	std::copy(src, src + _value.size(), out);
}

void ConstantControl::control(double t, active const* u, double const* p, active* out) const
{
	double const* const src = p ? p : _value.data();
	for (std::size_t i = 0; i < _value.size(); ++i)
		out[i] = src[i];
}

void ConstantControl::control(double t, active const* u, active const* p, active* out) const
{
	if (!p)
	{
		for (std::size_t i = 0; i < _value.size(); ++i)
			out[i] = _value[i];
		return;
	}

	std::copy(p, p + _value.size(), out);
}


ControlledPowerGrid::ControlledPowerGrid(const IControlLaw& control, const PowerGrid& grid) : _control(control), _openLoop(grid)
{
	if (_control.numOutputs() != _openLoop.numParameters())
	{
		throw DimensionError("Control law returns " + std::to_string(_control.numOutputs()) + " values but grid has "
			+ std::to_string(_openLoop.numParameters()) + " parameters");
	}

	const unsigned int n = _openLoop.numDofs();
	std::vector<int> allCols(n);
	for (unsigned int i = 0; i < n; ++i)
		allCols[i] = i;

	for (unsigned int i = 0; i < n; ++i)
		_pattern.pushBackSlice(allCols);

	LOG(Debug) << "Closed-loop grid with " << n << " DOFs and " << _control.numParameters() << " control parameters";
}

ControlledPowerGrid::~ControlledPowerGrid() GRIDDAE_NOEXCEPT { }

void ControlledPowerGrid::evaluate(double t, double const* u, double const* p, double* du) const
{
	std::vector<double> pCont(_control.numOutputs(), 0.0);
	_control.control(t, u, p, pCont.data());
	_openLoop.evaluate(t, u, pCont.data(), du);
}

void ControlledPowerGrid::evaluate(double t, active const* u, double const* p, active* du) const
{
	std::vector<active> pCont(_control.numOutputs());
	_control.control(t, u, p, pCont.data());
	_openLoop.evaluate(t, u, pCont.data(), du);
}

void ControlledPowerGrid::evaluate(double t, active const* u, active const* p, active* du) const
{
	std::vector<active> pCont(_control.numOutputs());
	_control.control(t, u, p, pCont.data());
	_openLoop.evaluate(t, u, pCont.data(), du);
}

} // namespace griddae
