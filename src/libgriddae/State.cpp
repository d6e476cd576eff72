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

#include "State.hpp"
#include "PowerGrid.hpp"
#include "model/NodeModel.hpp"
#include "model/LineModel.hpp"
#include "griddae/Exceptions.hpp"
#include "griddae/ParameterProvider.hpp"

#include <cmath>

namespace griddae
{

PerturbationMode to_perturbationmode(const std::string& mode)
{
	if (mode == "INC")
		return PerturbationMode::Increase;
	if (mode == "DEC")
		return PerturbationMode::Decrease;
	if (mode == "SET")
		return PerturbationMode::Set;

	throw InvalidParameterException("Unknown perturbation mode " + mode + " (expected INC, DEC, or SET)");
}

Perturbation Perturbation::fromParameters(IParameterProvider& paramProvider)
{
	const int node = paramProvider.getInt("NODE");
	if (node < 0)
		throw InvalidParameterException("Perturbation NODE has to be non-negative");

	Perturbation p;
	p.node = static_cast<unsigned int>(node);
	p.variable = paramProvider.getString("VARIABLE");
	p.mode = to_perturbationmode(paramProvider.getString("MODE"));
	p.value = paramProvider.getDouble("VALUE");
	return p;
}

State::State(const PowerGrid& grid, std::vector<double> vec) : _grid(&grid), _vec(std::move(vec))
{
	if (_vec.size() != grid.numDofs())
		throw DimensionError("State vector has " + std::to_string(_vec.size()) + " elements, grid requires " + std::to_string(grid.numDofs()));
}

void State::checkNode(unsigned int node) const
{
	if (node >= _grid->numNodes())
		throw DimensionError("Node index " + std::to_string(node) + " exceeds the " + std::to_string(_grid->numNodes()) + " nodes of the grid");
}

std::vector<double> State::nodeState(unsigned int node) const
{
	checkNode(node);
	return std::vector<double>(_vec.begin() + _grid->offset(node), _vec.begin() + _grid->offset(node + 1));
}

double State::operator()(unsigned int node, const std::string& variable) const
{
	return _vec[_grid->variableIndex(node, variable)];
}

util::Complex<double> State::voltage(unsigned int node) const
{
	checkNode(node);
	if (!_grid->node(node).hasVoltageState())
		throw UnsupportedNodeTypeError(std::string("Node model ") + _grid->node(node).name() + " has no voltage state");

	const unsigned int off = _grid->offset(node);
	return util::Complex<double>(_vec[off], _vec[off + 1]);
}

double State::voltageMagnitude(unsigned int node) const
{
	return util::abs(voltage(node));
}

double State::voltageAngle(unsigned int node) const
{
	const util::Complex<double> u = voltage(node);
	return std::atan2(u.im, u.re);
}

util::Complex<double> State::current(unsigned int node) const
{
	checkNode(node);

	const int n = static_cast<int>(node);
	util::Complex<double> total;
	for (unsigned int l = 0; l < _grid->numLines(); ++l)
	{
		const int src = _grid->lineSource(l);
		const int dst = _grid->lineDestination(l);
		if ((src != n) && (dst != n))
			continue;

		const util::Complex<double> uSrc(_vec[_grid->offset(src)], _vec[_grid->offset(src) + 1]);
		const util::Complex<double> uDst(_vec[_grid->offset(dst)], _vec[_grid->offset(dst) + 1]);

		util::Complex<double> iSrc;
		util::Complex<double> iDst;
		_grid->line(l).currents(uSrc, uDst, iSrc, iDst);

		if (src == n)
			total += iSrc;
		if (dst == n)
			total += iDst;
	}

	return total;
}

util::Complex<double> State::power(unsigned int node) const
{
	return voltage(node) * util::conj(current(node));
}

State State::withPerturbation(const Perturbation& pert) const
{
	checkNode(pert.node);
	const unsigned int idx = _grid->variableIndex(pert.node, pert.variable);

	std::vector<double> vec(_vec);
	switch (pert.mode)
	{
		case PerturbationMode::Increase:
			vec[idx] += pert.value;
			break;
		case PerturbationMode::Decrease:
			vec[idx] -= pert.value;
			break;
		case PerturbationMode::Set:
			vec[idx] = pert.value;
			break;
	}

	return State(*_grid, std::move(vec));
}

} // namespace griddae
