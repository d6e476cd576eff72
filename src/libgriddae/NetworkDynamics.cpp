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

#include "NetworkDynamics.hpp"
#include "PowerGrid.hpp"
#include "model/NodeModel.hpp"
#include "model/LineModel.hpp"
#include "graph/GraphAlgos.hpp"
#include "ComplexArithmetic.hpp"
#include "ParallelSupport.hpp"
#include "Logging.hpp"

#include <algorithm>

namespace griddae
{

NetworkDynamics::NetworkDynamics(const PowerGrid& grid) : _grid(grid), _defaultParams(grid.defaultParameters())
{
	const unsigned int nNodes = grid.numNodes();

	_massMatrix.reserve(grid.numDofs());
	_varNames.reserve(grid.numDofs());
	for (unsigned int n = 0; n < nNodes; ++n)
	{
		const model::INodeModel& node = grid.node(n);
		for (unsigned int i = 0; i < node.numDofs(); ++i)
		{
			_massMatrix.push_back(node.isDifferential(i) ? 1.0 : 0.0);
			_varNames.push_back(std::string(node.variableName(i)) + "_" + std::to_string(n));
		}
	}

	_incidence = graph::incidenceListFromConnectionList(grid.connections(), nNodes, grid.numLines());

	// Rows of a node depend on its own block and on the voltages of its neighbors
	const util::SlicedVector<int> adj = graph::adjacencyListFromConnectionList(grid.connections(), nNodes, grid.numLines());
	std::vector<int> cols;
	for (unsigned int n = 0; n < nNodes; ++n)
	{
		cols.clear();
		for (unsigned int i = grid.offset(n); i < grid.offset(n + 1); ++i)
			cols.push_back(i);

		for (int const* m = adj.begin(n); m != adj.end(n); ++m)
		{
			cols.push_back(grid.offset(*m));
			cols.push_back(grid.offset(*m) + 1);
		}

		std::sort(cols.begin(), cols.end());

		for (unsigned int i = grid.offset(n); i < grid.offset(n + 1); ++i)
			_pattern.pushBackSlice(cols);
	}

	LOG(Debug) << "Assembled grid with " << nNodes << " nodes, " << grid.numLines() << " lines, " << _massMatrix.size() << " variables, "
		<< _pattern.size() << " Jacobian nonzeros";
}

NetworkDynamics::~NetworkDynamics() GRIDDAE_NOEXCEPT { }

void NetworkDynamics::evaluate(double t, double const* u, double const* p, double* du) const
{
	evaluateImpl<double, double, double>(t, u, p ? p : _defaultParams.data(), du);
}

void NetworkDynamics::evaluate(double t, active const* u, double const* p, active* du) const
{
	evaluateImpl<active, double, active>(t, u, p ? p : _defaultParams.data(), du);
}

void NetworkDynamics::evaluate(double t, active const* u, active const* p, active* du) const
{
	if (p)
		evaluateImpl<active, active, active>(t, u, p, du);
	else
		evaluateImpl<active, double, active>(t, u, _defaultParams.data(), du);
}

template <typename StateType, typename ParamType, typename ResultType>
void NetworkDynamics::evaluateImpl(double t, StateType const* u, ParamType const* p, ResultType* du) const
{
	const std::size_t nLines = _grid.numLines();
	const std::size_t nNodes = _grid.numNodes();

	// Current drawn from source (2l) and destination (2l+1) of each line
	std::vector<util::Complex<StateType>> lineCurrents(2 * nLines);

#ifdef GRIDDAE_PARALLELIZE
	tbb::parallel_for(std::size_t(0), nLines, [&](std::size_t l)
#else
	for (std::size_t l = 0; l < nLines; ++l)
#endif
	{
		const unsigned int offSrc = _grid.offset(_grid.lineSource(l));
		const unsigned int offDst = _grid.offset(_grid.lineDestination(l));
		const util::Complex<StateType> uSrc(u[offSrc], u[offSrc + 1]);
		const util::Complex<StateType> uDst(u[offDst], u[offDst + 1]);

		_grid.line(l).currents(uSrc, uDst, lineCurrents[2 * l], lineCurrents[2 * l + 1]);
	} GRIDDAE_PARFOR_END;

#ifdef GRIDDAE_PARALLELIZE
	tbb::parallel_for(std::size_t(0), nNodes, [&](std::size_t n)
#else
	for (std::size_t n = 0; n < nNodes; ++n)
#endif
	{
		const int node = static_cast<int>(n);
		util::Complex<StateType> current;
		for (int const* l = _incidence.begin(n); l != _incidence.end(n); ++l)
		{
			if (_grid.lineSource(*l) == node)
				current += lineCurrents[2 * (*l)];
			if (_grid.lineDestination(*l) == node)
				current += lineCurrents[2 * (*l) + 1];
		}

		const unsigned int off = _grid.offset(n);
		_grid.node(n).dynamics(t, u + off, current, p + _grid.parameterOffset(n), du + off);
	} GRIDDAE_PARFOR_END;
}

} // namespace griddae
