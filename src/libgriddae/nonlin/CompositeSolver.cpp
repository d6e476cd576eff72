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

#include "nonlin/CompositeSolver.hpp"
#include "griddae/ParameterProvider.hpp"
#include "Logging.hpp"

#include <string>
#include <algorithm>

namespace griddae
{

namespace nonlin
{

CompositeSolver::CompositeSolver() { }
CompositeSolver::~CompositeSolver()
{
	for (Solver* s : _solvers)
		delete s;
}

bool CompositeSolver::configure(IParameterProvider& paramProvider)
{
	if (paramProvider.exists("SUBSOLVERS"))
	{
		for (Solver* s : _solvers)
			delete s;
		_solvers.clear();

		const std::vector<std::string> subSolvers = paramProvider.getStringArray("SUBSOLVERS");
		for (const std::string& subName : subSolvers)
		{
			// Unknown names and nested composites resolve to the default chain
			Solver* const s = createSolver(subName);
			if (std::string(s->name()) == CompositeSolver::identifier())
			{
				LOG(Error) << "Unknown or nested nonlinear subsolver " << subName;
				delete s;
				return false;
			}

			addSubsolver(s);
		}
	}

	bool success = true;
	for (Solver* s : _solvers)
		success = s->configure(paramProvider) && success;

	return success && !_solvers.empty();
}

bool CompositeSolver::solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
		double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const
{
	const std::vector<double> start(point, point + size);

	for (Solver* s : _solvers)
	{
		std::copy(start.begin(), start.end(), point);
		if (s->solve(residual, jacobian, tol, point, workingMemory, jacMatrix, size))
			return true;

		LOG(Debug) << "Subsolver " << s->name() << " failed, trying next";
	}

	return false;
}

unsigned int CompositeSolver::workspaceSize(unsigned int problemSize) const
{
	unsigned int ws = 0;
	for (Solver* s : _solvers)
		ws = std::max(ws, s->workspaceSize(problemSize));
	return ws;
}
		
unsigned int CompositeSolver::numTuningParameters() const
{
	unsigned int ntp = 0;
	for (Solver* s : _solvers)
		ntp += s->numTuningParameters();
	return ntp;
}

void CompositeSolver::addSubsolver(Solver* const solver)
{
	if (solver)
		_solvers.push_back(solver);
}

} // namespace nonlin

} // namespace griddae
