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

#include "nonlin/LevenbergMarquardt.hpp"
#include "griddae/ParameterProvider.hpp"
#include "linalg/DenseMatrix.hpp"
#include "Logging.hpp"

namespace griddae
{

namespace nonlin
{

LevenbergMarquardtSolver::LevenbergMarquardtSolver() : _initDamping(1e-2), _maxIter(100) { }
LevenbergMarquardtSolver::~LevenbergMarquardtSolver() { }

bool LevenbergMarquardtSolver::configure(IParameterProvider& paramProvider)
{
	if (paramProvider.exists("INIT_DAMPING"))
		_initDamping = paramProvider.getDouble("INIT_DAMPING");
	if (paramProvider.exists("MAX_ITERATIONS"))
		_maxIter = paramProvider.getInt("MAX_ITERATIONS");
	return _initDamping > 0.0;
}

bool LevenbergMarquardtSolver::solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
		double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const
{
	const bool success = levenbergMarquardt(residual, jacobian, _maxIter, tol, _initDamping, point, workingMemory, jacMatrix, size);
	LOG(Debug) << name() << (success ? " converged" : " failed");
	return success;
}

} // namespace nonlin

} // namespace griddae
