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

#include "nonlin/AdaptiveTrustRegionNewton.hpp"
#include "griddae/ParameterProvider.hpp"
#include "linalg/DenseMatrix.hpp"
#include "Logging.hpp"

namespace griddae
{

namespace nonlin
{

namespace
{
	/**
	 * @brief Reads the tuning parameters shared by both trust region Newton solvers
	 */
	void readTrustRegionParameters(IParameterProvider& paramProvider, double& initDamping, double& minDamping, unsigned int& maxIter)
	{
		if (paramProvider.exists("INIT_DAMPING"))
			initDamping = paramProvider.getDouble("INIT_DAMPING");
		if (paramProvider.exists("MIN_DAMPING"))
			minDamping = paramProvider.getDouble("MIN_DAMPING");
		if (paramProvider.exists("MAX_ITERATIONS"))
			maxIter = paramProvider.getInt("MAX_ITERATIONS");
	}
}

AdaptiveTrustRegionNewtonSolver::AdaptiveTrustRegionNewtonSolver() : _initDamping(1e-2), _minDamping(1e-4), _maxIter(50) { }
AdaptiveTrustRegionNewtonSolver::~AdaptiveTrustRegionNewtonSolver() { }

bool AdaptiveTrustRegionNewtonSolver::configure(IParameterProvider& paramProvider)
{
	readTrustRegionParameters(paramProvider, _initDamping, _minDamping, _maxIter);
	return (_initDamping > 0.0) && (_minDamping > 0.0) && (_minDamping <= _initDamping);
}

bool AdaptiveTrustRegionNewtonSolver::solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
		double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const
{
	double* const scaleFactors = workingMemory + 4 * size;
	const bool success = adaptiveTrustRegionNewtonMethod(residual, [&](double const* const x, double* const y) -> bool {
			if (!jacobian(x, jacMatrix))
				return false;

			jacMatrix.rowScaleFactors(scaleFactors);
			jacMatrix.scaleRows(scaleFactors);

			return jacMatrix.factorize() && jacMatrix.solve(scaleFactors, y);
		},
		_maxIter, tol, _initDamping, _minDamping, point, workingMemory, size);

	LOG(Debug) << name() << (success ? " converged" : " failed");
	return success;
}


RobustAdaptiveTrustRegionNewtonSolver::RobustAdaptiveTrustRegionNewtonSolver() : _initDamping(1e-2), _minDamping(1e-4), _maxIter(50) { }
RobustAdaptiveTrustRegionNewtonSolver::~RobustAdaptiveTrustRegionNewtonSolver() { }

bool RobustAdaptiveTrustRegionNewtonSolver::configure(IParameterProvider& paramProvider)
{
	readTrustRegionParameters(paramProvider, _initDamping, _minDamping, _maxIter);
	return (_initDamping > 0.0) && (_minDamping > 0.0) && (_minDamping <= _initDamping);
}

bool RobustAdaptiveTrustRegionNewtonSolver::solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
		double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const
{
	double* const scaleFactors = workingMemory + 4 * size;
	const bool success = robustAdaptiveTrustRegionNewtonMethod(residual, [&](double const* const x, double* const y) -> bool {
			if (!jacobian(x, jacMatrix))
				return false;

			jacMatrix.rowScaleFactors(scaleFactors);
			jacMatrix.scaleRows(scaleFactors);

			return jacMatrix.factorize() && jacMatrix.solve(scaleFactors, y);
		},
		[&](double* const y) -> bool {
			// Factorization belongs to the row-scaled matrix
			return jacMatrix.solve(scaleFactors, y);
		},
		_maxIter, tol, _initDamping, _minDamping, point, workingMemory, size);

	LOG(Debug) << name() << (success ? " converged" : " failed");
	return success;
}

} // namespace nonlin

} // namespace griddae
