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

/**
 * @file 
 * Provides adaptive trust-region Newton methods for solving nonlinear equation systems
 */

#ifndef LIBGRIDDAE_ADAPTRUSTNEWTON_HPP_
#define LIBGRIDDAE_ADAPTRUSTNEWTON_HPP_

#include "common/CompilerSpecific.hpp"
#include "nonlin/Solver.hpp"

#include <cmath>
#include <functional>
#include <algorithm>

#include "MathUtil.hpp"
#include "linalg/Norms.hpp"

namespace griddae
{

namespace nonlin
{

	/**
	 * @brief Iterate output policy that discards all information
	 */
	struct VoidNewtonIterateOutputPolicy
	{
		inline static void outerIteration(unsigned int idxIter, double residualNorm, double const* const res, double const* const x, double const* const dx, unsigned int size) { }
		inline static void innerIteration(unsigned int idxIter, double residualNorm, double const* const res, double const* const x, double const* const dx, double damping, double mu, unsigned int size) { }
	};

	/**
	 * @brief Residual based adaptive trust-region Newton method (affine contravariant)
	 * @details Adaptively damped Newton method for @f$ f(x) = 0 @f$ with global convergence based on
	 *          residual monotonicity (Deuflhard, Newton Methods for Nonlinear Problems, NLEQ-RES).
	 *          Iteration stops successfully if @f$ \| f(x) \|_2 \leq @f$ @p resTol.
	 *          
	 *          The linear systems @f$ J_f(x) \Delta x = f(x) @f$ are solved by @p jacobianSolver which
	 *          returns the solution in-place. Note that the sign of the Newton step is handled here.
	 *          
	 *          Suggested values for ( @p damping, @p minDamping ): ( 1.0, 1e-4 ) for mildly nonlinear,
	 *          ( 1e-2, 1e-4 ) for highly nonlinear, and ( 1e-4, 1e-8 ) for extremely nonlinear problems.
	 * 
	 * @param [in] residual Function `bool residual(double const* const x, double* const r)`
	 * @param [in] jacobianSolver Function `bool jacobianSolver(double const* const x, double* const r)`
	 * @param [in] maxIter Maximum number of iterations
	 * @param [in] resTol Residual tolerance
	 * @param [in] damping Initial damping factor
	 * @param [in] minDamping Minimal damping factor
	 * @param [in,out] point On entry initial point, on exit solution or last iterate
	 * @param [in] workingMemory Working memory of at least 4 * @p size elements
	 * @param [in] size Number of unknowns
	 * @tparam IterateOutputPolicy Receives information on each iteration
	 * @return @c true if the method has converged, otherwise @c false
	 */
	template <typename IterateOutputPolicy = VoidNewtonIterateOutputPolicy>
	bool adaptiveTrustRegionNewtonMethod(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, double* const)> jacobianSolver,
		unsigned int maxIter, double resTol, double damping, double minDamping, double* const point, double* const workingMemory, unsigned int size)
	{
		double mu = 0.0;
		double lastResidualNorm = 0.0;

		double* const residualMem = workingMemory;
		double* const dx = workingMemory + size;
		double* const trialPoint = workingMemory + 2 * size;
		double* const lastResidual = workingMemory + 3 * size;

		if (!residual(point, lastResidual))
			return false;

		std::copy(lastResidual, lastResidual + size, dx);

		double residualNorm = linalg::l2Norm(lastResidual, size);

		IterateOutputPolicy::outerIteration(0, residualNorm, lastResidual, point, nullptr, size);

		for (unsigned int kIter = 0; kIter < maxIter; ++kIter)
		{
			if (residualNorm <= resTol)
				return true;

			// Solve J * dx = f(x), the minus sign is applied when updating the point
			if (!jacobianSolver(point, dx))
				return false;

			if (kIter > 0)
			{
				// Predict damping factor
				mu *= lastResidualNorm / residualNorm;
				damping = std::min(1.0, mu);
			}

			lastResidualNorm = residualNorm;

			// Line search, abort on failed regularity test
			while (damping >= minDamping)
			{
				for (unsigned int i = 0; i < size; ++i)
					trialPoint[i] = point[i] - damping * dx[i];

				if (!residual(trialPoint, residualMem))
					return false;

				residualNorm = linalg::l2Norm(residualMem, size);

				IterateOutputPolicy::innerIteration(kIter + 1, residualNorm, residualMem, trialPoint, dx, damping, mu, size);

				const double theta = residualNorm / lastResidualNorm;

				mu = 0.0;
				const double factor = 1.0 - damping;
				for (unsigned int i = 0; i < size; ++i)
					mu += sqr(residualMem[i] - factor * lastResidual[i]);
				mu = 0.5 * lastResidualNorm * damping * damping / std::sqrt(mu);

				if (!std::isfinite(theta) || (theta >= 1.0))
				{
					damping = std::min(mu, 0.5 * damping);
					continue;
				}

				const double dampingNew = std::min(1.0, mu);
				if (dampingNew >= 4.0 * damping)
				{
					damping = dampingNew;
					continue;
				}

				break;
			}

			if (damping < minDamping)
				return false;

			IterateOutputPolicy::outerIteration(kIter + 1, residualNorm, residualMem, trialPoint, dx, size);

			std::copy(trialPoint, trialPoint + size, point);
			std::copy(residualMem, residualMem + size, lastResidual);
			std::copy(residualMem, residualMem + size, dx);
		}

		return residualNorm <= resTol;
	}

	/**
	 * @brief Error based adaptive trust-region Newton method (affine covariant)
	 * @details Adaptively damped Newton method for @f$ f(x) = 0 @f$ based on monotonicity of the
	 *          simplified Newton correction (Deuflhard, NLEQ-ERR). Iteration stops successfully if
	 *          the norm of the Newton correction @f$ \| J_f(x)^{-1} f(x) \|_2 @f$ drops below @p errTol.
	 *          
	 *          The Jacobian is factorized once per outer iteration by @p jacobianSolver, further right
	 *          hand sides at trial points are solved by @p jacobianResolver with the same factorization.
	 * 
	 * @param [in] residual Function `bool residual(double const* const x, double* const r)`
	 * @param [in] jacobianSolver Function `bool jacobianSolver(double const* const x, double* const r)`
	 * @param [in] jacobianResolver Function `bool jacobianResolver(double* const r)`
	 * @param [in] maxIter Maximum number of iterations
	 * @param [in] errTol Error tolerance
	 * @param [in] damping Initial damping factor
	 * @param [in] minDamping Minimal damping factor
	 * @param [in,out] point On entry initial point, on exit solution or last iterate
	 * @param [in] workingMemory Working memory of at least 4 * @p size elements
	 * @param [in] size Number of unknowns
	 * @tparam IterateOutputPolicy Receives information on each iteration
	 * @return @c true if the method has converged, otherwise @c false
	 */
	template <typename IterateOutputPolicy = VoidNewtonIterateOutputPolicy>
	bool robustAdaptiveTrustRegionNewtonMethod(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, double* const)> jacobianSolver,
		std::function<bool(double* const)> jacobianResolver, unsigned int maxIter, double errTol, double damping, double minDamping, double* const point, 
		double* const workingMemory, unsigned int size)
	{
		double mu = 0.0;

		double* const dx = workingMemory;
		double* const trialPoint = workingMemory + size;
		double* const lastDxBar = workingMemory + 2 * size;
		double* const lastResidual = workingMemory + 3 * size;

		if (!residual(point, dx))
			return false;

		double errNorm = 0.0;
		double lastErrNorm = 0.0;
		double errNormTrial = 0.0;

		for (unsigned int kIter = 0; kIter < maxIter; ++kIter)
		{
			// Solve J * dx = f(x), the minus sign is applied when updating the point
			if (!jacobianSolver(point, dx))
				return false;

			lastErrNorm = errNorm;
			errNorm = linalg::l2Norm(dx, size);

			IterateOutputPolicy::outerIteration(kIter, errNorm, dx, point, dx, size);

			if (errNorm <= errTol)
			{
				for (unsigned int i = 0; i < size; ++i)
					point[i] -= dx[i];
				return true;
			}

			if (kIter > 0)
			{
				// Predict damping factor
				mu = 0.0;
				for (unsigned int i = 0; i < size; ++i)
					mu += sqr(lastDxBar[i] - dx[i]);
				mu = (lastErrNorm * errNormTrial) / (std::sqrt(mu) * errNorm) * damping;

				damping = std::min(1.0, mu);
			}

			// Line search, abort on failed regularity test
			while (damping >= minDamping)
			{
				for (unsigned int i = 0; i < size; ++i)
					trialPoint[i] = point[i] - damping * dx[i];

				if (!residual(trialPoint, lastResidual))
					return false;

				// Simplified Newton correction at the trial point
				std::copy(lastResidual, lastResidual + size, lastDxBar);
				if (!jacobianResolver(lastDxBar))
					return false;

				errNormTrial = linalg::l2Norm(lastDxBar, size);
				const double theta = errNormTrial / errNorm;

				IterateOutputPolicy::innerIteration(kIter + 1, errNormTrial, lastDxBar, trialPoint, dx, damping, mu, size);

				mu = 0.0;
				const double factor = 1.0 - damping;
				for (unsigned int i = 0; i < size; ++i)
					mu += sqr(lastDxBar[i] - factor * dx[i]);
				mu = 0.5 * errNorm * damping * damping / std::sqrt(mu);

				if (!std::isfinite(theta) || (theta >= 1.0))
				{
					damping = std::min(mu, 0.5 * damping);
					continue;
				}

				const double dampingNew = std::min(1.0, mu);

				if ((damping == 1.0) && (dampingNew == 1.0) && (errNormTrial <= errTol))
				{
					for (unsigned int i = 0; i < size; ++i)
						point[i] = trialPoint[i] - lastDxBar[i];
					return true;
				}

				if (dampingNew >= 4.0 * damping)
				{
					damping = dampingNew;
					continue;
				}

				break;
			}

			if (damping < minDamping)
				return false;

			std::copy(trialPoint, trialPoint + size, point);
			std::copy(lastResidual, lastResidual + size, dx);
		}

		return false;
	}

	/**
	 * @brief Residual based adaptive trust-region Newton solver with dense Jacobians
	 */
	class AdaptiveTrustRegionNewtonSolver : public Solver
	{
	public:
		AdaptiveTrustRegionNewtonSolver();
		virtual ~AdaptiveTrustRegionNewtonSolver();

		static const char* identifier() { return "ATRN_RES"; }
		virtual const char* name() const { return AdaptiveTrustRegionNewtonSolver::identifier(); }
		virtual bool configure(IParameterProvider& paramProvider);

		virtual unsigned int workspaceSize(unsigned int problemSize) const
		{
			// Method requires 4 * problemSize, row scaling factors take another problemSize
			return 5 * problemSize;
		}
		
		virtual unsigned int numTuningParameters() const { return 3; }

		virtual bool solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
			double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const;
	
	protected:
		double _initDamping; //!< Initial damping factor
		double _minDamping; //!< Minimal damping factor
		unsigned int _maxIter; //!< Maximum number of iterations
	};

	/**
	 * @brief Error based adaptive trust-region Newton solver with dense Jacobians
	 */
	class RobustAdaptiveTrustRegionNewtonSolver : public Solver
	{
	public:
		RobustAdaptiveTrustRegionNewtonSolver();
		virtual ~RobustAdaptiveTrustRegionNewtonSolver();

		static const char* identifier() { return "ATRN_ERR"; }
		virtual const char* name() const { return RobustAdaptiveTrustRegionNewtonSolver::identifier(); }
		virtual bool configure(IParameterProvider& paramProvider);

		virtual unsigned int workspaceSize(unsigned int problemSize) const
		{
			return 5 * problemSize;
		}
		
		virtual unsigned int numTuningParameters() const { return 3; }

		virtual bool solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
			double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const;
	
	protected:
		double _initDamping; //!< Initial damping factor
		double _minDamping; //!< Minimum damping factor
		unsigned int _maxIter; //!< Maximum number of iterations
	};

} // namespace nonlin

} // namespace griddae

#endif  // LIBGRIDDAE_ADAPTRUSTNEWTON_HPP_
