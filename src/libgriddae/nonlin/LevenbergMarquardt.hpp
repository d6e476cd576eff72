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
 * Provides the Levenberg-Marquardt method for solving nonlinear equation systems
 */

#ifndef LIBGRIDDAE_LEVENBERGMARQUARDT_HPP_
#define LIBGRIDDAE_LEVENBERGMARQUARDT_HPP_

#include "common/CompilerSpecific.hpp"
#include "nonlin/Solver.hpp"

#include <cmath>
#include <functional>
#include <algorithm>
#include <limits>

#include "linalg/DenseMatrix.hpp"
#include "linalg/Norms.hpp"

namespace griddae
{

namespace nonlin
{
	namespace detail
	{
		inline bool checkLevenbergMarquardtConvergence(double trialSumSq, double residualSumSq, double maxGrad, 
			double resTol, double tolOpt, double relFactor)
		{
			if (trialSumSq <= resTol * resTol)
				return true;
			// Gradient vanishes (stationary point of the sum of squares)
			if (maxGrad <= relFactor * tolOpt)
				return true;
			// Stagnating decrease
			if (std::abs(trialSumSq - residualSumSq) <= resTol * residualSumSq)
				return true;

			return false;
		}
	}

	struct VoidLMIterateOutputPolicy
	{
		inline static void outerIteration(unsigned int idxIter, double residualNorm, double const* const res, double const* const x, double const* const dx, double damping, unsigned int size) { }
		inline static void innerIteration(unsigned int idxIter, double residualNorm, double const* const res, double const* const x, double const* const dx, double damping, unsigned int size) { }
	};

	/**
	 * @brief Levenberg-Marquardt method for nonlinear least squares problems
	 * @details Minimizes @f$ \frac{1}{2} \| f(x) \|_2^2 @f$ by solving the damped least squares problems
	 *          @f[ \begin{pmatrix} J_f(x) \\ \sqrt{\lambda} I \end{pmatrix} \Delta x \approx \begin{pmatrix} -f(x) \\ 0 \end{pmatrix} @f]
	 *          and adapting @f$ \lambda @f$ by factors of 10. In contrast to Newton methods, singular
	 *          Jacobians (e.g., rows that vanish identically) are admissible.
	 *          Note that convergence to a stationary point of the sum of squares that is not a root
	 *          is reported as success.
	 * @param [in] residual Function `bool residual(double const* const x, double* const r)`
	 * @param [in] jacobian Function `bool jacobian(double const* const x, linalg::detail::DenseMatrixBase& jac)`
	 * @param [in] maxIter Maximum number of iterations
	 * @param [in] resTol Residual tolerance
	 * @param [in] damping Initial damping factor @f$ \lambda @f$
	 * @param [in,out] point On entry initial point, on exit solution or last iterate
	 * @param [in] workingMemory Working memory of at least 7 * @p size elements
	 * @param [in,out] jacMatrix Matrix for storing the Jacobian
	 * @param [in] size Number of unknowns
	 * @return @c true if the method has converged, otherwise @c false
	 */
	template <typename IterateOutputPolicy = VoidLMIterateOutputPolicy>
	bool levenbergMarquardt(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
		unsigned int maxIter, double resTol, double damping, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size)
	{
		const double dampingMultiplier = 10.0;
		const unsigned int maxTrials = 10;

		double* const residualMem = workingMemory;
		double* const newResidual = workingMemory + size;
		double* const dx = workingMemory + 2 * size; // 2 * size
		double* const trialPoint = workingMemory + 4 * size;
		double* const workspace = workingMemory + 5 * size; // 2 * size

		unsigned int nTrials = 0;
		const double tolOpt = resTol * 1e-4;

		// Upper part is the system Jacobian, lower part the damping
		linalg::DenseMatrix augmentedJac;
		augmentedJac.resize(2 * size, size);

		if (!residual(point, residualMem))
			return false;
		if (!jacobian(point, jacMatrix))
			return false;

		double residualSumSq = linalg::l2NormSquared(residualMem, size);

		// Gradient J^T r
		jacMatrix.transposedMultiplyVector(residualMem, newResidual);
		const double relFactor = std::max(linalg::linfNorm(newResidual, size), std::sqrt(std::numeric_limits<double>::epsilon()));

		IterateOutputPolicy::outerIteration(0, std::sqrt(residualSumSq), residualMem, point, nullptr, damping, size);

		if (detail::checkLevenbergMarquardtConvergence(std::numeric_limits<double>::infinity(), residualSumSq, linalg::linfNorm(newResidual, size), resTol, tolOpt, relFactor))
			return true;

		for (unsigned int kIter = 0; kIter < maxIter; ++kIter)
		{
			augmentedJac.submatrixAssign(jacMatrix, 0, 0, size, size);
			augmentedJac.submatrixSetAll(0.0, size, 0, size, size);

			const double sqrtDamping = std::sqrt(damping);
			for (unsigned int i = 0; i < size; ++i)
			{
				augmentedJac.native(i + size, i) = sqrtDamping;
				dx[i] = -residualMem[i];
				dx[i + size] = 0.0;
			}

			if (!augmentedJac.leastSquaresSolve(dx, workspace, 2 * size))
				return false;

			for (unsigned int i = 0; i < size; ++i)
				trialPoint[i] = point[i] + dx[i];

			if (!residual(trialPoint, newResidual))
				return false;

			const double trialSumSq = linalg::l2NormSquared(newResidual, size);
			if (trialSumSq < residualSumSq)
			{
				std::copy(newResidual, newResidual + size, residualMem);
				std::copy(trialPoint, trialPoint + size, point);

				// Successful steps reduce the damping, Jacobian is always updated at the new point
				if (nTrials == 0)
					damping /= dampingMultiplier;

				if (!jacobian(point, jacMatrix))
					return false;

				jacMatrix.transposedMultiplyVector(residualMem, newResidual);
				const double maxGrad = linalg::linfNorm(newResidual, size);

				IterateOutputPolicy::outerIteration(kIter + 1, std::sqrt(trialSumSq), residualMem, point, dx, damping, size);

				if (detail::checkLevenbergMarquardtConvergence(trialSumSq, residualSumSq, maxGrad, resTol, tolOpt, relFactor))
					return true;

				residualSumSq = trialSumSq;
				nTrials = 0;
			}
			else
			{
				IterateOutputPolicy::innerIteration(kIter + 1, std::sqrt(trialSumSq), newResidual, trialPoint, dx, damping, size);

				damping *= dampingMultiplier;
				++nTrials;

				if (nTrials >= maxTrials)
					break;
			}
		}

		return false;
	}

	/**
	 * @brief Levenberg-Marquardt solver with dense Jacobians
	 */
	class LevenbergMarquardtSolver : public Solver
	{
	public:
		LevenbergMarquardtSolver();
		virtual ~LevenbergMarquardtSolver();

		static const char* identifier() { return "LEVMAR"; }
		virtual const char* name() const { return LevenbergMarquardtSolver::identifier(); }
		virtual bool configure(IParameterProvider& paramProvider);

		virtual unsigned int workspaceSize(unsigned int problemSize) const { return 7 * problemSize; }
		
		virtual unsigned int numTuningParameters() const { return 2; }

		virtual bool solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
			double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const;
	
	protected:
		double _initDamping; //!< Initial damping factor
		unsigned int _maxIter; //!< Maximum number of iterations
	};

} // namespace nonlin

} // namespace griddae

#endif  // LIBGRIDDAE_LEVENBERGMARQUARDT_HPP_
