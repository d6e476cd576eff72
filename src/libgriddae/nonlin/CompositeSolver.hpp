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
 * Chains several nonlinear solvers and stops at the first one that succeeds
 */

#ifndef LIBGRIDDAE_COMPOSITESOLVER_HPP_
#define LIBGRIDDAE_COMPOSITESOLVER_HPP_

#include "nonlin/Solver.hpp"

#include <vector>

namespace griddae
{

namespace nonlin
{

	/**
	 * @brief Tries its subsolvers in order until one of them converges
	 * @details Every subsolver starts from the initial point that was passed to solve(), failed
	 *          attempts do not leak their last iterate into the next attempt.
	 *          The subsolvers are owned by the CompositeSolver.
	 */
	class CompositeSolver : public Solver
	{
	public:
		CompositeSolver();
		virtual ~CompositeSolver();

		static const char* identifier() { return "COMPOSITE"; }
		virtual const char* name() const { return CompositeSolver::identifier(); }
		virtual bool configure(IParameterProvider& paramProvider);

		virtual unsigned int workspaceSize(unsigned int problemSize) const;
		virtual unsigned int numTuningParameters() const;

		virtual bool solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
			double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const;

		/**
		 * @brief Appends a subsolver and takes ownership of it
		 * @param [in] solver Subsolver, @c nullptr is ignored
		 */
		void addSubsolver(Solver* const solver);

		inline unsigned int numSubsolvers() const { return _solvers.size(); }

	protected:
		std::vector<Solver*> _solvers;
	};

} // namespace nonlin

} // namespace griddae

#endif  // LIBGRIDDAE_COMPOSITESOLVER_HPP_
