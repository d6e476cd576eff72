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
 * Provides a unified interface for nonlinear equation solvers
 */

#ifndef LIBGRIDDAE_NONLINGENERALSOLVER_HPP_
#define LIBGRIDDAE_NONLINGENERALSOLVER_HPP_

#include <functional>
#include <string>

namespace griddae
{

class IParameterProvider;

namespace linalg
{
	namespace detail
	{
		class DenseMatrixBase;
	}
}

namespace nonlin
{

	/**
	 * @brief General interface for all nonlinear equation solvers
	 * @details Solves nonlinear equations @f$ F(x) = 0 @f$, where @f$ F\colon \mathbb{R}^n \to \mathbb{R}^n @f$
	 *          and the Jacobian @f$ J_F(x) @f$ is available as dense matrix.
	 */
	class Solver
	{
	public:
		Solver() { }
		virtual ~Solver() { }

		/**
		 * @brief Returns the name of the nonlinear solver
		 * @details This name is also used to identify and create the nonlinear solver in the factory.
		 * @return Name of the nonlinear equation solver
		 */
		virtual const char* name() const = 0;

		/**
		 * @brief Configures the solver by extracting all parameters from the given @p paramProvider
		 * @details The scope of the griddae::IParameterProvider is left unchanged on return.
		 *          Parameters that are not provided keep their current values.
		 * @param [in] paramProvider Parameter provider
		 * @return @c true if the configuration was successful, otherwise @c false
		 */
		virtual bool configure(IParameterProvider& paramProvider) = 0;

		/**
		 * @brief Returns the required amount of working memory (doubles) for a given problem size
		 * @param [in] problemSize Number of unknowns of the problem
		 * @return Number of required doubles (working memory)
		 */
		virtual unsigned int workspaceSize(unsigned int problemSize) const = 0;

		virtual unsigned int numTuningParameters() const = 0;

		/**
		 * @brief Solves the nonlinear equation system
		 * @param [in] residual Function `bool residual(double const* const x, double* const r)` writing
		 *             @f$ F(x) @f$ into @p r. Returning @c false aborts the solver with failure.
		 * @param [in] jacobian Function `bool jacobian(double const* const x, linalg::detail::DenseMatrixBase& jac)`
		 *             assembling @f$ J_F(x) @f$. Returning @c false aborts the solver with failure.
		 * @param [in] tol Error tolerance used as termination criterion
		 * @param [in,out] point On entry initial guess, on exit solution or last iterate
		 * @param [in] workingMemory Additional memory, size is given by workspaceSize() function
		 * @param [in,out] jacMatrix Dense matrix used for storing and solving the linear systems
		 * @param [in] size Size of the problem
		 * @return @c true if a solution meeting the tolerance was found, @c false otherwise
		 */
		virtual bool solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
			double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const = 0;
	};

	/**
	 * @brief Creates solvers with the given @p name
	 * @details If a solver with the requested @p name does not exist, the default solver is returned.
	 *          The default solver is a composite of the error-oriented trust region Newton method
	 *          followed by the Levenberg-Marquardt method.
	 * @param [in] name Name of the solver
	 * @return The requested solver (owned by the caller)
	 */
	Solver* createSolver(const std::string& name);

} // namespace nonlin

} // namespace griddae

#endif  // LIBGRIDDAE_NONLINGENERALSOLVER_HPP_
