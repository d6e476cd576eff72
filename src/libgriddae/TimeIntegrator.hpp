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
 * Time integration of grid dynamics with the IDAS DAE solver
 */

#ifndef LIBGRIDDAE_TIMEINTEGRATOR_HPP_
#define LIBGRIDDAE_TIMEINTEGRATOR_HPP_

#include "common/CompilerSpecific.hpp"

#include <vector>

namespace griddae
{

class IVectorField;
class IParameterProvider;

/**
 * @brief Solution of a time integration
 * @details States are stored time-major, i.e., the state at time point @c i starts at
 *          element @c i * numDofs.
 */
struct Trajectory
{
	std::vector<double> time;
	std::vector<double> states;
	unsigned int numDofs;

	inline unsigned int numTimePoints() const GRIDDAE_NOEXCEPT { return time.size(); }
	inline double const* state(unsigned int i) const { return states.data() + i * numDofs; }
	inline std::vector<double> finalState() const { return std::vector<double>(states.end() - numDofs, states.end()); }
};

/**
 * @brief Integrates the implicit form @f$ \dot{u} - f(u, p, t) = 0 @f$ of a vector field
 * @details Algebraic variables are marked by a zero mass matrix entry. Inconsistent
 *          algebraic variables of the initial state are corrected by IDAS before the
 *          first step. The iteration matrix is computed by automatic differentiation.
 */
class TimeIntegrator
{
public:
	TimeIntegrator();

	/**
	 * @brief Reads @c ABSTOL, @c RELTOL, @c MAX_STEPS, and @c SOLUTION_TIMES from the current scope
	 * @details All fields are optional.
	 * @param [in] paramProvider Parameter provider
	 */
	void configure(IParameterProvider& paramProvider);

	inline void setTolerances(double absTol, double relTol) GRIDDAE_NOEXCEPT { _absTol = absTol; _relTol = relTol; }
	inline void setMaxSteps(int maxSteps) GRIDDAE_NOEXCEPT { _maxSteps = maxSteps; }

	/**
	 * @brief Sets the time points at which the solution is stored
	 * @details If empty, @c 101 equidistant time points are used.
	 * @param [in] times Strictly increasing non-negative time points
	 */
	void setSolutionTimes(const std::vector<double>& times);

	inline double absoluteTolerance() const GRIDDAE_NOEXCEPT { return _absTol; }
	inline double relativeTolerance() const GRIDDAE_NOEXCEPT { return _relTol; }
	inline int maxSteps() const GRIDDAE_NOEXCEPT { return _maxSteps; }
	inline const std::vector<double>& solutionTimes() const GRIDDAE_NOEXCEPT { return _solutionTimes; }

	/**
	 * @brief Integrates from @c t = 0 to @p tEnd
	 * @param [in] field Vector field
	 * @param [in] u0 Initial state
	 * @param [in] tEnd End time
	 * @param [in] p Parameters or @c nullptr for the default parameters of the field
	 * @return Solution at the configured time points within @c [0, tEnd]
	 * @throw IntegrationException if IDAS fails
	 */
	Trajectory integrate(const IVectorField& field, const std::vector<double>& u0, double tEnd, std::vector<double> const* p = nullptr) const;

	/**
	 * @brief Integrates until the time derivative vanishes
	 * @param [in] field Vector field
	 * @param [in] u0 Initial state
	 * @param [in] tMax Maximum integration time
	 * @param [in] tol Tolerance for the maximum norm of @f$ f(u) @f$
	 * @return Dynamic steady state
	 * @throw IntegrationException if IDAS fails or no steady state is reached before @p tMax
	 */
	std::vector<double> steadyState(const IVectorField& field, const std::vector<double>& u0, double tMax, double tol) const;

protected:
	double _absTol;
	double _relTol;
	int _maxSteps;
	std::vector<double> _solutionTimes;
};

/**
 * @brief Integrates a vector field with default settings until its derivative vanishes
 * @sa TimeIntegrator::steadyState()
 */
std::vector<double> findSteadyState(const IVectorField& field, const std::vector<double>& u0, double tMax, double tol);

} // namespace griddae

#endif  // LIBGRIDDAE_TIMEINTEGRATOR_HPP_
