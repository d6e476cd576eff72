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
 * Defines the interface of vector fields with mass matrix
 */

#ifndef LIBGRIDDAE_VECTORFIELD_HPP_
#define LIBGRIDDAE_VECTORFIELD_HPP_

#include "common/CompilerSpecific.hpp"
#include "AutoDiff.hpp"
#include "SlicedVector.hpp"

#include <string>
#include <vector>

namespace griddae
{

/**
 * @brief Right hand side of a (differential-algebraic) system @f$ M \dot{u} = f(u, p, t) @f$
 * @details The mass matrix @f$ M @f$ is diagonal with entries @c 1 (differential variable)
 *          and @c 0 (algebraic variable). Evaluation is free of side effects and may be
 *          called concurrently.
 */
class IVectorField
{
public:
	virtual ~IVectorField() GRIDDAE_NOEXCEPT { }

	/**
	 * @brief Returns the length of the state vector
	 */
	virtual unsigned int numDofs() const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Returns the length of the parameter vector
	 */
	virtual unsigned int numParameters() const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Returns the parameter vector used when @c nullptr is passed as parameters
	 */
	virtual const std::vector<double>& defaultParameters() const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Returns the diagonal of the mass matrix
	 */
	virtual const std::vector<double>& massMatrix() const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Returns the name of each state variable
	 */
	virtual const std::vector<std::string>& variableNames() const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Returns the structural nonzeros of the Jacobian @f$ \partial f / \partial u @f$
	 * @details Slice @c r contains the column indices of row @c r in ascending order.
	 */
	virtual const util::SlicedVector<int>& sparsityPattern() const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Evaluates the vector field
	 * @param [in] t Time point
	 * @param [in] u State vector
	 * @param [in] p Parameter vector or @c nullptr for the default parameters
	 * @param [out] du Value of the vector field
	 */
	virtual void evaluate(double t, double const* u, double const* p, double* du) const = 0;
	virtual void evaluate(double t, active const* u, double const* p, active* du) const = 0;
	virtual void evaluate(double t, active const* u, active const* p, active* du) const = 0;

	/**
	 * @brief Returns whether each state variable is differential
	 * @details A variable is differential if and only if its mass matrix entry equals @c 1.
	 */
	std::vector<bool> differentialVariables() const;

	/**
	 * @brief Evaluates the vector field with checked vector lengths
	 * @param [in] t Time point
	 * @param [in] u State vector
	 * @param [in] p Parameter vector
	 * @return Value of the vector field
	 * @throws DimensionError if @p u or @p p have the wrong length
	 */
	std::vector<double> rhs(double t, const std::vector<double>& u, const std::vector<double>& p) const;

	/**
	 * @brief Evaluates the vector field using the default parameters
	 * @throws DimensionError if @p u has the wrong length
	 */
	std::vector<double> rhs(double t, const std::vector<double>& u) const;
};

} // namespace griddae

#endif  // LIBGRIDDAE_VECTORFIELD_HPP_
