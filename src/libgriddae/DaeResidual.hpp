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
 * Fully implicit residual form of a grid vector field
 */

#ifndef LIBGRIDDAE_DAERESIDUAL_HPP_
#define LIBGRIDDAE_DAERESIDUAL_HPP_

#include "common/CompilerSpecific.hpp"

#include <vector>

namespace griddae
{

class IVectorField;

namespace linalg
{
	namespace detail
	{
		class DenseMatrixBase;
	}
}

/**
 * @brief Implicit residual @f$ F(t, u, \dot{u}) = \dot{u} - f(u, p, t) @f$ of a vector field
 * @details Ignores the mass matrix, which allows passing singular systems to implicit
 *          integrators. Scratch memory is allocated per call, so the object can be shared
 *          between threads.
 */
class DaeResidual
{
public:
	/**
	 * @brief Creates the residual with the default parameters of the field
	 * @param [in] field Vector field, has to outlive this object
	 */
	explicit DaeResidual(const IVectorField& field);

	/**
	 * @brief Creates the residual with fixed parameters
	 * @param [in] field Vector field, has to outlive this object
	 * @param [in] p Parameters of length IVectorField::numParameters()
	 */
	DaeResidual(const IVectorField& field, const std::vector<double>& p);

	/**
	 * @brief Evaluates the residual
	 * @param [in] t Time
	 * @param [in] u State
	 * @param [in] du Time derivative of the state
	 * @param [out] res Residual
	 */
	void residual(double t, double const* u, double const* du, double* res) const;

	/**
	 * @brief Computes the iteration matrix @f$ \partial F / \partial u + c_j \partial F / \partial \dot{u} = -J_f + c_j I @f$
	 * @param [in] t Time
	 * @param [in] u State
	 * @param [in] cj Scaling of the derivative part supplied by the time integrator
	 * @param [out] jac Square matrix of size IVectorField::numDofs()
	 */
	void jacobian(double t, double const* u, double cj, linalg::detail::DenseMatrixBase& jac) const;

	inline const IVectorField& field() const GRIDDAE_NOEXCEPT { return _field; }
	inline unsigned int numDofs() const GRIDDAE_NOEXCEPT { return _numDofs; }

protected:
	const IVectorField& _field;
	std::vector<double> _params;
	unsigned int _numDofs;
};

} // namespace griddae

#endif  // LIBGRIDDAE_DAERESIDUAL_HPP_
