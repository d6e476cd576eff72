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
 * Assembles the vector field of a power grid from its node and line models
 */

#ifndef LIBGRIDDAE_NETWORKDYNAMICS_HPP_
#define LIBGRIDDAE_NETWORKDYNAMICS_HPP_

#include "VectorField.hpp"
#include "SlicedVector.hpp"

#include <string>
#include <vector>

namespace griddae
{

class PowerGrid;

/**
 * @brief Vector field of a power grid
 * @details Evaluation first computes the currents of all lines from the voltages of their
 *          endpoints. Then the local vector field of each node is evaluated with the total
 *          current drawn by its incident lines, summed in ascending line order. Both stages
 *          run in parallel if @c GRIDDAE_PARALLELIZE is defined; the result does not depend
 *          on the evaluation order.
 *
 *          The topology, mass matrix, and variable names are captured on construction.
 */
class NetworkDynamics : public IVectorField
{
public:
	/**
	 * @brief Assembles the vector field of the given grid
	 * @param [in] grid Power grid, has to outlive this object
	 */
	explicit NetworkDynamics(const PowerGrid& grid);
	virtual ~NetworkDynamics() GRIDDAE_NOEXCEPT;

	virtual unsigned int numDofs() const GRIDDAE_NOEXCEPT { return _massMatrix.size(); }
	virtual unsigned int numParameters() const GRIDDAE_NOEXCEPT { return _defaultParams.size(); }
	virtual const std::vector<double>& defaultParameters() const GRIDDAE_NOEXCEPT { return _defaultParams; }
	virtual const std::vector<double>& massMatrix() const GRIDDAE_NOEXCEPT { return _massMatrix; }
	virtual const std::vector<std::string>& variableNames() const GRIDDAE_NOEXCEPT { return _varNames; }
	virtual const util::SlicedVector<int>& sparsityPattern() const GRIDDAE_NOEXCEPT { return _pattern; }

	virtual void evaluate(double t, double const* u, double const* p, double* du) const;
	virtual void evaluate(double t, active const* u, double const* p, active* du) const;
	virtual void evaluate(double t, active const* u, active const* p, active* du) const;

	inline const PowerGrid& grid() const GRIDDAE_NOEXCEPT { return _grid; }

	/**
	 * @brief Returns the lines incident to each node in ascending order
	 */
	inline const util::SlicedVector<int>& incidence() const GRIDDAE_NOEXCEPT { return _incidence; }

protected:
	const PowerGrid& _grid; //!< Grid
	std::vector<double> _massMatrix; //!< Diagonal of the mass matrix
	std::vector<std::string> _varNames; //!< Variable names suffixed with the node index
	std::vector<double> _defaultParams; //!< Configured parameters of the grid
	util::SlicedVector<int> _incidence; //!< Lines incident to each node
	util::SlicedVector<int> _pattern; //!< Structural nonzeros of the Jacobian

	template <typename StateType, typename ParamType, typename ResultType>
	void evaluateImpl(double t, StateType const* u, ParamType const* p, ResultType* du) const;
};

} // namespace griddae

#endif  // LIBGRIDDAE_NETWORKDYNAMICS_HPP_
