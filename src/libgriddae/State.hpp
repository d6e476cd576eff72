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
 * Defines the immutable State of a power grid and perturbations of it
 */

#ifndef LIBGRIDDAE_STATE_HPP_
#define LIBGRIDDAE_STATE_HPP_

#include "ComplexArithmetic.hpp"

#include <string>
#include <vector>
#include <utility>

namespace griddae
{

class PowerGrid;
class IParameterProvider;

/**
 * @brief Kind of change applied to a state variable
 */
enum class PerturbationMode : int
{
	Increase,
	Decrease,
	Set
};

/**
 * @brief Converts a string (@c INC, @c DEC, @c SET) to a PerturbationMode
 * @throws InvalidParameterException if the string is unknown
 */
PerturbationMode to_perturbationmode(const std::string& mode);

/**
 * @brief Change of a single state variable of a node
 */
struct Perturbation
{
	unsigned int node; //!< Index of the node
	std::string variable; //!< Local name of the variable (e.g., @c ω)
	PerturbationMode mode;
	double value; //!< Increment, decrement, or new value

	/**
	 * @brief Reads a perturbation from the keys @c NODE, @c VARIABLE, @c MODE, and @c VALUE
	 * @param [in] paramProvider Parameter provider
	 * @return Perturbation
	 */
	static Perturbation fromParameters(IParameterProvider& paramProvider);
};

/**
 * @brief State vector of a power grid with symbolic access to its variables
 * @details States are immutable. Operations that change values return a new State.
 *          The grid has to outlive the State.
 */
class State
{
public:
	/**
	 * @brief Creates a state from a raw vector
	 * @param [in] grid Power grid
	 * @param [in] vec Global state vector
	 * @throws DimensionError if the length of @p vec does not match the grid
	 */
	State(const PowerGrid& grid, std::vector<double> vec);

	inline const std::vector<double>& vector() const GRIDDAE_NOEXCEPT { return _vec; }
	inline const PowerGrid& grid() const GRIDDAE_NOEXCEPT { return *_grid; }
	inline unsigned int size() const GRIDDAE_NOEXCEPT { return _vec.size(); }

	/**
	 * @brief Returns the local state block of a node
	 * @throws DimensionError if @p node is out of range
	 */
	std::vector<double> nodeState(unsigned int node) const;

	/**
	 * @brief Returns a state variable by local name (e.g., @c u_r or @c ω)
	 */
	double operator()(unsigned int node, const std::string& variable) const;

	/**
	 * @brief Returns the complex voltage @f$ u @f$ of a node
	 * @throws UnsupportedNodeTypeError if the node has no voltage state
	 */
	util::Complex<double> voltage(unsigned int node) const;

	/**
	 * @brief Returns the voltage magnitude @f$ |u| @f$ of a node
	 */
	double voltageMagnitude(unsigned int node) const;

	/**
	 * @brief Returns the voltage angle @f$ \arg u @f$ of a node
	 */
	double voltageAngle(unsigned int node) const;

	/**
	 * @brief Returns the total current drawn from a node by its incident lines
	 */
	util::Complex<double> current(unsigned int node) const;

	/**
	 * @brief Returns the complex power @f$ s = u \bar{\imath} @f$ of a node
	 */
	util::Complex<double> power(unsigned int node) const;

	/**
	 * @brief Returns a copy of this state with a perturbed variable
	 * @param [in] pert Perturbation
	 * @return Perturbed state
	 */
	State withPerturbation(const Perturbation& pert) const;

private:
	const PowerGrid* _grid;
	std::vector<double> _vec;

	void checkNode(unsigned int node) const;
};

} // namespace griddae

#endif  // LIBGRIDDAE_STATE_HPP_
