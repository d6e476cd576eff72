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
 * Defines the node model interface.
 */

#ifndef LIBGRIDDAE_NODEMODELINTERFACE_HPP_
#define LIBGRIDDAE_NODEMODELINTERFACE_HPP_

#include "common/CompilerSpecific.hpp"
#include "AutoDiff.hpp"
#include "ComplexArithmetic.hpp"

#include <string>

namespace griddae
{

class IParameterProvider;

namespace model
{

/**
 * @brief Defines the node model interface
 * @details A node model owns a contiguous block of the global state vector and computes the
 *          time derivative of this block from the local state, the total current drawn from the
 *          node by its incident lines, and the node's block of the global parameter vector.
 *          
 *          Each local variable is either differential (mass matrix entry 1) or algebraic (entry 0).
 *          Models that carry the complex node voltage as the first two local variables
 *          <tt>(u_r, u_i)</tt> report this through hasVoltageState(); lines can only be
 *          attached to such nodes.
 *          
 *          Node models are immutable after configure() and may be evaluated concurrently.
 */
class INodeModel
{
public:

	virtual ~INodeModel() GRIDDAE_NOEXCEPT { }

	/**
	 * @brief Returns the name (type tag) of the model
	 * @return Name of the model
	 */
	virtual const char* name() const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Reads parameters and model constants from the given parameter provider
	 * @details The scope of the parameter provider is expected to be the node's scope and
	 *          is left unchanged on return. Missing parameters throw InvalidParameterException.
	 * @param [in] paramProvider Parameter provider
	 * @return @c true if the configuration was successful, otherwise @c false
	 */
	virtual bool configure(IParameterProvider& paramProvider) = 0;

	/**
	 * @brief Returns the number of local state variables
	 */
	virtual unsigned int numDofs() const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Returns the name of a local state variable
	 * @param [in] idx Local index of the variable
	 * @return Variable name (e.g., @c u_r or @c ω)
	 */
	virtual const char* variableName(unsigned int idx) const = 0;

	/**
	 * @brief Returns whether a local variable is differential (@c true) or algebraic (@c false)
	 * @param [in] idx Local index of the variable
	 */
	virtual bool isDifferential(unsigned int idx) const = 0;

	/**
	 * @brief Returns whether the first two local variables are the complex node voltage
	 */
	virtual bool hasVoltageState() const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Returns whether the model fixes the node voltage to a reference (slack node)
	 * @param [out] uRe Real part of the reference voltage if this is a slack node
	 * @param [out] uIm Imaginary part of the reference voltage if this is a slack node
	 * @return @c true if the node is a reference (slack) node, otherwise @c false
	 */
	virtual bool referenceVoltage(double& uRe, double& uIm) const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Returns whether an operating point search can handle this node
	 */
	virtual bool supportsOperationPoint() const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Returns the number of entries in the global parameter vector owned by this node
	 */
	virtual unsigned int numParameters() const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Writes the configured parameter values
	 * @param [out] p Pointer to the node's block of the global parameter vector
	 */
	virtual void defaultParameters(double* p) const = 0;

	/**
	 * @brief Evaluates the local vector field
	 * @param [in] t Current time point
	 * @param [in] u Pointer to the local state
	 * @param [in] i Total current drawn from the node by its incident lines
	 * @param [in] p Pointer to the node's block of the global parameter vector
	 * @param [out] du Pointer to the local time derivative
	 */
	virtual void dynamics(double t, double const* u, const util::Complex<double>& i, double const* p, double* du) const = 0;
	virtual void dynamics(double t, active const* u, const util::Complex<active>& i, double const* p, active* du) const = 0;
	virtual void dynamics(double t, active const* u, const util::Complex<active>& i, active const* p, active* du) const = 0;

};

} // namespace model
} // namespace griddae

#endif  // LIBGRIDDAE_NODEMODELINTERFACE_HPP_
