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
 * Closed-loop vector field of a power grid with a feedback control law
 */

#ifndef LIBGRIDDAE_CONTROLLEDPOWERGRID_HPP_
#define LIBGRIDDAE_CONTROLLEDPOWERGRID_HPP_

#include "VectorField.hpp"
#include "NetworkDynamics.hpp"
#include "SlicedVector.hpp"

#include <string>
#include <vector>

namespace griddae
{

class PowerGrid;

/**
 * @brief Feedback law that computes the parameters of the open-loop grid
 * @details The control law maps state, parameters, and time to the parameter vector
 *          of the open-loop vector field. It must not store state between calls.
 *          A @c nullptr parameter vector refers to defaultParameters().
 */
class IControlLaw
{
public:
	virtual ~IControlLaw() GRIDDAE_NOEXCEPT { }

	/**
	 * @brief Returns the number of parameters accepted by the control law
	 */
	virtual unsigned int numParameters() const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Returns the length of the controller output
	 */
	virtual unsigned int numOutputs() const GRIDDAE_NOEXCEPT = 0;

	virtual const std::vector<double>& defaultParameters() const GRIDDAE_NOEXCEPT = 0;

	virtual void control(double t, double const* u, double const* p, double* out) const = 0;
	virtual void control(double t, active const* u, double const* p, active* out) const = 0;
	virtual void control(double t, active const* u, active const* p, active* out) const = 0;
};

/**
 * @brief Control law that returns its parameters unchanged
 */
class ConstantControl : public IControlLaw
{
public:
	explicit ConstantControl(const std::vector<double>& value) : _value(value) { }
	virtual ~ConstantControl() GRIDDAE_NOEXCEPT { }

	virtual unsigned int numParameters() const GRIDDAE_NOEXCEPT { return _value.size(); }
	virtual unsigned int numOutputs() const GRIDDAE_NOEXCEPT { return _value.size(); }
	virtual const std::vector<double>& defaultParameters() const GRIDDAE_NOEXCEPT { return _value; }

	virtual void control(double t, double const* u, double const* p, double* out) const;
	virtual void control(double t, active const* u, double const* p, active* out) const;
	virtual void control(double t, active const* u, active const* p, active* out) const;

protected:
	std::vector<double> _value;
};

/**
 * @brief Power grid whose parameters are computed by a control law on each evaluation
 * @details Mass matrix and variable names are the ones of the open-loop grid. The
 *          parameters of this field are the parameters of the control law. Since the
 *          control law may depend on every state, the sparsity pattern is dense.
 */
class ControlledPowerGrid : public IVectorField
{
public:
	/**
	 * @brief Creates the closed-loop field
	 * @param [in] control Control law, has to outlive this object
	 * @param [in] grid Power grid, has to outlive this object
	 * @throw DimensionError if the controller output does not match the grid parameters
	 */
	ControlledPowerGrid(const IControlLaw& control, const PowerGrid& grid);
	virtual ~ControlledPowerGrid() GRIDDAE_NOEXCEPT;

	virtual unsigned int numDofs() const GRIDDAE_NOEXCEPT { return _openLoop.numDofs(); }
	virtual unsigned int numParameters() const GRIDDAE_NOEXCEPT { return _control.numParameters(); }
	virtual const std::vector<double>& defaultParameters() const GRIDDAE_NOEXCEPT { return _control.defaultParameters(); }
	virtual const std::vector<double>& massMatrix() const GRIDDAE_NOEXCEPT { return _openLoop.massMatrix(); }
	virtual const std::vector<std::string>& variableNames() const GRIDDAE_NOEXCEPT { return _openLoop.variableNames(); }
	virtual const util::SlicedVector<int>& sparsityPattern() const GRIDDAE_NOEXCEPT { return _pattern; }

	virtual void evaluate(double t, double const* u, double const* p, double* du) const;
	virtual void evaluate(double t, active const* u, double const* p, active* du) const;
	virtual void evaluate(double t, active const* u, active const* p, active* du) const;

	inline const NetworkDynamics& openLoop() const GRIDDAE_NOEXCEPT { return _openLoop; }

protected:
	const IControlLaw& _control;
	NetworkDynamics _openLoop;
	util::SlicedVector<int> _pattern;
};

} // namespace griddae

#endif  // LIBGRIDDAE_CONTROLLEDPOWERGRID_HPP_
