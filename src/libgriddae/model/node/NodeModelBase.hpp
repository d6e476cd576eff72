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
 * Defines a base class for node models
 */

#ifndef LIBGRIDDAE_NODEMODELBASE_HPP_
#define LIBGRIDDAE_NODEMODELBASE_HPP_

#include "model/NodeModel.hpp"
#include "model/ModelMacros.hpp"
#include "MathUtil.hpp"
#include "ParamReaderHelper.hpp"

#include <string>

namespace griddae
{

namespace model
{

/**
 * @brief Base class for node models whose first two variables are the complex voltage
 * @details Derived classes pass static tables of variable names and differential flags,
 *          which have to outlive the model.
 */
class NodeModelBase : public INodeModel
{
public:

	NodeModelBase(char const* const* varNames, bool const* differential, unsigned int nDof);

	virtual ~NodeModelBase() GRIDDAE_NOEXCEPT;

	virtual unsigned int numDofs() const GRIDDAE_NOEXCEPT { return _nDof; }
	virtual const char* variableName(unsigned int idx) const;
	virtual bool isDifferential(unsigned int idx) const;

	virtual bool hasVoltageState() const GRIDDAE_NOEXCEPT { return true; }
	virtual bool referenceVoltage(double& uRe, double& uIm) const GRIDDAE_NOEXCEPT { return false; }
	virtual bool supportsOperationPoint() const GRIDDAE_NOEXCEPT { return true; }

protected:
	char const* const* _varNames; //!< Name of each local variable
	bool const* _differential; //!< Differential flag of each local variable
	unsigned int _nDof; //!< Number of local variables
};

/**
 * @brief Computes the frequency scaling @f$ \Omega_H = 2 \pi \Omega / H @f$ of swing equations
 */
inline double inertiaScaling(double omega, double inertia) GRIDDAE_NOEXCEPT
{
	return 2.0 * pi * omega / inertia;
}

} // namespace model
} // namespace griddae

#endif  // LIBGRIDDAE_NODEMODELBASE_HPP_
