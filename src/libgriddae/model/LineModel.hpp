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
 * Defines the line model interface.
 */

#ifndef LIBGRIDDAE_LINEMODELINTERFACE_HPP_
#define LIBGRIDDAE_LINEMODELINTERFACE_HPP_

#include "common/CompilerSpecific.hpp"
#include "AutoDiff.hpp"
#include "ComplexArithmetic.hpp"

namespace griddae
{

class IParameterProvider;

namespace model
{

/**
 * @brief Defines the line model interface
 * @details Lines are static: they carry no state and map the voltages of their
 *          two endpoints to the currents drawn from each endpoint.
 */
class ILineModel
{
public:

	virtual ~ILineModel() GRIDDAE_NOEXCEPT { }

	virtual const char* name() const GRIDDAE_NOEXCEPT = 0;

	/**
	 * @brief Reads the line constants from the given parameter provider
	 * @details The scope of the parameter provider is the line's scope and is left unchanged.
	 * @param [in] paramProvider Parameter provider
	 * @return @c true if the configuration was successful, otherwise @c false
	 */
	virtual bool configure(IParameterProvider& paramProvider) = 0;

	/**
	 * @brief Computes the currents drawn from the endpoints
	 * @param [in] uSrc Voltage at the source node
	 * @param [in] uDst Voltage at the destination node
	 * @param [out] iSrc Current drawn from the source node
	 * @param [out] iDst Current drawn from the destination node
	 */
	virtual void currents(const util::Complex<double>& uSrc, const util::Complex<double>& uDst, util::Complex<double>& iSrc, util::Complex<double>& iDst) const = 0;
	virtual void currents(const util::Complex<active>& uSrc, const util::Complex<active>& uDst, util::Complex<active>& iSrc, util::Complex<active>& iDst) const = 0;
};

} // namespace model
} // namespace griddae

#endif  // LIBGRIDDAE_LINEMODELINTERFACE_HPP_
