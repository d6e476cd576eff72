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
 * Provides helper functions for reading parameters
 */

#ifndef LIBGRIDDAE_PARAMREADERHELPER_HPP_
#define LIBGRIDDAE_PARAMREADERHELPER_HPP_

#include "griddae/ParameterProvider.hpp"
#include "griddae/Exceptions.hpp"

#include <string>
#include <vector>

namespace griddae
{

/**
 * @brief Reads a complex value given as array @c [re, im] or as real scalar
 * @param [in] paramProvider Parameter provider
 * @param [in] name Name of the parameter
 * @param [out] re Real part
 * @param [out] im Imaginary part
 */
inline void readComplexParameter(IParameterProvider& paramProvider, const std::string& name, double& re, double& im)
{
	if (!paramProvider.exists(name))
		throw InvalidParameterException("Parameter " + name + " not found");

	if (!paramProvider.isArray(name))
	{
		re = paramProvider.getDouble(name);
		im = 0.0;
		return;
	}

	const std::vector<double> vals = paramProvider.getDoubleArray(name);
	if (vals.size() != 2)
		throw InvalidParameterException("Complex parameter " + name + " requires two elements [re, im]");

	re = vals[0];
	im = vals[1];
}

/**
 * @brief Reads an optional complex value and keeps the given values if it is missing
 */
inline void readOptionalComplexParameter(IParameterProvider& paramProvider, const std::string& name, double& re, double& im)
{
	if (paramProvider.exists(name))
		readComplexParameter(paramProvider, name, re, im);
}

} // namespace griddae

#endif  // LIBGRIDDAE_PARAMREADERHELPER_HPP_
