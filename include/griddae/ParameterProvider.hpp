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
 * Defines the ParameterProvider interface.
 */

#ifndef LIBGRIDDAE_PARAMPROVIDER_HPP_
#define LIBGRIDDAE_PARAMPROVIDER_HPP_

#include <string>
#include <vector>

#include "common/CompilerSpecific.hpp"

namespace griddae
{

/**
 * @brief Provides access to parameters and options of grid elements, solvers and integrators
 * @details The parameters are organized in a hierarchy of scopes (e.g., a scope per node
 *          of the grid). Only the parameters in the currently opened scope are accessible.
 *          Scalar getters also accept arrays of length one, array getters also accept scalars.
 */
class IParameterProvider
{
public:

	virtual ~IParameterProvider() GRIDDAE_NOEXCEPT { }

	/**
	 * @brief Returns the value of a parameter of type @c double
	 * @param [in] paramName Name of the parameter
	 * @return Value of the parameter
	 * @throws InvalidParameterException if the parameter does not exist
	 */
	virtual double getDouble(const std::string& paramName) = 0;

	virtual int getInt(const std::string& paramName) = 0;
	virtual bool getBool(const std::string& paramName) = 0;
	virtual std::string getString(const std::string& paramName) = 0;

	virtual std::vector<double> getDoubleArray(const std::string& paramName) = 0;
	virtual std::vector<int> getIntArray(const std::string& paramName) = 0;
	virtual std::vector<std::string> getStringArray(const std::string& paramName) = 0;

	/**
	 * @brief Checks whether a parameter or scope exists in the current scope
	 * @param [in] paramName Name of the parameter or scope
	 * @return @c true if it exists, otherwise @c false
	 */
	virtual bool exists(const std::string& paramName) = 0;

	virtual bool isArray(const std::string& paramName) = 0;

	/**
	 * @brief Returns the number of elements of an array parameter (@c 1 for scalars)
	 */
	virtual std::size_t numElements(const std::string& paramName) = 0;

	/**
	 * @brief Opens a sub-scope of the current scope
	 * @param [in] scope Name of the scope
	 */
	virtual void pushScope(const std::string& scope) = 0;

	/**
	 * @brief Closes the current scope and returns to its parent
	 */
	virtual void popScope() = 0;
};

} // namespace griddae

#endif  // LIBGRIDDAE_PARAMPROVIDER_HPP_
