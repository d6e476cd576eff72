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
 * Defines exceptions.
 */

#ifndef LIBGRIDDAE_EXCEPTIONS_HPP_
#define LIBGRIDDAE_EXCEPTIONS_HPP_

#include <stdexcept>
#include <string>

namespace griddae
{

/**
 * @brief Signals invalid parameter or option values
 */
class InvalidParameterException : public std::domain_error
{
public:
	explicit InvalidParameterException(const std::string& what_arg) : std::domain_error(what_arg) { }
	explicit InvalidParameterException(const char* what_arg) : std::domain_error(what_arg) { }
};

/**
 * @brief Signals malformed topology or vectors of wrong length
 */
class DimensionError : public std::domain_error
{
public:
	explicit DimensionError(const std::string& what_arg) : std::domain_error(what_arg) { }
	explicit DimensionError(const char* what_arg) : std::domain_error(what_arg) { }
};

/**
 * @brief Signals that no operating point could be computed
 */
class OperationPointError : public std::runtime_error
{
public:
	explicit OperationPointError(const std::string& what_arg) : std::runtime_error(what_arg) { }
	explicit OperationPointError(const char* what_arg) : std::runtime_error(what_arg) { }
};

/**
 * @brief Signals a node type that the operating point search cannot handle
 */
class UnsupportedNodeTypeError : public OperationPointError
{
public:
	explicit UnsupportedNodeTypeError(const std::string& what_arg) : OperationPointError(what_arg) { }
	explicit UnsupportedNodeTypeError(const char* what_arg) : OperationPointError(what_arg) { }
};

/**
 * @brief Signals a violated consistency requirement of the model data
 */
class AssertionError : public std::logic_error
{
public:
	explicit AssertionError(const std::string& what_arg) : std::logic_error(what_arg) { }
	explicit AssertionError(const char* what_arg) : std::logic_error(what_arg) { }
};

/**
 * @brief Signals errors during the time integration process
 */
class IntegrationException : public std::runtime_error
{
public:
	explicit IntegrationException(const std::string& what_arg) : std::runtime_error(what_arg) { }
	explicit IntegrationException(const char* what_arg) : std::runtime_error(what_arg) { }
};

/**
 * @brief Signals a failed spectral analysis of the Jacobian
 */
class StabilityError : public std::runtime_error
{
public:
	explicit StabilityError(const std::string& what_arg) : std::runtime_error(what_arg) { }
	explicit StabilityError(const char* what_arg) : std::runtime_error(what_arg) { }
};

} // namespace griddae

#endif  // LIBGRIDDAE_EXCEPTIONS_HPP_
