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
 * Implements the griddae::IParameterProvider interface for JSON documents.
 */

#ifndef GRIDDAE_JSONPARAMETERPROVIDER_HPP_
#define GRIDDAE_JSONPARAMETERPROVIDER_HPP_

#include "griddae/ParameterProvider.hpp"
#include "common/CompilerSpecific.hpp"

#include <string>
#include <stack>
#include <ostream>

#include <nlohmann/json_fwd.hpp>

namespace griddae
{

/**
 * @brief JSON backed parameter provider
 * @details Scopes are JSON objects. The provider owns a copy of the document and can
 *          be modified through set() and addScope().
 */
class JsonParameterProvider : public griddae::IParameterProvider
{
public:

	JsonParameterProvider(const char* data);
	JsonParameterProvider(const std::string& data);
	JsonParameterProvider(const nlohmann::json& data);
	JsonParameterProvider(const JsonParameterProvider& cpy);
	JsonParameterProvider(JsonParameterProvider&& cpy) GRIDDAE_NOEXCEPT;

	virtual ~JsonParameterProvider() GRIDDAE_NOEXCEPT;

	JsonParameterProvider& operator=(const JsonParameterProvider& cpy);
	JsonParameterProvider& operator=(JsonParameterProvider&& cpy) GRIDDAE_NOEXCEPT;

	virtual double getDouble(const std::string& paramName);
	virtual int getInt(const std::string& paramName);
	virtual bool getBool(const std::string& paramName);
	virtual std::string getString(const std::string& paramName);
	virtual std::vector<double> getDoubleArray(const std::string& paramName);
	virtual std::vector<int> getIntArray(const std::string& paramName);
	virtual std::vector<std::string> getStringArray(const std::string& paramName);
	virtual bool exists(const std::string& paramName);
	virtual bool isArray(const std::string& paramName);
	virtual std::size_t numElements(const std::string& paramName);
	virtual void pushScope(const std::string& scope);
	virtual void popScope();

	/**
	 * @brief Adds an empty scope to the current scope if it does not exist yet
	 * @param [in] scope Name of the scope
	 */
	void addScope(const std::string& scope);

	void set(const std::string& paramName, double val);
	void set(const std::string& paramName, int val);
	void set(const std::string& paramName, bool val);
	void set(const std::string& paramName, char const* val);
	void set(const std::string& paramName, const std::string& val);
	void set(const std::string& paramName, const std::vector<double>& val);
	void set(const std::string& paramName, const std::vector<int>& val);
	void set(const std::string& paramName, const std::vector<std::string>& val);

	void remove(const std::string& name);

	inline nlohmann::json* data() { return _root; }
	inline nlohmann::json const* data() const { return _root; }

	void toFile(const std::string& fileName) const;
	static JsonParameterProvider fromFile(const std::string& fileName);

private:
	JsonParameterProvider(nlohmann::json* data);

	const nlohmann::json& lookup(const std::string& paramName) const;

	nlohmann::json* _root;
	std::stack<nlohmann::json*> _opened;
	std::string _scopePath;
};

std::ostream& operator<<(std::ostream& out, const JsonParameterProvider& jpp);

} // namespace griddae

#endif  // GRIDDAE_JSONPARAMETERPROVIDER_HPP_
