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

#include <nlohmann/json.hpp>

#include <sstream>
#include <fstream>

#include "common/CompilerSpecific.hpp"
#include "common/JsonParameterProvider.hpp"
#include "griddae/Exceptions.hpp"
#include "io/IOException.hpp"

using json = nlohmann::json;

namespace griddae
{

JsonParameterProvider::JsonParameterProvider(const char* data) : _root(new json(json::parse(data))), _scopePath("/")
{
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(const std::string& data) : _root(new json(json::parse(data))), _scopePath("/")
{
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(const json& data) : _root(new json(data)), _scopePath("/")
{
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(json* data) : _root(data), _scopePath("/")
{
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(const JsonParameterProvider& cpy) : _root(new json(*cpy._root)), _scopePath("/")
{
	// Scopes of the copy refer to the original document, start over at the root
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(JsonParameterProvider&& cpy) GRIDDAE_NOEXCEPT : _root(cpy._root), _opened(std::move(cpy._opened)), _scopePath(std::move(cpy._scopePath))
{
	cpy._root = nullptr;
	cpy._opened = std::stack<json*>();
}

JsonParameterProvider::~JsonParameterProvider() GRIDDAE_NOEXCEPT
{
	delete _root;
}

JsonParameterProvider& JsonParameterProvider::operator=(const JsonParameterProvider& cpy)
{
	if (this == &cpy)
		return *this;

	delete _root;
	_root = new json(*cpy._root);
	_opened = std::stack<json*>();
	_opened.push(_root);
	_scopePath = "/";

	return *this;
}

JsonParameterProvider& JsonParameterProvider::operator=(JsonParameterProvider&& cpy) GRIDDAE_NOEXCEPT
{
	delete _root;
	_root = cpy._root;
	_opened = std::move(cpy._opened);
	_scopePath = std::move(cpy._scopePath);

	cpy._root = nullptr;
	cpy._opened = std::stack<json*>();

	return *this;
}

const json& JsonParameterProvider::lookup(const std::string& paramName) const
{
	const json& scope = *_opened.top();
	const json::const_iterator it = scope.find(paramName);
	if (it == scope.end())
		throw InvalidParameterException("Parameter " + paramName + " not found in scope " + _scopePath);

	// Unwrap arrays of length one to scalars
	if (it->is_array() && (it->size() == 1))
		return (*it)[0];

	return *it;
}

double JsonParameterProvider::getDouble(const std::string& paramName)
{
	return lookup(paramName).get<double>();
}

int JsonParameterProvider::getInt(const std::string& paramName)
{
	const json& p = lookup(paramName);
	if (p.is_boolean())
		return p.get<bool>();

	return p.get<int>();
}

bool JsonParameterProvider::getBool(const std::string& paramName)
{
	const json& p = lookup(paramName);
	if (p.is_number_integer())
		return p.get<int>();

	return p.get<bool>();
}

std::string JsonParameterProvider::getString(const std::string& paramName)
{
	return lookup(paramName).get<std::string>();
}

std::vector<double> JsonParameterProvider::getDoubleArray(const std::string& paramName)
{
	if (!exists(paramName))
		throw InvalidParameterException("Parameter " + paramName + " not found in scope " + _scopePath);

	const json& p = _opened.top()->at(paramName);
	if (!p.is_array())
		return std::vector<double>(1, p.get<double>());

	return p.get<std::vector<double>>();
}

std::vector<int> JsonParameterProvider::getIntArray(const std::string& paramName)
{
	if (!exists(paramName))
		throw InvalidParameterException("Parameter " + paramName + " not found in scope " + _scopePath);

	const json& p = _opened.top()->at(paramName);
	if (!p.is_array())
	{
		if (p.is_boolean())
			return std::vector<int>(1, p.get<bool>());

		return std::vector<int>(1, p.get<int>());
	}

	std::vector<int> values;
	values.reserve(p.size());
	for (const json& e : p)
	{
		if (e.is_boolean())
			values.push_back(e.get<bool>());
		else
			values.push_back(e.get<int>());
	}
	return values;
}

std::vector<std::string> JsonParameterProvider::getStringArray(const std::string& paramName)
{
	if (!exists(paramName))
		throw InvalidParameterException("Parameter " + paramName + " not found in scope " + _scopePath);

	const json& p = _opened.top()->at(paramName);
	if (!p.is_array())
		return std::vector<std::string>(1, p.get<std::string>());

	return p.get<std::vector<std::string>>();
}

bool JsonParameterProvider::exists(const std::string& paramName)
{
	return _opened.top()->find(paramName) != _opened.top()->end();
}

bool JsonParameterProvider::isArray(const std::string& paramName)
{
	return _opened.top()->at(paramName).is_array();
}

std::size_t JsonParameterProvider::numElements(const std::string& paramName)
{
	return _opened.top()->at(paramName).size();
}

void JsonParameterProvider::pushScope(const std::string& scope)
{
	if (!exists(scope))
		throw InvalidParameterException("Scope " + scope + " not found in scope " + _scopePath);

	_opened.push(&_opened.top()->at(scope));
	_scopePath += scope + "/";
}

void JsonParameterProvider::popScope()
{
	_opened.pop();

	// Strip trailing "scope/" from path
	const std::size_t idx = _scopePath.find_last_of('/', _scopePath.length() - 2);
	_scopePath.erase(idx + 1);
}

void JsonParameterProvider::addScope(const std::string& scope)
{
	if (!exists(scope))
		(*_opened.top())[scope] = json::object();
}

void JsonParameterProvider::set(const std::string& paramName, double val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, int val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, bool val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, char const* val)
{
	(*_opened.top())[paramName] = std::string(val);
}

void JsonParameterProvider::set(const std::string& paramName, const std::string& val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, const std::vector<double>& val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, const std::vector<int>& val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, const std::vector<std::string>& val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::remove(const std::string& name)
{
	_opened.top()->erase(name);
}

void JsonParameterProvider::toFile(const std::string& fileName) const
{
	std::ofstream ofs(fileName, std::ios::out | std::ios::trunc);
	if (!ofs)
		throw io::IOException("Could not open file " + fileName + " for writing");

	ofs << _root->dump(4);
}

JsonParameterProvider JsonParameterProvider::fromFile(const std::string& fileName)
{
	std::ifstream ifs(fileName);
	if (!ifs)
		throw io::IOException("Could not open file " + fileName);

	json* root = new json();
	try
	{
		ifs >> (*root);
	}
	catch (const json::parse_error& e)
	{
		delete root;
		throw io::IOException("Could not parse file " + fileName + ": " + e.what());
	}

	return JsonParameterProvider(root);
}

std::ostream& operator<<(std::ostream& out, const JsonParameterProvider& jpp)
{
	out << jpp.data()->dump(4);
	return out;
}

} // namespace griddae
