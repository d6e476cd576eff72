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

#include "model/node/NodeModelBase.hpp"
#include "griddae/Exceptions.hpp"

#include <string>

namespace griddae
{

namespace model
{

NodeModelBase::NodeModelBase(char const* const* varNames, bool const* differential, unsigned int nDof)
	: _varNames(varNames), _differential(differential), _nDof(nDof)
{
}

NodeModelBase::~NodeModelBase() GRIDDAE_NOEXCEPT { }

const char* NodeModelBase::variableName(unsigned int idx) const
{
	if (idx >= _nDof)
		throw DimensionError("Variable index " + std::to_string(idx) + " exceeds the " + std::to_string(_nDof) + " variables of node model " + name());
	return _varNames[idx];
}

bool NodeModelBase::isDifferential(unsigned int idx) const
{
	if (idx >= _nDof)
		throw DimensionError("Variable index " + std::to_string(idx) + " exceeds the " + std::to_string(_nDof) + " variables of node model " + name());
	return _differential[idx];
}

} // namespace model
} // namespace griddae
