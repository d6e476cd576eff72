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

#include "VectorField.hpp"
#include "griddae/Exceptions.hpp"

namespace griddae
{

std::vector<bool> IVectorField::differentialVariables() const
{
	const std::vector<double>& mm = massMatrix();
	std::vector<bool> diff(mm.size(), false);
	for (std::size_t i = 0; i < mm.size(); ++i)
		diff[i] = (mm[i] == 1.0);

	return diff;
}

std::vector<double> IVectorField::rhs(double t, const std::vector<double>& u, const std::vector<double>& p) const
{
	if (u.size() != numDofs())
		throw DimensionError("State vector has " + std::to_string(u.size()) + " elements, expected " + std::to_string(numDofs()));
	if (p.size() != numParameters())
		throw DimensionError("Parameter vector has " + std::to_string(p.size()) + " elements, expected " + std::to_string(numParameters()));

	std::vector<double> du(u.size(), 0.0);
	evaluate(t, u.data(), p.data(), du.data());
	return du;
}

std::vector<double> IVectorField::rhs(double t, const std::vector<double>& u) const
{
	return rhs(t, u, defaultParameters());
}

} // namespace griddae
