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

#include "DaeResidual.hpp"
#include "VectorField.hpp"
#include "Jacobian.hpp"
#include "linalg/DenseMatrix.hpp"
#include "griddae/Exceptions.hpp"

#include <string>

namespace griddae
{

DaeResidual::DaeResidual(const IVectorField& field) : DaeResidual(field, field.defaultParameters()) { }

DaeResidual::DaeResidual(const IVectorField& field, const std::vector<double>& p) : _field(field), _params(p), _numDofs(field.numDofs())
{
	if (_params.size() != _field.numParameters())
		throw DimensionError("Parameter vector has " + std::to_string(_params.size()) + " elements, expected " + std::to_string(_field.numParameters()));
}

void DaeResidual::residual(double t, double const* u, double const* du, double* res) const
{
	std::vector<double> f(_numDofs, 0.0);
	_field.evaluate(t, u, _params.data(), f.data());

	for (unsigned int i = 0; i < _numDofs; ++i)
		res[i] = du[i] - f[i];
}

void DaeResidual::jacobian(double t, double const* u, double cj, linalg::detail::DenseMatrixBase& jac) const
{
	griddae_assert(jac.rows() == _numDofs);
	griddae_assert(jac.columns() == _numDofs);

	const std::vector<double>& p = _params;
	const IVectorField& field = _field;
	denseJacobian([&](active const* x, active* res) { field.evaluate(t, x, p.data(), res); }, u, _numDofs, jac);

	for (unsigned int r = 0; r < _numDofs; ++r)
	{
		for (unsigned int c = 0; c < _numDofs; ++c)
			jac.native(r, c) = -jac.native(r, c);

		jac.native(r, r) += cj;
	}
}

} // namespace griddae
