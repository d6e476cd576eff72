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

#include "Jacobian.hpp"
#include "AdUtils.hpp"
#include "VectorField.hpp"
#include "graph/GraphAlgos.hpp"
#include "linalg/DenseMatrix.hpp"
#include "Logging.hpp"

#include <algorithm>

namespace griddae
{

void denseJacobian(const ActiveFunction& fn, double const* x, unsigned int n, linalg::detail::DenseMatrixBase& jac)
{
	const unsigned int maxDir = ad::getMaxDirections();

	std::vector<active> adX(n);
	std::vector<active> adRes(jac.rows());

	for (unsigned int colOffset = 0; colOffset < n; colOffset += maxDir)
	{
		const unsigned int nCols = std::min(maxDir, n - colOffset);
		ad::setDirections(nCols);

		ad::copyToAd(x, adX.data(), n);
		ad::prepareAdVectorSeedsForDenseMatrix(adX.data(), colOffset, nCols, n);

		fn(adX.data(), adRes.data());

		ad::extractDenseJacobianFromAd(adRes.data(), colOffset, nCols, jac);
	}
}

void denseJacobian(const IVectorField& field, double t, double const* u, double const* p, linalg::detail::DenseMatrixBase& jac)
{
	denseJacobian([&](active const* x, active* res) { field.evaluate(t, x, p, res); }, u, field.numDofs(), jac);
}

ColoredJacobian::ColoredJacobian(const util::SlicedVector<int>& pattern, unsigned int nCols) : _pattern(pattern)
{
	_numColors = graph::greedyColumnColoring(_pattern, nCols, _colors);
	LOG(Debug) << "Compressed " << nCols << " Jacobian columns to " << _numColors << " colors";
}

void ColoredJacobian::compute(const ActiveFunction& fn, double const* x, Eigen::SparseMatrix<double>& jac) const
{
	const unsigned int maxDir = ad::getMaxDirections();
	const unsigned int n = _colors.size();

	std::vector<active> adX(n);
	std::vector<active> adRes(_pattern.slices());

	std::vector<Eigen::Triplet<double>> entries;
	entries.reserve(_pattern.size());

	for (unsigned int colorOffset = 0; colorOffset < _numColors; colorOffset += maxDir)
	{
		const unsigned int nColors = std::min(maxDir, _numColors - colorOffset);
		ad::setDirections(nColors);

		ad::copyToAd(x, adX.data(), n);
		ad::prepareAdVectorSeedsForColoring(adX.data(), _colors, colorOffset, nColors);

		fn(adX.data(), adRes.data());

		ad::extractColoredJacobianFromAd(adRes.data(), _colors, colorOffset, nColors, _pattern, entries);
	}

	jac.resize(_pattern.slices(), n);
	jac.setFromTriplets(entries.begin(), entries.end());
	jac.makeCompressed();
}

} // namespace griddae
