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

#include "AdUtils.hpp"
#include "linalg/DenseMatrix.hpp"

namespace griddae
{

namespace ad
{

void prepareAdVectorSeedsForDenseMatrix(active* const adVec, int adDirOffset, int numCols, int size)
{
	for (int i = 0; i < size; ++i)
		adVec[i].fillADValue(0, 0.0);

	for (int col = 0; col < numCols; ++col)
		adVec[adDirOffset + col].setADValue(col, 1.0);
}

void extractDenseJacobianFromAd(active const* const adVec, int adDirOffset, int numCols, linalg::detail::DenseMatrixBase& mat)
{
	for (unsigned int eq = 0; eq < mat.rows(); ++eq)
	{
		for (int col = 0; col < numCols; ++col)
			mat.native(eq, adDirOffset + col) = adVec[eq].getADValue(col);
	}
}

void prepareAdVectorSeedsForColoring(active* const adVec, const std::vector<int>& colors, int colorOffset, int numColors)
{
	for (std::size_t i = 0; i < colors.size(); ++i)
	{
		adVec[i].fillADValue(0, 0.0);

		const int dir = colors[i] - colorOffset;
		if ((dir >= 0) && (dir < numColors))
			adVec[i].setADValue(dir, 1.0);
	}
}

void extractColoredJacobianFromAd(active const* const adVec, const std::vector<int>& colors, int colorOffset, int numColors,
	const util::SlicedVector<int>& rowPattern, std::vector<Eigen::Triplet<double>>& entries)
{
	for (std::size_t r = 0; r < rowPattern.slices(); ++r)
	{
		for (int const* c = rowPattern.begin(r); c != rowPattern.end(r); ++c)
		{
			const int dir = colors[*c] - colorOffset;
			if ((dir >= 0) && (dir < numColors))
				entries.push_back(Eigen::Triplet<double>(static_cast<int>(r), *c, adVec[r].getADValue(dir)));
		}
	}
}

} // namespace ad

} // namespace griddae
