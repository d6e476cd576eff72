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
 * Provides several utilities for automatic differentiation (AD)
 */

#ifndef LIBGRIDDAE_ADUTILS_HPP_
#define LIBGRIDDAE_ADUTILS_HPP_

#include "AutoDiff.hpp"
#include "SlicedVector.hpp"

#include <vector>
#include <Eigen/Sparse>

namespace griddae
{

namespace linalg
{
	namespace detail
	{
		class DenseMatrixBase;
	}
}

namespace ad
{

/**
 * @brief Sets seed vectors for a chunk of columns of a dense Jacobian
 * @details Column @c adDirOffset + k of the Jacobian is assigned to AD direction @c k for
 *          <tt>0 <= k < numCols</tt>. All other directions of all entries are cleared.
 * @param [in,out] adVec Vector of AD datatypes that receives the seed vectors
 * @param [in] adDirOffset Index of the first column of the chunk
 * @param [in] numCols Number of columns in the chunk, at most ad::getDirections()
 * @param [in] size Length of @p adVec
 */
void prepareAdVectorSeedsForDenseMatrix(active* const adVec, int adDirOffset, int numCols, int size);

/**
 * @brief Extracts a chunk of columns of a dense Jacobian from an AD vector
 * @param [in] adVec Result vector of AD datatypes seeded by prepareAdVectorSeedsForDenseMatrix()
 * @param [in] adDirOffset Index of the first column of the chunk
 * @param [in] numCols Number of columns in the chunk
 * @param [out] mat Dense matrix that receives the columns
 */
void extractDenseJacobianFromAd(active const* const adVec, int adDirOffset, int numCols, linalg::detail::DenseMatrixBase& mat);

/**
 * @brief Sets seed vectors for column-compressed Jacobian computation
 * @details Entry @c i receives a unit derivative in direction <tt>colors[i] - colorOffset</tt> if its
 *          color is in the chunk <tt>[colorOffset, colorOffset + numColors)</tt>.
 * @param [in,out] adVec Vector of AD datatypes that receives the seed vectors
 * @param [in] colors Color of each column
 * @param [in] colorOffset First color of the chunk
 * @param [in] numColors Number of colors in the chunk, at most ad::getDirections()
 */
void prepareAdVectorSeedsForColoring(active* const adVec, const std::vector<int>& colors, int colorOffset, int numColors);

/**
 * @brief Extracts the entries of a chunk of colors from a column-compressed AD evaluation
 * @details Since columns of the same color have no common row, the entry @c (r,c) is stored
 *          in direction <tt>colors[c] - colorOffset</tt> of the result @c r.
 * @param [in] adVec Result vector of AD datatypes
 * @param [in] colors Color of each column
 * @param [in] colorOffset First color of the chunk
 * @param [in] numColors Number of colors in the chunk
 * @param [in] rowPattern Column indices of the structural nonzeros of each row
 * @param [in,out] entries Receives the entries of the columns in the chunk
 */
void extractColoredJacobianFromAd(active const* const adVec, const std::vector<int>& colors, int colorOffset, int numColors,
	const util::SlicedVector<int>& rowPattern, std::vector<Eigen::Triplet<double>>& entries);

/**
 * @brief Copies the values of a double vector into an AD vector without modifying its derivatives
 */
inline void copyToAd(double const* const src, active* const adVec, int size)
{
	for (int i = 0; i < size; ++i)
		adVec[i].setValue(src[i]);
}

} // namespace ad

} // namespace griddae

#endif  // LIBGRIDDAE_ADUTILS_HPP_
