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
 * Provides pseudo inverses of dense matrices
 */

#ifndef LIBGRIDDAE_LINALG_PSEUDOINVERSE_HPP_
#define LIBGRIDDAE_LINALG_PSEUDOINVERSE_HPP_

#include <vector>
#include <Eigen/Dense>

namespace griddae
{

namespace linalg
{

/**
 * @brief Computes the Moore-Penrose pseudo inverse of a matrix
 * @details Uses a complete orthogonal decomposition.
 * @param [in] mat Matrix
 * @return Pseudo inverse of @p mat
 */
inline Eigen::MatrixXd pseudoInverse(const Eigen::MatrixXd& mat)
{
	Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(mat);
	return cod.pseudoInverse();
}

/**
 * @brief Computes the projector @f$ M^+ M @f$ onto the differential subspace of a mass matrix
 * @param [in] massDiag Diagonal of the mass matrix
 * @return Dense projection matrix
 */
inline Eigen::MatrixXd massProjector(const std::vector<double>& massDiag)
{
	const Eigen::Index n = static_cast<Eigen::Index>(massDiag.size());
	Eigen::MatrixXd mass = Eigen::MatrixXd::Zero(n, n);
	for (Eigen::Index i = 0; i < n; ++i)
		mass(i, i) = massDiag[i];

	return pseudoInverse(mass) * mass;
}

} // namespace linalg

} // namespace griddae

#endif  // LIBGRIDDAE_LINALG_PSEUDOINVERSE_HPP_
