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
 * Computes Jacobians by forward mode automatic differentiation
 */

#ifndef LIBGRIDDAE_JACOBIAN_HPP_
#define LIBGRIDDAE_JACOBIAN_HPP_

#include "AutoDiff.hpp"
#include "SlicedVector.hpp"

#include <functional>
#include <vector>
#include <Eigen/Sparse>

namespace griddae
{

class IVectorField;

namespace linalg
{
	namespace detail
	{
		class DenseMatrixBase;
	}
}

/**
 * @brief Function @f$ F\colon \mathbb{R}^n \to \mathbb{R}^m @f$ evaluated on AD types
 * @details Signature <tt>void fn(active const* x, active* res)</tt>
 */
typedef std::function<void(active const*, active*)> ActiveFunction;

/**
 * @brief Computes the dense Jacobian of a function
 * @details The columns are processed in chunks of at most ad::getMaxDirections() AD directions.
 *          The number of AD directions is a global setting, concurrent Jacobian evaluations
 *          are not supported.
 * @param [in] fn Function to differentiate
 * @param [in] x Point of evaluation
 * @param [in] n Number of inputs (columns of the Jacobian)
 * @param [out] jac Dense matrix with @f$ m @f$ rows and @p n columns
 */
void denseJacobian(const ActiveFunction& fn, double const* x, unsigned int n, linalg::detail::DenseMatrixBase& jac);

/**
 * @brief Computes the dense Jacobian @f$ \partial f / \partial u @f$ of a vector field
 * @param [in] field Vector field
 * @param [in] t Time point
 * @param [in] u State vector
 * @param [in] p Parameter vector or @c nullptr for the default parameters
 * @param [out] jac Square dense matrix of size IVectorField::numDofs()
 */
void denseJacobian(const IVectorField& field, double t, double const* u, double const* p, linalg::detail::DenseMatrixBase& jac);

/**
 * @brief Sparse Jacobian computation with column compression
 * @details The columns of the sparsity pattern are colored such that columns of the same
 *          color do not share a row. One AD direction per color then yields all nonzero entries.
 *          If there are more colors than AD directions, the colors are processed in chunks.
 */
class ColoredJacobian
{
public:
	/**
	 * @brief Colors the given sparsity pattern
	 * @param [in] pattern Column indices of the structural nonzeros of each row
	 * @param [in] nCols Number of columns
	 */
	ColoredJacobian(const util::SlicedVector<int>& pattern, unsigned int nCols);

	inline unsigned int numColors() const GRIDDAE_NOEXCEPT { return _numColors; }
	inline const std::vector<int>& colors() const GRIDDAE_NOEXCEPT { return _colors; }
	inline const util::SlicedVector<int>& pattern() const GRIDDAE_NOEXCEPT { return _pattern; }

	/**
	 * @brief Computes the Jacobian of @p fn at @p x
	 * @details Every structural nonzero is stored, also if its value vanishes.
	 *          This keeps the pattern of @p jac constant across calls.
	 * @param [in] fn Function to differentiate, its structure has to match the pattern
	 * @param [in] x Point of evaluation
	 * @param [out] jac Sparse matrix that receives the Jacobian
	 */
	void compute(const ActiveFunction& fn, double const* x, Eigen::SparseMatrix<double>& jac) const;

protected:
	util::SlicedVector<int> _pattern; //!< Structural nonzeros of each row
	std::vector<int> _colors; //!< Color of each column
	unsigned int _numColors; //!< Number of colors
};

} // namespace griddae

#endif  // LIBGRIDDAE_JACOBIAN_HPP_
