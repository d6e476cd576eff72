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

#include "linalg/DenseMatrix.hpp"
#include <cmath>
#include <algorithm>

namespace griddae
{

namespace linalg
{

namespace detail
{

void DenseMatrixBase::submatrixSetAll(double val, unsigned int startRow, unsigned int startCol, 
			unsigned int numRows, unsigned int numCols)
{
	griddae_assert(_rows >= startRow + numRows);
	griddae_assert(_cols >= startCol + numCols);

	for (unsigned int i = 0; i < numRows; ++i)
	{
		double* const row = _data + (startRow + i) * stride() + startCol;
		std::fill(row, row + numCols, val);
	}
}

void DenseMatrixBase::submatrixAssign(const DenseMatrixBase& mat, unsigned int startRow, unsigned int startCol, 
			unsigned int numRows, unsigned int numCols)
{
	griddae_assert(numRows == mat.rows());
	griddae_assert(numCols == mat.columns());
	griddae_assert(_rows >= startRow + numRows);
	griddae_assert(_cols >= startCol + numCols);

	for (unsigned int i = 0; i < numRows; ++i)
	{
		double const* const src = mat.data() + i * mat.stride();
		std::copy(src, src + numCols, _data + (startRow + i) * stride() + startCol);
	}
}

void DenseMatrixBase::multiplyVector(const double* const x, double alpha, double beta, double* const y) const
{
	// LAPACK sees the transposed matrix, so rows and columns interchange
	// and we multiply with the transposed of the transposed
	lapackInt_t m = _cols;
	lapackInt_t n = _rows;
	lapackInt_t lda = stride();
	lapackInt_t inc = 1;
	char trans[] = "T";

	LapackMultiplyDense(trans, &m, &n, &alpha, const_cast<double*>(_data), &lda, const_cast<double*>(x), &inc, &beta, y, &inc);
}

void DenseMatrixBase::transposedMultiplyVector(const double* const x, double alpha, double beta, double* const y) const
{
	lapackInt_t m = _cols;
	lapackInt_t n = _rows;
	lapackInt_t lda = stride();
	lapackInt_t inc = 1;
	char trans[] = "N";

	LapackMultiplyDense(trans, &m, &n, &alpha, const_cast<double*>(_data), &lda, const_cast<double*>(x), &inc, &beta, y, &inc);
}

bool DenseMatrixBase::factorize()
{
	griddae_assert(_rows == _cols);

	// Factorizing the transposed matrix is fine as long as solves use the transposition flag
	lapackInt_t n = _rows;
	lapackInt_t lda = stride();
	lapackInt_t flag = 0;

	LapackFactorDense(&n, &n, _data, &lda, _pivot, &flag);

	// Positive flag i indicates that U(i,i) is exactly zero
	return flag == 0;
}

bool DenseMatrixBase::solve(double* rhs) const
{
	griddae_assert(_rows == _cols);

	lapackInt_t n = _rows;
	lapackInt_t nrhs = 1;
	lapackInt_t lda = stride();
	lapackInt_t flag = 0;
	char trans[] = "T";

	LapackSolveDense(trans, &n, &nrhs, const_cast<double*>(_data), &lda, const_cast<lapackInt_t*>(_pivot), rhs, &n, &flag);

	if (flag != 0)
		return false;

	for (unsigned int i = 0; i < _rows; ++i)
	{
		if (!std::isfinite(rhs[i]))
			return false;
	}
	return true;
}

bool DenseMatrixBase::solve(double const* scalingFactors, double* rhs) const
{
	for (unsigned int i = 0; i < _rows; ++i)
		rhs[i] /= scalingFactors[i];
	return solve(rhs);
}

bool DenseMatrixBase::leastSquaresSolve(double* rhs, double* workspace, unsigned int size)
{
	griddae_assert(_rows >= _cols);
	griddae_assert(size >= 2 * _cols);

	// LAPACK sees the transposed (underdetermined) system
	char trans[] = "T";
	lapackInt_t n = _rows;
	lapackInt_t m = _cols;
	lapackInt_t nrhs = 1;
	lapackInt_t lda = stride();
	lapackInt_t lwork = size;
	lapackInt_t flag = 0;

	LapackDenseLeastSquares(trans, &m, &n, &nrhs, _data, &lda, rhs, &n, workspace, &lwork, &flag);

	return flag == 0;
}

void DenseMatrixBase::scaleRows(double const* scalingFactors, unsigned int numRows)
{
	const unsigned int ld = stride();
	for (unsigned int i = 0; i < numRows; ++i)
	{
		for (unsigned int j = 0; j < _cols; ++j)
			_data[i * ld + j] /= scalingFactors[i];
	}
}

void DenseMatrixBase::rowScaleFactors(double* scalingFactors, unsigned int numRows) const
{
	const unsigned int ld = stride();
	for (unsigned int i = 0; i < numRows; ++i)
	{
		scalingFactors[i] = 0.0;
		for (unsigned int j = 0; j < _cols; ++j)
			scalingFactors[i] = std::max(scalingFactors[i], std::abs(_data[i * ld + j]));

		if (scalingFactors[i] == 0.0)
			scalingFactors[i] = 1.0;
	}
}

std::ostream& operator<<(std::ostream& out, const DenseMatrixBase& dm)
{
	out << "[";
	for (unsigned int i = 0; i < dm.rows(); ++i)
	{
		for (unsigned int j = 0; j < dm.columns(); ++j)
		{
			out << dm.native(i, j);
			if (j != dm.columns() - 1)
				out << ", ";
		}
		if (i != dm.rows() - 1)
			out << "; ";
	}
	out << "]";
	return out;
}

}  // namespace detail

}  // namespace linalg

}  // namespace griddae
