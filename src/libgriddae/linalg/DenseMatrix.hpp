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
 * Defines a dense matrix class backed by LAPACK.
 */

#ifndef LIBGRIDDAE_DENSEMATRIX_HPP_
#define LIBGRIDDAE_DENSEMATRIX_HPP_

#include "common/CompilerSpecific.hpp"
#include "LapackInterface.hpp"

#include <ostream>
#include <algorithm>

namespace griddae
{

namespace linalg
{

namespace detail
{

	/**
	 * @brief Dense matrix in row-major storage that does not own its memory
	 * @details Provides LU factorization, linear solves and least squares solves via LAPACK.
	 *          Since LAPACK works on column-major storage, LAPACK sees the transposed matrix
	 *          and all calls pass the transposition flag accordingly.
	 */
	class DenseMatrixBase
	{
	public:

		~DenseMatrixBase() GRIDDAE_NOEXCEPT { }

		/**
		 * @brief Sets all matrix elements to the given value
		 * @param [in] val Value all elements are set to
		 */
		inline void setAll(double val)
		{
			std::fill(_data, _data + stride() * _rows, val);
		}

		/**
		 * @brief Accesses an element of the matrix using row and column index
		 * @param [in] row Row index
		 * @param [in] col Column index
		 * @return Matrix element at the given position
		 */
		inline double& native(unsigned int row, unsigned int col)
		{
			griddae_assert(row < _rows);
			griddae_assert(col < _cols);
			return _data[row * stride() + col];
		}

		inline const double native(unsigned int row, unsigned int col) const
		{
			griddae_assert(row < _rows);
			griddae_assert(col < _cols);
			return _data[row * stride() + col];
		}

		inline unsigned int elements() const GRIDDAE_NOEXCEPT { return _cols * _rows; }
		inline unsigned int columns() const GRIDDAE_NOEXCEPT { return _cols; }
		inline unsigned int rows() const GRIDDAE_NOEXCEPT { return _rows; }
		inline unsigned int stride() const GRIDDAE_NOEXCEPT { return _cols; }

		inline double* data() GRIDDAE_NOEXCEPT { return _data; }
		inline double const* data() const GRIDDAE_NOEXCEPT { return _data; }

		inline lapackInt_t* pivotData() GRIDDAE_NOEXCEPT { return _pivot; }
		inline lapackInt_t const* pivotData() const GRIDDAE_NOEXCEPT { return _pivot; }

		inline double* rowPtr(unsigned int idx)
		{
			griddae_assert(idx < _rows);
			return _data + stride() * idx;
		}

		inline double const* rowPtr(unsigned int idx) const
		{
			griddae_assert(idx < _rows);
			return _data + stride() * idx;
		}

		/**
		 * @brief Sets all elements of a submatrix to the given value
		 * @param [in] val Value the submatrix elements are set to
		 * @param [in] startRow Index of the first row of the submatrix
		 * @param [in] startCol Index of the first column of the submatrix
		 * @param [in] numRows Number of rows of the submatrix
		 * @param [in] numCols Number of columns of the submatrix
		 */
		void submatrixSetAll(double val, unsigned int startRow, unsigned int startCol, 
			unsigned int numRows, unsigned int numCols);

		/**
		 * @brief Copies the given matrix into a submatrix of this matrix
		 * @param [in] mat Source matrix of size @p numRows x @p numCols
		 * @param [in] startRow Index of the first row of the submatrix
		 * @param [in] startCol Index of the first column of the submatrix
		 * @param [in] numRows Number of rows of the submatrix
		 * @param [in] numCols Number of columns of the submatrix
		 */
		void submatrixAssign(const DenseMatrixBase& mat, unsigned int startRow, unsigned int startCol, 
			unsigned int numRows, unsigned int numCols);

		inline void multiplyVector(const double* const x, double* const y) const
		{
			multiplyVector(x, 1.0, 0.0, y);
		}

		inline void transposedMultiplyVector(const double* const x, double* const y) const
		{
			transposedMultiplyVector(x, 1.0, 0.0, y);
		}

		/**
		 * @brief Computes @f$ y = \alpha A x + \beta y @f$
		 */
		void multiplyVector(const double* const x, double alpha, double beta, double* const y) const;

		/**
		 * @brief Computes @f$ y = \alpha A^T x + \beta y @f$
		 */
		void transposedMultiplyVector(const double* const x, double alpha, double beta, double* const y) const;

		/**
		 * @brief Factorizes the square matrix in-place using LU decomposition with partial pivoting
		 * @return @c true if the factorization was successful, @c false if the matrix is singular
		 */
		bool factorize();

		/**
		 * @brief Solves the linear system using a previously computed factorization
		 * @param [in,out] rhs On entry right hand side, on exit solution
		 * @return @c true if the system was solved, otherwise @c false
		 */
		bool solve(double* rhs) const;

		/**
		 * @brief Solves a row-scaled system using a previously computed factorization
		 * @details The matrix is expected to be scaled by scaleRows() with the given
		 *          @p scalingFactors before factorization.
		 * @param [in] scalingFactors Row scaling factors
		 * @param [in,out] rhs On entry right hand side, on exit solution
		 * @return @c true if the system was solved, otherwise @c false
		 */
		bool solve(double const* scalingFactors, double* rhs) const;

		/**
		 * @brief Solves the overdetermined system in the least squares sense using QR factorization
		 * @details The matrix is overwritten by its factorization.
		 * @param [in,out] rhs On entry right hand side of length rows(), on exit solution in the first columns() elements
		 * @param [in] workspace Workspace of at least @c 2*columns() elements
		 * @param [in] size Size of the workspace
		 * @return @c true if the system was solved, otherwise @c false
		 */
		bool leastSquaresSolve(double* rhs, double* workspace, unsigned int size);

		/**
		 * @brief Divides each row by the corresponding scaling factor
		 */
		inline void scaleRows(double const* scalingFactors) { scaleRows(scalingFactors, rows()); }
		void scaleRows(double const* scalingFactors, unsigned int numRows);

		/**
		 * @brief Computes the maximum absolute value of each row
		 * @details Rows that vanish identically get the scaling factor @c 1 such that scaling
		 *          leaves them zero and a subsequent factorization reports the singularity.
		 * @param [out] scalingFactors Array of row scaling factors
		 */
		inline void rowScaleFactors(double* scalingFactors) const { rowScaleFactors(scalingFactors, rows()); }
		void rowScaleFactors(double* scalingFactors, unsigned int numRows) const;

	protected:
		double* _data; //!< Pointer to the array in which the matrix is stored
		unsigned int _rows; //!< Number of rows
		unsigned int _cols; //!< Number of columns
		lapackInt_t* _pivot; //!< Pointer to an array which is used for pivoting by factorization methods

		DenseMatrixBase() GRIDDAE_NOEXCEPT : _data(nullptr), _rows(0), _cols(0), _pivot(nullptr) { }
		DenseMatrixBase(double* const data, lapackInt_t* const pivot, unsigned int rows, unsigned int cols) GRIDDAE_NOEXCEPT : _data(data), _rows(rows), _cols(cols), _pivot(pivot) { }

		inline void copyValues(double const* const src)
		{
			std::copy(src, src + stride() * _rows, _data);
		}

		inline void copyPivot(lapackInt_t const* const src)
		{
			std::copy(src, src + std::min(_rows, _cols), _pivot);
		}
	};

	std::ostream& operator<<(std::ostream& out, const DenseMatrixBase& dm);

}

/**
 * @brief Dense matrix that owns its memory
 */
class DenseMatrix : public detail::DenseMatrixBase
{
public:

	DenseMatrix() GRIDDAE_NOEXCEPT { }
	DenseMatrix(unsigned int rows, unsigned int cols) : DenseMatrixBase() { resize(rows, cols); }
	~DenseMatrix() GRIDDAE_NOEXCEPT
	{
		delete[] _pivot;
		delete[] _data;
	}

	DenseMatrix(const DenseMatrix& cpy) : DenseMatrixBase(new double[cpy.stride() * cpy._rows], new lapackInt_t[std::min(cpy._rows, cpy._cols)], cpy._rows, cpy._cols)
	{
		copyValues(cpy._data);
		copyPivot(cpy._pivot);
	}

	DenseMatrix(DenseMatrix&& cpy) GRIDDAE_NOEXCEPT : DenseMatrixBase(cpy._data, cpy._pivot, cpy._rows, cpy._cols)
	{
		cpy._data = nullptr;
		cpy._pivot = nullptr;
		cpy._rows = 0;
		cpy._cols = 0;
	}

	inline DenseMatrix& operator=(const DenseMatrix& cpy)
	{
		if (&cpy == this)
			return *this;

		if (cpy.elements() != elements())
		{
			delete[] _data;
			_data = new double[cpy.elements()];
		}
		if (std::min(cpy._rows, cpy._cols) != std::min(_rows, _cols))
		{
			delete[] _pivot;
			_pivot = new lapackInt_t[std::min(cpy._rows, cpy._cols)];
		}

		_cols = cpy._cols;
		_rows = cpy._rows;
		copyValues(cpy._data);
		copyPivot(cpy._pivot);

		return *this;
	}

	inline DenseMatrix& operator=(DenseMatrix&& cpy) GRIDDAE_NOEXCEPT
	{
		_cols = cpy._cols;
		_rows = cpy._rows;

		delete[] _data;
		_data = cpy._data;
		cpy._data = nullptr;

		delete[] _pivot;
		_pivot = cpy._pivot;
		cpy._pivot = nullptr;

		cpy._rows = 0;
		cpy._cols = 0;

		return *this;
	}

	/**
	 * @brief Resizes the matrix and sets all elements to zero
	 * @param [in] rows Number of rows
	 * @param [in] cols Number of columns
	 */
	inline void resize(unsigned int rows, unsigned int cols)
	{
		_cols = cols;
		_rows = rows;

		delete[] _data;
		_data = new double[stride() * _rows];

		delete[] _pivot;
		_pivot = new lapackInt_t[std::min(_rows, _cols)];

		setAll(0.0);
	}
};

} // namespace linalg

} // namespace griddae

#endif  // LIBGRIDDAE_DENSEMATRIX_HPP_
