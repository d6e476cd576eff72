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
 * Declares the LAPACK / BLAS routines used by the dense matrix class.
 * 
 * The name mangling of the Fortran symbols is selected by the macros
 * GRIDDAE_LAPACK_TRAILING_UNDERSCORE, GRIDDAE_LAPACK_PRECEDING_UNDERSCORE, and
 * GRIDDAE_LAPACK_UPPERCASE. Integers are 64 bit wide if GRIDDAE_LAPACK_64BIT_INT is set.
 */

#ifndef LIBGRIDDAE_LAPACKINTERFACE_HPP_
#define LIBGRIDDAE_LAPACKINTERFACE_HPP_

#ifdef GRIDDAE_LAPACK_64BIT_INT
	#include <cstdint>
#endif

#ifdef GRIDDAE_LAPACK_UPPERCASE
	#define GRIDDAE_LAPACK_NAME(nameLower, nameUpper) nameUpper
#else
	#define GRIDDAE_LAPACK_NAME(nameLower, nameUpper) nameLower
#endif

#if defined(GRIDDAE_LAPACK_TRAILING_UNDERSCORE)
	#define GRIDDAE_LAPACK_CONCAT(name) name##_
#elif defined(GRIDDAE_LAPACK_PRECEDING_UNDERSCORE)
	#define GRIDDAE_LAPACK_CONCAT(name) _##name
#else
	#define GRIDDAE_LAPACK_CONCAT(name) name
#endif

#define GRIDDAE_LAPACK_EXPAND(name) GRIDDAE_LAPACK_CONCAT(name)
#define LAPACK_FUNC(nameLower, nameUpper) GRIDDAE_LAPACK_EXPAND(GRIDDAE_LAPACK_NAME(nameLower, nameUpper))

namespace griddae
{
	#ifdef GRIDDAE_LAPACK_64BIT_INT
		typedef int64_t lapackInt_t;
	#else
		typedef int lapackInt_t;
	#endif

	extern "C" void LAPACK_FUNC(dgetrf,DGETRF) (lapackInt_t* m, lapackInt_t* n, double* A, lapackInt_t* lda, lapackInt_t* ipiv, lapackInt_t* info);

	extern "C" void LAPACK_FUNC(dgetrs,DGETRS) (char* trans, lapackInt_t* n, lapackInt_t* nrhs, double* a, 
			lapackInt_t* lda, lapackInt_t* ipiv, double* b, lapackInt_t* ldb, lapackInt_t* info);

	extern "C" void LAPACK_FUNC(dgemv,DGEMV) (char* trans, lapackInt_t* m, lapackInt_t* n,
			double* alpha, double* a, lapackInt_t* lda, double* x, lapackInt_t* incx, double* beta,
			double* y, lapackInt_t* incy);

	extern "C" void LAPACK_FUNC(dgels,DGELS) (char* trans, lapackInt_t* M, lapackInt_t* N, lapackInt_t* NRHS, double* A,
			lapackInt_t* LDA, double* B, lapackInt_t* LDB, double* WORK, lapackInt_t* LWORK, lapackInt_t* INFO);

	#define LapackFactorDense LAPACK_FUNC(dgetrf,DGETRF)
	#define LapackSolveDense LAPACK_FUNC(dgetrs,DGETRS)
	#define LapackMultiplyDense LAPACK_FUNC(dgemv,DGEMV)
	#define LapackDenseLeastSquares LAPACK_FUNC(dgels,DGELS)
}

#endif  // LIBGRIDDAE_LAPACKINTERFACE_HPP_
