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
 * Provides several vector norms
 */

#ifndef LIBGRIDDAE_NORMS_HPP_
#define LIBGRIDDAE_NORMS_HPP_

#include <cmath>
#include <limits>
#include <algorithm>
#include "MathUtil.hpp"
#include "common/CompilerSpecific.hpp"

namespace griddae
{

namespace linalg
{
	/**
	 * @brief Computes the squared @f$ \ell^2 @f$-norm of a vector
	 * @param [in] x Vector
	 * @param [in] size Length of the vector
	 * @return Squared @f$ \ell^2 @f$-norm
	 */
	inline double l2NormSquared(double const* const x, int size)
	{
		double res = 0.0;
		for (int i = 0; i < size; ++i)
			res += sqr(x[i]);
		return res;
	}

	inline double l2Norm(double const* const x, int size)
	{
		return std::sqrt(l2NormSquared(x, size));
	}

	/**
	 * @brief Computes the maximum norm of a vector
	 * @details Returns NaN if any element is NaN.
	 * @param [in] x Vector
	 * @param [in] size Length of the vector
	 * @return Maximum norm
	 */
	inline double linfNorm(double const* const x, int size)
	{
		double res = 0.0;
		for (int i = 0; i < size; ++i)
		{
			if (griddae_unlikely(std::isnan(x[i])))
				return std::numeric_limits<double>::quiet_NaN();

			res = std::max(std::abs(x[i]), res);
		}
		return res;
	}

} // namespace linalg

} // namespace griddae

#endif  // LIBGRIDDAE_NORMS_HPP_
