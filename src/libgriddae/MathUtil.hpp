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
 * Provides several math functions
 */

#ifndef LIBGRIDDAE_MATHUTIL_HPP_
#define LIBGRIDDAE_MATHUTIL_HPP_

#include "common/CompilerSpecific.hpp"

namespace griddae
{
	/**
	 * @brief Computes the square of the given argument
	 */
	inline double sqr(const double x) GRIDDAE_NOEXCEPT { return x * x; }

	/**
	 * @brief Ratio of circumference and diameter of a circle
	 */
	constexpr double pi = 3.14159265358979323846;

} // namespace griddae

#endif  // LIBGRIDDAE_MATHUTIL_HPP_
