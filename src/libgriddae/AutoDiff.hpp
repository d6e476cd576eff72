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
 * @file Automatic differentiation (AD) library integration
 */

#ifndef LIBGRIDDAE_AUTODIFF_HPP_
#define LIBGRIDDAE_AUTODIFF_HPP_

#include "common/CompilerSpecific.hpp"

#include <cstddef>
#include <type_traits>

#define SFAD_DEFAULT_DIR 80

#include "sfad.hpp"

#define ACTIVE_INIT SFAD_GLOBAL_GRAD_SIZE

namespace griddae
{
	/**
	 * @brief Scalar type carrying a value and its directional derivatives
	 */
	typedef sfad::Fwd<double> active;

	namespace ad
	{
		/**
		 * @brief Returns the maximum number of allowed AD directions (seed vectors)
		 * @return Maximum number of allowed AD directions
		 */
		inline std::size_t getMaxDirections() GRIDDAE_NOEXCEPT { return SFAD_DEFAULT_DIR; }

		/**
		 * @brief Returns the current number of AD directions (seed vectors)
		 * @return Current number of AD directions
		 */
		inline std::size_t getDirections() GRIDDAE_NOEXCEPT { return sfad::getGradientSize(); }

		/**
		 * @brief Sets the current number of AD directions (seed vectors)
		 * @details The number of AD directions must not exceed the value returned by getMaxDirections().
		 *          The direction count is global and must not be changed while AD evaluations are running.
		 * @param [in] n Number of required AD directions
		 */
		inline void setDirections(std::size_t n)
		{
			griddae_assert(n <= SFAD_DEFAULT_DIR);
			sfad::setGradientSize(n);
		}
	}

	/**
	 * @brief Selects the @c active type between @c double and @c active
	 * @tparam A Type A
	 * @tparam B Type B
	 */
	template <typename A, typename B>
	struct DoubleActivePromoterImpl { };

	template <>
	struct DoubleActivePromoterImpl<griddae::active, griddae::active> { typedef griddae::active type; };

	template <>
	struct DoubleActivePromoterImpl<griddae::active, double> { typedef griddae::active type; };

	template <>
	struct DoubleActivePromoterImpl<double, griddae::active> { typedef griddae::active type; };

	template <>
	struct DoubleActivePromoterImpl<double, double> { typedef double type; };

	template <typename A, typename B>
	struct DoubleActivePromoter { typedef typename DoubleActivePromoterImpl<std::decay_t<A>, std::decay_t<B>>::type type; };

	/**
	 * @brief Extracts the value of a @c double or @c active
	 */
	inline double primalValue(double v) GRIDDAE_NOEXCEPT { return v; }
	inline double primalValue(const active& v) { return v.getValue(); }
}

#endif  // LIBGRIDDAE_AUTODIFF_HPP_
