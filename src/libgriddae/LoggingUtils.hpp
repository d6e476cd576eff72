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
 * Utilities for logging various data types.
 */

#ifndef LIBGRIDDAE_LOGGING_UTILS_HPP_
#define LIBGRIDDAE_LOGGING_UTILS_HPP_

#ifndef GRIDDAE_LOGGING_DISABLE
	#include "AutoDiff.hpp"

	#include <ostream>
#endif

namespace griddae
{
namespace log
{
	/**
	 * @brief Container for logging arrays given by pointer and number of elements
	 * @tparam T Type of the underlying array items
	 */
	template <class T>
	struct VectorPtr
	{
		const T* data;
		unsigned int nElem;

		VectorPtr(T const* d, unsigned int n) : data(d), nElem(n) { }
	};

	template <class T>
	inline VectorPtr<T> makeVectorPtr(T const* d, unsigned int n) { return VectorPtr<T>(d, n); }

#ifndef GRIDDAE_LOGGING_DISABLE

	inline std::ostream& operator<<(std::ostream& os, const griddae::active& v)
	{
		os << v.getValue() << " [";
		for (std::size_t i = 0; i < griddae::ad::getDirections(); ++i)
		{
			if (i > 0)
				os << ", ";
			os << v.getADValue(i);
		}
		os << "]";
		return os;
	}

	template <class T>
	inline std::ostream& operator<<(std::ostream& os, const griddae::log::VectorPtr<T>& v)
	{
		os << "[";
		for (unsigned int i = 0; i < v.nElem; ++i)
		{
			if (i > 0)
				os << ",";
			os << v.data[i];
		}
		os << "]";
		return os;
	}

#endif

} // namespace log
} // namespace griddae

#endif  // LIBGRIDDAE_LOGGING_UTILS_HPP_
