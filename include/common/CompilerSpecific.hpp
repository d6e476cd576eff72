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
 * Defines compiler dependent macros for inlining, branch prediction and debug assertions.
 */

#ifndef GRIDDAE_COMPILERSPECIFIC_HPP_
#define GRIDDAE_COMPILERSPECIFIC_HPP_

#define GRIDDAE_NOEXCEPT noexcept
#define GRIDDAE_CONST_OR_NOTHING const

#if (defined _MSC_VER) || (defined __INTEL_COMPILER)
	#define GRIDDAE_STRONG_INLINE __forceinline
#else
	#define GRIDDAE_STRONG_INLINE inline
#endif

#ifdef __GNUC__
	#define GRIDDAE_ALWAYS_INLINE __attribute__((always_inline)) inline
#else
	#define GRIDDAE_ALWAYS_INLINE GRIDDAE_STRONG_INLINE
#endif

// Debug switches
#if defined(NDEBUG) || !defined(DEBUG)
	#ifndef GRIDDAE_NO_DEBUG
		#define GRIDDAE_NO_DEBUG
	#endif
	#ifdef GRIDDAE_DEBUG
		#undef GRIDDAE_DEBUG
	#endif
#endif
#if defined(DEBUG) || defined(GRIDDAE_DEBUG)
	#define GRIDDAE_DEBUG
	#undef GRIDDAE_NO_DEBUG
	#include <cassert>
#endif

#ifdef GRIDDAE_NO_DEBUG
	#define griddae_assert(x)
	#define GRIDDAE_ONLY_USED_FOR_DEBUG(x) (void)x
#else
	#define griddae_assert(x) assert(x)
	#define GRIDDAE_ONLY_USED_FOR_DEBUG(x)
#endif

#ifdef __GNUC__
	#define griddae_likely(x) __builtin_expect(!!(x), 1)
	#define griddae_unlikely(x) __builtin_expect(!!(x), 0)
#else
	#define griddae_likely(x) (x)
	#define griddae_unlikely(x) (x)
#endif

#endif  // GRIDDAE_COMPILERSPECIFIC_HPP_
