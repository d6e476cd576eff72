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
 * Helper functions and macros for parallelization.
 * 
 * Loops are written as
 * <pre>
 * #ifdef GRIDDAE_PARALLELIZE
 *     tbb::parallel_for(std::size_t(0), n, [&](std::size_t i)
 * #else
 *     for (std::size_t i = 0; i < n; ++i)
 * #endif
 *     {
 *         ...
 *     } GRIDDAE_PARFOR_END;
 * </pre>
 */

#ifndef LIBGRIDDAE_PARALLEL_SUPPORT_HPP_
#define LIBGRIDDAE_PARALLEL_SUPPORT_HPP_

#include "common/CompilerSpecific.hpp"

#ifdef GRIDDAE_PARALLELIZE
	#define GRIDDAE_PARFOR_END )

	#include <tbb/parallel_for.h>
	#include <tbb/task_arena.h>

	namespace griddae
	{
	namespace util
	{
		/**
		 * @brief Returns the maximum number of threads at this point in the code
		 * @return Maximum number of threads
		 */
		inline unsigned int getMaxThreads() { return tbb::this_task_arena::max_concurrency(); }
	} // namespace util
	} // namespace griddae

#else
	#define GRIDDAE_PARFOR_END

	namespace griddae
	{
	namespace util
	{
		inline unsigned int getMaxThreads() GRIDDAE_NOEXCEPT { return 1; }
	} // namespace util
	} // namespace griddae

#endif

#endif  // LIBGRIDDAE_PARALLEL_SUPPORT_HPP_
