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
 * Provides version info.
 */

#ifndef LIBGRIDDAE_LIBVERSIONINFO_HPP_
#define LIBGRIDDAE_LIBVERSIONINFO_HPP_

#include "common/CompilerSpecific.hpp"

namespace griddae
{

	/**
	 * @brief Returns the version string of the libgriddae library
	 * @return Version string
	 */
	const char* getLibraryVersion() GRIDDAE_NOEXCEPT;

	/**
	 * @brief Returns the build type (Debug, Release, RelWithDebInfo, RelMinSize)
	 * @return Build type
	 */
	const char* getLibraryBuildType() GRIDDAE_NOEXCEPT;

	/**
	 * @brief Returns the compiler including its version used for building the library
	 * @return Compiler and its version
	 */
	const char* getLibraryCompiler() GRIDDAE_NOEXCEPT;

} // namespace griddae

#endif  // LIBGRIDDAE_LIBVERSIONINFO_HPP_
