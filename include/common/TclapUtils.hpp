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

#ifndef GRIDDAE_TCLAPUTILS_HPP_
#define GRIDDAE_TCLAPUTILS_HPP_

#include <tclap/StdOutput.h>
#include <iostream>
#include <string>

#include "griddae/LibVersionInfo.hpp"

namespace TCLAP 
{

	/**
	 * @brief Modifies the standard behavior of TCLAP to output the library version and build variant
	 */
	class CustomOutput : public StdOutput
	{
	public:

		CustomOutput(const std::string& progName) : _progName(progName) { }

		virtual void version(CmdLineInterface& c)
		{
			std::cout << "This is " << _progName << " version " << griddae::getLibraryVersion() << "\n";
			std::cout << "Build variant " << griddae::getLibraryBuildType() << " (" << griddae::getLibraryCompiler() << ")\n";
			std::cout << "See the accompanying LICENSE.txt file" << std::endl;
		}

	protected:
		std::string _progName;
	};

}

#endif  // GRIDDAE_TCLAPUTILS_HPP_
