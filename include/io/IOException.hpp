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

#ifndef GRIDDAE_IOEXCEPTION_HPP_
#define GRIDDAE_IOEXCEPTION_HPP_

#include <string>
#include <stdexcept>

namespace griddae
{

namespace io
{

/**
 * @brief Signals failures of reading or writing files
 */
class IOException : public std::runtime_error
{
public:
	IOException(const std::string& message) : std::runtime_error(message) { }
};

} // namespace io

} // namespace griddae

#endif /* GRIDDAE_IOEXCEPTION_HPP_ */
