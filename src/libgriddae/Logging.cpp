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


#include "Logging.hpp"

namespace
{
	griddae::ILogReceiver* activeReceiver = nullptr;
}

#ifndef GRIDDAE_LOGGING_DISABLE

	// Messages below Warning stay silent until the application raises the level
	template <>
	griddae::LogLevel griddae::log::RuntimeFilteringLogger<griddae::log::GlobalLogger>::_minLvl = griddae::LogLevel::Warning;

	#ifdef __clang__
		template class griddae::log::RuntimeFilteringLogger<griddae::log::GlobalLogger>;
	#endif

namespace griddae
{
	namespace log
	{
		void emitLog(const char* file, const char* func, const unsigned int line, LogLevel lvl, const char* message)
		{
			if (!activeReceiver)
				return;

			activeReceiver->message(file, func, line, lvl, to_string(lvl), message);
		}
	}

	void setLogLevel(LogLevel lvl)
	{
		log::RuntimeFilteringLogger<log::GlobalLogger>::level(lvl);
	}

	LogLevel getLogLevel()
	{
		return log::RuntimeFilteringLogger<log::GlobalLogger>::level();
	}
}

#else

namespace griddae
{
	void setLogLevel(LogLevel lvl) { }
	LogLevel getLogLevel() { return LogLevel::None; }
}

#endif

void griddae::setLogReceiver(griddae::ILogReceiver* const recv)
{
	activeReceiver = recv;
}
