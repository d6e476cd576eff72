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
 * Adapter for transmitting the log messages to a receiver.
 */

#ifndef LIBGRIDDAE_LOGGING_IMPL_HPP_
#define LIBGRIDDAE_LOGGING_IMPL_HPP_

#include "griddae/Logging.hpp"
#include "common/LoggerBase.hpp"

#ifndef GRIDDAE_LOGLEVEL_MIN
	#define GRIDDAE_LOGLEVEL_MIN Trace
#endif

namespace griddae
{
namespace log
{

	/**
	 * @brief Dispatches a log message to the registered receiver
	 * @param [in] file Filename in which the log message was raised
	 * @param [in] func Name of the function (implementation defined @c __func__ variable)
	 * @param [in] line Number of the line in which the log message was raised
	 * @param [in] lvl LogLevel representing the severity of the message
	 * @param [in] message Message string
	 */
	void emitLog(const char* file, const char* func, const unsigned int line, LogLevel lvl, const char* message);

	class EmitterWritePolicy
	{
	public:
		static inline void writeLine(const char* fileName, const char* funcName, unsigned int line, LogLevel lvl, const std::string& msg)
		{
			emitLog(fileName, funcName, line, lvl, msg.c_str());
		}
	};

	typedef NonFilteringLogger<PlainFormattingPolicy, EmitterWritePolicy> GlobalLogger;

#ifndef GRIDDAE_LOGGING_DISABLE
	typedef Logger<RuntimeFilteringLogger<GlobalLogger>, LogLevel::GRIDDAE_LOGLEVEL_MIN> DoubleFilterLogger;

	#ifdef __clang__
		template<> LogLevel RuntimeFilteringLogger<GlobalLogger>::_minLvl;
		extern template class RuntimeFilteringLogger<GlobalLogger>;
	#endif
#else
	typedef Logger<GlobalLogger, LogLevel::None> DiscardingLogger;
#endif

} // namespace log
} // namespace griddae

#ifndef GRIDDAE_LOGGING_DISABLE
	/**
	 * @brief Logging macro, used as <pre>LOG(Info) << "My log line " << arg1;</pre>
	 */
	#define LOG(lvl) LOG_BASE(griddae::log::DoubleFilterLogger, lvl)
#else
	#define LOG(lvl) LOG_BASE(griddae::log::DiscardingLogger, lvl)
#endif

#endif  // LIBGRIDDAE_LOGGING_IMPL_HPP_
