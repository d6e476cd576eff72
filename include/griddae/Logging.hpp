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
 * Log levels and the receiver interface through which the library reports messages.
 */

#ifndef LIBGRIDDAE_LOGGING_HPP_
#define LIBGRIDDAE_LOGGING_HPP_

#include "common/CompilerSpecific.hpp"

#include <cctype>
#include <string>

namespace griddae
{
	/**
	 * @brief Severity of a log message
	 * @details Levels are nested: a receiver set to Debug also gets everything from Fatal to Normal and Info.
	 */
	enum class LogLevel : unsigned int
	{
		None = 0, //!< Nothing is logged
		Fatal = 1,
		Error = 2,
		Warning = 3, //!< Recoverable problems, e.g., a grid without slack node
		Normal = 4,
		Info = 5, //!< Results such as spectrum reports
		Debug = 6, //!< Solver selection and residual norms of solutions
		Trace = 7, //!< Every solver iteration
	};

	namespace detail
	{
		static const char* const logLevelNames[] = {"None", "Fatal", "Error", "Warning", "Normal", "Info", "Debug", "Trace"};
		static const unsigned int numLogLevels = sizeof(logLevelNames) / sizeof(logLevelNames[0]);
	}

	inline const char* to_string(LogLevel lvl) GRIDDAE_NOEXCEPT
	{
		const unsigned int idx = static_cast<unsigned int>(lvl);
		return (idx < detail::numLogLevels) ? detail::logLevelNames[idx] : "Unknown";
	}

	/**
	 * @brief Converts the name of a level to its LogLevel
	 * @details Unknown names are mapped to LogLevel::None.
	 */
	inline LogLevel to_loglevel(const std::string& ll) GRIDDAE_NOEXCEPT
	{
		for (unsigned int i = 1; i < detail::numLogLevels; ++i)
		{
			if (ll == detail::logLevelNames[i])
				return static_cast<LogLevel>(i);
		}
		return LogLevel::None;
	}

	/**
	 * @brief Parses a log level given either by name or by its numeric value
	 * @param [in] str Level name (e.g., @c Debug) or number in @c 0 to @c 7
	 * @param [out] lvl Parsed level, unchanged on failure
	 * @return @c true if @p str denotes a valid level, otherwise @c false
	 */
	inline bool parseLogLevel(const std::string& str, LogLevel& lvl) GRIDDAE_NOEXCEPT
	{
		if (str.empty())
			return false;

		if (std::isdigit(static_cast<unsigned char>(str[0])))
		{
			if ((str.size() != 1) || (static_cast<unsigned int>(str[0] - '0') >= detail::numLogLevels))
				return false;

			lvl = static_cast<LogLevel>(str[0] - '0');
			return true;
		}

		for (unsigned int i = 0; i < detail::numLogLevels; ++i)
		{
			if (str == detail::logLevelNames[i])
			{
				lvl = static_cast<LogLevel>(i);
				return true;
			}
		}
		return false;
	}

	/**
	 * @brief Receives the formatted log messages of the library
	 */
	class ILogReceiver
	{
	public:
		virtual ~ILogReceiver() GRIDDAE_NOEXCEPT { }

		/**
		 * @param [in] file Source file that raised the message
		 * @param [in] func Function that raised the message
		 * @param [in] line Line in @p file
		 * @param [in] lvl Severity
		 * @param [in] lvlStr Name of @p lvl
		 * @param [in] message Formatted message
		 */
		virtual void message(const char* file, const char* func, const unsigned int line, LogLevel lvl, const char* lvlStr, const char* message) = 0;
	};

	/**
	 * @brief Installs @p recv as receiver of all library messages
	 * @details Passing @c nullptr silences the library. The receiver is not owned.
	 */
	void setLogReceiver(ILogReceiver* const recv);

	/**
	 * @brief Sets the run-time log level, messages of lower severity are dropped
	 * @details Levels above the compile-time minimum @c GRIDDAE_LOGLEVEL_MIN have no effect.
	 */
	void setLogLevel(LogLevel lvl);

	LogLevel getLogLevel();

} // namespace griddae

#endif  // LIBGRIDDAE_LOGGING_HPP_
