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
 * Logging mechanism that filters messages at compile- and runtime.
 * 
 * The design (log statements assembled from nested parameter lists that are discarded
 * at compile time if the level is filtered out) follows templog by Hendrik Schober,
 * distributed under the Boost Software License, Version 1.0.
 */

#ifndef GRIDDAE_LOGGERBASE_HPP_
#define GRIDDAE_LOGGERBASE_HPP_

#include "common/CompilerSpecific.hpp"

#include <vector>
#include <string>
#include <sstream>
#include <ostream>
#include <type_traits>

namespace griddae
{

enum class LogLevel : unsigned int;
inline const char* to_string(LogLevel lvl) GRIDDAE_NOEXCEPT;

namespace log
{

	namespace detail
	{
		/**
		 * @brief Terminator of parameter lists
		 */
		struct NullType { };

		template <class T1, class T2>
		struct NestedList
		{
			T1 left;
			T2 right;

			NestedList(const T1& l, const T2& r) GRIDDAE_NOEXCEPT : left(l), right(r) { }
		};

		/**
		 * @brief Log message of a given level holding pointers to all streamed parameters
		 * @details Parameters are only recorded if @p passOn is @c true, that is, if the message
		 *          survives compile-time filtering.
		 * @tparam lvl LogLevel of this message
		 * @tparam passOn Determines whether the message is passed on or filtered out
		 * @tparam params_t Type list of recorded parameters
		 */
		template <LogLevel lvl, bool passOn, class params_t>
		struct LogMessage
		{
			params_t params;

			LogMessage(const params_t& p = params_t()) GRIDDAE_NOEXCEPT : params(p) { }
		};

		template <LogLevel lvl, class paramList_t, class param_t>
		inline LogMessage<lvl, false, NullType> operator<<(const LogMessage<lvl, false, paramList_t>&, const param_t&) GRIDDAE_NOEXCEPT
		{
			return LogMessage<lvl, false, NullType>();
		}

		template <LogLevel lvl, class paramList_t, class param_t>
		inline LogMessage<lvl, true, NestedList<paramList_t, const param_t*>> operator<<(const LogMessage<lvl, true, paramList_t>& lm, const param_t& p) GRIDDAE_NOEXCEPT
		{
			return LogMessage<lvl, true, NestedList<paramList_t, const param_t*>>(NestedList<paramList_t, const param_t*>(lm.params, &p));
		}

		/**
		 * @brief Positional information of a log statement
		 * @details Assigning a LogMessage forwards the complete statement to @p logger_t.
		 */
		template <class logger_t>
		struct LogStatement
		{
			const char* fileName;
			const char* funcName;
			unsigned int line;

			LogStatement(const char* fin, const char* fun, unsigned int ln) GRIDDAE_NOEXCEPT : fileName(fin), funcName(fun), line(ln) { }

			template <LogLevel lvl, bool passOn, class params_t>
			inline void operator=(const LogMessage<lvl, passOn, params_t>& lm)
			{
				logger_t::forward(fileName, funcName, line, lm);
			}
		};

		inline void writeParams(std::ostream& os, NullType) { }
		inline void writeParams(std::ostream& os, const NullType*) { }

		template <class T>
		inline void writeParams(std::ostream& os, const T* p)
		{
			os << *p;
		}

		/**
		 * @brief Writes the recorded parameters in the order they were streamed
		 * @details The first parameter is the leftmost leaf of the nested list.
		 */
		template <class paramList_t, class T>
		inline void writeParams(std::ostream& os, const NestedList<paramList_t, T>& p)
		{
			writeParams(os, p.left);
			writeParams(os, p.right);
		}

	} // namespace detail


	template <class T>
	inline std::ostream& operator<<(std::ostream& os, const std::vector<T>& v)
	{
		os << "[";
		for (std::size_t i = 0; i < v.size(); ++i)
		{
			if (i > 0)
				os << ",";
			os << v[i];
		}
		os << "]";
		return os;
	}


	/**
	 * @brief Logger that filters messages at compile time
	 * @details Messages with a level above @p lvl are turned into empty statements that the
	 *          compiler removes. This logger has to be the first one to see a LogMessage.
	 * @tparam nextLogger_t Logger that receives all messages surviving the filter
	 * @tparam lvl Maximum level of passed on messages
	 */
	template <class nextLogger_t, LogLevel lvl>
	class Logger
	{
	public:
		typedef Logger<nextLogger_t, lvl> this_logger_t;
		typedef nextLogger_t forward_logger_t;

		static inline detail::LogStatement<this_logger_t> statement(const char* fileName, const char* funcName, unsigned int line)
		{
			return detail::LogStatement<this_logger_t>(fileName, funcName, line);
		}

		template <LogLevel stmtLevel>
		static inline detail::LogMessage<stmtLevel, (lvl >= stmtLevel), detail::NullType> createMessage()
		{
			return detail::LogMessage<stmtLevel, (lvl >= stmtLevel), detail::NullType>();
		}

		template <LogLevel stmtLevel, class params_t>
		static inline void forward(const char*, const char*, unsigned int, const detail::LogMessage<stmtLevel, false, params_t>&) { }

		template <LogLevel stmtLevel, class params_t>
		static inline void forward(const char* fileName, const char* funcName, unsigned int line, const detail::LogMessage<stmtLevel, true, params_t>& lm)
		{
			forward_logger_t::forward(fileName, funcName, line, lm);
		}
	};

	/**
	 * @brief Formats the message as plain concatenation of all streamed parameters
	 */
	class PlainFormattingPolicy
	{
	public:
		template <class paramList_t>
		static inline void format(std::ostream& os, const char* fileName, const char* funcName, unsigned int line, LogLevel lvl, const paramList_t& p)
		{
			detail::writeParams(os, p);
		}
	};

	/**
	 * @brief Prefixes messages with level and position
	 */
	class StandardFormattingPolicy
	{
	public:
		template <class paramList_t>
		static inline void format(std::ostream& os, const char* fileName, const char* funcName, unsigned int line, LogLevel lvl, const paramList_t& p)
		{
			os << '[' << to_string(lvl) << ": " << fileName << "::" << funcName << "::" << line << "] ";
			detail::writeParams(os, p);
		}
	};

	/**
	 * @brief Logger that filters messages at runtime against a global level
	 */
	template <class forward_logger_t>
	class RuntimeFilteringLogger
	{
	public:
		template <LogLevel lvl, class params_t>
		static inline void forward(const char* fileName, const char* funcName, unsigned int line, const detail::LogMessage<lvl, true, params_t>& lm)
		{
			if (lvl <= _minLvl)
				forward_logger_t::forward(fileName, funcName, line, lm);
		}

		static inline LogLevel level() GRIDDAE_NOEXCEPT { return _minLvl; }
		static inline void level(LogLevel newLvl) GRIDDAE_NOEXCEPT { _minLvl = newLvl; }

	private:
		static LogLevel _minLvl;
	};

	/**
	 * @brief Final logger in the chain that formats messages and hands the lines to a write policy
	 * @details The write policy has to implement
	 *          <pre>
	 *              static void writeLine(const char* fileName, const char* funcName, unsigned int line, LogLevel lvl, const std::string& msg);
	 *          </pre>
	 */
	template <class formattingPolicy_t, class writePolicy_t>
	class NonFilteringLogger
	{
	public:
		template <LogLevel lvl, class params_t>
		static inline void forward(const char*, const char*, unsigned int, const detail::LogMessage<lvl, false, params_t>&) { }

		template <LogLevel lvl, class params_t>
		static inline void forward(const char* fileName, const char* funcName, unsigned int line, const detail::LogMessage<lvl, true, params_t>& lm)
		{
			std::ostringstream oss;
			formattingPolicy_t::format(oss, fileName, funcName, line, lvl, lm.params);
			oss << "\n";
			writePolicy_t::writeLine(fileName, funcName, line, lvl, oss.str());
		}
	};

} // namespace log
} // namespace griddae

/**
 * @brief Base for logging macros
 * @details Usage pattern is <pre>LOG_BASE(myLogger, Info) << "My log line " << arg1;</pre>
 */
#define LOG_BASE(logger_t, lvl) logger_t::statement(__FILE__, __func__, __LINE__) = logger_t::template createMessage<griddae::LogLevel::lvl>()

#endif  // GRIDDAE_LOGGERBASE_HPP_
