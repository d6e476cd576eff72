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

#define CATCH_CONFIG_RUNNER
#include <catch.hpp>

#ifdef GRIDDAE_PARALLELIZE
	#include <tbb/global_control.h>
	#include <tbb/task_arena.h>
#endif


// Uncomment the next line to enable logging output of GridDAE in unit tests
//#define GRIDDAETEST_ENABLE_LOG


#ifdef GRIDDAETEST_ENABLE_LOG
	#include "griddae/Logging.hpp"
	#include <iostream>

	class LogReceiver : public griddae::ILogReceiver
	{
	public:
		LogReceiver() { }

		virtual void message(const char* file, const char* func, const unsigned int line, griddae::LogLevel lvl, const char* lvlStr, const char* message)
		{
			std::cout << '[' << lvlStr << ": " << func << "::" << line << "] " << message << std::flush;
		}
	};
#endif

int main(int argc, char* argv[])
{
#ifdef GRIDDAETEST_ENABLE_LOG
	LogReceiver lr;
	griddae::setLogReceiver(&lr);
	griddae::setLogLevel(griddae::LogLevel::Trace);
#endif

#ifdef GRIDDAE_PARALLELIZE
	int nThreads = tbb::this_task_arena::max_concurrency();
#else
	int nThreads = 0;
#endif

	Catch::Session session;

	// Add command line option for threads to CATCH's argument parser
	session.cli(session.cli() | Catch::clara::Opt(nThreads, "number")["--tbbthreads"]("number of TBB threads"));

	const int returnCode = session.applyCommandLine(argc, argv);
	if (returnCode != 0)
		return returnCode;

#ifdef GRIDDAE_PARALLELIZE
	tbb::global_control tbbGlobalControl(tbb::global_control::max_allowed_parallelism, (nThreads <= 0) ? tbb::this_task_arena::max_concurrency() : nThreads);
#endif

	return session.run();
}
