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

#include <catch.hpp>
#include "GridHelper.hpp"

#include "LoggingUtils.hpp"
#include "Logging.hpp"
#include "OperationPoint.hpp"
#include "PowerGrid.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace
{
	class CollectingLogReceiver : public griddae::ILogReceiver
	{
	public:
		virtual void message(const char* file, const char* func, const unsigned int line, griddae::LogLevel lvl, const char* lvlStr, const char* message)
		{
			levels.push_back(lvl);
			messages.push_back(message);
		}

		std::vector<griddae::LogLevel> levels;
		std::vector<std::string> messages;
	};
}

TEST_CASE("Log vector output from linear array", "[Logging]")
{
	std::stringstream ss;

	SECTION("Doubles")
	{
		const std::vector<double> data = {1.5, -2.0, 0.25};
		ss << griddae::log::VectorPtr<double>(data.data(), data.size());
		REQUIRE(ss.str() == "[1.5,-2,0.25]");
	}

	SECTION("Single element")
	{
		const int val = 7;
		ss << griddae::log::makeVectorPtr(&val, 1);
		REQUIRE(ss.str() == "[7]");
	}

	SECTION("Empty")
	{
		ss << griddae::log::VectorPtr<int>(nullptr, 0);
		REQUIRE(ss.str() == "[]");
	}
}

TEST_CASE("Log level string conversion", "[Logging]")
{
	const griddae::LogLevel levels[] = {griddae::LogLevel::Fatal, griddae::LogLevel::Error, griddae::LogLevel::Warning,
		griddae::LogLevel::Normal, griddae::LogLevel::Info, griddae::LogLevel::Debug, griddae::LogLevel::Trace};

	for (griddae::LogLevel lvl : levels)
		CHECK(griddae::to_loglevel(griddae::to_string(lvl)) == lvl);

	CHECK(griddae::to_loglevel("Verbose") == griddae::LogLevel::None);
}

TEST_CASE("Log level parsed from name or number", "[Logging]")
{
	griddae::LogLevel lvl = griddae::LogLevel::Warning;

	CHECK(griddae::parseLogLevel("Debug", lvl));
	CHECK(lvl == griddae::LogLevel::Debug);

	CHECK(griddae::parseLogLevel("0", lvl));
	CHECK(lvl == griddae::LogLevel::None);

	CHECK(griddae::parseLogLevel("7", lvl));
	CHECK(lvl == griddae::LogLevel::Trace);

	CHECK_FALSE(griddae::parseLogLevel("8", lvl));
	CHECK_FALSE(griddae::parseLogLevel("12", lvl));
	CHECK_FALSE(griddae::parseLogLevel("debug", lvl));
	CHECK_FALSE(griddae::parseLogLevel("", lvl));
	CHECK(lvl == griddae::LogLevel::Trace);

	CHECK(std::string(griddae::to_string(static_cast<griddae::LogLevel>(42))) == "Unknown");
}

#ifndef GRIDDAE_LOGGING_DISABLE

TEST_CASE("Missing slack node is reported as warning", "[Logging],[Guess]")
{
	griddae::JsonParameterProvider jpp = griddae::test::emptyGridConfig(1, 0);
	griddae::test::addPQ(jpp, 0, -0.1, 0.0);

	griddae::PowerGrid grid;
	griddae::test::configureGrid(grid, jpp);

	CollectingLogReceiver recv;
	const griddae::LogLevel oldLevel = griddae::getLogLevel();
	griddae::setLogReceiver(&recv);
	griddae::setLogLevel(griddae::LogLevel::Warning);

	const std::vector<double> guess = griddae::initialGuess(grid);

	griddae::setLogReceiver(nullptr);
	griddae::setLogLevel(oldLevel);

	CHECK(guess == std::vector<double>({1.0, 0.0}));
	REQUIRE(recv.levels.size() == 1);
	CHECK(recv.levels[0] == griddae::LogLevel::Warning);
	CHECK(recv.messages[0].find("SlackAlgebraic") != std::string::npos);
}

#endif
