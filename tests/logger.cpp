/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include <catch2/catch.hpp>
#include "preamble.hpp"
#include "utils/logger.hpp"

using namespace kittymix;

CATCH_TEST_CASE("Log levels parse from their names", "[logger]")
{
	CATCH_CHECK(parse_log_level("TraceL1") == Logger::Level::TraceL1);
	CATCH_CHECK(parse_log_level("Debug") == Logger::Level::Debug);
	CATCH_CHECK(parse_log_level("Info") == Logger::Level::Info);
	CATCH_CHECK(parse_log_level("Warning") == Logger::Level::Warning);
	CATCH_CHECK(parse_log_level("Error") == Logger::Level::Error);
	CATCH_CHECK_THROWS_AS(parse_log_level("Loud"), runtime_error);
	CATCH_CHECK_THROWS_AS(parse_log_level(""), runtime_error);
}

CATCH_TEST_CASE("A string logger captures its messages", "[logger]")
{
	auto log = globals::logger->create_string_logger("LoggerTestCapture");
	INFO_AS(log, "Hello {}", 42);
	WARN_AS(log, "Careful with {}", "that"sv);
	auto const output = log.get_buffer();
	CATCH_CHECK_THAT(output, Catch::Matchers::Contains("[INF] Hello 42"));
	CATCH_CHECK_THAT(output, Catch::Matchers::Contains("[WRN] Careful with that"));
	CATCH_CHECK(log.get_buffer().empty());
}

CATCH_TEST_CASE("A string logger filters by level", "[logger]")
{
	auto log = globals::logger->create_string_logger("LoggerTestFilter", Logger::Level::Warning);
	DEBUG_AS(log, "Hidden");
	INFO_AS(log, "Also hidden");
	ERROR_AS(log, "Shown");
	auto const output = log.get_buffer();
	CATCH_CHECK_THAT(output, !Catch::Matchers::Contains("hidden", Catch::CaseSensitive::No));
	CATCH_CHECK_THAT(output, Catch::Matchers::Contains("[ERR] Shown"));
}

CATCH_TEST_CASE("Categories are created once per name", "[logger]")
{
	auto* first = globals::logger->create_category("LoggerTestCategory", Logger::Level::Info, false, false);
	auto* second = globals::logger->create_category("LoggerTestCategory");
	CATCH_CHECK(first == second);
	CATCH_CHECK(first != globals::logger->global);
}
