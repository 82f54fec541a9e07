/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include "preamble.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "lib/debug.hpp"

using namespace kittymix;

auto main(int argc, char* argv[]) -> int
{
	lib::dbg::set_assert_handler();
	auto config_stub = globals::config.provide(nullopt);
	auto logger_stub = globals::logger.provide("kittymix-tests.log", Logger::Level::Warning);
	return Catch::Session().run(argc, argv);
}
