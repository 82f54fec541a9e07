/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include <catch2/catch.hpp>
#include "preamble.hpp"
#include "audio/command.hpp"

using namespace kittymix;
using namespace kittymix::audio;

CATCH_TEST_CASE("A delayed command is pending until its start time", "[command]")
{
	auto command = Command{change::Volume{0.0f}, Easing::Linear, 1.0, 2.0};
	CATCH_CHECK(command.is_pending());
	CATCH_CHECK_FALSE(command.is_done());
	CATCH_CHECK(command.progress() == 0.0f);

	command.start_after -= 1.0;
	CATCH_CHECK_FALSE(command.is_pending());
	CATCH_CHECK(command.elapsed() == 0.0);
	CATCH_CHECK(command.progress() == 0.0f);

	command.start_after -= 1.0;
	CATCH_CHECK(command.progress() == Approx(0.5f));
	CATCH_CHECK_FALSE(command.is_done());

	command.start_after -= 1.0;
	CATCH_CHECK(command.is_done());
	CATCH_CHECK(command.progress() == 1.0f);
}

CATCH_TEST_CASE("Command progress follows its easing and clamps past the end", "[command]")
{
	auto command = Command{change::Panning{0.0f}, Easing::QuadIn, 0.0, 2.0};
	command.start_after = -1.0;
	CATCH_CHECK(command.progress() == Approx(0.25f));
	command.start_after = -10.0;
	CATCH_CHECK(command.progress() == 1.0f);
}

CATCH_TEST_CASE("Instant commands jump straight to the end", "[command]")
{
	auto const now = Command::instant(change::Index{40});
	CATCH_CHECK_FALSE(now.is_pending());
	CATCH_CHECK(now.is_done());
	CATCH_CHECK(now.progress() == 1.0f);
	CATCH_CHECK(holds_alternative<change::Index>(now.change));

	auto const later = Command::instant(change::Pause{true}, 0.5);
	CATCH_CHECK(later.is_pending());
	CATCH_CHECK_FALSE(later.is_done());
	CATCH_CHECK(later.progress() == 1.0f);
}
