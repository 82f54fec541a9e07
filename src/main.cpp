/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include <cstdlib>
#include <charconv>
#include <cstdio>
#include "preamble.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "lib/debug.hpp"
#include "audio/mixer.hpp"
#include "audio/codec.hpp"
#include "io/file.hpp"

using namespace kittymix; // Can't namespace main()

static auto parse_rate(string_view text) -> double
{
	auto rate = 0.0;
	auto const [end, error] = std::from_chars(text.data(), text.data() + text.size(), rate);
	if (error != std::errc{} || end != text.data() + text.size() || !isfinite(rate))
		throw runtime_error_fmt("Invalid playback rate: {}", text);
	return rate;
}

static auto run(span<char* const> args) -> int
{
	if (args.size() < 2 || args.size() > 3) {
		print(stderr, "Usage: {} <file> [rate]\n", args.empty()? AppTitle : static_cast<char const*>(args[0]));
		return EXIT_FAILURE;
	}
	auto const path = fs::path{args[1]};
	auto const rate = args.size() == 3? parse_rate(args[2]) : 1.0;
	if (!io::has_extension(path, io::AudioExtensions))
		WARN("{} doesn't have a known audio extension, trying to decode anyway", path);

	auto const audio_cat = globals::logger->create_category("Audio",
		parse_log_level(globals::config->get_entry<string>("logging", "audio")));
	auto sound = audio::load_sound(path, audio_cat);
	sound.set_volume(static_cast<float>(globals::config->get_entry<double>("player", "volume")));
	if (rate < 0.0) sound.seek_to_end();
	sound.set_playback_rate(audio::PlaybackRate::factor(rate));

	auto mixer_stub = globals::mixer.provide(audio_cat);
	auto const handle = globals::mixer->play(move(sound));
	INFO("Playing {} at {}x speed, {:.2f}s long", path, rate, handle.duration_seconds());
	globals::mixer->wait();

	auto const errors = globals::mixer->handle_errors([&](dev::StreamError const& error) {
		ERROR_AS(audio_cat, "Playback interrupted ({}): {}", enum_name(error.kind), error.message);
	});
	if (errors > 0) return EXIT_FAILURE;
	INFO("Playback finished");
	return EXIT_SUCCESS;
}

auto main(int argc, char* argv[]) -> int
try {
	lib::dbg::set_assert_handler();
	auto config_stub = globals::config.provide();
	globals::config->load_from_file();
	auto logger_stub = globals::logger.provide(LogfilePath,
		parse_log_level(globals::config->get_entry<string>("logging", "global")));
	INFO("{} {}.{}.{} starting up", AppTitle, AppVersion[0], AppVersion[1], AppVersion[2]);
	return run(span{argv, static_cast<usize>(argc)});
}
catch (exception const& e) {
	if (globals::logger)
		CRIT("Uncaught exception: {}", e.what());
	else
		print(stderr, "Uncaught exception: {}\n", e.what());
	return EXIT_FAILURE;
}
