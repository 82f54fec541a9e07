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
#include "audio/sound.hpp"

using namespace kittymix;
using namespace kittymix::audio;

// Power of two, so that one output frame advances the cursor by exactly one source frame
static constexpr auto Rate = 64;

// Frame i of a ramp. Every frame is distinct and none of them is silent.
static auto ramp_frame(ssize_t i) -> Frame
{
	auto const value = static_cast<float>(i + 1);
	return {value, -value};
}

static auto ramp(ssize_t count) -> Sound
{
	auto frames = vector<Frame>{};
	frames.reserve(count);
	for (auto i = 0z; i < count; i += 1)
		frames.emplace_back(ramp_frame(i));
	return Sound::from_frames(Rate, {frames.data(), frames.size()});
}

static auto constant(ssize_t count, Frame frame = {1.0f, 1.0f}) -> Sound
{
	auto const frames = vector<Frame>(count, frame);
	return Sound::from_frames(Rate, {frames.data(), frames.size()});
}

// Render the given number of frames, returning the last one.
static auto tick(Sound& sound, int count = 1) -> Frame
{
	auto last = Frame::Zero;
	for (auto i = 0; i < count; i += 1)
		last = sound.next_frame(Rate);
	return last;
}

CATCH_TEST_CASE("A sound plays its frames in order at the native rate", "[sound]")
{
	auto sound = ramp(16);
	CATCH_CHECK(sound.sample_rate() == Rate);
	CATCH_CHECK(sound.frame_count() == 16);
	CATCH_CHECK(sound.duration_seconds() == 0.25);
	CATCH_CHECK(sound.duration() == 250ms);
	for (auto i = 0z; i < 16; i += 1) {
		CATCH_INFO("frame " << i);
		CATCH_CHECK(sound.next_frame(Rate) == ramp_frame(i));
	}
}

CATCH_TEST_CASE("A sound finishes once its buffer has played out", "[sound]")
{
	auto sound = ramp(8);
	tick(sound, 8);
	CATCH_CHECK_FALSE(sound.finished());
	CATCH_CHECK(tick(sound) == Frame::Zero);
	CATCH_CHECK(sound.finished());
	CATCH_CHECK(sound.index() == 8);
	CATCH_CHECK(sound.next_frame(Rate) == Frame::Zero);
	CATCH_CHECK(sound.finished());
}

CATCH_TEST_CASE("An empty sound is finished from the start", "[sound]")
{
	auto sound = Sound::from_frames(Rate, {});
	CATCH_CHECK(sound.frame_count() == 0);
	CATCH_CHECK(sound.finished());
	CATCH_CHECK(sound.next_frame(Rate) == Frame::Zero);
}

CATCH_TEST_CASE("A sound rejects an invalid sample rate", "[sound]")
{
	auto const frames = to_array<Frame>({{1.0f, 1.0f}, {1.0f, 1.0f}});
	CATCH_CHECK_THROWS_AS(Sound::from_frames(0, frames), runtime_error);
	CATCH_CHECK_THROWS_AS(Sound::from_frames(-44100, frames), runtime_error);
}

CATCH_TEST_CASE("A sound outputs silence for an invalid output rate", "[sound]")
{
	auto sound = ramp(8);
	CATCH_CHECK(sound.next_frame(0) == Frame::Zero);
	CATCH_CHECK(sound.next_frame(-1) == Frame::Zero);
	CATCH_CHECK(sound.next_frame(Rate) == ramp_frame(0));
}

CATCH_TEST_CASE("A sound shares its frame buffer", "[sound]")
{
	auto const first = ramp(8);
	auto const second = Sound{Rate * 2, first.get_frames()};
	CATCH_CHECK(second.get_frames() == first.get_frames());
	CATCH_CHECK(second.duration_seconds() == Approx(first.duration_seconds() / 2.0));
}

CATCH_TEST_CASE("Seeking moves the cursor after the buffered frames play out", "[sound]")
{
	auto sound = ramp(16);
	sound.seek_to_index(10);
	CATCH_CHECK(sound.index() == 10);
	CATCH_CHECK(tick(sound, 3) == ramp_frame(10));
	CATCH_CHECK(tick(sound) == ramp_frame(11));
}

CATCH_TEST_CASE("Seeking clamps to the buffer", "[sound]")
{
	auto sound = ramp(16);
	sound.seek_to_index(100);
	CATCH_CHECK(sound.index() == 16);
	sound.seek_to_index(-5);
	CATCH_CHECK(sound.index() == 0);
	sound.seek_to(0.125);
	CATCH_CHECK(sound.index() == 8);
	sound.seek_by(0.0625);
	CATCH_CHECK(sound.index() == 12);
	sound.seek_by(-1e300);
	CATCH_CHECK(sound.index() == 0);
	sound.seek_to_end();
	CATCH_CHECK(sound.index() == 15);
	sound.reset();
	CATCH_CHECK(sound.index() == 0);
}

CATCH_TEST_CASE("Volume is applied as frames are read from the buffer", "[sound]")
{
	auto sound = constant(16);
	sound.set_volume(0.5f);
	CATCH_CHECK(sound.volume() == 0.5f);
	CATCH_CHECK(sound.base_volume() == 1.0f);
	CATCH_CHECK(tick(sound).left == 1.0f);
	CATCH_CHECK(tick(sound, 3).left == 0.5f);
}

CATCH_TEST_CASE("Panning follows an equal-power law", "[sound]")
{
	auto sound = constant(16);
	sound.set_panning(0.0f);
	CATCH_CHECK(sound.panning() == 0.0f);
	auto const left = tick(sound, 4);
	CATCH_CHECK(left.left == Approx(std::numbers::sqrt2));
	CATCH_CHECK(left.right == Approx(0.0f).margin(1e-6));

	auto centred = constant(16);
	CATCH_CHECK(tick(centred, 4) == Frame{1.0f, 1.0f});
}

CATCH_TEST_CASE("A paused sound holds its position and goes silent", "[sound]")
{
	auto sound = ramp(16);
	sound.pause();
	CATCH_CHECK(sound.paused());
	CATCH_CHECK(tick(sound) == ramp_frame(0));
	tick(sound, 7);
	CATCH_CHECK(sound.index() == 2);
	CATCH_CHECK(sound.outputting_silence());
	CATCH_CHECK(tick(sound) == Frame::Zero);
	CATCH_CHECK_FALSE(sound.finished());

	sound.resume();
	CATCH_CHECK_FALSE(sound.paused());
	tick(sound, 4);
	CATCH_CHECK(sound.index() == 6);
	CATCH_CHECK(tick(sound) == ramp_frame(4));
}

CATCH_TEST_CASE("Seeking a paused sound leaves the buffered frames alone", "[sound]")
{
	auto sound = ramp(16);
	auto const playing = sound.playing_index();
	sound.pause();
	sound.seek_to_index(100);
	CATCH_CHECK(sound.index() == 16);
	CATCH_CHECK(sound.playing_index() == playing);
	CATCH_CHECK(tick(sound) == ramp_frame(0));
}

CATCH_TEST_CASE("A reversed sound plays back to the start and finishes", "[sound]")
{
	auto sound = ramp(8);
	sound.seek_to_end();
	sound.reverse();
	CATCH_CHECK(sound.playback_rate() == PlaybackRate::factor(-1.0));
	CATCH_CHECK(tick(sound, 3) == ramp_frame(7));
	CATCH_CHECK(tick(sound) == ramp_frame(6));
	for (auto i = 0; i < 100 && !sound.finished(); i += 1)
		tick(sound);
	CATCH_CHECK(sound.finished());
	CATCH_CHECK(sound.index() == -1);
}

CATCH_TEST_CASE("Doubling the playback rate skips every other frame", "[sound]")
{
	auto sound = ramp(32);
	sound.set_playback_rate(PlaybackRate::factor(2.0));
	CATCH_CHECK(sound.base_playback_rate() == PlaybackRate{});
	tick(sound, 2);
	CATCH_CHECK(tick(sound) == ramp_frame(4));
	CATCH_CHECK(tick(sound) == ramp_frame(6));
}

CATCH_TEST_CASE("An extreme playback rate moves a looping sound by a bounded amount", "[sound]")
{
	auto sound = ramp(16);
	sound.set_loop_enabled(true);
	sound.set_playback_rate(PlaybackRate::factor(1e12));
	tick(sound, Rate);
	CATCH_CHECK_FALSE(sound.finished());
	CATCH_CHECK(sound.index() >= 0);
	CATCH_CHECK(sound.index() < 16);

	sound.pause();
	tick(sound, Rate);
	CATCH_CHECK(sound.outputting_silence());
}

CATCH_TEST_CASE("A forward loop repeats its region", "[sound]")
{
	auto sound = ramp(16);
	sound.set_loop_index(4, 8);
	sound.set_loop_enabled(true);
	CATCH_CHECK(sound.loop_enabled());
	CATCH_CHECK(sound.loop_points() == LoopPoints{4, 8});
	tick(sound, 6);
	CATCH_CHECK(sound.index() == 4);
	tick(sound, 2);
	for (auto lap = 0; lap < 3; lap += 1) {
		for (auto i = 4z; i < 8; i += 1)
			CATCH_CHECK(tick(sound) == ramp_frame(i));
	}
	CATCH_CHECK_FALSE(sound.finished());
}

CATCH_TEST_CASE("A backward loop jumps from its start to its end", "[sound]")
{
	auto sound = ramp(16);
	sound.seek_to_index(12);
	sound.set_playback_rate(PlaybackRate::factor(-1.0));
	sound.set_loop_index(4, 8);
	sound.set_loop_enabled(true);
	tick(sound, 7);
	CATCH_CHECK(sound.index() == 5);
	tick(sound);
	CATCH_CHECK(sound.index() == 8);
}

CATCH_TEST_CASE("Loop points are clamped and ordered", "[sound]")
{
	auto sound = ramp(16);
	CATCH_CHECK(sound.loop_points() == LoopPoints{0, 16});
	sound.set_loop_index(100, -3);
	CATCH_CHECK(sound.loop_points() == LoopPoints{0, 16});
	sound.set_loop_index(12, 4);
	CATCH_CHECK(sound.loop_start() == 4);
	CATCH_CHECK(sound.loop_end() == 12);
	sound.set_loop(0.125, 0.1875);
	CATCH_CHECK(sound.loop_start_seconds() == 0.125);
	CATCH_CHECK(sound.loop_end_seconds() == 0.1875);
}

CATCH_TEST_CASE("An empty loop region does not hold the sound", "[sound]")
{
	auto sound = ramp(4);
	sound.set_loop_index(2, 2);
	sound.set_loop_enabled(true);
	tick(sound, 5);
	CATCH_CHECK(sound.finished());
}

CATCH_TEST_CASE("A delayed volume command fades over its duration", "[sound][command]")
{
	auto sound = constant(512);
	sound.add_command({change::Volume{0.0f}, Easing::Linear, 1.0, 5.0});
	CATCH_CHECK(sound.command_count() == 1);
	tick(sound, Rate / 2);
	CATCH_CHECK(sound.volume() == 1.0f);
	tick(sound, Rate * 3);
	CATCH_CHECK(sound.volume() == Approx(0.5f).margin(0.01));
	tick(sound, Rate * 3 - Rate / 2);
	CATCH_CHECK(sound.volume() == 0.0f);
	CATCH_CHECK(sound.command_count() == 0);
	tick(sound, Rate);
	CATCH_CHECK(sound.volume() == 0.0f);
}

CATCH_TEST_CASE("A command tweens from the resting value", "[sound][command]")
{
	auto sound = constant(256);
	sound.set_volume(0.5f);
	sound.add_command({change::Volume{0.0f}, Easing::Linear, 0.0, 1.0});
	tick(sound);
	CATCH_CHECK(sound.volume() == 1.0f);
	CATCH_CHECK(sound.base_volume() == 1.0f);
	tick(sound, Rate / 2 - 1);
	CATCH_CHECK(sound.volume() == 0.515625f);
	tick(sound, Rate / 2);
	CATCH_CHECK(sound.volume() == 0.0f);
	CATCH_CHECK(sound.base_volume() == 0.0f);
	CATCH_CHECK(sound.command_count() == 0);
}

CATCH_TEST_CASE("Overlapping commands share the resting value", "[sound][command]")
{
	auto sound = constant(256);
	sound.add_command({change::Volume{0.0f}, Easing::Linear, 0.0, 1.0});
	sound.add_command({change::Volume{0.5f}, Easing::Linear, 0.5, 1.0});
	tick(sound, Rate / 2);
	CATCH_CHECK(sound.volume() == 0.515625f);
	// The second command starts from 1.0, not from where the first one left off
	tick(sound);
	CATCH_CHECK(sound.volume() == 1.0f);
}

CATCH_TEST_CASE("The later of two overlapping commands prevails", "[sound][command]")
{
	auto sound = constant(256);
	sound.add_command({change::PlaybackRate{PlaybackRate::factor(2.0)}, Easing::Linear, 0.0, 1.0});
	sound.add_command({change::PlaybackRate{PlaybackRate::factor(0.5)}, Easing::Linear, 0.0, 1.0});
	tick(sound, Rate / 2);
	CATCH_CHECK(sound.playback_rate().as_factor() < 1.0);
	tick(sound, Rate / 2);
	CATCH_CHECK(sound.playback_rate() == PlaybackRate::factor(0.5));
	CATCH_CHECK(sound.command_count() == 0);
}

CATCH_TEST_CASE("Instant commands take effect on the next frame", "[sound][command]")
{
	CATCH_SECTION("Index") {
		auto sound = ramp(128);
		sound.add_command(Command::instant(change::Index{40}));
		tick(sound);
		CATCH_CHECK(sound.index() == 41);
		CATCH_CHECK(sound.command_count() == 0);
	}
	CATCH_SECTION("Position") {
		auto sound = ramp(128);
		sound.add_command(Command::instant(change::Position{0.5}));
		tick(sound);
		CATCH_CHECK(sound.index() == 33);
	}
	CATCH_SECTION("Pause after a delay") {
		auto sound = ramp(128);
		sound.add_command(Command::instant(change::Pause{true}, 0.5));
		tick(sound, Rate / 2 - 1);
		CATCH_CHECK_FALSE(sound.paused());
		tick(sound);
		CATCH_CHECK(sound.paused());
	}
}

CATCH_TEST_CASE("A pause command flips halfway through", "[sound][command]")
{
	auto sound = ramp(128);
	sound.add_command({change::Pause{true}, Easing::Linear, 0.0, 1.0});
	tick(sound, Rate / 2);
	CATCH_CHECK_FALSE(sound.paused());
	tick(sound);
	CATCH_CHECK(sound.paused());
	tick(sound, Rate / 2 - 1);
	CATCH_CHECK(sound.paused());
	CATCH_CHECK(sound.command_count() == 0);
}

CATCH_TEST_CASE("A rate command blends pitch shifts in semitones", "[sound][command]")
{
	auto sound = constant(256);
	sound.set_playback_rate(PlaybackRate::semitones(-12.0));
	sound.set_playback_rate(PlaybackRate::semitones(0.0));
	CATCH_CHECK(sound.base_playback_rate() == PlaybackRate::semitones(-12.0));
	sound.add_command({change::PlaybackRate{PlaybackRate::factor(2.0)}, Easing::Linear, 0.0, 1.0});
	tick(sound, Rate / 2 + 1);
	CATCH_CHECK(sound.playback_rate().is_semitones());
	CATCH_CHECK(sound.playback_rate().as_semitones() == Approx(0.0).margin(1e-9));
	tick(sound, Rate / 2 - 1);
	CATCH_CHECK(sound.command_count() == 0);
	CATCH_CHECK(sound.playback_rate().is_semitones());
	CATCH_CHECK(sound.playback_rate().as_factor() == Approx(2.0));
}

CATCH_TEST_CASE("A loop command tweens the loop region", "[sound][command]")
{
	auto sound = ramp(256);
	sound.add_command({change::LoopSeconds{1.0, 2.0}, Easing::Linear, 0.0, 1.0});
	// Tweening away from the whole-sound loop, the end stays past the buffer until it lands
	tick(sound, Rate / 2);
	CATCH_CHECK(sound.loop_start() == 31);
	CATCH_CHECK(sound.loop_end() == 256);
	tick(sound, Rate / 2);
	CATCH_CHECK(sound.loop_points() == LoopPoints{64, 128});
	CATCH_CHECK(sound.loop_start_seconds() == 1.0);
	CATCH_CHECK(sound.loop_end_seconds() == 2.0);
}
