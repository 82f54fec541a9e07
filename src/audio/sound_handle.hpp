/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "audio/sound.hpp"

namespace kittymix::audio {

// Shared, lock-guarded reference to a playing Sound. Copies refer to the same instance; the
// sound lives for as long as any handle to it does. Every method locks the sound for the
// duration of that one call only.
class SoundHandle {
public:
	explicit SoundHandle(Sound sound): state{make_shared<State>(move(sound))} {}

	// Run a function with exclusive access to the sound, returning its result.
	template<invocable<Sound&> Func>
	auto locked(Func&& func) const -> decltype(auto)
	{
		auto lock = lock_guard{state->lock};
		return forward<Func>(func)(state->sound);
	}

	auto next_frame(int output_rate) const noexcept -> Frame
	{
		auto lock = lock_guard{state->lock};
		return state->sound.next_frame(output_rate);
	}

	void add_command(Command command) const { locked([&](auto& s) { s.add_command(command); }); }

	void set_volume(float volume) const { locked([&](auto& s) { s.set_volume(volume); }); }
	void set_playback_rate(PlaybackRate rate) const { locked([&](auto& s) { s.set_playback_rate(rate); }); }
	void set_panning(float panning) const { locked([&](auto& s) { s.set_panning(panning); }); }
	void set_paused(bool paused) const { locked([&](auto& s) { s.set_paused(paused); }); }
	void pause() const { set_paused(true); }
	void resume() const { set_paused(false); }
	void reverse() const { locked([](auto& s) { s.reverse(); }); }

	void seek_to_index(ssize_t index) const { locked([&](auto& s) { s.seek_to_index(index); }); }
	void seek_to(double seconds) const { locked([&](auto& s) { s.seek_to(seconds); }); }
	void seek_by(double seconds) const { locked([&](auto& s) { s.seek_by(seconds); }); }
	void seek_to_end() const { locked([](auto& s) { s.seek_to_end(); }); }
	void reset() const { locked([](auto& s) { s.reset(); }); }

	void set_loop(double start_seconds, double end_seconds) const
	{ locked([&](auto& s) { s.set_loop(start_seconds, end_seconds); }); }
	void set_loop_index(ssize_t start, ssize_t end) const
	{ locked([&](auto& s) { s.set_loop_index(start, end); }); }
	void set_loop_enabled(bool enabled) const { locked([&](auto& s) { s.set_loop_enabled(enabled); }); }

	[[nodiscard]] auto sample_rate() const -> int { return locked([](auto& s) { return s.sample_rate(); }); }
	[[nodiscard]] auto frame_count() const -> ssize_t { return locked([](auto& s) { return s.frame_count(); }); }
	[[nodiscard]] auto duration() const -> nanoseconds { return locked([](auto& s) { return s.duration(); }); }
	[[nodiscard]] auto duration_seconds() const -> double
	{ return locked([](auto& s) { return s.duration_seconds(); }); }
	[[nodiscard]] auto index() const -> ssize_t { return locked([](auto& s) { return s.index(); }); }
	[[nodiscard]] auto base_index() const -> ssize_t { return locked([](auto& s) { return s.base_index(); }); }
	[[nodiscard]] auto playing_index() const -> ssize_t { return locked([](auto& s) { return s.playing_index(); }); }
	[[nodiscard]] auto volume() const -> float { return locked([](auto& s) { return s.volume(); }); }
	[[nodiscard]] auto base_volume() const -> float { return locked([](auto& s) { return s.base_volume(); }); }
	[[nodiscard]] auto playback_rate() const -> PlaybackRate
	{ return locked([](auto& s) { return s.playback_rate(); }); }
	[[nodiscard]] auto base_playback_rate() const -> PlaybackRate
	{ return locked([](auto& s) { return s.base_playback_rate(); }); }
	[[nodiscard]] auto panning() const -> float { return locked([](auto& s) { return s.panning(); }); }
	[[nodiscard]] auto base_panning() const -> float { return locked([](auto& s) { return s.base_panning(); }); }
	[[nodiscard]] auto paused() const -> bool { return locked([](auto& s) { return s.paused(); }); }
	[[nodiscard]] auto loop_enabled() const -> bool { return locked([](auto& s) { return s.loop_enabled(); }); }
	[[nodiscard]] auto loop_points() const -> LoopPoints { return locked([](auto& s) { return s.loop_points(); }); }
	[[nodiscard]] auto loop_start() const -> ssize_t { return locked([](auto& s) { return s.loop_start(); }); }
	[[nodiscard]] auto loop_end() const -> ssize_t { return locked([](auto& s) { return s.loop_end(); }); }
	[[nodiscard]] auto loop_start_seconds() const -> double
	{ return locked([](auto& s) { return s.loop_start_seconds(); }); }
	[[nodiscard]] auto loop_end_seconds() const -> double
	{ return locked([](auto& s) { return s.loop_end_seconds(); }); }
	[[nodiscard]] auto finished() const -> bool { return locked([](auto& s) { return s.finished(); }); }
	[[nodiscard]] auto outputting_silence() const -> bool
	{ return locked([](auto& s) { return s.outputting_silence(); }); }

	// Check if two handles refer to the same sound.
	auto operator==(SoundHandle const& other) const -> bool { return state == other.state; }

private:
	struct State {
		mutex lock;
		Sound sound;

		explicit State(Sound&& sound): sound{move(sound)} {}
	};
	shared_ptr<State> state;
};

}
