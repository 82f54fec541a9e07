/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "audio/playback.hpp"
#include "audio/easing.hpp"

namespace kittymix::audio {

// Targets of a Command. Each one drives a single playback parameter of a Sound.
namespace change {

struct Volume { float value; };
struct PlaybackRate { audio::PlaybackRate value; };
// Flips the paused state halfway through the command rather than tweening.
struct Pause { bool value; };
struct Index { ssize_t value; };
struct Position { double seconds; };
struct LoopSeconds { double start; double end; };
struct LoopIndex { ssize_t start; ssize_t end; };
// 0.0 is hard left, 0.5 is centre, 1.0 is hard right.
struct Panning { float value; };

}

using Change = variant<
	change::Volume,
	change::PlaybackRate,
	change::Pause,
	change::Index,
	change::Position,
	change::LoopSeconds,
	change::LoopIndex,
	change::Panning
>;

// A change to a playback parameter, scheduled to start after a delay and follow an easing curve
// for the given duration (all in seconds). Once start_after drops below zero, its negation is
// the time elapsed since the command became active.
struct Command {
	Change change;
	Easing easing = Easing::Linear;
	double start_after = 0.0;
	double duration = 0.0;

	// A change that happens at once, after the given delay.
	[[nodiscard]] static auto instant(Change change, double start_after = 0.0) -> Command
	{
		return Command{change, Easing::Linear, start_after, 0.0};
	}

	[[nodiscard]] auto elapsed() const -> double { return -start_after; }
	[[nodiscard]] auto is_pending() const -> bool { return start_after > 0.0; }
	[[nodiscard]] auto is_done() const -> bool { return elapsed() >= duration && !is_pending(); }

	// Progress along the easing curve at the current time. A zero duration jumps straight to the end.
	[[nodiscard]] auto progress() const -> float
	{
		auto const t = duration > 0.0? clamp(elapsed() / duration, 0.0, 1.0) : 1.0;
		return apply(easing, static_cast<float>(t));
	}
};

}
