/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "audio/tween.hpp"

namespace kittymix::audio {

// Speed of playback, either as a multiplier of the source rate or as a pitch shift.
// A negative factor plays the sound in reverse.
class PlaybackRate {
public:
	struct Factor {
		double value;
		auto operator==(Factor const&) const -> bool = default;
	};
	struct Semitones {
		double value;
		auto operator==(Semitones const&) const -> bool = default;
	};

	constexpr PlaybackRate(): rate{Factor{1.0}} {}
	constexpr PlaybackRate(Factor factor): rate{factor} {}
	constexpr PlaybackRate(Semitones semitones): rate{semitones} {}

	[[nodiscard]] static constexpr auto factor(double value) -> PlaybackRate { return Factor{value}; }
	[[nodiscard]] static constexpr auto semitones(double value) -> PlaybackRate { return Semitones{value}; }

	// Speed multiplier. Semitones s convert to 2^(s/12).
	[[nodiscard]] auto as_factor() const -> double
	{
		return visit(visitor{
			[](Factor f) { return f.value; },
			[](Semitones s) { return exp2(s.value / 12.0); },
		}, rate);
	}

	// Pitch shift. Non-positive factors have no pitch equivalent, and yield NaN or -infinity.
	[[nodiscard]] auto as_semitones() const -> double
	{
		return visit(visitor{
			[](Factor f) { return 12.0 * log2(f.value); },
			[](Semitones s) { return s.value; },
		}, rate);
	}

	[[nodiscard]] auto is_semitones() const -> bool { return holds_alternative<Semitones>(rate); }

	// Negate whichever representation is held. Note that for Semitones this mirrors the pitch
	// shift rather than the direction of playback.
	[[nodiscard]] auto reversed() const -> PlaybackRate
	{
		return visit(visitor{
			[](Factor f) -> PlaybackRate { return Factor{-f.value}; },
			[](Semitones s) -> PlaybackRate { return Semitones{-s.value}; },
		}, rate);
	}

	auto operator==(PlaybackRate const&) const -> bool = default;

private:
	variant<Factor, Semitones> rate;
};

// Blends in the representation of a. A semitone blend towards a rate with no pitch equivalent
// (zero or reverse) falls back to blending factors.
inline auto interpolate(PlaybackRate const& a, PlaybackRate const& b, float t) -> PlaybackRate
{
	auto const td = static_cast<double>(t);
	if (a.is_semitones() && b.as_factor() > 0.0)
		return PlaybackRate::semitones(lerp(a.as_semitones(), b.as_semitones(), td));
	return PlaybackRate::factor(lerp(a.as_factor(), b.as_factor(), td));
}

// Half-open region of sample indices that a looping sound repeats.
struct LoopPoints {
	ssize_t start;
	ssize_t end;

	// Sentinel meaning "the whole sound".
	static LoopPoints const Whole;

	auto operator==(LoopPoints const&) const -> bool = default;
};
inline constexpr LoopPoints LoopPoints::Whole{0, numeric_limits<ssize_t>::max()};

inline auto interpolate(LoopPoints const& a, LoopPoints const& b, float t) -> LoopPoints
{
	return {interpolate(a.start, b.start, t), interpolate(a.end, b.end, t)};
}

}
