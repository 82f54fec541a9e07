/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"

namespace kittymix::audio {

inline auto interpolate(float a, float b, float t) -> float { return lerp(a, b, t); }
inline auto interpolate(double a, double b, float t) -> double { return lerp(a, b, static_cast<double>(t)); }

// Sample indices are blended in double precision and rounded to the nearest index, saturating
// at the limits of the type.
inline auto interpolate(ssize_t a, ssize_t b, float t) -> ssize_t
{
	constexpr auto Limit = 0x1p63;
	auto const blended = round(lerp(static_cast<double>(a), static_cast<double>(b), static_cast<double>(t)));
	if (blended >= Limit) return numeric_limits<ssize_t>::max();
	if (blended < -Limit) return numeric_limits<ssize_t>::min();
	return static_cast<ssize_t>(blended);
}

// A value type that a Command can animate. interpolate(a, b, t) must return a at t == 0
// and b at t == 1; values of t outside of [0, 1] extrapolate.
template<typename T>
concept tweenable = copyable<T> && requires(T const& a, T const& b, float t) {
	{ interpolate(a, b, t) } -> same_as<T>;
};

// A playback attribute with a tween-affected current value, and the resting value a tween
// started from. Outside of a tween, both are equal.
template<tweenable T>
struct Parameter {
	T value;
	T base_value;

	explicit Parameter(T initial): value{initial}, base_value{initial} {}

	// Snapshot the current value as the resting point, then jump to a new value.
	void start_tween(T new_value)
	{
		base_value = value;
		value = move(new_value);
	}

	// Freeze the current value as the new resting point.
	void stop_tween() { base_value = value; }

	// Move along the tween from the resting point towards target.
	void update(T const& target, float t) { value = interpolate(base_value, target, t); }
};

}
