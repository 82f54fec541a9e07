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

// Shape of a tween's progress over time. Back, Bounce and Elastic curves overshoot the [0, 1] range.
enum class Easing {
	Linear,
	Reverse,
	BackIn,
	BackOut,
	BackInOut,
	BounceIn,
	BounceOut,
	BounceInOut,
	CircIn,
	CircOut,
	CircInOut,
	CubicIn,
	CubicOut,
	CubicInOut,
	ElasticIn,
	ElasticOut,
	ElasticInOut,
	ExpoIn,
	ExpoOut,
	ExpoInOut,
	QuadIn,
	QuadOut,
	QuadInOut,
	QuartIn,
	QuartOut,
	QuartInOut,
	QuintIn,
	QuintOut,
	QuintInOut,
	SineIn,
	SineOut,
	SineInOut,
};

// Map normalized time t in [0, 1] onto the curve.
[[nodiscard]] auto apply(Easing, float t) noexcept -> float;

}
