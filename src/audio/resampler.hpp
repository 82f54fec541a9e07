/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "lib/audio_common.hpp"

namespace kittymix::audio {

using lib::Frame;

// Four-frame sliding window over a source buffer, producing frames in between the samples.
// The window holds the previous, current, next and next-next frames, each tagged with the source
// index it was read from.
class Resampler {
public:
	explicit Resampler(ssize_t starting_index = 0) noexcept
	{
		fill(window, Tagged{Frame::Zero, starting_index});
	}

	// Shift the window left, appending a new frame at the end.
	void push_frame(Frame frame, ssize_t index) noexcept
	{
		window[0] = window[1];
		window[1] = window[2];
		window[2] = window[3];
		window[3] = Tagged{frame, index};
	}

	// 4-point, 3rd-order Hermite x-form interpolation between the current and next frames,
	// from "Polynomial Interpolators for High-Quality Resampling of Oversampled Audio"
	// by Olli Niemitalo, p. 43. fraction of 0.0 returns the current frame exactly.
	[[nodiscard]] auto get(float fraction) const noexcept -> Frame
	{
		auto const prev = window[0].frame;
		auto const curr = window[1].frame;
		auto const next = window[2].frame;
		auto const next_next = window[3].frame;
		auto const c0 = curr;
		auto const c1 = (next - prev) * 0.5f;
		auto const c2 = prev - curr * 2.5f + next * 2.0f - next_next * 0.5f;
		auto const c3 = (next_next - prev) * 0.5f + (curr - next) * 1.5f;
		return ((c3 * fraction + c2) * fraction + c1) * fraction + c0;
	}

	// Source index of the frame currently being played. This trails the most recently
	// pushed index, as the window extends past it in both directions.
	[[nodiscard]] auto current_frame_index() const noexcept -> ssize_t { return window[1].index; }

	// Check if everything in the window is silence.
	[[nodiscard]] auto outputting_silence() const noexcept -> bool
	{
		return all_of(window, [](auto const& t) { return t.frame == Frame::Zero; });
	}

private:
	struct Tagged {
		Frame frame;
		ssize_t index;
	};
	array<Tagged, 4> window;
};

}
