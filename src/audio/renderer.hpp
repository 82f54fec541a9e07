/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/logger.hpp"
#include "audio/sound_handle.hpp"
#include "audio/sound.hpp"

namespace kittymix::audio {

// Sums any number of playing sounds into a single stream of frames. Rendering is driven from
// outside, either by an audio device or manually (for example to record to a buffer).
// Sounds are dropped from the renderer on the tick they finish.
class Renderer {
public:
	explicit Renderer(Logger::Category);

	// Start playing a sound. The returned handle controls it for as long as it plays.
	auto play(Sound) -> SoundHandle;

	// Start playing a sound through an existing handle. Adding a handle that is already
	// playing has no effect.
	void add(SoundHandle);

	// Render one frame at the given output sampling rate.
	auto next_frame(int output_rate) noexcept -> Frame;

	// Render consecutive frames into the whole buffer.
	void fill_buffer(int output_rate, span<Frame> buffer) noexcept;

	// Check if every sound has finished playing.
	[[nodiscard]] auto is_finished() const -> bool;

	[[nodiscard]] auto active_count() const -> ssize_t;

	Renderer(Renderer const&) = delete;
	auto operator=(Renderer const&) -> Renderer& = delete;
	Renderer(Renderer&&) = delete;
	auto operator=(Renderer&&) -> Renderer& = delete;

private:
	Logger::Category cat;
	mutable mutex sounds_lock;
	vector<SoundHandle> sounds;
	// Sounds retired by mix_one() since the last report_retired()
	mutable ssize_t retired = 0;

	auto mix_one(int output_rate) noexcept -> Frame;
	void report_retired() const;
};

}
