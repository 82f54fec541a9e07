/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/service.hpp"
#include "utils/logger.hpp"
#include "audio/sound_handle.hpp"
#include "audio/renderer.hpp"
#include "audio/sound.hpp"
#include "dev/audio.hpp"

namespace kittymix::audio {

// Plays sounds on the system's audio output.
class Mixer {
public:
	// Initialize, opening an output stream on the audio device.
	// Throws lib::BackendError subclasses if the device can't be started.
	explicit Mixer(Logger::Category);

	auto play(Sound sound) -> SoundHandle { return renderer.play(move(sound)); }
	void add(SoundHandle handle) { renderer.add(move(handle)); }

	[[nodiscard]] auto is_finished() const -> bool { return renderer.is_finished(); }

	// Block until every sound has finished playing, or the device reported a stream error.
	// Reported errors remain available to handle_errors().
	void wait() const;

	// Pass stream errors reported by the device since the last call to the handler.
	// Returns the number of errors handled.
	template<invocable<dev::StreamError const&> Func>
	auto handle_errors(Func&& handler) -> ssize_t { return audio.drain_errors(forward<Func>(handler)); }

	[[nodiscard]] auto get_renderer() -> Renderer& { return renderer; }
	[[nodiscard]] auto get_sampling_rate() const -> int { return audio.get_sampling_rate(); }
	[[nodiscard]] auto get_latency() const -> nanoseconds { return audio.get_latency(); }

	Mixer(Mixer const&) = delete;
	auto operator=(Mixer const&) -> Mixer& = delete;
	Mixer(Mixer&&) = delete;
	auto operator=(Mixer&&) -> Mixer& = delete;

private:
	Logger::Category cat;
	milliseconds poll_interval;
	Renderer renderer;
	dev::Audio audio;
};

}

namespace kittymix::globals {
inline auto mixer = Service<audio::Mixer>{};
}
