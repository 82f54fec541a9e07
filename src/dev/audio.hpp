/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/assert.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "lib/audio_common.hpp"
#include "lib/pipewire.hpp"

namespace kittymix::dev {

using lib::Frame;
using lib::ChannelCount;

// A failure reported by the output stream after it started running.
struct StreamError {
	lib::StreamFault kind;
	string message;
};

// The system's audio output. Frames are requested from the processor function on a realtime
// thread for as long as the instance exists.
class Audio {
public:
	using Processor = lib::pw::Processor;

	// Initialize the audio device. The processor is called repeatedly with a buffer of frames to fill
	// and the device's sampling rate.
	// Throws lib::BackendError subclasses if the device can't be started.
	Audio(Logger::Category, Processor processor);
	~Audio() noexcept;

	// Return current sampling rate. The value is only valid while an Audio instance exists.
	[[nodiscard]] auto get_sampling_rate() const -> int { return ASSERT_VAL(context->properties.sampling_rate); }

	// Return current latency of the audio device.
	[[nodiscard]] auto get_latency() const -> nanoseconds { return lib::audio_latency(context->properties); }

	// Number of stream errors waiting to be drained. Approximate while the stream is running.
	[[nodiscard]] auto pending_errors() const -> ssize_t { return static_cast<ssize_t>(errors.size_approx()); }

	// Pass every stream error reported so far to the handler, in order of arrival.
	// Returns the number of errors handled.
	template<invocable<StreamError const&> Func>
	auto drain_errors(Func&& handler) -> ssize_t;

	Audio(Audio const&) = delete;
	auto operator=(Audio const&) -> Audio& = delete;
	Audio(Audio&&) = delete;
	auto operator=(Audio&&) -> Audio& = delete;

private:
	InstanceLimit<Audio, 1> instance_limit;

	Logger::Category cat;
	mpmc_queue<StreamError> errors;
	lib::pw::Context context;

	void on_error(lib::StreamFault, string_view message);
};

template<invocable<StreamError const&> Func>
auto Audio::drain_errors(Func&& handler) -> ssize_t
{
	auto count = 0z;
	auto error = StreamError{};
	while (errors.try_dequeue(error)) {
		handler(error);
		count += 1;
	}
	return count;
}

}
