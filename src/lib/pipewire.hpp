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

// Forward declarations

struct pw_thread_loop;

namespace kittymix::lib::pw {

// Forward declarations

struct Stream_t;

// Called from the realtime thread with a buffer of frames to fill, and the current sampling rate.
using Processor = function<void(span<Frame>, int)>;

// Called from the PipeWire thread when the stream fails after it was started.
using ErrorHandler = function<void(StreamFault, string_view)>;

// Context object for PipeWire internal state.
struct Context_t {
	AudioProperties properties;
	pw_thread_loop* loop;
	Stream_t* stream;
	Processor processor;
	ErrorHandler error_handler;
	bool streaming;
	bool format_rejected;
	optional<string> negotiation_error;
};
using Context = unique_ptr<Context_t>;

// Initialize PipeWire and open an audio stream. processor will be called in a separate thread
// with a buffer of frames to fill. The call blocks until the stream format is negotiated, for at
// most connect_timeout. A Context is returned and must be passed to cleanup().
// Throws NoOutputDevice if negotiation doesn't finish in time, UnsupportedSampleFormat if the
// device rejects stereo float output, StreamBuildError or StreamPlayError if PipeWire fails.
auto init(string_view stream_name, int buffer_size, milliseconds connect_timeout,
	Processor&& processor, ErrorHandler&& error_handler) -> Context;

// Clean up PipeWire and associated objects.
void cleanup(Context&& context);

}
