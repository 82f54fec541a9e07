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

namespace kittymix::lib::ffmpeg {

// Opaque type for raw decoder output, unusable before being converted to a known format.
struct DecoderOutput_t;
struct DecoderOutputDeleter {
	void operator()(DecoderOutput_t*) const noexcept;
};
using DecoderOutput = unique_ptr<DecoderOutput_t, DecoderOutputDeleter>;

// Properties of decoded audio, in its native format.
struct StreamInfo {
	int sample_rate; // 0 if the stream doesn't declare one
	int channels;
	ssize_t frame_count;
};

// Set the logger category for ffmpeg to use on the current thread. If not called, will log
// to the global category.
void set_thread_log_category(Logger::Category);

// Decode the first audio stream of a file in a buffer into uncompressed audio data.
// Throws runtime_error if ffmpeg can't demux or decode the contents.
auto decode_file_buffer(span<byte const> file_contents) -> DecoderOutput;

[[nodiscard]] auto stream_info(DecoderOutput const&) -> StreamInfo;

// Convert decoded audio to interleaved 32-bit float samples, keeping the sample rate and
// channel layout. The stream must have a known sample rate.
// Throws runtime_error if ffmpeg throws.
auto convert_to_float(DecoderOutput&& input) -> vector<float>;

}
