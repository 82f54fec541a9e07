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
#include "lib/audio_common.hpp"
#include "audio/sound.hpp"

namespace kittymix::audio {

using lib::Frame;

// A fully decoded audio clip, ready to be played by any number of Sounds.
struct DecodedAudio {
	int sample_rate;
	shared_ptr<Sound::Frames const> frames;
};

// Turns audio files in any format supported by ffmpeg into stereo frames at the file's native
// sampling rate.
class Decoder {
public:
	// Decoder diagnostics are logged to the provided category, or the global one if null.
	explicit Decoder(Logger::Category cat = nullptr): cat{cat} {}

	// Decode the contents of an audio file. Mono audio is duplicated to both channels.
	// Throws UnsupportedFormat if the contents can't be decoded, UnknownSampleRate if the stream
	// has no sampling rate, or UnsupportedChannelCount if it's neither mono nor stereo.
	[[nodiscard]] auto decode(span<byte const> file_contents) const -> DecodedAudio;

private:
	Logger::Category cat;
};

// Read and decode an audio file, creating a Sound that plays it from the start.
// Throws runtime_error if the file can't be read, or DecodeError subclasses if it can't be decoded.
[[nodiscard]] auto load_sound(fs::path const&, Logger::Category = nullptr) -> Sound;

}
