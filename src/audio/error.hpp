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

// Failure to turn a file's contents into a frame buffer.
class DecodeError: public runtime_error {
public:
	using runtime_error::runtime_error;
};

// The container or codec isn't recognized, or the data is corrupt.
class UnsupportedFormat: public DecodeError {
public:
	using DecodeError::DecodeError;
};

// The audio stream doesn't declare a sample rate.
class UnknownSampleRate: public DecodeError {
public:
	UnknownSampleRate(): DecodeError{"Audio stream has no known sample rate"} {}
};

// Only mono and stereo sources are accepted.
class UnsupportedChannelCount: public DecodeError {
public:
	explicit UnsupportedChannelCount(int channels):
		DecodeError{format("Unsupported number of channels: {}", channels)},
		channels{channels}
	{}

	[[nodiscard]] auto get_channels() const -> int { return channels; }

private:
	int channels;
};

}
