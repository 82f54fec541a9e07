/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"

namespace kittymix::lib {

inline constexpr auto ChannelCount = 2zu;

// A single stereo audio frame.
struct Frame {
	float left;
	float right;

	static Frame const Zero;

	// A frame with the same value in both channels.
	static constexpr auto from_mono(float value) -> Frame { return {value, value}; }

	constexpr auto operator+=(Frame other) -> Frame& { left += other.left; right += other.right; return *this; }
	constexpr auto operator-=(Frame other) -> Frame& { left -= other.left; right -= other.right; return *this; }
	constexpr auto operator*=(float gain) -> Frame& { left *= gain; right *= gain; return *this; }
	constexpr auto operator/=(float div) -> Frame& { left /= div; right /= div; return *this; }

	friend constexpr auto operator+(Frame a, Frame b) -> Frame { return a += b; }
	friend constexpr auto operator-(Frame a, Frame b) -> Frame { return a -= b; }
	friend constexpr auto operator*(Frame a, float gain) -> Frame { return a *= gain; }
	friend constexpr auto operator*(float gain, Frame a) -> Frame { return a *= gain; }
	friend constexpr auto operator/(Frame a, float div) -> Frame { return a /= div; }
	friend constexpr auto operator-(Frame a) -> Frame { return {-a.left, -a.right}; }
	friend constexpr auto operator==(Frame, Frame) -> bool = default;
};
inline constexpr Frame Frame::Zero{0.0f, 0.0f};

// The format of an audio sample, as negotiated with the output device.
enum class SampleFormat {
	Unknown,
	Float32, // 32-bit IEEE floating point (identical to C++ float type)
	Int16,   // 16-bit signed integer (identical to C++ short type)
	Int24,   // 24-bit signed integer (stored in a 32-bit signed integer, aligned to most significant bits)
};

struct AudioProperties {
	int sampling_rate;
	SampleFormat sample_format;
	int buffer_size;
};

inline auto audio_latency(AudioProperties const& props) -> nanoseconds
{
	return duration_cast<nanoseconds>(
		duration<double>{
			static_cast<double>(props.buffer_size) / static_cast<double>(props.sampling_rate)});
}

// Kinds of failure an already running output stream can report.
enum class StreamFault {
	DeviceLost,   // The device was disconnected or the stream was unlinked from it
	StreamFailed, // The stream entered an unrecoverable error state
};

// Failures to start an audio output stream. Thrown only while the stream is being set up;
// once it's running, errors are reported through the device's error queue instead.
class BackendError: public runtime_error {
public:
	using runtime_error::runtime_error;
};

// No output device could be reached, or it never negotiated a stream format.
class NoOutputDevice: public BackendError {
public:
	using BackendError::BackendError;
};

// The device insists on a sample format the mixer can't produce.
class UnsupportedSampleFormat: public BackendError {
public:
	using BackendError::BackendError;
};

class StreamBuildError: public BackendError {
public:
	using BackendError::BackendError;
};

class StreamPlayError: public BackendError {
public:
	using BackendError::BackendError;
};

}
