/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "lib/pipewire.hpp"

#include <cstdint>
#include <spa/param/audio/format-utils.h>
#include <spa/param/audio/raw-utils.h>
#include <spa/param/audio/format.h>
#include <spa/param/audio/raw.h>
#include <spa/param/format-utils.h>
#include <spa/param/format.h>
#include <spa/param/param.h>
#include <spa/pod/builder.h>
#include <spa/pod/pod.h>
#include <pipewire/thread-loop.h>
#include <pipewire/properties.h>
#include <pipewire/pipewire.h>
#include <pipewire/stream.h>
#include <pipewire/core.h>
#include <pipewire/keys.h>
#include <pipewire/port.h>
#include "preamble.hpp"
#include "lib/audio_common.hpp"

namespace kittymix::lib::pw {

struct Stream_t {
	pw_stream* stream;
	pw_stream_events events;
};

// Holds the thread loop lock until the end of scope.
using LoopLock = unique_resource<pw_thread_loop*, decltype([](auto* loop) {
	pw_thread_loop_unlock(loop);
})>;

static auto lock_loop(pw_thread_loop* loop) -> LoopLock
{
	pw_thread_loop_lock(loop);
	return LoopLock{loop};
}

static void on_process(void* data)
{
	auto* context = static_cast<Context_t*>(data);

	auto* buffer_outer = pw_stream_dequeue_buffer(context->stream->stream);
	if (!buffer_outer) return;
	auto* buffer = buffer_outer->buffer;
	auto* output = buffer->datas[0].data;
	if (!output) return;

	constexpr auto Stride = sizeof(Frame);
	static_assert(Stride == sizeof(float) * ChannelCount);
	auto const max_frames = buffer->datas[0].maxsize / Stride;
	auto const frames = buffer_outer->requested? min<uint64_t>(max_frames, buffer_outer->requested) : max_frames;

	buffer->datas[0].chunk->offset = 0;
	buffer->datas[0].chunk->stride = Stride;
	buffer->datas[0].chunk->size = frames * Stride;
	auto out = span{static_cast<Frame*>(output), frames};
	fill(out, Frame::Zero);

	context->processor(out, context->properties.sampling_rate);

	pw_stream_queue_buffer(context->stream->stream, buffer_outer);
}

static void on_param_changed(void* data, uint32_t id, spa_pod const* param)
{
	if (!param || id != SPA_PARAM_Format) return;
	auto audio_info = spa_audio_info{};
	if (spa_format_parse(param, &audio_info.media_type, &audio_info.media_subtype) < 0) return;
	if (audio_info.media_type != SPA_MEDIA_TYPE_audio || audio_info.media_subtype != SPA_MEDIA_SUBTYPE_raw) return;
	if (spa_format_audio_raw_parse(param, &audio_info.info.raw) < 0) return;

	auto* context = static_cast<Context_t*>(data);
	auto const& raw = audio_info.info.raw;
	if (raw.format != SPA_AUDIO_FORMAT_F32 || raw.channels != ChannelCount) {
		context->format_rejected = true;
		context->negotiation_error = format("device negotiated format {} with {} channels, expected stereo float",
			static_cast<int>(raw.format), raw.channels);
	} else {
		context->properties.sampling_rate = raw.rate;
	}
	pw_thread_loop_signal(context->loop, false);
}

static void on_state_changed(void* data, pw_stream_state old, pw_stream_state state, char const* error)
{
	auto* context = static_cast<Context_t*>(data);
	if (state == PW_STREAM_STATE_ERROR) {
		auto const message = string_view{error? error : "unknown stream error"};
		if (context->streaming) {
			context->error_handler(StreamFault::StreamFailed, message);
		} else {
			context->negotiation_error = string{message};
			pw_thread_loop_signal(context->loop, false);
		}
	} else if (state == PW_STREAM_STATE_UNCONNECTED && old != PW_STREAM_STATE_UNCONNECTED && context->streaming) {
		context->error_handler(StreamFault::DeviceLost, "stream was disconnected from the device");
	}
}

[[nodiscard]] auto init(string_view stream_name, int buffer_size, milliseconds connect_timeout,
	Processor&& processor, ErrorHandler&& error_handler) -> Context
{
	auto context = make_unique<Context_t>(Context_t{
		.properties = AudioProperties{
			.sampling_rate = 0, // Unknown until negotiated
			.sample_format = SampleFormat::Float32,
			.buffer_size = buffer_size,
		},
		.loop = nullptr,
		.stream = nullptr,
		.processor = move(processor),
		.error_handler = move(error_handler),
		.streaming = false,
		.format_rejected = false,
		.negotiation_error = nullopt,
	});
	pw_init(nullptr, nullptr);
	context->loop = pw_thread_loop_new(nullptr, nullptr);
	if (!context->loop) throw StreamBuildError{"Failed to create PipeWire thread loop"};

	try {
		context->stream = new Stream_t{};
		auto* stream = context->stream;
		stream->events = pw_stream_events{
			.version = PW_VERSION_STREAM_EVENTS,
			.state_changed = on_state_changed,
			.param_changed = on_param_changed,
			.process = on_process,
		};
		stream->stream = pw_stream_new_simple(
			pw_thread_loop_get_loop(context->loop), string{stream_name}.c_str(),
			pw_properties_new(
				PW_KEY_MEDIA_TYPE, "Audio",
				PW_KEY_MEDIA_CATEGORY, "Playback",
				PW_KEY_MEDIA_ROLE, "Music",
				PW_KEY_NODE_FORCE_QUANTUM, format("{}", buffer_size).c_str(),
			nullptr),
			&stream->events, context.get());
		if (!stream->stream) throw StreamBuildError{"Failed to create PipeWire stream"};

		auto params = array<spa_pod const*, 1>{};
		auto buffer = array<uint8_t, 1024>{};
		auto builder = SPA_POD_BUILDER_INIT(buffer.data(), buffer.size());
		auto audio_info = spa_audio_info_raw{
			.format = SPA_AUDIO_FORMAT_F32,
			.channels = ChannelCount,
		};
		params[0] = spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &audio_info);
		auto const connected = pw_stream_connect(stream->stream, PW_DIRECTION_OUTPUT, PW_ID_ANY,
			static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS),
			params.data(), 1);
		if (connected < 0) throw StreamBuildError{"Failed to connect PipeWire stream"};

		if (pw_thread_loop_start(context->loop) < 0) throw StreamPlayError{"Failed to start PipeWire thread loop"};

		// Wait for the format to be negotiated
		auto lock = lock_loop(context->loop);
		auto deadline = timespec{};
		pw_thread_loop_get_time(context->loop, &deadline, duration_cast<nanoseconds>(connect_timeout).count());
		while (context->properties.sampling_rate == 0 && !context->negotiation_error) {
			if (pw_thread_loop_timed_wait_full(context->loop, &deadline) < 0) break;
		}
		if (context->format_rejected) throw UnsupportedSampleFormat{*context->negotiation_error};
		if (context->negotiation_error) throw NoOutputDevice{*context->negotiation_error};
		if (context->properties.sampling_rate == 0)
			throw NoOutputDevice{format("No output device negotiated a format within {}ms", connect_timeout.count())};
		context->streaming = true;
	} catch (exception const&) {
		cleanup(move(context));
		throw;
	}
	return context;
}

void cleanup(Context&& context)
{
	if (context->stream) {
		auto lock = lock_loop(context->loop);
		context->streaming = false;
		if (context->stream->stream) pw_stream_destroy(context->stream->stream);
	}
	delete context->stream;
	pw_thread_loop_destroy(context->loop);
	context.reset();
}

}
