/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "lib/ffmpeg.hpp"

extern "C" {
#include <libswresample/swresample.h>
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/mathematics.h>
#include <libavutil/opt.h>
}
#include <cstdarg>
#include <cerrno>
#include <cstdio>
#include "preamble.hpp"
#include "utils/assert.hpp"
#include "utils/logger.hpp"

namespace kittymix::lib::ffmpeg {

// Fix av_err2str macro making use of C-only features
#ifdef av_err2str
#undef av_err2str
av_always_inline auto av_err2string(int errnum) -> string {
	char str[AV_ERROR_MAX_STRING_SIZE];
	return av_make_error_string(str, AV_ERROR_MAX_STRING_SIZE, errnum);
}
#define av_err2str(err) av_err2string(err).c_str()
#endif

struct DecoderOutput_t {
	vector<vector<byte>> data;
	ssize_t sample_count;
	AVSampleFormat sample_format;
	int sample_rate;
	AVChannelLayout channel_layout;
	bool planar;

	~DecoderOutput_t() { av_channel_layout_uninit(&channel_layout); }
};

void DecoderOutputDeleter::operator()(DecoderOutput_t* output) const noexcept
{
	delete output;
}

// Helper functions for error handling

static auto ret_check(int ret) -> int
{
	if (ret < 0) throw runtime_error_fmt("ffmpeg error: {}", av_err2str(ret));
	return ret;
}

template<typename T>
static auto ptr_check(T* ptr) -> T*
{
	if (!ptr) throw runtime_error_fmt("ffmpeg error: {}", av_err2str(AVERROR(errno)));
	return ptr;
}

// Logger override support

thread_local Logger::Category cat = nullptr;
static atomic<bool> log_callback_set = false;

static void log_callback(void*, int level, char const* fmt, va_list va_og)
{
	if (level > AV_LOG_INFO) return; // Too verbose

	va_list va; // not auto due to possibly-macro shenanigans
	va_copy(va, va_og);
	auto const msg_size = std::vsnprintf(nullptr, 0, fmt, va);
	va_end(va);
	if (msg_size < 0) return;
	auto msg = string(msg_size, '\0'); // uniform initializer misinterprets this as a list of chars
	std::vsnprintf(msg.data(), msg_size + 1, fmt, va_og);
	if (!msg.empty() && msg.back() == '\n') msg.pop_back();

	auto log_cat = cat? cat : globals::logger->global;
	     if (level <= AV_LOG_FATAL)    CRIT_AS(log_cat, "ffmpeg: {}", msg);
	else if (level <= AV_LOG_ERROR)   ERROR_AS(log_cat, "ffmpeg: {}", msg);
	else if (level <= AV_LOG_WARNING)  WARN_AS(log_cat, "ffmpeg: {}", msg);
	else                               INFO_AS(log_cat, "ffmpeg: {}", msg);
}

static void set_log_callback()
{
	auto prev = log_callback_set.exchange(true);
	if (prev) return;
	av_log_set_callback(log_callback);
}

// RAII wrappers for ffmpeg objects

static constexpr auto PageSize = 4096zu;
using AVBuffer = unique_resource<void*, decltype([](auto* buf) { av_free(buf); })>;
using AVIO = unique_resource<AVIOContext*, decltype([](auto* ctx) {
	av_free(ctx->buffer);
	avio_context_free(&ctx);
})>;
using AVFormat = unique_resource<AVFormatContext*, decltype([](auto* ctx) {
	avformat_close_input(&ctx);
})>;
using AVCodec = unique_resource<AVCodecContext*, decltype([](auto* ctx) {
	avcodec_free_context(&ctx);
})>;
using AVPacket = unique_resource<AVPacket*, decltype([](auto* p) {
	av_packet_free(&p);
})>;
using AVFrame = unique_resource<AVFrame*, decltype([](auto* f) {
	av_frame_free(&f);
})>;
using SwrContext = unique_resource<SwrContext*, decltype([](auto* swr) {
	swr_free(&swr);
})>;

// Data buffer wrapper with a cursor for seeking support.
struct SeekBuffer {
	span<byte const> buffer;
	ssize_t cursor;
};

// Memory buffer IO callbacks

static auto av_io_read(void* opaque, uint8_t* buf, int buf_size) -> int
{
	auto& buffer = *static_cast<SeekBuffer*>(opaque);
	auto* byte_buf = reinterpret_cast<byte*>(buf);
	auto const bytes_available = ssize(buffer.buffer) - buffer.cursor;
	if (bytes_available <= 0) return AVERROR_EOF;
	auto const bytes_to_read = min<ssize_t>(buf_size, bytes_available);
	copy(buffer.buffer.subspan(buffer.cursor, bytes_to_read), byte_buf);
	buffer.cursor += bytes_to_read;
	return static_cast<int>(bytes_to_read);
}

static auto av_io_seek(void* opaque, int64_t offset, int whence) -> int64_t
{
	auto& buffer = *static_cast<SeekBuffer*>(opaque);
	auto const size = ssize(buffer.buffer);
	auto new_cursor = 0z;
	switch (whence & ~AVSEEK_FORCE) {
	case SEEK_SET: new_cursor = offset; break;
	case SEEK_CUR: new_cursor = buffer.cursor + offset; break;
	case SEEK_END: new_cursor = size + offset; break;
	case AVSEEK_SIZE: return static_cast<int64_t>(size);
	default: return AVERROR(EINVAL);
	}

	if (new_cursor < 0 || new_cursor > size) return AVERROR(EINVAL);
	buffer.cursor = new_cursor;
	return static_cast<int64_t>(new_cursor);
}

void set_thread_log_category(Logger::Category new_cat)
{
	cat = new_cat;
}

auto decode_file_buffer(span<byte const> file_contents) -> DecoderOutput
{
	set_log_callback();
	auto file_buffer = SeekBuffer{ .buffer = file_contents, .cursor = 0 };
	auto io_buffer = AVBuffer{ptr_check(av_malloc(PageSize))};
	auto io = AVIO{ptr_check(avio_alloc_context(static_cast<unsigned char*>(io_buffer.get()), PageSize, 0,
		&file_buffer, &av_io_read, nullptr, &av_io_seek))};
	io_buffer.release(); // AVIOContext takes control over the buffer from now on
	auto* format_rw = ptr_check(avformat_alloc_context());
	format_rw->pb = io.get();
	format_rw->flags |= AVFMT_FLAG_CUSTOM_IO;

	ret_check(avformat_open_input(&format_rw, "", nullptr, nullptr)); // Frees the context on failure
	auto format = AVFormat{format_rw};

	ret_check(avformat_find_stream_info(format.get(), nullptr));
	auto const stream_id = av_find_best_stream(format.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
	if (stream_id < 0) throw runtime_error{"No audio stream found"};
	auto* stream = format->streams[stream_id];

	auto* codec = avcodec_find_decoder(stream->codecpar->codec_id);
	if (!codec) throw runtime_error_fmt("No decoder available for codec {}", avcodec_get_name(stream->codecpar->codec_id));
	auto codec_ctx = AVCodec{ptr_check(avcodec_alloc_context3(codec))};
	ret_check(avcodec_parameters_to_context(codec_ctx.get(), stream->codecpar));
	codec_ctx->pkt_timebase = stream->time_base; // Fix "Could not update timestamps for discarded samples."
	ret_check(avcodec_open2(codec_ctx.get(), codec, nullptr));

	auto result = DecoderOutput{new DecoderOutput_t{
		.data = {},
		.sample_count = 0,
		.sample_format = codec_ctx->sample_fmt,
		.sample_rate = codec_ctx->sample_rate,
		.channel_layout = {},
		.planar = static_cast<bool>(av_sample_fmt_is_planar(codec_ctx->sample_fmt)),
	}};
	ret_check(av_channel_layout_copy(&result->channel_layout, &codec_ctx->ch_layout));
	auto const channels = static_cast<ssize_t>(result->channel_layout.nb_channels);
	auto const planes = result->planar? channels : 1z;
	auto const bytes_per_sample = static_cast<ssize_t>(av_get_bytes_per_sample(codec_ctx->sample_fmt));
	if (bytes_per_sample <= 0) throw runtime_error{"Decoder produced an unknown sample format"};
	auto const samples_per_frame = result->planar? 1z : channels;
	auto const sample_count_estimate = stream->duration > 0 && codec_ctx->sample_rate > 0?
		av_rescale_q(stream->duration, stream->time_base, AVRational{1, codec_ctx->sample_rate}) : 0;
	auto byte_size_estimate = samples_per_frame * sample_count_estimate * bytes_per_sample;
	byte_size_estimate += 4096; // Overallocate slightly to avoid realloc on underestimation
	for (auto i = 0z; i < planes; i += 1) {
		result->data.emplace_back();
		result->data.back().resize(byte_size_estimate);
	}

	auto cursor = 0z;
	auto in_packet = AVPacket{ptr_check(av_packet_alloc())};
	auto out_frame = AVFrame{ptr_check(av_frame_alloc())};
	auto flushing = false;
	while (!flushing) {
		auto const ret = av_read_frame(format.get(), in_packet.get());
		if (ret == AVERROR_EOF)
			flushing = true;
		else
			ret_check(ret);
		if (!flushing && in_packet->stream_index != stream_id) {
			av_packet_unref(in_packet.get());
			continue;
		}
		ret_check(avcodec_send_packet(codec_ctx.get(), flushing? nullptr : in_packet.get()));
		av_packet_unref(in_packet.get());

		while (true) {
			auto const ret = avcodec_receive_frame(codec_ctx.get(), out_frame.get());
			if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
			ret_check(ret);

			auto const frame_bytes = out_frame->nb_samples * bytes_per_sample * samples_per_frame;
			if (cursor + frame_bytes > byte_size_estimate) {
				byte_size_estimate = max(cursor + frame_bytes, byte_size_estimate * 2);
				for (auto& vec: result->data)
					vec.resize(byte_size_estimate);
			}

			for (auto i = 0z; i < planes; i += 1) {
				ASSUME(out_frame->extended_data[i]);
				copy(span{reinterpret_cast<byte const*>(out_frame->extended_data[i]), static_cast<usize>(frame_bytes)},
					result->data[i].begin() + cursor);
			}
			cursor += frame_bytes;
		}
	}

	ASSERT(cursor <= byte_size_estimate);
	for (auto& vec: result->data)
		vec.resize(cursor);
	ASSERT(cursor % (bytes_per_sample * samples_per_frame) == 0);
	result->sample_count = cursor / (bytes_per_sample * samples_per_frame);

	return result;
}

auto stream_info(DecoderOutput const& output) -> StreamInfo
{
	return StreamInfo{
		.sample_rate = output->sample_rate,
		.channels = output->channel_layout.nb_channels,
		.frame_count = output->sample_count,
	};
}

auto convert_to_float(DecoderOutput&& input) -> vector<float>
{
	set_log_callback();
	ASSERT(input->sample_rate > 0);
	auto out_layout = AVChannelLayout{};
	if (input->channel_layout.order == AV_CHANNEL_ORDER_UNSPEC)
		av_channel_layout_default(&input->channel_layout, input->channel_layout.nb_channels);
	ret_check(av_channel_layout_copy(&out_layout, &input->channel_layout));
	auto const channels = out_layout.nb_channels;

	auto* swr_rw = static_cast<::SwrContext*>(nullptr);
	auto const alloc_ret = swr_alloc_set_opts2(&swr_rw,
		&out_layout, AV_SAMPLE_FMT_FLT, input->sample_rate,
		&input->channel_layout, input->sample_format, input->sample_rate, 0, nullptr);
	av_channel_layout_uninit(&out_layout);
	ret_check(alloc_ret);
	auto swr = SwrContext{swr_rw};
	ret_check(swr_init(swr.get()));

	auto const max_out_samples = ret_check(swr_get_out_samples(swr.get(), static_cast<int>(input->sample_count)));
	auto output = vector<float>{};
	output.resize(static_cast<usize>(max_out_samples) * channels);
	auto in_ptrs = vector<uint8_t const*>{};
	in_ptrs.reserve(input->data.size());
	for (auto const& vec: input->data)
		in_ptrs.push_back(reinterpret_cast<uint8_t const*>(vec.data()));
	auto* out_ptr = reinterpret_cast<uint8_t*>(output.data());
	auto out_samples = ret_check(swr_convert(swr.get(), &out_ptr, max_out_samples,
		in_ptrs.data(), static_cast<int>(input->sample_count)));
	out_ptr = reinterpret_cast<uint8_t*>(output.data() + out_samples * channels);
	out_samples += ret_check(swr_convert(swr.get(), &out_ptr, max_out_samples - out_samples, nullptr, 0)); // Flush final samples
	ASSERT(max_out_samples >= out_samples);
	output.resize(static_cast<usize>(out_samples) * channels);

	input.reset();
	return output;
}

}
