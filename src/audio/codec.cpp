/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "audio/codec.hpp"

#include "preamble.hpp"
#include "utils/logger.hpp"
#include "lib/ffmpeg.hpp"
#include "audio/error.hpp"
#include "io/file.hpp"

namespace kittymix::audio {

auto Decoder::decode(span<byte const> file_contents) const -> DecodedAudio
{
	auto const log_cat = cat? cat : globals::logger->global;
	lib::ffmpeg::set_thread_log_category(log_cat);
	auto decoded = [&] {
		try {
			return lib::ffmpeg::decode_file_buffer(file_contents);
		} catch (runtime_error const& e) {
			throw UnsupportedFormat{e.what()};
		}
	}();

	auto const info = lib::ffmpeg::stream_info(decoded);
	if (info.sample_rate <= 0) throw UnknownSampleRate{};
	if (info.channels != 1 && info.channels != 2) throw UnsupportedChannelCount{info.channels};

	auto const samples = lib::ffmpeg::convert_to_float(move(decoded));
	auto frames = make_shared<Sound::Frames>();
	if (info.channels == 1) {
		frames->reserve(samples.size());
		for (auto const sample: samples)
			frames->emplace_back(Frame::from_mono(sample));
	} else {
		frames->reserve(samples.size() / 2);
		for (auto const pair: samples | views::chunk(2))
			frames->emplace_back(Frame{pair[0], pair[1]});
	}
	DEBUG_AS(log_cat, "Decoded {} frames at {}Hz ({} channels)", frames->size(), info.sample_rate, info.channels);
	return DecodedAudio{
		.sample_rate = info.sample_rate,
		.frames = move(frames),
	};
}

auto load_sound(fs::path const& path, Logger::Category cat) -> Sound
{
	auto const file = io::read_file(path);
	auto const decoded = Decoder{cat}.decode(file.contents);
	INFO_AS(cat? cat : globals::logger->global, "Loaded {}: {:.2f}s at {}Hz",
		path, static_cast<double>(decoded.frames->size()) / decoded.sample_rate, decoded.sample_rate);
	return Sound{decoded.sample_rate, decoded.frames};
}

}
