/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "audio/renderer.hpp"

#include "preamble.hpp"
#include "utils/logger.hpp"

namespace kittymix::audio {

Renderer::Renderer(Logger::Category cat):
	cat{cat}
{}

auto Renderer::play(Sound sound) -> SoundHandle
{
	auto handle = SoundHandle{move(sound)};
	add(handle);
	return handle;
}

void Renderer::add(SoundHandle handle)
{
	auto lock = lock_guard{sounds_lock};
	if (find_if(sounds, [&](auto const& s) { return s == handle; }) != sounds.end()) return;
	sounds.emplace_back(move(handle));
	TRACE_AS(cat, "Added sound to the renderer, {} playing", sounds.size());
}

auto Renderer::next_frame(int output_rate) noexcept -> Frame
{
	auto lock = lock_guard{sounds_lock};
	return mix_one(output_rate);
}

void Renderer::fill_buffer(int output_rate, span<Frame> buffer) noexcept
{
	auto lock = lock_guard{sounds_lock};
	for (auto& dest: buffer)
		dest = mix_one(output_rate);
}

auto Renderer::is_finished() const -> bool
{
	auto lock = lock_guard{sounds_lock};
	report_retired();
	return sounds.empty();
}

auto Renderer::active_count() const -> ssize_t
{
	auto lock = lock_guard{sounds_lock};
	report_retired();
	return ssize(sounds);
}

auto Renderer::mix_one(int output_rate) noexcept -> Frame
{
	auto mix = Frame::Zero;
	for (auto i = 0z; i < ssize(sounds);) {
		auto sound_finished = false;
		mix += sounds[i].locked([&](Sound& sound) {
			auto const frame = sound.next_frame(output_rate);
			sound_finished = sound.finished();
			return frame;
		});
		if (sound_finished) {
			sounds.erase(sounds.begin() + i);
			retired += 1;
		} else {
			i += 1;
		}
	}
	return mix;
}

void Renderer::report_retired() const
{
	if (retired == 0) return;
	TRACE_AS(cat, "Retired {} finished sounds, {} playing", retired, sounds.size());
	retired = 0;
}

}
