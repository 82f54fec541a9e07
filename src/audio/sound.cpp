/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "audio/sound.hpp"

#include "preamble.hpp"
#include "audio/command.hpp"

namespace kittymix::audio {

// Number of frames pushed at creation, so that the first output is the first frame of the buffer.
static constexpr auto PrerollFrames = 3;

Sound::Sound(int sample_rate, shared_ptr<Frames const> frames):
	frames{move(frames)},
	rate{sample_rate},
	cursor{-1},
	rate_param{PlaybackRate{}},
	gain{1.0f},
	pan{0.5f},
	loop{LoopPoints::Whole},
	resampler{-1}
{
	if (rate <= 0) throw runtime_error_fmt("Invalid sample rate: {}", rate);
	if (!this->frames) this->frames = make_shared<Frames const>();
	for (auto i = 0; i < PrerollFrames; i += 1)
		advance();
}

auto Sound::from_frames(int sample_rate, span<Frame const> frames) -> Sound
{
	return Sound{sample_rate, make_shared<Frames const>(frames.begin(), frames.end())};
}

auto Sound::next_frame(int output_rate) noexcept -> Frame
{
	if (finished()) return Frame::Zero;
	if (output_rate <= 0) return Frame::Zero;

	wrap_loop();
	auto const dt = 1.0 / static_cast<double>(output_rate);
	if (!commands.empty()) update_commands(dt);

	auto const output = resampler.get(static_cast<float>(fractional_position));

	// A tick can't move the cursor by more than a full pass over the buffer
	auto const max_step = static_cast<double>(frame_count() + 1);
	auto const step = static_cast<double>(rate) * dt * abs(rate_param.value.as_factor());
	if (isfinite(step)) fractional_position += min(step, max_step);
	while (fractional_position >= 1.0) {
		fractional_position -= 1.0;
		advance();
		if (finished()) {
			fractional_position = 0.0;
			break;
		}
	}
	return output;
}

void Sound::add_command(Command command) { commands.emplace_back(command); }

void Sound::set_volume(float volume) { gain.start_tween(volume); }

void Sound::set_playback_rate(PlaybackRate playback_rate) { rate_param.start_tween(playback_rate); }

void Sound::set_panning(float panning) { pan.start_tween(panning); }

void Sound::set_paused(bool paused) { is_paused = paused; }

void Sound::reverse() { set_playback_rate(rate_param.value.reversed()); }

void Sound::seek_to_index(ssize_t index)
{
	cursor.start_tween(clamp(index, 0z, frame_count()));
	if (!is_paused) push_current();
}

void Sound::seek_to(double seconds) { seek_to_index(seconds_to_index(seconds)); }

void Sound::seek_by(double seconds)
{
	// Bounded offset, so that the sum can't overflow
	auto const limit = frame_count() + 1;
	auto const offset = clamp(seconds_to_index(seconds), -limit, limit);
	seek_to_index(cursor.value + offset);
}

void Sound::seek_to_end() { seek_to_index(max(frame_count() - 1, 0z)); }

void Sound::set_loop(double start_seconds, double end_seconds)
{
	set_loop_index(seconds_to_index(start_seconds), seconds_to_index(end_seconds));
}

void Sound::set_loop_index(ssize_t start, ssize_t end) { loop.start_tween(LoopPoints{start, end}); }

auto Sound::loop_points() const -> LoopPoints
{
	auto const count = frame_count();
	auto const start = clamp(loop.value.start, 0z, count);
	auto const end = clamp(loop.value.end, 0z, count);
	return {min(start, end), max(start, end)};
}

auto Sound::finished() const -> bool
{
	if (looping && loop_start() < loop_end()) return false;
	return past_end() && resampler.outputting_silence();
}

auto Sound::past_end() const -> bool
{
	return moving_forward()? cursor.value >= frame_count() : cursor.value < 0;
}

auto Sound::seconds_to_index(double seconds) const -> ssize_t
{
	constexpr auto Limit = 0x1p62;
	auto const index = round(seconds * static_cast<double>(rate));
	if (!(index > -Limit)) return static_cast<ssize_t>(-Limit);
	if (!(index < Limit)) return static_cast<ssize_t>(Limit);
	return static_cast<ssize_t>(index);
}

// Move the cursor by one frame in the direction of playback, and feed the resampler.
// A paused sound feeds it silence instead, without moving.
void Sound::advance() noexcept
{
	if (is_paused) {
		resampler.push_frame(Frame::Zero, cursor.value);
		return;
	}
	cursor.value = clamp(cursor.value + (moving_forward()? 1z : -1z), -1z, frame_count());
	if (!wrap_loop()) push_current();
}

// Snap the cursor to the other end of the loop region if it reached a boundary.
// Returns true if a jump happened.
auto Sound::wrap_loop() noexcept -> bool
{
	if (!looping) return false;
	auto const [start, end] = loop_points();
	if (start >= end) return false;
	auto const target = [&]() -> optional<ssize_t> {
		if (moving_forward() && cursor.value >= end) return start;
		if (!moving_forward() && cursor.value <= start) return end;
		return nullopt;
	}();
	if (!target) return false;
	cursor.start_tween(*target);
	if (!is_paused) push_current();
	return true;
}

// Push the frame under the cursor to the resampler, with volume and panning applied.
// Positions outside of the buffer read as silence.
void Sound::push_current() noexcept
{
	auto const index = cursor.value;
	auto const& buffer = *frames;
	if (index < 0 || index >= ssize(buffer)) {
		resampler.push_frame(Frame::Zero, index);
		return;
	}
	// Equal-power pan law, normalized to unity gain at centre
	auto const angle = static_cast<double>(clamp(pan.value, 0.0f, 1.0f)) * Pi_v<double> / 2.0;
	auto const left_gain = static_cast<float>(cos(angle) * std::numbers::sqrt2);
	auto const right_gain = static_cast<float>(sin(angle) * std::numbers::sqrt2);
	auto frame = buffer[index] * gain.value;
	frame.left *= left_gain;
	frame.right *= right_gain;
	resampler.push_frame(frame, index);
}

// Apply every active command at its current progress, then advance their timers. A command
// tweens from the parameter's resting value, and lands exactly on the end of its curve on its
// final tick, which becomes the new resting value.
void Sound::update_commands(double dt) noexcept
{
	for (auto i = 0z; i < ssize(commands);) {
		auto& command = commands[i];
		if (!command.is_pending())
			apply_change(command.change, command.progress());
		command.start_after -= dt;

		if (command.is_done()) {
			apply_change(command.change, apply(command.easing, 1.0f));
			settle(command.change);
			commands.erase(commands.begin() + i);
		} else {
			i += 1;
		}
	}
}

void Sound::apply_change(Change const& change, float t) noexcept
{
	auto const clamp_cursor = [&] { cursor.value = clamp(cursor.value, -1z, frame_count()); };
	visit(visitor{
		[&](change::Volume c) { gain.update(c.value, t); },
		[&](change::PlaybackRate c) { rate_param.update(c.value, t); },
		[&](change::Pause c) { if (t >= 0.5f) is_paused = c.value; },
		[&](change::Index c) {
			cursor.update(clamp(c.value, 0z, frame_count()), t);
			clamp_cursor();
		},
		[&](change::Position c) {
			cursor.update(clamp(seconds_to_index(c.seconds), 0z, frame_count()), t);
			clamp_cursor();
		},
		[&](change::LoopSeconds c) {
			loop.update(LoopPoints{seconds_to_index(c.start), seconds_to_index(c.end)}, t);
		},
		[&](change::LoopIndex c) { loop.update(LoopPoints{c.start, c.end}, t); },
		[&](change::Panning c) { pan.update(c.value, t); },
	}, change);
}

// Make the parameter targeted by a change rest at its current value.
void Sound::settle(Change const& change) noexcept
{
	visit(visitor{
		[&](change::Volume) { gain.stop_tween(); },
		[&](change::PlaybackRate) { rate_param.stop_tween(); },
		[](change::Pause) {},
		[&](change::Index) { cursor.stop_tween(); },
		[&](change::Position) { cursor.stop_tween(); },
		[&](change::LoopSeconds) { loop.stop_tween(); },
		[&](change::LoopIndex) { loop.stop_tween(); },
		[&](change::Panning) { pan.stop_tween(); },
	}, change);
}

}
