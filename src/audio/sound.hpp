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
#include "audio/resampler.hpp"
#include "audio/playback.hpp"
#include "audio/command.hpp"
#include "audio/tween.hpp"

namespace kittymix::audio {

using lib::Frame;

// A playing instance of an audio clip. The frame buffer is immutable and can be shared by any
// number of sounds; everything else is the playback state of this instance only.
// The cursor is a signed index into the buffer, in the range [-1, frame_count()]. It runs one
// frame past either end of the buffer, so that the sound can play out the frames still held by
// the resampler before it reports being finished.
class Sound {
public:
	using Frames = vector<Frame>;

	// Create a sound playing from the beginning of the buffer at sample_rate Hz.
	// Throws runtime_error if the sample rate is not positive.
	Sound(int sample_rate, shared_ptr<Frames const> frames);

	// Create a sound from a copy of the provided frames.
	[[nodiscard]] static auto from_frames(int sample_rate, span<Frame const> frames) -> Sound;

	// Render the next output frame at the given output sampling rate. Returns silence once the
	// sound is finished.
	auto next_frame(int output_rate) noexcept -> Frame;

	// Schedule a command. Commands run in insertion order, so of two simultaneously active
	// commands on the same parameter the one added later prevails.
	void add_command(Command);

	// Playback control

	void set_volume(float);
	void set_playback_rate(PlaybackRate);
	void set_panning(float);
	void set_paused(bool);
	void pause() { set_paused(true); }
	void resume() { set_paused(false); }
	// Swap the direction of playback. For a rate in semitones, this mirrors the pitch instead.
	void reverse();

	// Move the cursor to the given index, clamped to the buffer. Unless the sound is paused,
	// the frame at the new position is pushed to the resampler right away.
	void seek_to_index(ssize_t);
	void seek_to(double seconds);
	void seek_by(double seconds);
	// Move to the last frame of the buffer, so that the sound can be played in reverse.
	void seek_to_end();
	// Move back to the first frame.
	void reset() { seek_to_index(0); }

	// Set the loop region, as a half-open range. Does not enable looping by itself.
	void set_loop(double start_seconds, double end_seconds);
	void set_loop_index(ssize_t start, ssize_t end);
	void set_loop_enabled(bool enabled) { looping = enabled; }

	// Queries

	[[nodiscard]] auto get_frames() const -> shared_ptr<Frames const> const& { return frames; }
	[[nodiscard]] auto sample_rate() const -> int { return rate; }
	[[nodiscard]] auto frame_count() const -> ssize_t { return ssize(*frames); }
	[[nodiscard]] auto duration_seconds() const -> double
	{ return static_cast<double>(frame_count()) / static_cast<double>(rate); }
	[[nodiscard]] auto duration() const -> nanoseconds
	{ return duration_cast<nanoseconds>(std::chrono::duration<double>{duration_seconds()}); }

	[[nodiscard]] auto index() const -> ssize_t { return cursor.value; }
	[[nodiscard]] auto base_index() const -> ssize_t { return cursor.base_value; }
	// Index of the source frame currently heard, which trails index() by the resampler's lookahead.
	[[nodiscard]] auto playing_index() const -> ssize_t { return resampler.current_frame_index(); }
	[[nodiscard]] auto volume() const -> float { return gain.value; }
	[[nodiscard]] auto base_volume() const -> float { return gain.base_value; }
	[[nodiscard]] auto playback_rate() const -> PlaybackRate { return rate_param.value; }
	[[nodiscard]] auto base_playback_rate() const -> PlaybackRate { return rate_param.base_value; }
	[[nodiscard]] auto panning() const -> float { return pan.value; }
	[[nodiscard]] auto base_panning() const -> float { return pan.base_value; }
	[[nodiscard]] auto paused() const -> bool { return is_paused; }
	[[nodiscard]] auto loop_enabled() const -> bool { return looping; }
	// Loop region clamped to the buffer. The default region spans the whole buffer.
	[[nodiscard]] auto loop_points() const -> LoopPoints;
	[[nodiscard]] auto loop_start() const -> ssize_t { return loop_points().start; }
	[[nodiscard]] auto loop_end() const -> ssize_t { return loop_points().end; }
	[[nodiscard]] auto loop_start_seconds() const -> double { return index_to_seconds(loop_start()); }
	[[nodiscard]] auto loop_end_seconds() const -> double { return index_to_seconds(loop_end()); }
	[[nodiscard]] auto command_count() const -> ssize_t { return ssize(commands); }

	// A sound is finished once its cursor is past the end of the buffer in the direction of
	// playback, and everything it pushed to the resampler has been played out.
	[[nodiscard]] auto finished() const -> bool;
	[[nodiscard]] auto outputting_silence() const -> bool { return resampler.outputting_silence(); }

private:
	shared_ptr<Frames const> frames;
	int rate;
	Parameter<ssize_t> cursor;
	Parameter<PlaybackRate> rate_param;
	Parameter<float> gain;
	Parameter<float> pan;
	Parameter<LoopPoints> loop;
	bool looping = false;
	bool is_paused = false;
	double fractional_position = 0.0;
	Resampler resampler;
	small_vector<Command, 4> commands;

	[[nodiscard]] auto moving_forward() const -> bool { return rate_param.value.as_factor() >= 0.0; }
	[[nodiscard]] auto past_end() const -> bool;
	[[nodiscard]] auto seconds_to_index(double) const -> ssize_t;
	[[nodiscard]] auto index_to_seconds(ssize_t index) const -> double
	{ return static_cast<double>(index) / static_cast<double>(rate); }

	void advance() noexcept;
	auto wrap_loop() noexcept -> bool;
	void push_current() noexcept;
	void update_commands(double dt) noexcept;
	void apply_change(Change const&, float t) noexcept;
	void settle(Change const&) noexcept;
};

}
