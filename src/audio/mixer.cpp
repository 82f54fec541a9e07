/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "audio/mixer.hpp"

#include "preamble.hpp"
#include "utils/config.hpp"

namespace kittymix::audio {

Mixer::Mixer(Logger::Category cat):
	cat{cat},
	poll_interval{globals::config->get_entry<int>("mixer", "poll_interval")},
	renderer{cat},
	// The device may start requesting frames before the constructor returns; the renderer
	// is ready by then and outputs silence until something is played
	audio{cat, [this](span<Frame> buffer, int sampling_rate) {
		renderer.fill_buffer(sampling_rate, buffer);
	}}
{}

void Mixer::wait() const
{
	while (!is_finished() && audio.pending_errors() == 0)
		sleep_for(poll_interval);
}

}
