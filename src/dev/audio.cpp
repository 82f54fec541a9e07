/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "dev/audio.hpp"

#include "preamble.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "lib/pipewire.hpp"

namespace kittymix::dev {

Audio::Audio(Logger::Category cat, Processor processor):
	cat{cat}
{
	context = lib::pw::init(AppTitle,
		globals::config->get_entry<int>("pipewire", "buffer_size"),
		milliseconds{globals::config->get_entry<int>("pipewire", "connect_timeout")},
		move(processor),
		[this](auto kind, auto message) { on_error(kind, message); });
	INFO_AS(cat, "Pipewire audio initialized");
	INFO_AS(cat, "Audio device properties: sample rate: {}Hz, latency: {}ms",
		context->properties.sampling_rate,
		duration_cast<milliseconds>(lib::audio_latency(context->properties)).count());
}

Audio::~Audio() noexcept
{
	lib::pw::cleanup(move(context));
	INFO_AS(cat, "Pipewire audio cleaned up");
}

void Audio::on_error(lib::StreamFault kind, string_view message)
{
	WARN_AS(cat, "Audio stream error ({}): {}", enum_name(kind), message);
	errors.enqueue(StreamError{kind, string{message}});
}

}
