/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <system_error>
#include "mio/mmap.hpp"
#include "preamble.hpp"

namespace kittymix::lib::mio {

// Read-only memory mapping of a whole file, viewed as bytes.
using ReadMapping = ::mio::basic_mmap_source<byte>;

// Map an existing, non-empty file for reading.
// Throws system_error if the mapping fails.
inline auto map_for_reading(fs::path const& path) -> ReadMapping
{
	auto error = std::error_code{};
	auto mapping = ReadMapping{};
	mapping.map(path.string(), error);
	if (error) throw std::system_error{error, format("Failed to map {}", path)};
	return mapping;
}

}
