/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "lib/mio.hpp"

namespace kittymix::io {

// Extensions of audio files the command-line player expects to be able to decode.
static constexpr auto AudioExtensions = {
	".wav"sv, ".mp3"sv, ".ogg"sv, ".flac"sv, ".m4a"sv, ".opus"sv, ".aac"sv, ".aiff"sv, ".aif"sv
};

// A file open for reading. Contents represents the entire length of the file mapped into memory.
// Map is a RAII wrapper ensuring contents are available. Empty files are not mapped, and have
// empty contents.
struct ReadFile {
	fs::path path;
	lib::mio::ReadMapping map;
	span<byte const> contents;
};

// Open a file for reading.
// Throws runtime_error if the provided path doesn't exist or isn't a regular file, or
// system_error if it can't be mapped.
auto read_file(fs::path const&) -> ReadFile;

// Write provided contents to a file, overwriting if it already exists.
// Throws ios_base::failure on write errors.
void write_file(fs::path const&, span<byte const> contents);

// Check if a path has an extension that matches a set. Case-insensitive.
auto has_extension(fs::path const&, span<string_view const> extensions) -> bool;

}
