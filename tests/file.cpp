/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include <catch2/catch.hpp>
#include "preamble.hpp"
#include "io/file.hpp"

using namespace kittymix;

CATCH_TEST_CASE("Files written to disk read back identically", "[file]")
{
	auto const path = fs::path{std::filesystem::temp_directory_path() / "kittymix-file-test.bin"};
	auto const contents = to_array<byte>({byte{0x52}, byte{0x49}, byte{0x46}, byte{0x46}, byte{0x00}, byte{0xFF}});
	io::write_file(path, contents);
	{
		auto const file = io::read_file(path);
		CATCH_CHECK(file.path == path);
		CATCH_REQUIRE(file.contents.size() == contents.size());
		CATCH_CHECK(equal(file.contents, contents));
	}
	std::filesystem::remove(path);
}

CATCH_TEST_CASE("Empty files have empty contents", "[file]")
{
	auto const path = fs::path{std::filesystem::temp_directory_path() / "kittymix-file-empty.bin"};
	io::write_file(path, {});
	{
		auto const file = io::read_file(path);
		CATCH_CHECK(file.contents.empty());
	}
	std::filesystem::remove(path);
}

CATCH_TEST_CASE("Reading a missing file fails", "[file]")
{
	auto const path = fs::path{std::filesystem::temp_directory_path() / "kittymix-file-missing.bin"};
	std::filesystem::remove(path);
	CATCH_CHECK_THROWS_AS(io::read_file(path), runtime_error);
	CATCH_CHECK_THROWS_AS(io::read_file(std::filesystem::temp_directory_path()), runtime_error);
}

CATCH_TEST_CASE("Audio extensions match regardless of case", "[file]")
{
	auto const known = span<string_view const>{io::AudioExtensions};
	CATCH_CHECK(io::has_extension("song.wav", known));
	CATCH_CHECK(io::has_extension("dir/SONG.FLAC", known));
	CATCH_CHECK(io::has_extension("take.Ogg", known));
	CATCH_CHECK_FALSE(io::has_extension("notes.txt", known));
	CATCH_CHECK_FALSE(io::has_extension("wav", known));
	CATCH_CHECK_FALSE(io::has_extension("archive.wav.zip", known));
}
