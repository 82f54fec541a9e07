/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include <catch2/catch.hpp>
#include "preamble.hpp"
#include "utils/config.hpp"
#include "io/file.hpp"

using namespace kittymix;

static auto temp_path(string_view name) -> fs::path
{
	auto path = fs::path{std::filesystem::temp_directory_path() / name};
	std::filesystem::remove(path);
	return path;
}

static void write_text(fs::path const& path, string_view text)
{
	io::write_file(path, {reinterpret_cast<byte const*>(text.data()), text.size()});
}

CATCH_TEST_CASE("Config entries start at their defaults", "[config]")
{
	auto const config = Config{nullopt};
	CATCH_CHECK(config.get_entry<string>("logging", "global") == "Info");
	CATCH_CHECK(config.get_entry<string>("logging", "audio") == "Info");
	CATCH_CHECK(config.get_entry<int>("pipewire", "buffer_size") == 256);
	CATCH_CHECK(config.get_entry<int>("pipewire", "connect_timeout") == 2000);
	CATCH_CHECK(config.get_entry<int>("mixer", "poll_interval") == 50);
	CATCH_CHECK(config.get_entry<double>("player", "volume") == 1.0);
}

CATCH_TEST_CASE("Config entries can be changed but not retyped", "[config]")
{
	auto config = Config{nullopt};
	config.set_entry({"pipewire", "buffer_size", 1024});
	CATCH_CHECK(config.get_entry<int>("pipewire", "buffer_size") == 1024);
	CATCH_CHECK_THROWS_AS(config.set_entry({"pipewire", "buffer_size", 0.5}), logic_error);
	CATCH_CHECK_THROWS_AS(config.set_entry({"pipewire", "latency", 10}), logic_error);
	CATCH_CHECK_THROWS_AS(config.get_entry<int>("mixer", "volume"), logic_error);
	CATCH_CHECK(config.get_entry<int>("pipewire", "buffer_size") == 1024);
}

CATCH_TEST_CASE("An in-memory config never touches the disk", "[config]")
{
	auto config = Config{nullopt};
	config.load_from_file();
	config.save_to_file();
	CATCH_CHECK(config.get_entry<int>("mixer", "poll_interval") == 50);
}

CATCH_TEST_CASE("Config survives a round trip through its file", "[config]")
{
	auto const path = temp_path("kittymix-config-test.toml");
	{
		auto config = Config{path};
		config.load_from_file();
		config.set_entry({"pipewire", "buffer_size", 512});
		config.set_entry({"player", "volume", 0.5});
		config.set_entry({"logging", "audio", string{"Debug"}});
	}
	CATCH_REQUIRE(fs::exists(path));

	{
		auto config = Config{path};
		CATCH_CHECK(config.get_entry<int>("pipewire", "buffer_size") == 256);
		config.load_from_file();
		CATCH_CHECK(config.get_entry<int>("pipewire", "buffer_size") == 512);
		CATCH_CHECK(config.get_entry<double>("player", "volume") == 0.5);
		CATCH_CHECK(config.get_entry<string>("logging", "audio") == "Debug");
		CATCH_CHECK(config.get_entry<int>("mixer", "poll_interval") == 50);
	}
	std::filesystem::remove(path);
}

CATCH_TEST_CASE("Config ignores unknown and mistyped file entries", "[config]")
{
	auto const path = temp_path("kittymix-config-partial.toml");
	write_text(path,
		"[mixer]\n"
		"poll_interval = 10\n"
		"[player]\n"
		"volume = \"loud\"\n"
		"[unknown]\n"
		"entry = 1\n");
	{
		auto config = Config{path};
		config.load_from_file();
		CATCH_CHECK(config.get_entry<int>("mixer", "poll_interval") == 10);
		CATCH_CHECK(config.get_entry<double>("player", "volume") == 1.0);
		CATCH_CHECK(config.get_entry<int>("pipewire", "buffer_size") == 256);
	}
	std::filesystem::remove(path);
}
