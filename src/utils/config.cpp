/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "utils/config.hpp"

#include <toml++/toml.hpp>
#include <sstream>
#include "preamble.hpp"
#include "utils/logger.hpp"
#include "utils/assert.hpp"
#include "io/file.hpp"

namespace kittymix {

Config::Config(optional<fs::path> path):
	path{move(path)}
{
	create_defaults();
}

Config::~Config() noexcept
try {
	save_to_file();
} catch (exception const& e) {
	if (globals::logger) ERROR("Failed to flush config to file: {}", e.what());
}

void Config::load_from_file()
{
	if (!path || !fs::exists(*path)) return;
	auto const file = io::read_file(*path);
	auto const toml_data = toml::parse(
		{reinterpret_cast<char const*>(file.contents.data()), file.contents.size()});

	for (auto& entry: entries) {
		if (!toml_data.contains(entry.category)) continue;
		auto const* category_table = toml_data[entry.category].as_table();
		if (!category_table || !category_table->contains(entry.name)) continue;
		visit([&](auto& v) {
			auto const toml_entry = (*category_table)[entry.name].value<remove_cvref_t<decltype(v)>>();
			if (!toml_entry) return;
			v = *toml_entry;
		}, entry.value);
	}
}

void Config::save_to_file() const
{
	if (!path) return;
	auto toml_data = toml::table{};
	for (auto const& entry: entries) {
		if (!toml_data.contains(entry.category))
			toml_data.insert(entry.category, toml::table{});
		auto& category_table = *toml_data[entry.category].as_table();
		visit([&](auto const& v) { category_table.insert_or_assign(entry.name, v); }, entry.value);
	}

	auto file_content = std::stringstream{};
	file_content << toml_data;
	auto file_content_view = file_content.view();
	io::write_file(*path,
		{reinterpret_cast<byte const*>(file_content_view.data()), file_content_view.size()});
}

void Config::set_entry(Entry&& entry)
{
	auto& existing = find_entry(entry.category, entry.name);
	ASSERT(existing.value.index() == entry.value.index());
	existing.value = move(entry.value);
}

auto Config::find_entry(string_view category, string_view name) -> Entry&
{
	auto iter = find_if(entries, [&](auto const& e) { return e.category == category && e.name == name; });
	ASSERT(iter != entries.end());
	return *iter;
}

auto Config::find_entry(string_view category, string_view name) const -> Entry const&
{
	auto iter = find_if(entries, [&](auto const& e) { return e.category == category && e.name == name; });
	ASSERT(iter != entries.end());
	return *iter;
}

// Consult this function for the list of registered config entries.
void Config::create_defaults()
{
	entries.emplace_back(Entry{
		.category = "logging",
		.name = "global",
		.value = "Info",
	});
	entries.emplace_back(Entry{
		.category = "logging",
		.name = "audio",
		.value = "Info",
	});

	entries.emplace_back(Entry{
		.category = "pipewire",
		.name = "buffer_size",
		.value = 256,
	});
	entries.emplace_back(Entry{
		.category = "pipewire",
		.name = "connect_timeout",
		.value = 2000,
	});

	entries.emplace_back(Entry{
		.category = "mixer",
		.name = "poll_interval",
		.value = 50,
	});

	entries.emplace_back(Entry{
		.category = "player",
		.name = "volume",
		.value = 1.0,
	});
}

}
