/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <stop_token>
#include <filesystem>
#include <atomic>
#include <thread>
#include <mutex>

namespace kittymix {

namespace fs {
	using std::filesystem::path;
	using std::filesystem::status;
	using std::filesystem::exists;
	using std::filesystem::is_regular_file;
	using std::filesystem::file_size;
}

using std::jthread;
using std::stop_token;
using std::this_thread::sleep_for;
using std::this_thread::yield;
using std::atomic;
using std::mutex;
using std::lock_guard;

}
