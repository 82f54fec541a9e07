/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <functional>
#include <algorithm>
#include <ranges>

namespace kittymix {

namespace views {
	using std::ranges::views::chunk;
}

using std::ranges::all_of;
using std::ranges::fill;
using std::ranges::copy;
using std::ranges::find_if;
using std::ranges::equal;
using std::function;

}
