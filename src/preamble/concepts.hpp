/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <type_traits>
#include <concepts>
#include "preamble/utility.hpp"

namespace kittymix {

using std::same_as;
using std::copyable;
using std::invocable;

template<class T, class Variant>
inline constexpr auto is_variant_alternative_v = false;

template<class T, class... Ts>
inline constexpr auto is_variant_alternative_v<T, variant<Ts...>> =
	(... || std::is_same_v<T, Ts>);

// Constrain type T to one of a std::variant's available alternatives
template<class T, class Variant>
concept variant_alternative = is_variant_alternative_v<T, Variant>;

}
