/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <algorithm>
#include <concepts>
#include <numbers>
#include <limits>
#include <cmath>

namespace kittymix {

using std::min;
using std::max;
using std::clamp;
using std::round;
using std::trunc;
using std::abs;
using std::exp2;
using std::log2;
using std::sqrt;
using std::sin;
using std::cos;
using std::isfinite;
using std::numeric_limits;

template<std::floating_point T>
constexpr auto Pi_v = std::numbers::pi_v<T>;
constexpr auto Pi = Pi_v<float>;

// Linear interpolation between a and b. t is not clamped, so extrapolation is possible.
template<std::floating_point T>
constexpr auto lerp(T a, T b, T t) -> T { return a * (1 - t) + b * t; }

}
