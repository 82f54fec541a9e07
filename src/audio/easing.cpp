/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "audio/easing.hpp"

#include "preamble.hpp"

namespace kittymix::audio {

// Curve definitions follow https://easings.net

constexpr auto BackC1 = 1.70158f;
constexpr auto BackC2 = BackC1 * 1.525f;
constexpr auto BackC3 = BackC1 + 1.0f;
constexpr auto ElasticC4 = 2.0f * Pi / 3.0f;
constexpr auto ElasticC5 = 2.0f * Pi / 4.5f;

static auto squared(float x) -> float { return x * x; }
static auto cubed(float x) -> float { return x * x * x; }
static auto to_fourth(float x) -> float { return squared(squared(x)); }
static auto to_fifth(float x) -> float { return to_fourth(x) * x; }

static auto linear(float t) -> float { return t; }
static auto reverse(float t) -> float { return 1.0f - t; }

static auto back_in(float t) -> float { return BackC3 * cubed(t) - BackC1 * squared(t); }
static auto back_out(float t) -> float { return 1.0f + BackC3 * cubed(t - 1.0f) + BackC1 * squared(t - 1.0f); }
static auto back_in_out(float t) -> float
{
	if (t < 0.5f)
		return squared(2.0f * t) * ((BackC2 + 1.0f) * 2.0f * t - BackC2) / 2.0f;
	return (squared(2.0f * t - 2.0f) * ((BackC2 + 1.0f) * (t * 2.0f - 2.0f) + BackC2) + 2.0f) / 2.0f;
}

static auto bounce_out(float t) -> float
{
	constexpr auto N1 = 7.5625f;
	constexpr auto D1 = 2.75f;
	if (t < 1.0f / D1) return N1 * t * t;
	if (t < 2.0f / D1) return N1 * squared(t - 1.5f / D1) + 0.75f;
	if (t < 2.5f / D1) return N1 * squared(t - 2.25f / D1) + 0.9375f;
	return N1 * squared(t - 2.625f / D1) + 0.984375f;
}
static auto bounce_in(float t) -> float { return 1.0f - bounce_out(1.0f - t); }
static auto bounce_in_out(float t) -> float
{
	if (t < 0.5f) return (1.0f - bounce_out(1.0f - 2.0f * t)) / 2.0f;
	return (1.0f + bounce_out(2.0f * t - 1.0f)) / 2.0f;
}

static auto circ_in(float t) -> float { return 1.0f - sqrt(1.0f - squared(t)); }
static auto circ_out(float t) -> float { return sqrt(1.0f - squared(t - 1.0f)); }
static auto circ_in_out(float t) -> float
{
	if (t < 0.5f) return (1.0f - sqrt(1.0f - squared(2.0f * t))) / 2.0f;
	return (sqrt(1.0f - squared(-2.0f * t + 2.0f)) + 1.0f) / 2.0f;
}

static auto cubic_in(float t) -> float { return cubed(t); }
static auto cubic_out(float t) -> float { return 1.0f - cubed(1.0f - t); }
static auto cubic_in_out(float t) -> float
{
	if (t < 0.5f) return 4.0f * cubed(t);
	return 1.0f - cubed(-2.0f * t + 2.0f) / 2.0f;
}

static auto elastic_in(float t) -> float
{
	if (t <= 0.0f) return 0.0f;
	if (t >= 1.0f) return 1.0f;
	return -exp2(10.0f * t - 10.0f) * sin((t * 10.0f - 10.75f) * ElasticC4);
}
static auto elastic_out(float t) -> float
{
	if (t <= 0.0f) return 0.0f;
	if (t >= 1.0f) return 1.0f;
	return exp2(-10.0f * t) * sin((t * 10.0f - 0.75f) * ElasticC4) + 1.0f;
}
static auto elastic_in_out(float t) -> float
{
	if (t <= 0.0f) return 0.0f;
	if (t >= 1.0f) return 1.0f;
	if (t < 0.5f) return -(exp2(20.0f * t - 10.0f) * sin((20.0f * t - 11.125f) * ElasticC5)) / 2.0f;
	return exp2(-20.0f * t + 10.0f) * sin((20.0f * t - 11.125f) * ElasticC5) / 2.0f + 1.0f;
}

static auto expo_in(float t) -> float { return t <= 0.0f? 0.0f : exp2(10.0f * t - 10.0f); }
static auto expo_out(float t) -> float { return t >= 1.0f? 1.0f : 1.0f - exp2(-10.0f * t); }
static auto expo_in_out(float t) -> float
{
	if (t <= 0.0f) return 0.0f;
	if (t >= 1.0f) return 1.0f;
	if (t < 0.5f) return exp2(20.0f * t - 10.0f) / 2.0f;
	return (2.0f - exp2(-20.0f * t + 10.0f)) / 2.0f;
}

static auto quad_in(float t) -> float { return squared(t); }
static auto quad_out(float t) -> float { return 1.0f - squared(1.0f - t); }
static auto quad_in_out(float t) -> float
{
	if (t < 0.5f) return 2.0f * squared(t);
	return 1.0f - squared(-2.0f * t + 2.0f) / 2.0f;
}

static auto quart_in(float t) -> float { return to_fourth(t); }
static auto quart_out(float t) -> float { return 1.0f - to_fourth(1.0f - t); }
static auto quart_in_out(float t) -> float
{
	if (t < 0.5f) return 8.0f * to_fourth(t);
	return 1.0f - to_fourth(-2.0f * t + 2.0f) / 2.0f;
}

static auto quint_in(float t) -> float { return to_fifth(t); }
static auto quint_out(float t) -> float { return 1.0f - to_fifth(1.0f - t); }
static auto quint_in_out(float t) -> float
{
	if (t < 0.5f) return 16.0f * to_fifth(t);
	return 1.0f - to_fifth(-2.0f * t + 2.0f) / 2.0f;
}

static auto sine_in(float t) -> float { return 1.0f - cos(t * Pi / 2.0f); }
static auto sine_out(float t) -> float { return sin(t * Pi / 2.0f); }
static auto sine_in_out(float t) -> float { return -(cos(Pi * t) - 1.0f) / 2.0f; }

// Indexed by Easing
static constexpr auto Curves = to_array<float(*)(float)>({
	linear, reverse,
	back_in, back_out, back_in_out,
	bounce_in, bounce_out, bounce_in_out,
	circ_in, circ_out, circ_in_out,
	cubic_in, cubic_out, cubic_in_out,
	elastic_in, elastic_out, elastic_in_out,
	expo_in, expo_out, expo_in_out,
	quad_in, quad_out, quad_in_out,
	quart_in, quart_out, quart_in_out,
	quint_in, quint_out, quint_in_out,
	sine_in, sine_out, sine_in_out,
});
static_assert(Curves.size() == enum_count<Easing>());

auto apply(Easing easing, float t) noexcept -> float
{
	return Curves[+easing](t);
}

}
