// SPDX-License-Identifier: GPL-2.0
#ifndef UNITS_H
#define UNITS_H

#include <math.h>
#include <stdint.h>

/*
 * Small structs to make our units very explicit.
 *
 * The units are chosen so that configuration values can be expressed as
 * integers: "millibar" for pressure, "milliliter" for volume, "millimeter"
 * for depth and "second" for durations. Writing out the member name
 * ("depth.mm", "fill.mbar") keeps a value in millibar from being used as
 * bar by mistake.
 *
 * To initialize a variable, use named initializers:
 *	depth_t depth = { .mm = 10'000 }; // 10 m
 * or one of the user-defined literals:
 *	_sec, _min	-> duration_t
 *	_mm, _m		-> depth_t
 *	_mbar, _bar	-> pressure_t
 *	_ml, _l		-> volume_t
 *
 * Addition and subtraction of values of the same type are supported, as
 * are multiplication and division by a scalar from the right.
 * Attention: division uses C++ integer semantics and rounds towards 0!
 *
 * The gas simulation itself works on free liters and bar as doubles; the
 * conversion helpers at the end of this file go between the two worlds.
 */

/*
 * There is a semi-common pattern where lrint() is used to round
 * doubles to long integers and then cast down to a less wide
 * int. Since this is unwieldy, encapsulate this in this function
 */
template <typename INT>
INT int_cast(double v)
{
	return static_cast<INT>(lrint(v));
}

// Base class for all unit types using the "Curiously recurring template pattern"
// to implement addition, subtraction and scaling.
template <typename T>
struct unit_base {
	auto &get_base() {
		auto &[v] = static_cast<T &>(*this);
		return v;
	}
	auto get_base() const {
		auto [v] = static_cast<const T &>(*this);
		return v;
	}
	template <typename base_type>
	static T from_base(base_type v) {
		return { {}, v };
	}
	T operator+(const T &v2) const {
		return from_base(get_base() + v2.get_base());
	}
	T &operator+=(const T &v2) {
		get_base() += v2.get_base();
		return static_cast<T &>(*this);
	}
	T operator-(const T &v2) const {
		return from_base(get_base() - v2.get_base());
	}
	T &operator-=(const T &v2) {
		get_base() -= v2.get_base();
		return static_cast<T &>(*this);
	}
	template <typename base_type>
	T operator*(base_type v) const {
		return from_base(get_base() * v);
	}
	// Attn: C++ integer semantics: this always rounds towards 0!
	template <typename base_type>
	T operator/(base_type v) const {
		return from_base(get_base() / v);
	}
};

struct duration_t : public unit_base<duration_t>
{
	int32_t seconds = 0; // durations up to 34 yrs
};
static constexpr inline duration_t operator""_sec(unsigned long long sec)
{
	return duration_t { .seconds = static_cast<int32_t>(sec) };
}
static constexpr inline duration_t operator""_min(unsigned long long min)
{
	return duration_t { .seconds = static_cast<int32_t>(min * 60) };
}

struct depth_t : public unit_base<depth_t> // depth to 2000 km
{
	int32_t mm = 0;
};
static constexpr inline depth_t operator""_mm(unsigned long long mm)
{
	return depth_t { .mm = static_cast<int32_t>(mm) };
}
static constexpr inline depth_t operator""_m(unsigned long long m)
{
	return depth_t { .mm = static_cast<int32_t>(m * 1000) };
}

struct pressure_t : public unit_base<pressure_t>
{
	int32_t mbar = 0; // pressure up to 2000 bar
};
static constexpr inline pressure_t operator""_mbar(unsigned long long mbar)
{
	return pressure_t { .mbar = static_cast<int32_t>(mbar) };
}
static constexpr inline pressure_t operator""_bar(unsigned long long bar)
{
	return pressure_t { .mbar = static_cast<int32_t>(bar * 1000) };
}

struct volume_t : public unit_base<volume_t>
{
	int mliter = 0;
};
static constexpr inline volume_t operator""_ml(unsigned long long ml)
{
	return volume_t { .mliter = static_cast<int>(ml) };
}
static constexpr inline volume_t operator""_l(unsigned long long l)
{
	return volume_t { .mliter = static_cast<int>(l * 1000) };
}

static inline double to_bar(pressure_t p)
{
	return p.mbar / 1000.0;
}

static inline pressure_t bar_to_pressure(double bar)
{
	return pressure_t { .mbar = int_cast<int32_t>(bar * 1000) };
}

static inline double to_liter(volume_t v)
{
	return v.mliter / 1000.0;
}

static inline double to_meter(depth_t d)
{
	return d.mm / 1000.0;
}

static inline depth_t meter_to_depth(double m)
{
	return depth_t { .mm = int_cast<int32_t>(m * 1000) };
}

static inline double to_minutes(duration_t d)
{
	return d.seconds / 60.0;
}

static inline duration_t minutes_to_duration(double min)
{
	return duration_t { .seconds = int_cast<int32_t>(min * 60) };
}

/* Ambient pressure in atmospheres at the given depth, using the
 * 10 m of water per atmosphere approximation the planner works with. */
static inline double depth_to_ata(depth_t depth)
{
	return depth.mm / 10000.0 + 1.0;
}

/* Round a pressure given in bar to a multiple of 10 bar */
static inline double floor_to_10bar(double bar)
{
	return floor(bar / 10.0) * 10.0;
}

static inline double ceil_to_10bar(double bar)
{
	return ceil(bar / 10.0) * 10.0;
}

#endif
