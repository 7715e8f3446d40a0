// src/easing/easing.hpp
// Easing curves: map linear progress t in [0,1] to eased progress.
//
// Contract:
//  - ease(kind, 0) == 0 and ease(kind, 1) == 1 for every kind.
//  - Values strictly between the endpoints may leave [0,1] (elastic, back).
//  - Inputs outside [0,1] are out of contract: clamp before calling.
//
// Kinds are a closed set. Chart files refer to them either by name
// ("out_cubic") or by numeric index. The numeric indices follow the legacy
// chart table (see from_index), not the enumerator values.

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace easing {

enum class Kind : std::uint8_t {
  Linear = 0,
  InQuad,
  OutQuad,
  InOutQuad,
  InCubic,
  OutCubic,
  InOutCubic,
  InQuart,
  OutQuart,
  InOutQuart,
  InQuint,
  OutQuint,
  InOutQuint,
  InOutSine,
  InOutExpo,
  InOutCirc,
  OutElastic,
  OutBack,
  OutBounce,
  InCirc,
  OutCirc,
  OutSine,
  InSine,
};

inline constexpr std::size_t kKindCount = 23;

// Evaluate the curve. Pure; no failure modes.
double ease(Kind kind, double t);

// Clamp t to [0,1] and evaluate.
double ease_clamped(Kind kind, double t);

// Linear interpolation between a and b.
inline double lerp(double a, double b, double t) { return a + (b - a) * t; }

// Snake-case name, e.g. "in_out_quad".
const char *name(Kind kind);

// Inverse of name(). Accepts the snake-case names only.
std::optional<Kind> from_name(const std::string &s);

// Legacy numeric index -> Kind.
//   0..12   linear, then in/out/in_out for quad, cubic, quart, quint
//   13, 14  constant 0 / constant 1 in old charts; rejected (std::nullopt)
//   15..18  in_circ, out_circ, out_sine, in_sine
// Anything else -> std::nullopt. Kinds past in_out_quint that are not listed
// here can only be named.
std::optional<Kind> from_index(int index);

// All kinds in index order.
const std::array<Kind, kKindCount> &all_kinds();

} // namespace easing
