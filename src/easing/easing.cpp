// src/easing/easing.cpp
// Closed-form easing formulas. One switch, no tables of function pointers.

#include "easing/easing.hpp"

#include <algorithm>
#include <cmath>

namespace easing {

namespace {

constexpr double kPi = 3.14159265358979323846;

double out_bounce(double t) {
  constexpr double n1 = 7.5625;
  constexpr double d1 = 2.75;
  if (t < 1.0 / d1)
    return n1 * t * t;
  if (t < 2.0 / d1) {
    t -= 1.5 / d1;
    return n1 * t * t + 0.75;
  }
  if (t < 2.5 / d1) {
    t -= 2.25 / d1;
    return n1 * t * t + 0.9375;
  }
  t -= 2.625 / d1;
  return n1 * t * t + 0.984375;
}

// 1 - (-2t + 2)^n / 2, the second half of every polynomial in-out curve.
double in_out_tail(double t, int n) {
  return 1.0 - std::pow(-2.0 * t + 2.0, n) / 2.0;
}

} // namespace

double ease(Kind kind, double t) {
  switch (kind) {
  case Kind::Linear:
    return t;

  case Kind::InQuad:
    return t * t;
  case Kind::OutQuad:
    return 1.0 - (1.0 - t) * (1.0 - t);
  case Kind::InOutQuad:
    return t < 0.5 ? 2.0 * t * t : in_out_tail(t, 2);

  case Kind::InCubic:
    return t * t * t;
  case Kind::OutCubic:
    return 1.0 - std::pow(1.0 - t, 3);
  case Kind::InOutCubic:
    return t < 0.5 ? 4.0 * t * t * t : in_out_tail(t, 3);

  case Kind::InQuart:
    return t * t * t * t;
  case Kind::OutQuart:
    return 1.0 - std::pow(1.0 - t, 4);
  case Kind::InOutQuart:
    return t < 0.5 ? 8.0 * t * t * t * t : in_out_tail(t, 4);

  case Kind::InQuint:
    return t * t * t * t * t;
  case Kind::OutQuint:
    return 1.0 - std::pow(1.0 - t, 5);
  case Kind::InOutQuint:
    return t < 0.5 ? 16.0 * t * t * t * t * t : in_out_tail(t, 5);

  case Kind::InOutSine:
    // cos(pi) is not exactly -1 in floating point; pin the endpoints.
    if (t <= 0.0)
      return 0.0;
    if (t >= 1.0)
      return 1.0;
    return -(std::cos(kPi * t) - 1.0) / 2.0;

  case Kind::InOutExpo:
    if (t <= 0.0)
      return 0.0;
    if (t >= 1.0)
      return 1.0;
    return t < 0.5 ? std::pow(2.0, 20.0 * t - 10.0) / 2.0
                   : (2.0 - std::pow(2.0, -20.0 * t + 10.0)) / 2.0;

  case Kind::InOutCirc:
    return t < 0.5 ? (1.0 - std::sqrt(1.0 - std::pow(2.0 * t, 2))) / 2.0
                   : (std::sqrt(1.0 - std::pow(-2.0 * t + 2.0, 2)) + 1.0) / 2.0;

  case Kind::OutElastic: {
    if (t <= 0.0)
      return 0.0;
    if (t >= 1.0)
      return 1.0;
    constexpr double c4 = (2.0 * kPi) / 3.0;
    return std::pow(2.0, -10.0 * t) * std::sin((t * 10.0 - 0.75) * c4) + 1.0;
  }

  case Kind::OutBack: {
    if (t <= 0.0)
      return 0.0;
    if (t >= 1.0)
      return 1.0;
    constexpr double c1 = 1.70158;
    constexpr double c3 = c1 + 1.0;
    return 1.0 + c3 * std::pow(t - 1.0, 3) + c1 * std::pow(t - 1.0, 2);
  }

  case Kind::OutBounce:
    if (t >= 1.0)
      return 1.0;
    return out_bounce(t);

  case Kind::InCirc:
    return 1.0 - std::sqrt(1.0 - t * t);
  case Kind::OutCirc:
    return std::sqrt(1.0 - (t - 1.0) * (t - 1.0));

  case Kind::OutSine:
    if (t >= 1.0)
      return 1.0;
    return std::sin(t * kPi / 2.0);
  case Kind::InSine:
    if (t <= 0.0)
      return 0.0;
    if (t >= 1.0)
      return 1.0;
    return 1.0 - std::cos(t * kPi / 2.0);
  }
  return t;
}

double ease_clamped(Kind kind, double t) {
  return ease(kind, std::clamp(t, 0.0, 1.0));
}

namespace {

struct NamedKind {
  Kind kind;
  const char *name;
};

constexpr NamedKind kNames[kKindCount] = {
    {Kind::Linear, "linear"},
    {Kind::InQuad, "in_quad"},
    {Kind::OutQuad, "out_quad"},
    {Kind::InOutQuad, "in_out_quad"},
    {Kind::InCubic, "in_cubic"},
    {Kind::OutCubic, "out_cubic"},
    {Kind::InOutCubic, "in_out_cubic"},
    {Kind::InQuart, "in_quart"},
    {Kind::OutQuart, "out_quart"},
    {Kind::InOutQuart, "in_out_quart"},
    {Kind::InQuint, "in_quint"},
    {Kind::OutQuint, "out_quint"},
    {Kind::InOutQuint, "in_out_quint"},
    {Kind::InOutSine, "in_out_sine"},
    {Kind::InOutExpo, "in_out_expo"},
    {Kind::InOutCirc, "in_out_circ"},
    {Kind::OutElastic, "out_elastic"},
    {Kind::OutBack, "out_back"},
    {Kind::OutBounce, "out_bounce"},
    {Kind::InCirc, "in_circ"},
    {Kind::OutCirc, "out_circ"},
    {Kind::OutSine, "out_sine"},
    {Kind::InSine, "in_sine"},
};

constexpr int kLegacyIndexCount = 19;
constexpr int kLegacyZero = 13;
constexpr int kLegacyOne = 14;

constexpr Kind kLegacyIndex[kLegacyIndexCount] = {
    Kind::Linear,     Kind::InQuad,     Kind::OutQuad,    Kind::InOutQuad,
    Kind::InCubic,    Kind::OutCubic,   Kind::InOutCubic, Kind::InQuart,
    Kind::OutQuart,   Kind::InOutQuart, Kind::InQuint,    Kind::OutQuint,
    Kind::InOutQuint, Kind::Linear,     Kind::Linear,     Kind::InCirc,
    Kind::OutCirc,    Kind::OutSine,    Kind::InSine,
};

} // namespace

const char *name(Kind kind) {
  const auto idx = static_cast<std::size_t>(kind);
  return idx < kKindCount ? kNames[idx].name : "linear";
}

std::optional<Kind> from_name(const std::string &s) {
  for (const auto &n : kNames) {
    if (s == n.name)
      return n.kind;
  }
  return std::nullopt;
}

std::optional<Kind> from_index(int index) {
  if (index < 0 || index >= kLegacyIndexCount)
    return std::nullopt;
  // The constant curves break ease(0) == 0 / ease(1) == 1.
  if (index == kLegacyZero || index == kLegacyOne)
    return std::nullopt;
  return kLegacyIndex[index];
}

const std::array<Kind, kKindCount> &all_kinds() {
  static const std::array<Kind, kKindCount> kinds = [] {
    std::array<Kind, kKindCount> a{};
    for (std::size_t i = 0; i < kKindCount; ++i)
      a[i] = kNames[i].kind;
    return a;
  }();
  return kinds;
}

} // namespace easing
