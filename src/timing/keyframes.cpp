// src/timing/keyframes.cpp

#include "timing/keyframes.hpp"

#include <algorithm>

namespace timing {

double value_at(double beat, const KeyframeTrack &track, double fallback) {
  if (track.empty())
    return fallback;
  if (beat <= track.front().beat)
    return track.front().value;
  if (beat >= track.back().beat)
    return track.back().value;

  // First key strictly after `beat`; its predecessor starts the span.
  auto next = std::upper_bound(
      track.begin(), track.end(), beat,
      [](double b, const KeyPoint &k) { return b < k.beat; });
  const KeyPoint &k1 = *(next - 1);
  const KeyPoint &k2 = *next;

  const double span = k2.beat - k1.beat;
  if (span <= 0.0)
    return k2.value;
  const double t = (beat - k1.beat) / span;
  return easing::lerp(k1.value, k2.value, easing::ease_clamped(k1.ease, t));
}

} // namespace timing
