// src/timing/keyframes.hpp
// Keyframe tracks: a value animated over beats, eased between keys.
//
// Each key holds the value reached at its beat and the curve used to travel
// from it to the next key. Keys are kept sorted by beat.

#pragma once
#include <vector>

#include "easing/easing.hpp"

namespace timing {

struct KeyPoint {
  double beat = 0.0;
  double value = 0.0;
  easing::Kind ease = easing::Kind::Linear; // curve towards the next key
};

using KeyframeTrack = std::vector<KeyPoint>;

// Sample `track` at `beat`.
//  - empty track       -> fallback
//  - before first key  -> first value
//  - after last key    -> last value
//  - between k[i], k[i+1] -> k[i].value eased towards k[i+1].value
double value_at(double beat, const KeyframeTrack &track, double fallback);

} // namespace timing
