// src/timing/scroll.hpp
// Scroll-speed map: integrate a speed track into a "floor position".
//
// The floor position is the distance the note field has scrolled, in
// speed x seconds. Speed is a step function: each key holds its value until
// the next key, and eases are ignored. With no keys the speed is 1, so the
// floor position equals seconds since beat 0.
//
// Contract:
//  - build_scroll_map(track, tempo): `track` must be sorted by beat.
//      * Throws errors::ChartError if a speed is negative or non-finite.
//      * The first key sits at floor position 0.
//  - floor_at(seconds): total over all reals. Before the first key the first
//    speed applies. Non-decreasing in `seconds` since speeds are >= 0.

#pragma once
#include <vector>

#include "timing/keyframes.hpp"
#include "timing/tempo.hpp"

namespace timing {

// A precomputed span of constant scroll speed.
struct ScrollSeg {
  double startSec = 0.0;   // seconds since beat 0 at the key
  double speed = 1.0;      // floor units per second from here on
  double startFloor = 0.0; // floor position at startSec
};

struct ScrollMap {
  std::vector<ScrollSeg> segments; // ascending by startSec; empty = speed 1
};

ScrollMap build_scroll_map(const KeyframeTrack &speed, const TempoMap &tempo);

// Seconds since beat 0 -> floor position.
double floor_at(double seconds, const ScrollMap &scroll);

} // namespace timing
