// src/timing/tempo.hpp
// Timing utilities: build a tempo map and convert beats <-> seconds.
//
// Contract:
//  - build_tempo_map(events): validates and precomputes segment start times.
//      * Throws errors::InvalidTempoMap on an empty list, bpm <= 0,
//        negative or non-finite beats, or beats that do not strictly increase.
//      * If the first event sits after beat 0, an implicit origin at beat 0
//        with the same bpm is inserted.
//  - beat_to_time / time_to_beat: total over all reals. Past the last tempo
//    event we continue with the last tempo; before beat 0 with the first.
//
// Both conversions are strictly monotonic and inverse to each other within
// floating-point tolerance. Lookups are binary searches over the segments.

#pragma once
#include <vector>

namespace timing {

// A tempo change: from `beat` onward the chart plays at `bpm`.
struct TempoEvent {
  double beat = 0.0;
  double bpm = 120.0;
};

// A precomputed segment of constant tempo.
struct TempoSeg {
  double startBeat = 0.0; // segment begins at this beat
  double startSec = 0.0;  // time in seconds at startBeat
  double bpm = 120.0;     // tempo in this segment

  double secPerBeat() const { return 60.0 / bpm; }
};

struct TempoMap {
  std::vector<TempoSeg> segments; // ascending by startBeat, never empty
};

// Validate `events` (already in file order) and build the segment table.
TempoMap build_tempo_map(const std::vector<TempoEvent> &events);

// Beat position -> seconds since beat 0.
double beat_to_time(double beat, const TempoMap &tempo);

// Seconds since beat 0 -> beat position.
double time_to_beat(double seconds, const TempoMap &tempo);

// Tempo in effect at `beat`.
double bpm_at(double beat, const TempoMap &tempo);

} // namespace timing
