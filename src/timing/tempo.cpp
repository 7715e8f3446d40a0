// src/timing/tempo.cpp
// Implementation of timing utilities.

#include "timing/tempo.hpp"

#include "common/errors.hpp"
#include "common/util.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace timing {

namespace {

std::string at_index(std::size_t i) {
  return " (tempo event " + std::to_string(i) + ")";
}

// Last segment whose startBeat <= beat; the first segment for earlier beats.
const TempoSeg &segment_for_beat(double beat, const TempoMap &tempo) {
  const auto &segs = tempo.segments;
  auto it = std::upper_bound(
      segs.begin(), segs.end(), beat,
      [](double b, const TempoSeg &s) { return b < s.startBeat; });
  if (it == segs.begin())
    return segs.front();
  return *(it - 1);
}

// Last segment whose startSec <= seconds; the first segment for earlier times.
const TempoSeg &segment_for_time(double seconds, const TempoMap &tempo) {
  const auto &segs = tempo.segments;
  auto it = std::upper_bound(
      segs.begin(), segs.end(), seconds,
      [](double t, const TempoSeg &s) { return t < s.startSec; });
  if (it == segs.begin())
    return segs.front();
  return *(it - 1);
}

} // namespace

TempoMap build_tempo_map(const std::vector<TempoEvent> &events) {
  if (events.empty())
    throw errors::InvalidTempoMap("no tempo events");

  for (std::size_t i = 0; i < events.size(); ++i) {
    const auto &e = events[i];
    if (!util::finite_positive(e.bpm))
      throw errors::InvalidTempoMap("bpm must be > 0" + at_index(i));
    if (!util::finite_non_negative(e.beat))
      throw errors::InvalidTempoMap("beat must be finite and >= 0" +
                                    at_index(i));
    if (i > 0 && !(e.beat > events[i - 1].beat))
      throw errors::InvalidTempoMap("beats must strictly increase" +
                                    at_index(i));
  }

  TempoMap map;
  map.segments.reserve(events.size() + 1);

  // Implicit origin: the first declared tempo also governs [0, firstBeat).
  if (events.front().beat > 0.0)
    map.segments.push_back(TempoSeg{0.0, 0.0, events.front().bpm});

  for (const auto &e : events) {
    double startSec = 0.0;
    if (!map.segments.empty()) {
      const TempoSeg &prev = map.segments.back();
      startSec = prev.startSec + (e.beat - prev.startBeat) * prev.secPerBeat();
    }
    map.segments.push_back(TempoSeg{e.beat, startSec, e.bpm});
  }
  return map;
}

double beat_to_time(double beat, const TempoMap &tempo) {
  const TempoSeg &seg = segment_for_beat(beat, tempo);
  return seg.startSec + (beat - seg.startBeat) * seg.secPerBeat();
}

double time_to_beat(double seconds, const TempoMap &tempo) {
  const TempoSeg &seg = segment_for_time(seconds, tempo);
  return seg.startBeat + (seconds - seg.startSec) / seg.secPerBeat();
}

double bpm_at(double beat, const TempoMap &tempo) {
  return segment_for_beat(beat, tempo).bpm;
}

} // namespace timing
