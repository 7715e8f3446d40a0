// src/chart/chart.hpp
// Chart domain types: notes, metadata, camera tracks and the Chart itself.
//
// A Chart is validated once, in its constructor, and never changes after.
// It may be shared read-only by any number of sessions and samplers.
//
// Invariants after construction:
//  - tempo() is a valid, non-empty tempo map;
//  - notes() is sorted ascending by beat (stable for equal beats);
//  - camera tracks are sorted ascending by beat;
//  - every note lane is in [0, kMaxLanes).

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "timing/keyframes.hpp"
#include "timing/scroll.hpp"
#include "timing/tempo.hpp"

namespace chart {

// Upper bound (exclusive) on note lanes.
inline constexpr int kMaxLanes = 64;

enum class NoteKind : std::uint8_t { Tap = 0, Drag = 1, Hold = 2 };

struct NoteEvent {
  double beat = 0.0;          // head position
  int lane = 0;               // 0-based lane index
  NoteKind kind = NoteKind::Tap;
  double durationBeats = 0.0; // hold length; 0 for taps and drags

  double endBeat() const { return beat + durationBeats; }
};

struct Metadata {
  std::string title;
  std::string artist;
  std::string charter;
  double offset = 0.0; // chart seconds at which beat 0 sounds
};

// Animated view parameters, keyed by beat.
struct Camera {
  timing::KeyframeTrack scale; // default 1.0
  timing::KeyframeTrack x;     // default 0.0
  timing::KeyframeTrack speed; // scroll speed, held until the next key; 1.0
};

class Chart {
public:
  // Throws errors::InvalidTempoMap, errors::InvalidNote, or
  // errors::ChartError for a bad offset, camera key or scroll speed.
  Chart(const std::vector<timing::TempoEvent> &tempo,
        std::vector<NoteEvent> notes, Metadata meta = {}, Camera camera = {});

  const timing::TempoMap &tempo() const { return tempo_; }
  const std::vector<NoteEvent> &notes() const { return notes_; }
  const Metadata &meta() const { return meta_; }
  const Camera &camera() const { return camera_; }

  // Chart time (seconds, offset applied) <-> beat.
  double beat_at(double seconds) const;
  double time_at(double beat) const;

  // Floor position reached at `beat` under the camera speed track.
  double floor_at(double beat) const;

  // Time at which the last note (hold tails included) ends; never negative.
  double duration_seconds() const { return duration_; }
  double end_beat() const { return endBeat_; }

  // Highest lane index used plus one; 0 for an empty chart.
  int lane_count() const { return laneCount_; }

  // Longest durationBeats of any note.
  double max_duration_beats() const { return maxDuration_; }

  // Index of the first note with beat >= `beat` (notes().size() if none).
  std::size_t lower_index(double beat) const;

private:
  timing::TempoMap tempo_;
  std::vector<NoteEvent> notes_;
  Metadata meta_;
  Camera camera_;
  timing::ScrollMap scroll_;

  double duration_ = 0.0;
  double endBeat_ = 0.0;
  int laneCount_ = 0;
  double maxDuration_ = 0.0;
};

const char *kind_name(NoteKind kind);

} // namespace chart
