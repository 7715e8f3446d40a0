// src/render/sampler.hpp
// Frame sampler: turn (chart, playback state) into a RenderSnapshot.
//
// For the current beat b, the visible window is
//   [b - lookbehind, b + lookahead]
// and each note in it gets
//   raw   = (note.beat - b) / lookahead      // 1 at the horizon, 0 at the line
//   eased = ease(kind, raw)                   for raw in [0,1]
//   eased = clampPast ? 0 : raw               for notes already past the line
// Hold notes stay visible while any part of their body is inside the window.
//
// ScrollMode::Floor measures the same distances in floor position (see
// timing/scroll.hpp) instead of beats, so the chart's speed track makes notes
// approach faster or slower. The window then uses lookaheadFloor and
// lookbehindFloor.
//
// Snapshots hold raw pointers into the Chart's note vector. They are only
// valid while that Chart is alive, and are meant to be rebuilt every frame.

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chart/chart.hpp"
#include "easing/easing.hpp"
#include "playback/session.hpp"

namespace render {

enum class ScrollMode : std::uint8_t { Beats, Floor };

struct SamplerConfig {
  double lookaheadBeats = 4.0;  // how far ahead notes appear; must be > 0
  double lookbehindBeats = 0.5; // how long passed notes linger; >= 0
  easing::Kind ease = easing::Kind::Linear;
  bool clampPast = false; // pin past notes to progress 0
  ScrollMode scroll = ScrollMode::Beats;
  double lookaheadFloor = 2.0;   // ScrollMode::Floor window; must be > 0
  double lookbehindFloor = 0.25; // >= 0
};

// Throws errors::InvalidConfig.
void validate(const SamplerConfig &config);

struct VisibleNote {
  const chart::NoteEvent *note = nullptr;
  double rawProgress = 0.0;  // linear distance to the line, in lookaheads
  double easedProgress = 0.0;
  double tailProgress = 0.0; // hold tail position; equals head for taps
};

struct RenderSnapshot {
  double time = 0.0;
  double beat = 0.0;
  double cameraScale = 1.0;
  double cameraX = 0.0;
  double floorPosition = 0.0; // at `beat`, see timing/scroll.hpp
  std::vector<VisibleNote> visibleNotes; // ascending by beat
};

// Build the snapshot for the current frame. Does not validate `config`.
RenderSnapshot sample(const chart::Chart &chart,
                      const playback::PlaybackState &state,
                      const SamplerConfig &config);

// Overload that reuses `out` to avoid reallocating every frame.
void sample_into(const chart::Chart &chart,
                 const playback::PlaybackState &state,
                 const SamplerConfig &config, RenderSnapshot &out);

// "beats" / "floor".
const char *scroll_name(ScrollMode mode);
std::optional<ScrollMode> scroll_from_name(const std::string &s);

// Notes whose head beat lies in (fromBeat, toBeat]. Empty if toBeat <= fromBeat.
std::vector<const chart::NoteEvent *> crossed(const chart::Chart &chart,
                                              double fromBeat, double toBeat);

} // namespace render
