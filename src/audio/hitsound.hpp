// src/audio/hitsound.hpp
// Hitsounds: play a SoundFont drum hit whenever a note reaches the line.
// Built on TinySoundFont (tsf) + miniaudio.
//
// Public API:
//   audio::HitsoundPlayer player(sf2Path);   // opens and starts the device
//   player.trigger(render::crossed(chart, prevBeat, beat));
//
// Design notes:
// - The frame loop owns playback; this class never reads the Session. The
//   loop hands it the notes that crossed the line since the last frame.
// - trigger() only queues; the device callback drains the queue and renders,
//   so the frame loop never waits on the audio thread.
// - The .cpp contains the single-header library implementations and the
//   device callback, so headers elsewhere stay clean.

#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "chart/chart.hpp"

namespace audio {

class HitsoundPlayer {
public:
  // Throws std::runtime_error on device or SF2 errors.
  explicit HitsoundPlayer(const std::filesystem::path &sf2Path);
  ~HitsoundPlayer();

  HitsoundPlayer(const HitsoundPlayer &) = delete;
  HitsoundPlayer &operator=(const HitsoundPlayer &) = delete;

  // Queue one hit per note. Safe to call from the frame loop at any rate.
  void trigger(const std::vector<const chart::NoteEvent *> &notes);

  // Drop anything still queued and silence ringing voices (used on seek).
  void silence();

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// GM percussion key used for a note kind (channel 10 drum map).
int drum_key_for(chart::NoteKind kind);

} // namespace audio
