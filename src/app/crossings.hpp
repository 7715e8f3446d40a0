// src/app/crossings.hpp
// Which notes crossed the judgement line since the previous frame.
//
// The cursor remembers the beat seen last frame. Normal playback reports the
// notes in (last, now]. A seek or reset moves the cursor without reporting
// anything, so jumping forward does not fire every note in between.

#pragma once
#include <vector>

#include "chart/chart.hpp"
#include "playback/commands.hpp"
#include "render/sampler.hpp"

namespace app {

// True for commands that move the playhead instead of letting it run.
inline bool moves_playhead(const playback::Command &cmd) {
  return cmd.type == playback::CommandType::SeekRelative ||
         cmd.type == playback::CommandType::Reset;
}

class CrossingCursor {
public:
  explicit CrossingCursor(double beat) : last_(beat) {}

  // Re-anchor after a jump; nothing is reported for the skipped span.
  void jump_to(double beat) { last_ = beat; }

  // Notes crossed between the previous frame and `beat`. Empty unless
  // playback was running during the frame.
  std::vector<const chart::NoteEvent *>
  advance(const chart::Chart &chart, double beat, bool wasPlaying) {
    std::vector<const chart::NoteEvent *> out;
    if (wasPlaying && beat > last_)
      out = render::crossed(chart, last_, beat);
    last_ = beat;
    return out;
  }

  double last_beat() const { return last_; }

private:
  double last_;
};

} // namespace app
