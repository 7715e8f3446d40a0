// src/app/lanes.hpp
// ASCII renderer for a RenderSnapshot: one column per lane, `rows` rows
// between the judgement line (bottom) and the lookahead horizon (top).
//
//   |   o   |      <- tap ahead of the line
//   | # |   |      <- hold body
//   =========      <- judgement line
//
// Pure string building so it can be tested without a terminal.

#pragma once
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "chart/chart.hpp"
#include "playback/session.hpp"
#include "render/sampler.hpp"

namespace app {

// Row for a progress value: 0 = judgement line, rows-1 = horizon.
// Returns -1 for anything outside the field.
inline int row_for(double progress, int rows) {
  if (!(progress >= 0.0) || progress > 1.0)
    return -1;
  return static_cast<int>(std::lround(progress * (rows - 1)));
}

inline char glyph_for(chart::NoteKind kind) {
  switch (kind) {
  case chart::NoteKind::Tap:
    return 'o';
  case chart::NoteKind::Drag:
    return '~';
  case chart::NoteKind::Hold:
    return 'O';
  }
  return 'o';
}

inline std::string draw_lanes(const render::RenderSnapshot &snap, int lanes,
                              int rows) {
  lanes = std::max(lanes, 1);
  rows = std::max(rows, 2);
  // grid[0] is the horizon, grid[rows-1] the judgement line.
  std::vector<std::string> grid(static_cast<std::size_t>(rows),
                                std::string(static_cast<std::size_t>(lanes),
                                            ' '));

  const auto put = [&](int row, int lane, char c) {
    if (row < 0 || lane < 0 || lane >= lanes)
      return;
    grid[static_cast<std::size_t>(rows - 1 - row)]
        [static_cast<std::size_t>(lane)] = c;
  };

  for (const auto &v : snap.visibleNotes) {
    const int lane = v.note->lane;
    if (v.note->durationBeats > 0.0) {
      const int head = std::max(0, row_for(std::max(v.easedProgress, 0.0), rows));
      const int tail = row_for(std::min(v.tailProgress, 1.0), rows);
      for (int r = head + 1; r <= tail; ++r)
        put(r, lane, '#');
    }
    put(row_for(v.easedProgress, rows), lane, glyph_for(v.note->kind));
  }

  std::ostringstream os;
  for (const auto &line : grid) {
    os << '|';
    for (char c : line)
      os << ' ' << c;
    os << " |\n";
  }
  os << std::string(static_cast<std::size_t>(lanes) * 2 + 3, '=') << "\n";
  return os.str();
}

inline std::string status_line(const playback::PlaybackState &st,
                               const render::RenderSnapshot &snap,
                               double duration) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(2) << playback::state_name(st.state)
     << "  t=" << st.currentTime << "/" << duration << "s  beat=" << snap.beat
     << "  speed=x" << st.speed;
  if (st.loopCount > 0)
    os << "  loop " << st.loopCount;
  return os.str();
}

} // namespace app
