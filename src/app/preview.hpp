// src/app/preview.hpp
// Pretty, compact console preview of a loaded chart.
// - Prints metadata and the tempo map
// - Prints the first 10 notes with timestamps (s)

#pragma once
#include <algorithm>
#include <iomanip>
#include <iostream>

#include "chart/chart.hpp"

namespace app {

inline void print_preview(const chart::Chart &c, std::ostream &os = std::cout) {
  const auto &meta = c.meta();
  os << "Chart:\n";
  os << "  title    = " << (meta.title.empty() ? "(untitled)" : meta.title)
     << "\n";
  if (!meta.artist.empty())
    os << "  artist   = " << meta.artist << "\n";
  if (!meta.charter.empty())
    os << "  charter  = " << meta.charter << "\n";
  os << std::fixed << std::setprecision(3);
  os << "  offset   = " << meta.offset << " s\n";
  os << "  notes    = " << c.notes().size() << " in " << c.lane_count()
     << " lanes\n";
  os << "  duration = " << c.duration_seconds() << " s (" << c.end_beat()
     << " beats)\n";

  os << "\nTempo map:\n";
  for (const auto &seg : c.tempo().segments) {
    os << "  beat " << seg.startBeat << "  t=" << seg.startSec << "s  "
       << seg.bpm << " bpm\n";
  }

  os << "\nFirst 10 notes with time:\n";
  const std::size_t limit = std::min<std::size_t>(10, c.notes().size());
  for (std::size_t i = 0; i < limit; ++i) {
    const auto &n = c.notes()[i];
    os << "t=" << c.time_at(n.beat) << "s  beat=" << n.beat
       << "  lane=" << n.lane << "  " << chart::kind_name(n.kind);
    if (n.durationBeats > 0.0)
      os << " (" << n.durationBeats << " beats)";
    os << "\n";
  }
}

} // namespace app
