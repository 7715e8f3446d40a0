// src/timing/scroll.cpp

#include "timing/scroll.hpp"

#include "common/errors.hpp"
#include "common/util.hpp"

#include <algorithm>
#include <string>

namespace timing {

ScrollMap build_scroll_map(const KeyframeTrack &speed, const TempoMap &tempo) {
  ScrollMap out;
  out.segments.reserve(speed.size());
  for (std::size_t i = 0; i < speed.size(); ++i) {
    const KeyPoint &k = speed[i];
    if (!util::finite_non_negative(k.value))
      throw errors::ChartError("scroll speed must be finite and >= 0 "
                               "(speed key " +
                               std::to_string(i) + ")");

    ScrollSeg seg;
    seg.startSec = beat_to_time(k.beat, tempo);
    seg.speed = k.value;
    if (!out.segments.empty()) {
      const ScrollSeg &prev = out.segments.back();
      seg.startFloor =
          prev.startFloor + prev.speed * (seg.startSec - prev.startSec);
    }
    out.segments.push_back(seg);
  }
  return out;
}

double floor_at(double seconds, const ScrollMap &scroll) {
  const auto &segs = scroll.segments;
  if (segs.empty())
    return seconds;

  // Last key at or before `seconds`; keys sharing a time resolve to the last.
  auto it = std::upper_bound(
      segs.begin(), segs.end(), seconds,
      [](double t, const ScrollSeg &s) { return t < s.startSec; });
  const ScrollSeg &seg = it == segs.begin() ? segs.front() : *(it - 1);
  return seg.startFloor + seg.speed * (seconds - seg.startSec);
}

} // namespace timing
