// src/chart/chart.cpp

#include "chart/chart.hpp"

#include "common/errors.hpp"
#include "common/util.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace chart {

namespace {

void validate_note(const NoteEvent &n, std::size_t i) {
  const std::string where = " (note " + std::to_string(i) + ")";
  if (!std::isfinite(n.beat))
    throw errors::InvalidNote("beat must be finite" + where);
  if (n.lane < 0 || n.lane >= kMaxLanes)
    throw errors::InvalidNote("lane must be in [0, " +
                              std::to_string(kMaxLanes) + ")" + where);
  if (!util::finite_non_negative(n.durationBeats))
    throw errors::InvalidNote("duration must be finite and >= 0" + where);
}

void sort_track(timing::KeyframeTrack &track, const char *name) {
  for (const auto &k : track) {
    if (!std::isfinite(k.beat) || !std::isfinite(k.value))
      throw errors::ChartError(std::string("camera ") + name +
                               " key must be finite");
  }
  std::stable_sort(
      track.begin(), track.end(),
      [](const timing::KeyPoint &a, const timing::KeyPoint &b) {
        return a.beat < b.beat;
      });
}

} // namespace

Chart::Chart(const std::vector<timing::TempoEvent> &tempo,
             std::vector<NoteEvent> notes, Metadata meta, Camera camera)
    : tempo_(timing::build_tempo_map(tempo)), notes_(std::move(notes)),
      meta_(std::move(meta)), camera_(std::move(camera)) {
  if (!std::isfinite(meta_.offset))
    throw errors::ChartError("offset must be finite");

  for (std::size_t i = 0; i < notes_.size(); ++i)
    validate_note(notes_[i], i);

  // Keep authoring order for notes on the same beat.
  std::stable_sort(notes_.begin(), notes_.end(),
                   [](const NoteEvent &a, const NoteEvent &b) {
                     return a.beat < b.beat;
                   });

  sort_track(camera_.scale, "scale");
  sort_track(camera_.x, "x");
  sort_track(camera_.speed, "speed");
  scroll_ = timing::build_scroll_map(camera_.speed, tempo_);

  for (const auto &n : notes_) {
    endBeat_ = std::max(endBeat_, n.endBeat());
    laneCount_ = std::max(laneCount_, n.lane + 1);
    maxDuration_ = std::max(maxDuration_, n.durationBeats);
  }
  duration_ = notes_.empty() ? 0.0 : std::max(0.0, time_at(endBeat_));
}

double Chart::beat_at(double seconds) const {
  return timing::time_to_beat(seconds - meta_.offset, tempo_);
}

double Chart::time_at(double beat) const {
  return timing::beat_to_time(beat, tempo_) + meta_.offset;
}

double Chart::floor_at(double beat) const {
  return timing::floor_at(timing::beat_to_time(beat, tempo_), scroll_);
}

std::size_t Chart::lower_index(double beat) const {
  auto it = std::lower_bound(
      notes_.begin(), notes_.end(), beat,
      [](const NoteEvent &n, double b) { return n.beat < b; });
  return static_cast<std::size_t>(it - notes_.begin());
}

const char *kind_name(NoteKind kind) {
  switch (kind) {
  case NoteKind::Tap:
    return "tap";
  case NoteKind::Drag:
    return "drag";
  case NoteKind::Hold:
    return "hold";
  }
  return "tap";
}

} // namespace chart
