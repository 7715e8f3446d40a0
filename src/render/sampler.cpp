// src/render/sampler.cpp

#include "render/sampler.hpp"

#include "common/errors.hpp"
#include "common/util.hpp"
#include "timing/keyframes.hpp"

#include <algorithm>

namespace render {

namespace {

double progress_of(double pos, double now, double lookahead) {
  return (pos - now) / lookahead;
}

double eased_of(double raw, const SamplerConfig &config) {
  if (raw < 0.0)
    return config.clampPast ? 0.0 : raw;
  return easing::ease(config.ease, std::min(raw, 1.0));
}

// `head` and `tail` are the note's positions in the window's unit.
VisibleNote make_visible(const chart::NoteEvent &n, double head, double tail,
                         double now, double lookahead,
                         const SamplerConfig &config) {
  VisibleNote v;
  v.note = &n;
  v.rawProgress = progress_of(head, now, lookahead);
  v.easedProgress = eased_of(v.rawProgress, config);
  v.tailProgress =
      n.durationBeats > 0.0
          ? eased_of(progress_of(tail, now, lookahead), config)
          : v.easedProgress;
  return v;
}

void select_by_beats(const chart::Chart &chart, const SamplerConfig &config,
                     double beat, std::vector<VisibleNote> &out) {
  const double lo = beat - config.lookbehindBeats;
  const double hi = beat + config.lookaheadBeats;

  // A hold that started up to max_duration_beats() before `lo` can still
  // reach into the window, so the scan starts that much earlier.
  const auto &notes = chart.notes();
  for (std::size_t i = chart.lower_index(lo - chart.max_duration_beats());
       i < notes.size() && notes[i].beat <= hi; ++i) {
    const chart::NoteEvent &n = notes[i];
    if (n.beat < lo && n.endBeat() < lo)
      continue;
    out.push_back(make_visible(n, n.beat, n.endBeat(), beat,
                               config.lookaheadBeats, config));
  }
}

// Floor position never decreases with beat, so notes stay sorted by it.
void select_by_floor(const chart::Chart &chart, const SamplerConfig &config,
                     double now, std::vector<VisibleNote> &out) {
  const double lo = now - config.lookbehindFloor;
  const double hi = now + config.lookaheadFloor;

  const auto &notes = chart.notes();
  const auto first = std::partition_point(
      notes.begin(), notes.end(),
      [&](const chart::NoteEvent &n) { return chart.floor_at(n.beat) < lo; });

  // Every note before `first` has its head below `lo`. A hold among them is
  // visible only if its tail passes the head of the note just before
  // `first`, which bounds how far back the scan has to go.
  std::size_t start = 0;
  if (first != notes.begin())
    start = chart.lower_index((first - 1)->beat - chart.max_duration_beats());

  for (std::size_t i = start; i < notes.size(); ++i) {
    const chart::NoteEvent &n = notes[i];
    const double head = chart.floor_at(n.beat);
    if (head > hi)
      break;
    const double tail = chart.floor_at(n.endBeat());
    if (head < lo && tail < lo)
      continue;
    out.push_back(
        make_visible(n, head, tail, now, config.lookaheadFloor, config));
  }
}

} // namespace

void validate(const SamplerConfig &config) {
  if (!util::finite_positive(config.lookaheadBeats))
    throw errors::InvalidConfig("lookahead must be > 0 beats");
  if (!util::finite_non_negative(config.lookbehindBeats))
    throw errors::InvalidConfig("lookbehind must be >= 0 beats");
  if (!util::finite_positive(config.lookaheadFloor))
    throw errors::InvalidConfig("floor lookahead must be > 0");
  if (!util::finite_non_negative(config.lookbehindFloor))
    throw errors::InvalidConfig("floor lookbehind must be >= 0");
}

void sample_into(const chart::Chart &chart,
                 const playback::PlaybackState &state,
                 const SamplerConfig &config, RenderSnapshot &out) {
  const double beat = chart.beat_at(state.currentTime);

  out.time = state.currentTime;
  out.beat = beat;
  out.floorPosition = chart.floor_at(beat);
  out.cameraScale = timing::value_at(beat, chart.camera().scale, 1.0);
  out.cameraX = timing::value_at(beat, chart.camera().x, 0.0);
  out.visibleNotes.clear();

  switch (config.scroll) {
  case ScrollMode::Beats:
    select_by_beats(chart, config, beat, out.visibleNotes);
    break;
  case ScrollMode::Floor:
    select_by_floor(chart, config, out.floorPosition, out.visibleNotes);
    break;
  }
}

RenderSnapshot sample(const chart::Chart &chart,
                      const playback::PlaybackState &state,
                      const SamplerConfig &config) {
  RenderSnapshot snap;
  sample_into(chart, state, config, snap);
  return snap;
}

std::vector<const chart::NoteEvent *> crossed(const chart::Chart &chart,
                                              double fromBeat, double toBeat) {
  std::vector<const chart::NoteEvent *> out;
  if (!(toBeat > fromBeat))
    return out;
  const auto &notes = chart.notes();
  for (std::size_t i = chart.lower_index(fromBeat);
       i < notes.size() && notes[i].beat <= toBeat; ++i) {
    if (notes[i].beat > fromBeat)
      out.push_back(&notes[i]);
  }
  return out;
}

const char *scroll_name(ScrollMode mode) {
  switch (mode) {
  case ScrollMode::Beats:
    return "beats";
  case ScrollMode::Floor:
    return "floor";
  }
  return "beats";
}

std::optional<ScrollMode> scroll_from_name(const std::string &s) {
  if (s == "beats")
    return ScrollMode::Beats;
  if (s == "floor")
    return ScrollMode::Floor;
  return std::nullopt;
}

} // namespace render
