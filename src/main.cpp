// src/main.cpp
// chartplay: load a chart, then either print a preview or run the console
// player.
//
// Frame loop (one thread owns the Session):
//   1) apply pending keyboard commands
//   2) session.tick(wall-clock delta)
//   3) sample the chart, draw the lanes, queue hitsounds for crossed notes
//
// Controls: space play/pause, r reset, left/right seek one beat,
//           up/down speed, q quit.

#include "app/cli.hpp"
#include "app/crossings.hpp"
#include "app/keys.hpp"
#include "app/lanes.hpp"
#include "app/preview.hpp"
#include "app/terminal.hpp"
#include "audio/hitsound.hpp"
#include "chart/parse.hpp"
#include "common/errors.hpp"
#include "io/io.hpp"
#include "playback/session.hpp"
#include "render/sampler.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

constexpr int kRows = 16;

std::unique_ptr<audio::HitsoundPlayer>
open_hitsounds(const std::optional<std::string> &sf) {
  if (!sf)
    return nullptr;
  const auto path = io::resolve_soundfont(*sf);
  if (!path)
    throw std::runtime_error("SoundFont not found: " + *sf);
  std::cout << "Hitsounds: " << path->string() << "\n";
  return std::make_unique<audio::HitsoundPlayer>(*path);
}

// Returns false when the user asked to quit. `jumped` is set when a command
// moved the playhead, so the caller does not sound the notes skipped over.
bool handle_keys(playback::Session &session, audio::HitsoundPlayer *hits,
                 bool &jumped) {
  for (app::Key key = app::poll_key(); key != app::Key::None;
       key = app::poll_key()) {
    if (key == app::Key::Quit)
      return false;
    const auto cmd = app::command_for(key, session.state().speed);
    if (!cmd)
      continue;
    try {
      session.apply(*cmd);
    } catch (const errors::InvalidSpeed &e) {
      // Local and non-fatal: the session kept its previous speed.
      std::cerr << "warning: " << e.what() << "\n";
    }
    if (app::moves_playhead(*cmd)) {
      jumped = true;
      if (hits)
        hits->silence();
    }
  }
  return true;
}

void run_player(const chart::Chart &chart, const app::Cli &cli) {
  render::validate(cli.sampler);
  playback::Session session(chart, cli.playback);
  auto hits = open_hitsounds(cli.sfOverride);

  app::RawTerminal term;
  if (!term.active())
    std::cerr << "warning: stdin is not a terminal; keyboard disabled\n";

  const auto frame = std::chrono::microseconds(1000000 / cli.fps);
  const int lanes = std::max(chart.lane_count(), 1);
  render::RenderSnapshot snap;
  app::CrossingCursor crossings(session.current_beat());

  session.play();
  auto last = std::chrono::steady_clock::now();
  for (;;) {
    bool jumped = false;
    if (term.active() && !handle_keys(session, hits.get(), jumped))
      break;
    if (jumped)
      crossings.jump_to(session.current_beat());

    const auto now = std::chrono::steady_clock::now();
    const double dt = std::chrono::duration<double>(now - last).count();
    last = now;

    const bool wasPlaying = session.state().isPlaying;
    session.tick(dt);

    render::sample_into(chart, session.state(), cli.sampler, snap);
    const auto hit = crossings.advance(chart, snap.beat, wasPlaying);
    if (hits && !hit.empty())
      hits->trigger(hit);

    // Home the cursor and redraw in place.
    std::cout << "\x1b[H\x1b[2J" << app::draw_lanes(snap, lanes, kRows)
              << app::status_line(session.state(), snap, session.duration())
              << "\n"
              << std::flush;

    // Without a keyboard nobody can restart a stopped chart.
    if (!term.active() &&
        session.state().state == playback::PlayState::Stopped)
      break;

    std::this_thread::sleep_until(now + frame);
  }
  std::cout << "\n";
}

} // namespace

int main(int argc, char **argv) {
  try {
    app::Cli cli = app::parse_cli(argc, argv);

    const chart::Chart chart = chart::load_chart(cli.chartPath);
    std::cout << "Loaded chart: " << cli.chartPath.string() << "\n";

    if (cli.previewOnly) {
      app::print_preview(chart);
      return 0;
    }

    run_player(chart, cli);
    return 0;
  } catch (const std::exception &ex) {
    // No fallback chart: a chart that fails validation is not played.
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
