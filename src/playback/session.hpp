// src/playback/session.hpp
// Playback state machine for one player session.
//
// States: Stopped, Playing, Paused.
//   Stopped --play()--> Playing   (restart=true rewinds to 0 first)
//   Playing --pause()-> Paused    (pause() is idempotent)
//   Paused  --play()--> Playing
//   any     --stop()--> Stopped
//
// Time only moves in tick(dt), and only while Playing:
//   t' = t + dt * speed
// Reaching the end of the chart applies the configured EndPolicy.
//
// Seeks never fail: targets are clamped to [0, duration]. Bad speeds throw
// errors::InvalidSpeed and leave the state exactly as it was.
//
// The session reads the Chart (duration, tempo) and never modifies it. The
// Chart must outlive the Session.

#pragma once
#include <cstdint>

#include "chart/chart.hpp"
#include "playback/commands.hpp"

namespace playback {

enum class PlayState : std::uint8_t { Stopped, Playing, Paused };

enum class EndPolicy : std::uint8_t {
  StopAtEnd, // clamp to the end and stop
  Loop,      // wrap to the start and keep playing
  HoldAtEnd, // clamp to the end and keep "playing" on the last frame
};

struct Config {
  EndPolicy endPolicy = EndPolicy::StopAtEnd;
  double initialSpeed = 1.0;
};

// Everything a renderer needs to know about where playback is.
struct PlaybackState {
  double currentTime = 0.0; // chart seconds
  double speed = 1.0;       // playback rate multiplier, always > 0
  bool isPlaying = false;   // mirrors state == Playing
  PlayState state = PlayState::Stopped;
  std::uint32_t loopCount = 0; // wraps taken under EndPolicy::Loop
};

class Session {
public:
  // Throws errors::InvalidSpeed if config.initialSpeed is not > 0.
  explicit Session(const chart::Chart &chart, Config config = {});

  const PlaybackState &state() const { return state_; }
  const Config &config() const { return config_; }
  double duration() const { return duration_; }

  // Beat at the current time, through the chart's tempo map.
  double current_beat() const;

  void play(bool restart = false);
  void pause();
  void toggle();
  void stop();
  void reset();

  void seek(double seconds);
  void seek_relative(double delta, SeekUnit unit);

  // Throws errors::InvalidSpeed for non-finite or non-positive values.
  void set_speed(double multiplier);

  void set_end_policy(EndPolicy policy) { config_.endPolicy = policy; }

  // Advance by dt wall-clock seconds. Non-positive or non-finite dt: no-op.
  void tick(double dt);

  // Dispatch a control-surface command onto the calls above.
  void apply(const Command &cmd);

private:
  void set_play_state(PlayState s);
  double clamp_time(double t) const;
  // Add whole wraps to loopCount, saturating at its maximum.
  void add_loops(double wraps);

  const chart::Chart &chart_;
  Config config_;
  double duration_ = 0.0;
  PlaybackState state_;
};

const char *state_name(PlayState s);

} // namespace playback
