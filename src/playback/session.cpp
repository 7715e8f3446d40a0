// src/playback/session.cpp

#include "playback/session.hpp"

#include "common/errors.hpp"
#include "common/util.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace playback {

Session::Session(const chart::Chart &chart, Config config)
    : chart_(chart), config_(config), duration_(chart.duration_seconds()) {
  if (!util::finite_positive(config_.initialSpeed))
    throw errors::InvalidSpeed(config_.initialSpeed);
  state_.speed = config_.initialSpeed;
}

double Session::current_beat() const {
  return chart_.beat_at(state_.currentTime);
}

void Session::set_play_state(PlayState s) {
  state_.state = s;
  state_.isPlaying = (s == PlayState::Playing);
}

double Session::clamp_time(double t) const {
  return std::clamp(t, 0.0, duration_);
}

void Session::play(bool restart) {
  if (restart)
    state_.currentTime = 0.0;
  set_play_state(PlayState::Playing);
}

void Session::pause() {
  if (state_.state == PlayState::Playing)
    set_play_state(PlayState::Paused);
}

void Session::toggle() {
  if (state_.state == PlayState::Playing)
    pause();
  else
    play();
}

void Session::stop() { set_play_state(PlayState::Stopped); }

void Session::reset() {
  state_.currentTime = 0.0;
  state_.loopCount = 0;
}

void Session::seek(double seconds) {
  // NaN would poison every later tick; treat it as "stay put".
  if (std::isnan(seconds))
    return;
  state_.currentTime = clamp_time(seconds);
}

void Session::seek_relative(double delta, SeekUnit unit) {
  if (!std::isfinite(delta))
    return;
  if (unit == SeekUnit::Seconds) {
    seek(state_.currentTime + delta);
    return;
  }
  seek(chart_.time_at(current_beat() + delta));
}

void Session::set_speed(double multiplier) {
  if (!util::finite_positive(multiplier))
    throw errors::InvalidSpeed(multiplier);
  state_.speed = multiplier;
}

void Session::tick(double dt) {
  if (!state_.isPlaying || !util::finite_positive(dt))
    return;

  // Huge speeds may overflow to inf; that still means "past the end".
  const double next = state_.currentTime + dt * state_.speed;
  if (std::isfinite(next) && next < duration_) {
    state_.currentTime = next;
    return;
  }

  switch (config_.endPolicy) {
  case EndPolicy::StopAtEnd:
    state_.currentTime = duration_;
    set_play_state(PlayState::Stopped);
    break;
  case EndPolicy::HoldAtEnd:
    state_.currentTime = duration_;
    break;
  case EndPolicy::Loop:
    if (duration_ <= 0.0) {
      state_.currentTime = 0.0;
      break;
    }
    if (!std::isfinite(next)) {
      // No meaningful phase is left; restart and saturate the counter.
      state_.currentTime = 0.0;
      add_loops(std::numeric_limits<double>::infinity());
      break;
    }
    add_loops(std::floor(next / duration_));
    state_.currentTime = std::fmod(next, duration_);
    break;
  }
}

void Session::add_loops(double wraps) {
  constexpr auto kMax = std::numeric_limits<std::uint32_t>::max();
  const double room = static_cast<double>(kMax - state_.loopCount);
  if (!(wraps < room)) {
    state_.loopCount = kMax;
    return;
  }
  if (wraps > 0.0)
    state_.loopCount += static_cast<std::uint32_t>(wraps);
}

void Session::apply(const Command &cmd) {
  switch (cmd.type) {
  case CommandType::Play:
    play();
    break;
  case CommandType::Pause:
    pause();
    break;
  case CommandType::TogglePlay:
    toggle();
    break;
  case CommandType::Reset:
    reset();
    break;
  case CommandType::SeekRelative:
    seek_relative(cmd.value, cmd.unit);
    break;
  case CommandType::SetSpeed:
    set_speed(cmd.value);
    break;
  }
}

const char *state_name(PlayState s) {
  switch (s) {
  case PlayState::Stopped:
    return "stopped";
  case PlayState::Playing:
    return "playing";
  case PlayState::Paused:
    return "paused";
  }
  return "stopped";
}

} // namespace playback
