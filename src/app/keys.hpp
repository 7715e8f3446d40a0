// src/app/keys.hpp
// Keyboard -> control command mapping for the console host.
//
//   space       TogglePlay
//   r           Reset
//   left/right  SeekRelative(-/+ 1 beat)
//   up/down     SetSpeed(speed * 1.1 / speed / 1.1)
//   q, Esc      quit (handled by the caller, not a Command)

#pragma once
#include <optional>

#include "playback/commands.hpp"

namespace app {

enum class Key { None, Space, Reset, Left, Right, Up, Down, Quit, Other };

inline constexpr double kSpeedStep = 1.1;
inline constexpr double kSeekBeats = 1.0;

inline std::optional<playback::Command> command_for(Key key,
                                                    double currentSpeed) {
  using playback::Command;
  switch (key) {
  case Key::Space:
    return Command::toggle();
  case Key::Reset:
    return Command::reset();
  case Key::Left:
    return Command::seek_relative(-kSeekBeats, playback::SeekUnit::Beats);
  case Key::Right:
    return Command::seek_relative(kSeekBeats, playback::SeekUnit::Beats);
  case Key::Up:
    return Command::set_speed(currentSpeed * kSpeedStep);
  case Key::Down:
    return Command::set_speed(currentSpeed / kSpeedStep);
  default:
    return std::nullopt;
  }
}

} // namespace app
