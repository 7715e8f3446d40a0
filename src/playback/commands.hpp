// src/playback/commands.hpp
// Discrete control commands, as produced by an input layer (keyboard,
// scripted demo, UI buttons) and consumed by Session::apply().

#pragma once
#include <cstdint>

namespace playback {

enum class SeekUnit : std::uint8_t { Seconds, Beats };

enum class CommandType : std::uint8_t {
  Play,
  Pause,
  TogglePlay,
  Reset,
  SeekRelative, // value = delta, unit = Seconds or Beats
  SetSpeed,     // value = multiplier
};

struct Command {
  CommandType type = CommandType::TogglePlay;
  double value = 0.0;
  SeekUnit unit = SeekUnit::Seconds;

  static Command play() { return {CommandType::Play}; }
  static Command pause() { return {CommandType::Pause}; }
  static Command toggle() { return {CommandType::TogglePlay}; }
  static Command reset() { return {CommandType::Reset}; }
  static Command seek_relative(double delta, SeekUnit unit) {
    return {CommandType::SeekRelative, delta, unit};
  }
  static Command set_speed(double multiplier) {
    return {CommandType::SetSpeed, multiplier};
  }
};

} // namespace playback
