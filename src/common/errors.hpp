// src/common/errors.hpp
// Exception types shared by the chart loader, the playback session and the
// frame sampler.
//
// Load-time problems derive from ChartError: a chart either loads completely
// or not at all. Runtime command problems (bad speed, bad sampler settings)
// derive from std::invalid_argument and leave all state untouched.
//
// Seeking out of range is not an error: Session::seek clamps silently.

#pragma once
#include <stdexcept>
#include <string>

namespace errors {

// Base for everything that makes a chart unusable.
class ChartError : public std::runtime_error {
public:
  explicit ChartError(const std::string &msg) : std::runtime_error(msg) {}
};

// Non-positive bpm, negative/non-finite beat, or beats not strictly increasing.
class InvalidTempoMap : public ChartError {
public:
  explicit InvalidTempoMap(const std::string &msg)
      : ChartError("invalid tempo map: " + msg) {}
};

// Note with a negative lane, negative duration or non-finite beat.
class InvalidNote : public ChartError {
public:
  explicit InvalidNote(const std::string &msg)
      : ChartError("invalid note: " + msg) {}
};

// Malformed chart document (bad JSON, wrong types, missing fields).
class ParseError : public ChartError {
public:
  explicit ParseError(const std::string &msg)
      : ChartError("parse error: " + msg) {}
};

class InvalidSpeed : public std::invalid_argument {
public:
  explicit InvalidSpeed(double requested)
      : std::invalid_argument("invalid speed multiplier: " +
                              std::to_string(requested)),
        requested_(requested) {}

  double requested() const noexcept { return requested_; }

private:
  double requested_;
};

class InvalidConfig : public std::invalid_argument {
public:
  explicit InvalidConfig(const std::string &msg)
      : std::invalid_argument("invalid configuration: " + msg) {}
};

} // namespace errors
