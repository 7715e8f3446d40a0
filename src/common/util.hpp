// src/common/util.hpp
// Small helpers shared across modules: whole-file reads and a couple of
// numeric checks used by validation code.
#pragma once
#include <cmath>
#include <fstream>
#include <ios>
#include <stdexcept>
#include <string>

namespace util {

// Read an entire file into a string (binary mode, no newline translation).
inline std::string read_text(const std::string &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw std::runtime_error("Could not open file: " + path);
  }
  f.seekg(0, std::ios::end);
  const std::streamsize sz = f.tellg();
  if (sz < 0) {
    throw std::runtime_error("Could not get size of file: " + path);
  }
  std::string buf(static_cast<std::size_t>(sz), '\0');
  f.seekg(0, std::ios::beg);
  if (sz && !f.read(&buf[0], sz)) {
    throw std::runtime_error("Could not read file: " + path);
  }
  return buf;
}

inline bool finite_positive(double v) { return std::isfinite(v) && v > 0.0; }

inline bool finite_non_negative(double v) {
  return std::isfinite(v) && v >= 0.0;
}

} // namespace util
