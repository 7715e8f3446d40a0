// src/io/io.hpp
// Thin I/O facade for reading chart documents and probing SoundFont paths.
//
// Usage:
//   std::string text = io::read_text(path);   // std::string or fs::path
//   auto sf2 = io::resolve_soundfont("piano"); // soundfonts/piano.sf2
//
// Throws std::runtime_error on errors (propagated from common/util.hpp).

#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "common/util.hpp"

namespace io {

inline std::string read_text(const std::string &path) {
  return util::read_text(path);
}

inline std::string read_text(const std::filesystem::path &p) {
  return util::read_text(p.string());
}

// Resolve a SoundFont given either a path or a bare name.
// Lookup order:
//   1) the argument as a path, if it names a regular file;
//   2) <dir>/<name>, then <dir>/<name>.sf2, for dir = soundfonts/.
// Returns std::nullopt when nothing matches.
inline std::optional<std::filesystem::path>
resolve_soundfont(const std::string &nameOrPath,
                  const std::filesystem::path &dir = "soundfonts") {
  namespace fs = std::filesystem;
  std::error_code ec;
  const fs::path direct(nameOrPath);
  if (fs::is_regular_file(direct, ec))
    return fs::canonical(direct, ec);

  for (const fs::path &candidate :
       {dir / nameOrPath, dir / (nameOrPath + ".sf2")}) {
    if (fs::is_regular_file(candidate, ec))
      return fs::canonical(candidate, ec);
  }
  return std::nullopt;
}

} // namespace io
