// src/app/cli.hpp
// Minimal, robust CLI parsing for the chartplay host.
// Responsibilities:
//  - Extract the positional chart path.
//  - Parse playback/view options (speed, ease, window, scroll mode, end
//    policy, fps).
//  - Parse an optional --sf <name-or-path> hitsound SoundFont.
//  - Validate that the chart file exists (fail early with a clear error).
//
// Design notes:
//  * Header-only to keep wiring simple.
//  * We throw std::runtime_error on problems; main() catches and prints.
//
// Usage from main.cpp:
//   app::Cli cli = app::parse_cli(argc, argv);
//   cli.chartPath  --> std::filesystem::path to the .json chart
//   cli.playback   --> playback::Config for the Session
//   cli.sampler    --> render::SamplerConfig for the frame sampler

#pragma once
#include <cmath>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "easing/easing.hpp"
#include "playback/session.hpp"
#include "render/sampler.hpp"

namespace app {

struct Cli {
  std::filesystem::path chartPath;
  std::optional<std::string> sfOverride; // from --sf <name-or-path>, if given
  bool previewOnly = false;              // --preview: print and exit
  int fps = 60;
  playback::Config playback;
  render::SamplerConfig sampler;
};

inline std::string usage(const std::string &prog) {
  return "Usage:\n  " + prog +
         " <chart.json> [options]\n"
         "Options:\n"
         "  --preview             Print a chart summary and exit\n"
         "  --sf <name-or-path>   Play hitsounds with a SoundFont (by path, or "
         "by name in soundfonts/)\n"
         "  --speed <x>           Initial playback rate (> 0, default 1)\n"
         "  --ease <name>         Note approach curve (default linear)\n"
         "  --lookahead <beats>   Beats visible ahead of the line (default 4)\n"
         "  --lookbehind <beats>  Beats kept after the line (default 0.5)\n"
         "  --scroll beats|floor  Space notes by beat or by the chart's speed "
         "track (default beats)\n"
         "  --floor-window <x>    Floor distance visible ahead in floor mode "
         "(default 2)\n"
         "  --end stop|loop|hold  End-of-chart behaviour (default stop)\n"
         "  --fps <n>             Frame rate of the console view (default 60)\n";
}

// Small helper: true if s looks like a flag (starts with '-' and not just "-")
inline bool is_flag_like(const std::string &s) {
  return !s.empty() && s[0] == '-' && s != "-";
}

inline double parse_number(const std::string &flag, const std::string &v) {
  std::size_t used = 0;
  double d = 0.0;
  try {
    d = std::stod(v, &used);
  } catch (const std::exception &) {
    throw std::runtime_error(flag + " expects a number, got '" + v + "'");
  }
  if (used != v.size() || !std::isfinite(d))
    throw std::runtime_error(flag + " expects a number, got '" + v + "'");
  return d;
}

inline playback::EndPolicy parse_end_policy(const std::string &v) {
  if (v == "stop")
    return playback::EndPolicy::StopAtEnd;
  if (v == "loop")
    return playback::EndPolicy::Loop;
  if (v == "hold")
    return playback::EndPolicy::HoldAtEnd;
  throw std::runtime_error("--end expects stop, loop or hold, got '" + v +
                           "'");
}

// Parse argv into our Cli struct.
// Contract:
//  - argv[1] must be the chart file path (positional).
//  - Throws std::runtime_error on any invalid input.
inline Cli parse_cli(int argc, char **argv) {
  const std::string prog = argc > 0 ? argv[0] : "chartplay";
  if (argc < 2) {
    throw std::runtime_error(usage(prog));
  }

  // 1) Positional chart path (or a lone --help)
  const std::string first = argv[1];
  if (first == "--help" || first == "-h") {
    throw std::runtime_error(usage(prog));
  }
  std::filesystem::path chartPath = first;
  if (is_flag_like(first)) {
    throw std::runtime_error(
        "First argument must be a chart file path, not a flag.");
  }
  if (!std::filesystem::exists(chartPath) ||
      !std::filesystem::is_regular_file(chartPath)) {
    throw std::runtime_error("Chart file not found: " + chartPath.string());
  }

  Cli cli;

  // 2) Optional flags
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    const auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::runtime_error(a + " requires a value");
      }
      return argv[++i];
    };

    if (a == "--help" || a == "-h") {
      throw std::runtime_error(usage(prog));
    } else if (a == "--preview") {
      cli.previewOnly = true;
    } else if (a == "--sf") {
      cli.sfOverride = value();
    } else if (a == "--speed") {
      const double s = parse_number(a, value());
      if (s <= 0.0)
        throw std::runtime_error("--speed must be > 0");
      cli.playback.initialSpeed = s;
    } else if (a == "--ease") {
      const std::string name = value();
      const auto kind = easing::from_name(name);
      if (!kind)
        throw std::runtime_error("Unknown ease: " + name);
      cli.sampler.ease = *kind;
    } else if (a == "--lookahead") {
      cli.sampler.lookaheadBeats = parse_number(a, value());
    } else if (a == "--lookbehind") {
      cli.sampler.lookbehindBeats = parse_number(a, value());
    } else if (a == "--scroll") {
      const std::string name = value();
      const auto mode = render::scroll_from_name(name);
      if (!mode)
        throw std::runtime_error("--scroll expects beats or floor, got '" +
                                 name + "'");
      cli.sampler.scroll = *mode;
    } else if (a == "--floor-window") {
      cli.sampler.lookaheadFloor = parse_number(a, value());
    } else if (a == "--end") {
      cli.playback.endPolicy = parse_end_policy(value());
    } else if (a == "--fps") {
      const double f = parse_number(a, value());
      if (f < 1.0 || f > 1000.0)
        throw std::runtime_error("--fps must be between 1 and 1000");
      cli.fps = static_cast<int>(f);
    } else {
      // Unknown flags are errors to avoid surprises.
      throw std::runtime_error("Unknown option: " + a);
    }
  }

  // 3) Return the parsed/validated CLI
  cli.chartPath = std::filesystem::canonical(chartPath); // nice absolute path
  return cli;
}

} // namespace app
