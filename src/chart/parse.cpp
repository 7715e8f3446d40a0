// src/chart/parse.cpp
// Chart JSON -> Chart, built on nlohmann::json.

#include "chart/parse.hpp"

#include "common/errors.hpp"
#include "io/io.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace chart {

namespace {

// Fetch a required member or fail with its path.
const json &require(const json &obj, const char *key, const std::string &ctx) {
  auto it = obj.find(key);
  if (it == obj.end())
    throw errors::ParseError("missing '" + std::string(key) + "' in " + ctx);
  return *it;
}

double as_number(const json &v, const std::string &ctx) {
  if (!v.is_number())
    throw errors::ParseError(ctx + " must be a number");
  return v.get<double>();
}

std::string as_string(const json &v, const std::string &ctx) {
  if (!v.is_string())
    throw errors::ParseError(ctx + " must be a string");
  return v.get<std::string>();
}

double as_beat(const json &v, const std::string &ctx) {
  if (v.is_number())
    return v.get<double>();
  if (v.is_string()) {
    try {
      return parse_beat_string(v.get<std::string>());
    } catch (const errors::ParseError &e) {
      throw errors::ParseError(ctx + ": " + e.what());
    }
  }
  throw errors::ParseError(ctx + " must be a number or a \"p/q\" string");
}

// Integer that fits an int. Range checks past that are the caller's.
int as_int(const json &v, const std::string &ctx) {
  if (!v.is_number_integer())
    throw errors::ParseError(ctx + " must be an integer");
  constexpr auto lo = std::numeric_limits<int>::min();
  constexpr auto hi = std::numeric_limits<int>::max();
  if (v.is_number_unsigned()) {
    if (v.get<std::uint64_t>() > static_cast<std::uint64_t>(hi))
      throw errors::ParseError(ctx + " out of range: " + v.dump());
    return static_cast<int>(v.get<std::uint64_t>());
  }
  const auto i = v.get<std::int64_t>();
  if (i < lo || i > hi)
    throw errors::ParseError(ctx + " out of range: " + v.dump());
  return static_cast<int>(i);
}

easing::Kind as_ease(const json &v, const std::string &ctx) {
  if (v.is_number_integer()) {
    if (auto k = easing::from_index(as_int(v, ctx)))
      return *k;
    throw errors::ParseError(ctx + ": unsupported ease index " + v.dump());
  }
  if (v.is_string()) {
    if (auto k = easing::from_name(v.get<std::string>()))
      return *k;
    throw errors::ParseError(ctx + ": unknown ease '" +
                             v.get<std::string>() + "'");
  }
  throw errors::ParseError(ctx + " must be an ease name or index");
}

NoteKind as_kind(const json &v, const std::string &ctx) {
  if (v.is_number_integer()) {
    switch (v.get<int>()) {
    case 0:
      return NoteKind::Tap;
    case 1:
      return NoteKind::Drag;
    case 2:
      return NoteKind::Hold;
    default:
      throw errors::ParseError(ctx + ": unknown note kind " + v.dump());
    }
  }
  const std::string s = as_string(v, ctx);
  if (s == "tap")
    return NoteKind::Tap;
  if (s == "drag")
    return NoteKind::Drag;
  if (s == "hold")
    return NoteKind::Hold;
  throw errors::ParseError(ctx + ": unknown note kind '" + s + "'");
}

const json &as_array(const json &v, const std::string &ctx) {
  if (!v.is_array())
    throw errors::ParseError(ctx + " must be an array");
  return v;
}

const json &as_object(const json &v, const std::string &ctx) {
  if (!v.is_object())
    throw errors::ParseError(ctx + " must be an object");
  return v;
}

std::vector<timing::TempoEvent> parse_tempo_map(const json &arr) {
  std::vector<timing::TempoEvent> out;
  out.reserve(arr.size());
  for (std::size_t i = 0; i < arr.size(); ++i) {
    const std::string ctx = "tempo_map[" + std::to_string(i) + "]";
    const json &e = as_object(arr[i], ctx);
    timing::TempoEvent ev;
    ev.beat = as_beat(require(e, "beat", ctx), ctx + ".beat");
    ev.bpm = as_number(require(e, "bpm", ctx), ctx + ".bpm");
    out.push_back(ev);
  }
  return out;
}

std::vector<NoteEvent> parse_notes(const json &arr) {
  std::vector<NoteEvent> out;
  out.reserve(arr.size());
  for (std::size_t i = 0; i < arr.size(); ++i) {
    const std::string ctx = "notes[" + std::to_string(i) + "]";
    const json &n = as_object(arr[i], ctx);
    NoteEvent ev;
    ev.beat = as_beat(require(n, "beat", ctx), ctx + ".beat");
    if (auto it = n.find("lane"); it != n.end())
      ev.lane = as_int(*it, ctx + ".lane");
    if (auto it = n.find("kind"); it != n.end())
      ev.kind = as_kind(*it, ctx + ".kind");
    if (auto it = n.find("duration"); it != n.end())
      ev.durationBeats = as_beat(*it, ctx + ".duration");
    out.push_back(ev);
  }
  return out;
}

timing::KeyframeTrack parse_track(const json &arr, const std::string &name) {
  timing::KeyframeTrack out;
  as_array(arr, name);
  for (std::size_t i = 0; i < arr.size(); ++i) {
    const std::string ctx = name + "[" + std::to_string(i) + "]";
    const json &k = as_object(arr[i], ctx);
    timing::KeyPoint key;
    key.beat = as_beat(require(k, "beat", ctx), ctx + ".beat");
    key.value = as_number(require(k, "value", ctx), ctx + ".value");
    if (auto it = k.find("ease"); it != k.end())
      key.ease = as_ease(*it, ctx + ".ease");
    out.push_back(key);
  }
  return out;
}

Metadata parse_meta(const json &m) {
  as_object(m, "meta");
  Metadata meta;
  if (auto it = m.find("title"); it != m.end())
    meta.title = as_string(*it, "meta.title");
  if (auto it = m.find("artist"); it != m.end())
    meta.artist = as_string(*it, "meta.artist");
  if (auto it = m.find("charter"); it != m.end())
    meta.charter = as_string(*it, "meta.charter");
  if (auto it = m.find("offset"); it != m.end())
    meta.offset = as_number(*it, "meta.offset");
  return meta;
}

Camera parse_camera(const json &c) {
  as_object(c, "camera");
  Camera cam;
  if (auto it = c.find("scale"); it != c.end())
    cam.scale = parse_track(*it, "camera.scale");
  if (auto it = c.find("x"); it != c.end())
    cam.x = parse_track(*it, "camera.x");
  if (auto it = c.find("speed"); it != c.end())
    cam.speed = parse_track(*it, "camera.speed");
  return cam;
}

} // namespace

double parse_beat_string(const std::string &s) {
  const auto bad = [&s]() {
    return errors::ParseError("malformed beat '" + s + "'");
  };
  if (s.empty())
    throw bad();
  // strtod alone would also take hex, exponents, "inf" and leading spaces.
  const bool plain = std::all_of(s.begin(), s.end(), [](char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || c == '+' ||
           c == '-' || c == '.' || c == '/';
  });
  if (!plain)
    throw bad();

  const auto number = [&](const std::string &part) {
    if (part.empty())
      throw bad();
    char *end = nullptr;
    const double v = std::strtod(part.c_str(), &end);
    if (end != part.c_str() + part.size() || !std::isfinite(v))
      throw bad();
    return v;
  };

  const auto slash = s.find('/');
  if (slash == std::string::npos)
    return number(s);

  const double p = number(s.substr(0, slash));
  const double q = number(s.substr(slash + 1));
  if (q <= 0.0)
    throw bad();
  return p / q;
}

Chart parse_chart(const std::string &text) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error &e) {
    throw errors::ParseError(e.what());
  }

  as_object(doc, "document");
  const json &tempoArr = as_array(require(doc, "tempo_map", "document"),
                                  "tempo_map");
  const json &notesArr = as_array(require(doc, "notes", "document"), "notes");

  auto tempo = parse_tempo_map(tempoArr);
  auto notes = parse_notes(notesArr);

  Metadata meta;
  if (auto it = doc.find("meta"); it != doc.end())
    meta = parse_meta(*it);

  Camera camera;
  if (auto it = doc.find("camera"); it != doc.end())
    camera = parse_camera(*it);

  return Chart(tempo, std::move(notes), std::move(meta), std::move(camera));
}

Chart load_chart(const std::filesystem::path &path) {
  return parse_chart(io::read_text(path));
}

} // namespace chart
