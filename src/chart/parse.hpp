// src/chart/parse.hpp
// Public API: parse a JSON chart document into a validated Chart.
// - No printing here; pure data extraction.
// - Throws errors::ParseError on malformed documents, and lets
//   errors::InvalidTempoMap / errors::InvalidNote from the Chart through.
//
// Document shape:
//   {
//     "meta":      { "title", "artist", "charter", "offset" },   optional
//     "tempo_map": [ { "beat", "bpm" }, ... ],                    required
//     "notes":     [ { "beat", "lane", "kind", "duration" }, ...],required
//     "camera":    { "scale": [keys], "x": [keys] }               optional
//   }
// Beats may be numbers or rational strings such as "33/2".

#pragma once
#include <filesystem>
#include <string>

#include "chart/chart.hpp"

namespace chart {

// Parse a chart document already loaded in memory.
Chart parse_chart(const std::string &text);

// Read and parse a chart file. I/O failures throw std::runtime_error.
Chart load_chart(const std::filesystem::path &path);

// "3", "1.5", "33/2" -> double. Throws errors::ParseError.
double parse_beat_string(const std::string &s);

} // namespace chart
