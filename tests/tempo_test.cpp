// tests/tempo_test.cpp

#include "common/errors.hpp"
#include "timing/tempo.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

namespace {

using timing::TempoEvent;

timing::TempoMap three_tempos() {
  // 4 beats at 120 (2s), 4 beats at 60 (4s), then 240 onward.
  return timing::build_tempo_map({{0, 120}, {4, 60}, {8, 240}});
}

TEST(Tempo, FourBeatsAt120IsTwoSeconds) {
  const auto map = timing::build_tempo_map({{0, 120}});
  EXPECT_DOUBLE_EQ(timing::beat_to_time(4.0, map), 2.0);
  EXPECT_DOUBLE_EQ(timing::time_to_beat(2.0, map), 4.0);
}

TEST(Tempo, SegmentStartsArePrecomputed) {
  const auto map = three_tempos();
  ASSERT_EQ(map.segments.size(), 3u);
  EXPECT_DOUBLE_EQ(map.segments[1].startSec, 2.0);
  EXPECT_DOUBLE_EQ(map.segments[2].startSec, 6.0);
}

TEST(Tempo, PiecewiseConversion) {
  const auto map = three_tempos();
  EXPECT_DOUBLE_EQ(timing::beat_to_time(6.0, map), 4.0); // 2s + 2 beats@60
  EXPECT_DOUBLE_EQ(timing::beat_to_time(10.0, map), 6.5); // 6s + 2 beats@240
  EXPECT_DOUBLE_EQ(timing::time_to_beat(4.0, map), 6.0);
  EXPECT_DOUBLE_EQ(timing::time_to_beat(6.5, map), 10.0);
}

TEST(Tempo, ExtrapolatesBeyondBothEnds) {
  const auto map = three_tempos();
  // Before beat 0 the first tempo continues.
  EXPECT_DOUBLE_EQ(timing::beat_to_time(-2.0, map), -1.0);
  EXPECT_DOUBLE_EQ(timing::time_to_beat(-1.0, map), -2.0);
  // Far past the last event the last tempo continues.
  EXPECT_DOUBLE_EQ(timing::beat_to_time(108.0, map), 6.0 + 100 * 0.25);
}

TEST(Tempo, ImplicitOriginUsesFirstDeclaredBpm) {
  const auto map = timing::build_tempo_map({{2, 60}, {4, 120}});
  ASSERT_EQ(map.segments.size(), 3u);
  EXPECT_DOUBLE_EQ(map.segments[0].startBeat, 0.0);
  EXPECT_DOUBLE_EQ(map.segments[0].bpm, 60.0);
  EXPECT_DOUBLE_EQ(timing::beat_to_time(2.0, map), 2.0);
  EXPECT_DOUBLE_EQ(timing::beat_to_time(6.0, map), 5.0);
}

TEST(Tempo, RoundTripAcrossManyBeats) {
  const auto map = timing::build_tempo_map(
      {{0, 128}, {3.5, 97.25}, {7, 180}, {16.25, 45}, {20, 300}});
  for (int i = -40; i <= 400; ++i) {
    const double b = i * 0.0625;
    EXPECT_NEAR(timing::time_to_beat(timing::beat_to_time(b, map), map), b,
                1e-6)
        << "beat " << b;
  }
}

TEST(Tempo, BeatToTimeIsStrictlyMonotonic) {
  const auto map = timing::build_tempo_map(
      {{0, 128}, {3.5, 97.25}, {7, 180}, {16.25, 45}, {20, 300}});
  double prev = timing::beat_to_time(-1.0, map);
  for (int i = 1; i <= 500; ++i) {
    const double t = timing::beat_to_time(-1.0 + i * 0.05, map);
    EXPECT_LT(prev, t);
    prev = t;
  }
}

TEST(Tempo, BpmAt) {
  const auto map = three_tempos();
  EXPECT_DOUBLE_EQ(timing::bpm_at(-1.0, map), 120.0);
  EXPECT_DOUBLE_EQ(timing::bpm_at(3.99, map), 120.0);
  EXPECT_DOUBLE_EQ(timing::bpm_at(4.0, map), 60.0);
  EXPECT_DOUBLE_EQ(timing::bpm_at(50.0, map), 240.0);
}

TEST(Tempo, RejectsInvalidMaps) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(timing::build_tempo_map({}), errors::InvalidTempoMap);
  EXPECT_THROW(timing::build_tempo_map({{0, 0}}), errors::InvalidTempoMap);
  EXPECT_THROW(timing::build_tempo_map({{0, -120}}), errors::InvalidTempoMap);
  EXPECT_THROW(timing::build_tempo_map({{0, nan}}), errors::InvalidTempoMap);
  EXPECT_THROW(timing::build_tempo_map({{-1, 120}}), errors::InvalidTempoMap);
  EXPECT_THROW(timing::build_tempo_map({{0, 120}, {4, 90}, {4, 100}}),
               errors::InvalidTempoMap);
  EXPECT_THROW(timing::build_tempo_map({{0, 120}, {4, 90}, {2, 100}}),
               errors::InvalidTempoMap);
}

TEST(Tempo, InvalidTempoMapIsAChartError) {
  try {
    timing::build_tempo_map({{0, 120}, {1, 0}});
    FAIL() << "expected InvalidTempoMap";
  } catch (const errors::ChartError &e) {
    EXPECT_NE(std::string(e.what()).find("tempo event 1"), std::string::npos);
  }
}

} // namespace
