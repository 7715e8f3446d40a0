// tests/scroll_test.cpp

#include "common/errors.hpp"
#include "timing/scroll.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace {

using easing::Kind;

// 60 bpm keeps beats and seconds equal.
timing::TempoMap sixty() { return timing::build_tempo_map({{0, 60}}); }

TEST(Scroll, EmptyTrackScrollsAtOnePerSecond) {
  const auto map = timing::build_scroll_map({}, sixty());
  EXPECT_TRUE(map.segments.empty());
  EXPECT_DOUBLE_EQ(timing::floor_at(2.5, map), 2.5);
  EXPECT_DOUBLE_EQ(timing::floor_at(-1.0, map), -1.0);
}

TEST(Scroll, IntegratesStepSpeeds) {
  const auto map = timing::build_scroll_map(
      {{0, 1.0, Kind::Linear}, {2, 3.0, Kind::Linear}, {5, 0.5, Kind::Linear}},
      sixty());
  ASSERT_EQ(map.segments.size(), 3u);
  EXPECT_DOUBLE_EQ(map.segments[0].startFloor, 0.0);
  EXPECT_DOUBLE_EQ(map.segments[1].startFloor, 2.0);
  EXPECT_DOUBLE_EQ(map.segments[2].startFloor, 11.0);

  EXPECT_DOUBLE_EQ(timing::floor_at(1.0, map), 1.0);
  EXPECT_DOUBLE_EQ(timing::floor_at(3.0, map), 5.0);
  EXPECT_DOUBLE_EQ(timing::floor_at(7.0, map), 12.0);
}

TEST(Scroll, EasesAreIgnored) {
  const auto map = timing::build_scroll_map(
      {{0, 1.0, Kind::OutCubic}, {4, 2.0, Kind::Linear}}, sixty());
  EXPECT_DOUBLE_EQ(timing::floor_at(2.0, map), 2.0);
}

TEST(Scroll, KeysUseTheTempoMap) {
  // Beat 4 at 120 bpm is 2 s.
  const auto map = timing::build_scroll_map(
      {{0, 2.0, Kind::Linear}, {4, 1.0, Kind::Linear}},
      timing::build_tempo_map({{0, 120}}));
  EXPECT_DOUBLE_EQ(map.segments[1].startSec, 2.0);
  EXPECT_DOUBLE_EQ(timing::floor_at(3.0, map), 5.0);
}

TEST(Scroll, FirstSpeedExtendsBackwards) {
  const auto map =
      timing::build_scroll_map({{2, 2.0, Kind::Linear}}, sixty());
  EXPECT_DOUBLE_EQ(timing::floor_at(2.0, map), 0.0);
  EXPECT_DOUBLE_EQ(timing::floor_at(0.0, map), -4.0);
}

TEST(Scroll, ZeroSpeedFreezesTheField) {
  const auto map = timing::build_scroll_map(
      {{0, 1.0, Kind::Linear}, {2, 0.0, Kind::Linear}, {4, 1.0, Kind::Linear}},
      sixty());
  EXPECT_DOUBLE_EQ(timing::floor_at(2.0, map), 2.0);
  EXPECT_DOUBLE_EQ(timing::floor_at(3.5, map), 2.0);
  EXPECT_DOUBLE_EQ(timing::floor_at(5.0, map), 3.0);
}

TEST(Scroll, RejectsNegativeOrNonFiniteSpeeds) {
  EXPECT_THROW(
      timing::build_scroll_map({{0, -0.5, Kind::Linear}}, sixty()),
      errors::ChartError);
  EXPECT_THROW(timing::build_scroll_map(
                   {{0, std::numeric_limits<double>::infinity(),
                     Kind::Linear}},
                   sixty()),
               errors::ChartError);
}

} // namespace
