// tests/keyframes_test.cpp

#include "timing/keyframes.hpp"

#include <gtest/gtest.h>

namespace {

using easing::Kind;
using timing::KeyframeTrack;

TEST(Keyframes, EmptyTrackUsesFallback) {
  EXPECT_DOUBLE_EQ(timing::value_at(3.0, {}, 1.0), 1.0);
}

TEST(Keyframes, HoldsOutsideTheKeys) {
  const KeyframeTrack track = {{2, 10, Kind::Linear}, {4, 20, Kind::Linear}};
  EXPECT_DOUBLE_EQ(timing::value_at(0.0, track, 0.0), 10.0);
  EXPECT_DOUBLE_EQ(timing::value_at(9.0, track, 0.0), 20.0);
}

TEST(Keyframes, InterpolatesWithTheLeftKeysEase) {
  const KeyframeTrack track = {{0, 0, Kind::InQuad},
                               {2, 8, Kind::Linear},
                               {4, 0, Kind::Linear}};
  EXPECT_DOUBLE_EQ(timing::value_at(1.0, track, 0.0), 2.0); // 8 * 0.5^2
  EXPECT_DOUBLE_EQ(timing::value_at(3.0, track, 0.0), 4.0); // linear back
  EXPECT_DOUBLE_EQ(timing::value_at(2.0, track, 0.0), 8.0);
}

TEST(Keyframes, SingleKey) {
  const KeyframeTrack track = {{1, 0.5, Kind::OutBack}};
  EXPECT_DOUBLE_EQ(timing::value_at(-5.0, track, 9.0), 0.5);
  EXPECT_DOUBLE_EQ(timing::value_at(5.0, track, 9.0), 0.5);
}

} // namespace
