// tests/chart_test.cpp

#include "chart/chart.hpp"
#include "common/errors.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace {

using chart::NoteEvent;
using chart::NoteKind;

TEST(Chart, SortsNotesStablyByBeat) {
  const chart::Chart c({{0, 120}}, {{4, 0, NoteKind::Tap, 0},
                                    {1, 2, NoteKind::Tap, 0},
                                    {4, 1, NoteKind::Drag, 0},
                                    {2, 0, NoteKind::Hold, 1}});
  ASSERT_EQ(c.notes().size(), 4u);
  EXPECT_DOUBLE_EQ(c.notes()[0].beat, 1.0);
  EXPECT_DOUBLE_EQ(c.notes()[1].beat, 2.0);
  // Equal beats keep authoring order.
  EXPECT_EQ(c.notes()[2].lane, 0);
  EXPECT_EQ(c.notes()[3].lane, 1);
}

TEST(Chart, DerivedFields) {
  const chart::Chart c({{0, 120}}, {{1, 0, NoteKind::Tap, 0},
                                    {2, 3, NoteKind::Hold, 6},
                                    {7, 1, NoteKind::Tap, 0}});
  EXPECT_DOUBLE_EQ(c.end_beat(), 8.0); // hold tail outlasts the last tap
  EXPECT_DOUBLE_EQ(c.duration_seconds(), 4.0);
  EXPECT_EQ(c.lane_count(), 4);
  EXPECT_DOUBLE_EQ(c.max_duration_beats(), 6.0);
}

TEST(Chart, OffsetShiftsChartTime) {
  chart::Metadata meta;
  meta.offset = 1.5;
  const chart::Chart c({{0, 60}}, {{2, 0, NoteKind::Tap, 0}}, meta);
  EXPECT_DOUBLE_EQ(c.time_at(0.0), 1.5);
  EXPECT_DOUBLE_EQ(c.beat_at(3.5), 2.0);
  EXPECT_DOUBLE_EQ(c.duration_seconds(), 3.5);
}

TEST(Chart, EmptyChartHasZeroDuration) {
  const chart::Chart c({{0, 120}}, {});
  EXPECT_DOUBLE_EQ(c.duration_seconds(), 0.0);
  EXPECT_EQ(c.lane_count(), 0);
}

TEST(Chart, LowerIndex) {
  const chart::Chart c({{0, 120}}, {{1, 0, NoteKind::Tap, 0},
                                    {2, 0, NoteKind::Tap, 0},
                                    {3, 0, NoteKind::Tap, 0}});
  EXPECT_EQ(c.lower_index(0.0), 0u);
  EXPECT_EQ(c.lower_index(2.0), 1u);
  EXPECT_EQ(c.lower_index(2.5), 2u);
  EXPECT_EQ(c.lower_index(9.0), 3u);
}

TEST(Chart, CameraTracksAreSorted) {
  chart::Camera cam;
  cam.scale = {{4, 2.0, easing::Kind::Linear}, {0, 1.0, easing::Kind::Linear}};
  const chart::Chart c({{0, 120}}, {}, {}, cam);
  EXPECT_DOUBLE_EQ(c.camera().scale.front().beat, 0.0);
}

TEST(Chart, RejectsBadTempoMap) {
  EXPECT_THROW(chart::Chart({{0, 120}, {0, 140}}, {}),
               errors::InvalidTempoMap);
  EXPECT_THROW(chart::Chart({}, {}), errors::InvalidTempoMap);
}

TEST(Chart, RejectsBadNotes) {
  const double inf = std::numeric_limits<double>::infinity();
  EXPECT_THROW(chart::Chart({{0, 120}}, {{1, -1, NoteKind::Tap, 0}}),
               errors::InvalidNote);
  EXPECT_THROW(chart::Chart({{0, 120}}, {{1, 0, NoteKind::Hold, -2}}),
               errors::InvalidNote);
  EXPECT_THROW(chart::Chart({{0, 120}}, {{inf, 0, NoteKind::Tap, 0}}),
               errors::InvalidNote);
}

TEST(Chart, LanesAreBounded) {
  const int maxInt = std::numeric_limits<int>::max();
  EXPECT_THROW(chart::Chart({{0, 120}}, {{1, maxInt, NoteKind::Tap, 0}}),
               errors::InvalidNote);
  EXPECT_THROW(
      chart::Chart({{0, 120}}, {{1, chart::kMaxLanes, NoteKind::Tap, 0}}),
      errors::InvalidNote);

  const chart::Chart c({{0, 120}},
                       {{1, chart::kMaxLanes - 1, NoteKind::Tap, 0}});
  EXPECT_EQ(c.lane_count(), chart::kMaxLanes);
}

TEST(Chart, FloorPositionFollowsTheSpeedTrack) {
  chart::Camera cam;
  // 120 bpm: beat 4 is 2 s, beat 8 is 4 s.
  cam.speed = {{4, 3.0, easing::Kind::Linear}, {0, 1.0, easing::Kind::Linear}};
  const chart::Chart c({{0, 120}}, {}, {}, cam);
  EXPECT_DOUBLE_EQ(c.floor_at(0.0), 0.0);
  EXPECT_DOUBLE_EQ(c.floor_at(4.0), 2.0);
  EXPECT_DOUBLE_EQ(c.floor_at(8.0), 8.0);
}

TEST(Chart, WithoutASpeedTrackFloorIsSeconds) {
  const chart::Chart c({{0, 60}}, {});
  EXPECT_DOUBLE_EQ(c.floor_at(3.0), 3.0);
}

TEST(Chart, RejectsNegativeScrollSpeed) {
  chart::Camera cam;
  cam.speed = {{0, -1.0, easing::Kind::Linear}};
  EXPECT_THROW(chart::Chart({{0, 120}}, {}, {}, cam), errors::ChartError);
}

TEST(Chart, KindNames) {
  EXPECT_STREQ(chart::kind_name(NoteKind::Tap), "tap");
  EXPECT_STREQ(chart::kind_name(NoteKind::Drag), "drag");
  EXPECT_STREQ(chart::kind_name(NoteKind::Hold), "hold");
}

} // namespace
