// tests/easing_test.cpp

#include "easing/easing.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

namespace {

TEST(Easing, EveryKindHitsExactEndpoints) {
  for (easing::Kind k : easing::all_kinds()) {
    EXPECT_EQ(easing::ease(k, 0.0), 0.0) << easing::name(k);
    EXPECT_EQ(easing::ease(k, 1.0), 1.0) << easing::name(k);
  }
}

TEST(Easing, EveryKindHasADistinctName) {
  std::set<std::string> names;
  for (easing::Kind k : easing::all_kinds())
    names.insert(easing::name(k));
  EXPECT_EQ(names.size(), easing::kKindCount);
  EXPECT_EQ(easing::all_kinds().size(), easing::kKindCount);
}

TEST(Easing, NameLookupRoundTrips) {
  for (easing::Kind k : easing::all_kinds())
    EXPECT_EQ(easing::from_name(easing::name(k)), k);
  EXPECT_FALSE(easing::from_name("ease_zero").has_value());
  EXPECT_FALSE(easing::from_name("OutCubic").has_value());
}

TEST(Easing, NumericIndicesFollowTheChartTable) {
  for (int i = 0; i <= 12; ++i)
    EXPECT_EQ(easing::from_index(i), easing::all_kinds()[i]) << i;
  EXPECT_EQ(easing::from_index(15), easing::Kind::InCirc);
  EXPECT_EQ(easing::from_index(16), easing::Kind::OutCirc);
  EXPECT_EQ(easing::from_index(17), easing::Kind::OutSine);
  EXPECT_EQ(easing::from_index(18), easing::Kind::InSine);

  // 13 and 14 were constant curves.
  EXPECT_FALSE(easing::from_index(13).has_value());
  EXPECT_FALSE(easing::from_index(14).has_value());
  EXPECT_FALSE(easing::from_index(19).has_value());
  EXPECT_FALSE(easing::from_index(-1).has_value());
}

TEST(Easing, KnownMidpoints) {
  EXPECT_DOUBLE_EQ(easing::ease(easing::Kind::Linear, 0.25), 0.25);
  EXPECT_DOUBLE_EQ(easing::ease(easing::Kind::InQuad, 0.5), 0.25);
  EXPECT_DOUBLE_EQ(easing::ease(easing::Kind::OutQuad, 0.5), 0.75);
  EXPECT_DOUBLE_EQ(easing::ease(easing::Kind::InCubic, 0.5), 0.125);
  EXPECT_DOUBLE_EQ(easing::ease(easing::Kind::OutCubic, 0.5), 0.875);
  EXPECT_DOUBLE_EQ(easing::ease(easing::Kind::InQuint, 0.5), 0.03125);
  EXPECT_NEAR(easing::ease(easing::Kind::InOutSine, 0.5), 0.5, 1e-12);
  EXPECT_NEAR(easing::ease(easing::Kind::InOutExpo, 0.5), 0.5, 1e-12);
  EXPECT_NEAR(easing::ease(easing::Kind::InOutCirc, 0.5), 0.5, 1e-12);
  EXPECT_NEAR(easing::ease(easing::Kind::OutSine, 0.5), 0.7071067811865476,
              1e-12);
  EXPECT_NEAR(easing::ease(easing::Kind::InSine, 0.5), 0.2928932188134524,
              1e-12);
  EXPECT_NEAR(easing::ease(easing::Kind::InCirc, 0.6), 0.2, 1e-12);
  EXPECT_NEAR(easing::ease(easing::Kind::OutCirc, 0.4), 0.8, 1e-12);
}

TEST(Easing, InOutCurvesAreSymmetric) {
  const easing::Kind kinds[] = {
      easing::Kind::InOutQuad,  easing::Kind::InOutCubic,
      easing::Kind::InOutQuart, easing::Kind::InOutQuint,
      easing::Kind::InOutSine,  easing::Kind::InOutCirc};
  for (easing::Kind k : kinds) {
    for (double t : {0.1, 0.2, 0.3, 0.45}) {
      EXPECT_NEAR(easing::ease(k, t) + easing::ease(k, 1.0 - t), 1.0, 1e-9)
          << easing::name(k) << " t=" << t;
    }
  }
}

TEST(Easing, OvershootingCurvesLeaveTheUnitRange) {
  bool backOver = false;
  bool elasticOver = false;
  for (int i = 1; i < 100; ++i) {
    const double t = i / 100.0;
    backOver |= easing::ease(easing::Kind::OutBack, t) > 1.0;
    elasticOver |= easing::ease(easing::Kind::OutElastic, t) > 1.0;
  }
  EXPECT_TRUE(backOver);
  EXPECT_TRUE(elasticOver);
}

TEST(Easing, BounceStaysInsideUnitRange) {
  for (int i = 0; i <= 100; ++i) {
    const double v = easing::ease(easing::Kind::OutBounce, i / 100.0);
    EXPECT_GE(v, 0.0);
    EXPECT_LE(v, 1.0 + 1e-12);
  }
}

TEST(Easing, ClampedVariantPinsOutOfRangeInput) {
  EXPECT_EQ(easing::ease_clamped(easing::Kind::OutCubic, -3.0), 0.0);
  EXPECT_EQ(easing::ease_clamped(easing::Kind::OutCubic, 7.0), 1.0);
}

TEST(Easing, Lerp) {
  EXPECT_DOUBLE_EQ(easing::lerp(2.0, 6.0, 0.25), 3.0);
  EXPECT_DOUBLE_EQ(easing::lerp(2.0, 6.0, 1.0), 6.0);
}

} // namespace
