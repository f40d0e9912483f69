#include <gtest/gtest.h>
#include "TestFixes.hpp"
#include "core/TransportClassifier.hpp"

namespace {

const Coordinate kStart{52.0, 4.0};

// `n` fixes spaced `step_m` apart, one every `step_s` seconds.
std::vector<GpsFix> steady_walk(int n, double step_m, int step_s) {
  std::vector<GpsFix> out;
  for (int i = 0; i < n; ++i)
    out.push_back(make_fix("w" + std::to_string(i),
                           offset_m(kStart, step_m * i, 0.0),
                           kT0 + i * step_s * kMsPerSecond));
  return out;
}

} // namespace

TEST(TransportClassifier, UnknownWithoutDistanceOrDuration) {
  TransportClassifier c;
  EXPECT_EQ(c.classify(0.0, 10, {}), TransportMode::Unknown);
  EXPECT_EQ(c.classify(2.0, 0, {}), TransportMode::Unknown);
}

TEST(TransportClassifier, ClearSpeedsNeedNoSegments) {
  TransportClassifier c;
  EXPECT_EQ(c.classify(8.0, 10, {}), TransportMode::Driving);
  EXPECT_EQ(c.classify(0.3, 10, {}), TransportMode::Walking);
}

TEST(TransportClassifier, BoundaryAtTenKmhWithSlowSegments) {
  TransportClassifier c;
  // 20 m per minute: every segment is 1.2 km/h
  const auto slow = steady_walk(6, 20.0, 60);
  ASSERT_GE(c.segment_speeds(slow).slow, 2);

  EXPECT_DOUBLE_EQ(TransportClassifier::average_speed_kmh(1.0, 6), 10.0);
  EXPECT_EQ(c.classify(1.0, 6, slow), TransportMode::Walking);
  EXPECT_EQ(c.classify(1.01, 6, slow), TransportMode::Driving);
}

TEST(TransportClassifier, GreyZoneLongTripIsDriving) {
  TransportClassifier c;
  const auto slow = steady_walk(6, 20.0, 60);
  // 7 km/h average over more than the walking ceiling
  EXPECT_EQ(c.classify(1.4, 12, slow), TransportMode::Driving);
}

TEST(TransportClassifier, GreyZoneTieBreakWithoutSegments) {
  TransportClassifier c;
  EXPECT_EQ(c.classify(0.66, 6, {}), TransportMode::Driving); // 6.6 km/h
  EXPECT_EQ(c.classify(0.5, 6, {}), TransportMode::Walking);  // 5.0 km/h
}

TEST(TransportClassifier, SegmentSpeedsSkipGlitchesAndZeroTime) {
  TransportClassifier c;
  std::vector<GpsFix> fixes = steady_walk(3, 20.0, 60);
  // same timestamp as the previous fix
  fixes.push_back(make_fix("dup", offset_m(kStart, 60.0, 0.0),
                           fixes.back().captured_at));
  // 5 km in one second
  fixes.push_back(make_fix("jump", offset_m(kStart, 5000.0, 0.0),
                           fixes.back().captured_at + kMsPerSecond));
  const auto s = c.segment_speeds(fixes);
  EXPECT_EQ(s.total, 2);
  EXPECT_EQ(s.slow, 2);
  EXPECT_DOUBLE_EQ(s.slow_ratio(), 1.0);
}
