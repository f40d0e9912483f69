#include <gtest/gtest.h>
#include "TestFixes.hpp"
#include "core/GeoUtils.hpp"

static const Coordinate kOrigin{52.0, 4.0};

TEST(GeoUtils, HaversineKnownDistance) {
  // one degree of latitude on the 6371 km sphere
  EXPECT_NEAR(GeoUtils::haversine(0.0, 0.0, 1.0, 0.0), 111194.9, 0.5);
  EXPECT_DOUBLE_EQ(GeoUtils::haversine(kOrigin, kOrigin), 0.0);
}

TEST(GeoUtils, OffsetHelperMatchesHaversine) {
  const Coordinate north = offset_m(kOrigin, 500.0, 0.0);
  const Coordinate east = offset_m(kOrigin, 0.0, 300.0);
  EXPECT_NEAR(GeoUtils::haversine(kOrigin, north), 500.0, 0.01);
  EXPECT_NEAR(GeoUtils::haversine(kOrigin, east), 300.0, 0.05);
  EXPECT_NEAR(GeoUtils::haversine_km(kOrigin, north), 0.5, 1e-5);
}

TEST(GeoUtils, AdjustedDistanceClampsAtZero) {
  const Coordinate p = offset_m(kOrigin, 30.0, 0.0);
  EXPECT_NEAR(GeoUtils::adjusted_distance(kOrigin, p, 10.0), 20.0, 0.01);
  EXPECT_DOUBLE_EQ(GeoUtils::adjusted_distance(kOrigin, p, 50.0), 0.0);
}

TEST(CentroidAccumulator, WeightsByInverseAccuracy) {
  CentroidAccumulator acc;
  const Coordinate far = offset_m(kOrigin, 100.0, 0.0);
  acc.add(kOrigin, 5.0);
  acc.add(far, 20.0);
  // weights 0.2 and 0.05: the centroid sits 20 m from the precise fix
  EXPECT_NEAR(GeoUtils::haversine(kOrigin, acc.centroid()), 20.0, 0.05);
  EXPECT_NEAR(acc.accuracy(), 1.0 / std::sqrt(1.0 / 25 + 1.0 / 400), 1e-9);
  EXPECT_EQ(acc.count(), 2);
}

TEST(CentroidAccumulator, RemoveRestoresPreviousCentroid) {
  CentroidAccumulator acc;
  const Coordinate b = offset_m(kOrigin, 40.0, 10.0);
  acc.add(kOrigin, 5.0);
  const Coordinate before = acc.centroid();
  acc.add(b, 8.0);
  acc.remove(b, 8.0);
  EXPECT_NEAR(acc.centroid().lat, before.lat, 1e-9);
  EXPECT_NEAR(acc.centroid().lon, before.lon, 1e-9);
  acc.remove(kOrigin, 5.0);
  EXPECT_TRUE(acc.empty());
  EXPECT_DOUBLE_EQ(acc.accuracy(), 0.0);
}

TEST(CentroidAccumulator, FloorsAccuracyAtOneMetre) {
  CentroidAccumulator acc;
  acc.add(kOrigin, 0.0);
  EXPECT_DOUBLE_EQ(acc.accuracy(), 1.0);
}

TEST(GeoUtils, UnweightedCentroidIsPlainMean) {
  const Coordinate a{52.0, 4.0}, b{52.002, 4.004};
  const Coordinate m = GeoUtils::unweighted_centroid(std::vector<Coordinate>{a, b});
  EXPECT_DOUBLE_EQ(m.lat, 52.001);
  EXPECT_DOUBLE_EQ(m.lon, 4.002);
}

TEST(GeoUtils, InflatedBoxContainsPaddedPoints) {
  const auto box =
      GeoUtils::inflate_bbox(GeoUtils::compute_bbox({kOrigin}), 250.0);
  EXPECT_TRUE(GeoUtils::bbox_contains(box, offset_m(kOrigin, 240.0, 0.0)));
  EXPECT_TRUE(GeoUtils::bbox_contains(box, offset_m(kOrigin, 0.0, -240.0)));
  EXPECT_FALSE(GeoUtils::bbox_contains(box, offset_m(kOrigin, 400.0, 0.0)));
}
