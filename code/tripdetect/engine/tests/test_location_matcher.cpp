#include <gtest/gtest.h>
#include "TestFixes.hpp"
#include "core/LocationMatcher.hpp"

namespace {

const Coordinate kSite{52.0, 4.0};

Location make_location(const std::string &id, const Coordinate &c,
                       double radius, bool active = true) {
  Location l;
  l.id = id;
  l.name = id;
  l.center = c;
  l.radius_m = radius;
  l.is_active = active;
  return l;
}

// `inside` fixes at the site centre, the rest `outside_m` north of it.
std::vector<GpsFix> split_fixes(int inside, int outside, double outside_m) {
  std::vector<GpsFix> out;
  for (int i = 0; i < inside; ++i)
    out.push_back(make_fix("in-" + std::to_string(i), kSite, kT0 + i * 1000));
  const Coordinate far = offset_m(kSite, outside_m, 0.0);
  for (int i = 0; i < outside; ++i)
    out.push_back(
        make_fix("out-" + std::to_string(i), far, kT0 + (inside + i) * 1000));
  return out;
}

CentroidAccumulator accumulate(const std::vector<GpsFix> &fixes) {
  CentroidAccumulator acc;
  for (const auto &f : fixes)
    acc.add(f.coord, *f.accuracy);
  return acc;
}

} // namespace

TEST(LocationMatcher, PointMatchUsesAccuracyBuffer) {
  LocationMatcher m({make_location("depot", kSite, 50.0)});
  const Coordinate p = offset_m(kSite, 60.0, 0.0);
  EXPECT_FALSE(m.match_point(p, 5.0).has_value());
  auto hit = m.match_point(p, 15.0);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->location_id, "depot");
  EXPECT_DOUBLE_EQ(hit->voting_fraction, 1.0);
}

TEST(LocationMatcher, NearestActiveLocationWins) {
  LocationMatcher m({make_location("near", offset_m(kSite, 10.0, 0.0), 100.0),
                     make_location("far", offset_m(kSite, 40.0, 0.0), 100.0),
                     make_location("closed", kSite, 100.0, false)});
  auto hit = m.match_point(kSite, 0.0);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->location_id, "near");
}

TEST(LocationMatcher, VotingMatchesDriftedCentroidAt35Percent) {
  const auto fixes = split_fixes(7, 13, 185.0);
  const auto acc = accumulate(fixes);
  EXPECT_NEAR(GeoUtils::haversine(kSite, acc.centroid()), 120.0, 1.0);

  LocationMatcher m({make_location("yard", kSite, 50.0)});
  EXPECT_FALSE(m.match_point(acc.centroid(), acc.accuracy()).has_value());
  auto hit = m.match_cluster(acc.centroid(), acc.accuracy(), fixes);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->location_id, "yard");
  EXPECT_DOUBLE_EQ(hit->voting_fraction, 0.35);
}

TEST(LocationMatcher, VotingRejectsDriftedCentroidAt25Percent) {
  const auto fixes = split_fixes(5, 15, 160.0);
  const auto acc = accumulate(fixes);
  EXPECT_NEAR(GeoUtils::haversine(kSite, acc.centroid()), 120.0, 1.0);

  LocationMatcher m({make_location("yard", kSite, 50.0)});
  EXPECT_FALSE(m.match_cluster(acc.centroid(), acc.accuracy(), fixes));
}

TEST(LocationMatcher, HighestFractionThenNearestWins) {
  // 4 fixes at A, 6 at B: B has the larger share
  std::vector<GpsFix> fixes;
  const Coordinate a = kSite, b = offset_m(kSite, 400.0, 0.0);
  for (int i = 0; i < 4; ++i)
    fixes.push_back(make_fix("a" + std::to_string(i), a, kT0 + i, 0.0));
  for (int i = 0; i < 6; ++i)
    fixes.push_back(make_fix("b" + std::to_string(i), b, kT0 + 10 + i, 0.0));

  LocationMatcher m({make_location("A", a, 50.0), make_location("B", b, 50.0)});
  auto hit = m.match_by_point_voting(fixes);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->location_id, "B");
  EXPECT_DOUBLE_EQ(hit->voting_fraction, 0.6);

  // equal shares: the location nearer the raw centroid wins
  fixes.pop_back();
  fixes.pop_back();
  fixes.push_back(make_fix("mid", offset_m(kSite, 300.0, 0.0), kT0 + 30, 0.0));
  hit = m.match_by_point_voting(fixes);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->location_id, "B");
}

TEST(LocationMatcher, VotesTreatMissingAccuracyAsZero) {
  const Location loc = make_location("yard", kSite, 50.0);
  GpsFix f = make_fix("f", offset_m(kSite, 60.0, 0.0), kT0);
  f.accuracy.reset();
  EXPECT_EQ(LocationMatcher::votes_inside(loc, {f}), 0);
  f.accuracy = 15.0;
  EXPECT_EQ(LocationMatcher::votes_inside(loc, {f}), 1);
  EXPECT_DOUBLE_EQ(LocationMatcher::voting_fraction(loc, {f}, 0), 1.0);
}
