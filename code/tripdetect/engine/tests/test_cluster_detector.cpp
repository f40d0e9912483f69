#include <gtest/gtest.h>
#include "TestFixes.hpp"
#include "core/ClusterDetector.hpp"
#include "core/EntityIds.hpp"

namespace {

const Coordinate kA{52.0, 4.0};
const Coordinate kB = offset_m(kA, 8000.0, 0.0);

Location make_location(const std::string &id, const Coordinate &c) {
  Location l;
  l.id = id;
  l.name = id;
  l.center = c;
  l.radius_m = 100.0;
  return l;
}

class ClusterDetectorTest : public ::testing::Test {
protected:
  LocationMatcher no_locations{{}};

  std::vector<DetectionEvent> scan(const std::vector<GpsFix> &fixes,
                                   const LocationMatcher &matcher,
                                   ShiftStatus status = ShiftStatus::Completed,
                                   ScanStats *stats = nullptr) const {
    ScanContext ctx;
    ctx.shift_id = "shift-1";
    ctx.employee_id = "emp-1";
    ctx.status = status;
    DetectionStream stream(fixes, ctx, matcher);
    auto out = stream.collect();
    if (stats)
      *stats = stream.stats();
    return out;
  }

  static std::vector<StationaryCluster>
  clusters(const std::vector<DetectionEvent> &events) {
    std::vector<StationaryCluster> out;
    for (const auto &ev : events)
      if (auto *c = std::get_if<ClusterEvent>(&ev))
        out.push_back(c->cluster);
    return out;
  }

  static std::vector<Trip> trips(const std::vector<DetectionEvent> &events) {
    std::vector<Trip> out;
    for (const auto &ev : events)
      if (auto *t = std::get_if<TripEvent>(&ev))
        out.push_back(t->trip);
    return out;
  }

  // stop at A, 8 km drive north, stop at B
  static FixTrack commute() {
    FixTrack track;
    track.stop(kA, kT0, 180 * kMsPerSecond, 50)
        .drive_north(kA, kT0 + 180 * kMsPerSecond, 10 * kMsPerSecond, 59,
                     133.33)
        .stop(kB, kT0 + 780 * kMsPerSecond, 240 * kMsPerSecond, 49);
    return track;
  }

  // A stop whose last fix breaks its coherence, at 245 m north and
  // kT0 + 510 s.
  static FixTrack split_track() {
    FixTrack track;
    // coarse fixes at the origin, then a tight group 45 m north
    track.stop(kA, kT0, 120 * kMsPerSecond, 20, 100.0);
    track.stop(offset_m(kA, 45.0, 0.0), kT0 + 150 * kMsPerSecond,
               60 * kMsPerSecond, 5, 2.0);
    // slow walkers still inside the weighted radius
    track.add(offset_m(kA, 100.0, 0.0), kT0 + 300 * kMsPerSecond, 100.0, 1.0);
    track.add(offset_m(kA, 150.0, 0.0), kT0 + 390 * kMsPerSecond, 100.0, 1.0);
    // stopped fix that passes the weighted test but not the plain one
    track.add(offset_m(kA, 245.0, 0.0), kT0 + 510 * kMsPerSecond, 160.0, 0.0);
    return track;
  }
};

} // namespace

TEST_F(ClusterDetectorTest, DwellThresholdConfirmsCluster) {
  auto jitter = [](EpochMs span) {
    FixTrack track;
    for (int i = 0; i < 20; ++i)
      track.add(i % 2 ? offset_m(kA, 30.0, 0.0) : kA, kT0 + span * i / 19, 5.0,
                0.0);
    return track;
  };

  EXPECT_TRUE(
      scan(jitter(179 * kMsPerSecond).fixes(), no_locations).empty());

  auto events = scan(jitter(181 * kMsPerSecond).fixes(), no_locations);
  auto cs = clusters(events);
  ASSERT_EQ(cs.size(), 1u);
  EXPECT_EQ(cs[0].gps_point_count, 20);
  EXPECT_EQ(cs[0].started_at, kT0);
  EXPECT_EQ(cs[0].duration_seconds(), 181);
  EXPECT_TRUE(trips(events).empty());
}

TEST_F(ClusterDetectorTest, NearbyStopsMergeIntoOneCluster) {
  FixTrack track;
  track.stop(kA, kT0, 200 * kMsPerSecond, 20)
      .stop(offset_m(kA, 40.0, 0.0), kT0 + 210 * kMsPerSecond,
            200 * kMsPerSecond, 20);
  auto events = scan(track.fixes(), no_locations);
  auto cs = clusters(events);
  ASSERT_EQ(cs.size(), 1u);
  EXPECT_EQ(cs[0].gps_point_count, 40);
  EXPECT_TRUE(trips(events).empty());
}

TEST_F(ClusterDetectorTest, CommuteYieldsClusterTripCluster) {
  LocationMatcher matcher{
      {make_location("depot", kA), make_location("site", kB)}};
  ScanStats stats;
  auto events = scan(commute().fixes(), matcher, ShiftStatus::Completed, &stats);

  ASSERT_EQ(events.size(), 3u);
  ASSERT_TRUE(std::holds_alternative<ClusterEvent>(events[0]));
  ASSERT_TRUE(std::holds_alternative<TripEvent>(events[1]));
  ASSERT_TRUE(std::holds_alternative<ClusterEvent>(events[2]));

  const auto &a = std::get<ClusterEvent>(events[0]).cluster;
  const auto &trip = std::get<TripEvent>(events[1]).trip;
  const auto &b = std::get<ClusterEvent>(events[2]).cluster;

  EXPECT_EQ(a.id, EntityIds::cluster_id("shift-1", kT0));
  EXPECT_EQ(a.gps_point_count, 50);
  EXPECT_EQ(a.ended_at, kT0 + 180 * kMsPerSecond);
  EXPECT_EQ(a.matched_location_id, std::optional<std::string>("depot"));
  EXPECT_EQ(a.match_method, MatchMethod::Auto);

  EXPECT_EQ(b.started_at, kT0 + 780 * kMsPerSecond);
  EXPECT_EQ(b.gps_point_count, 49);
  EXPECT_EQ(b.matched_location_id, std::optional<std::string>("site"));

  EXPECT_EQ(trip.started_at, a.ended_at);
  EXPECT_EQ(trip.ended_at, b.started_at);
  EXPECT_EQ(trip.duration_minutes, 10);
  EXPECT_NEAR(trip.distance_km, 10.4, 0.01);
  EXPECT_EQ(trip.transport_mode, TransportMode::Driving);
  EXPECT_EQ(trip.start_cluster_id, std::optional<std::string>(a.id));
  EXPECT_EQ(trip.end_cluster_id, std::optional<std::string>(b.id));
  EXPECT_EQ(trip.start_location_id, std::optional<std::string>("depot"));
  EXPECT_EQ(trip.end_location_id, std::optional<std::string>("site"));
  ASSERT_FALSE(trip.point_ids.empty());
  EXPECT_EQ(trip.point_ids.front(), "shift-1-fix-50");
  EXPECT_DOUBLE_EQ(trip.confidence_score, 1.0);

  EXPECT_EQ(stats.fixes_seen, 158);
  EXPECT_EQ(stats.clusters, 2);
  EXPECT_EQ(stats.trips, 1);
  EXPECT_EQ(stats.trips_rejected, 0);
}

TEST_F(ClusterDetectorTest, SameFixesSameIds) {
  auto first = scan(commute().fixes(), no_locations);
  auto second = scan(commute().fixes(), no_locations);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    if (auto *c = std::get_if<ClusterEvent>(&first[i]))
      EXPECT_EQ(c->cluster.id, std::get<ClusterEvent>(second[i]).cluster.id);
    else
      EXPECT_EQ(std::get<TripEvent>(first[i]).trip.id,
                std::get<TripEvent>(second[i]).trip.id);
  }
}

TEST_F(ClusterDetectorTest, GapClosesClusterWithoutTrip) {
  FixTrack track;
  track.stop(kA, kT0, 200 * kMsPerSecond, 20)
      .stop(offset_m(kA, 2000.0, 0.0), kT0 + 200 * kMsPerSecond + 16 * kMsPerMinute,
            200 * kMsPerSecond, 20);
  ScanStats stats;
  auto events = scan(track.fixes(), no_locations, ShiftStatus::Completed, &stats);
  EXPECT_EQ(clusters(events).size(), 2u);
  EXPECT_TRUE(trips(events).empty());
  EXPECT_EQ(stats.gaps, 1);
}

TEST_F(ClusterDetectorTest, GapDiscardsPendingTentative) {
  FixTrack track;
  track.stop(kA, kT0, 200 * kMsPerSecond, 20);
  track.add(offset_m(kA, 300.0, 0.0), kT0 + 230 * kMsPerSecond, 5.0, 10.0);
  track.add(offset_m(kA, 600.0, 0.0), kT0 + 260 * kMsPerSecond, 5.0, 10.0);
  // tentative stop 1 km out, too short to confirm before the signal drops
  track.stop(offset_m(kA, 1000.0, 0.0), kT0 + 290 * kMsPerSecond,
             60 * kMsPerSecond, 5);
  track.stop(offset_m(kA, 3000.0, 0.0), kT0 + 350 * kMsPerSecond +
                                            20 * kMsPerMinute,
             200 * kMsPerSecond, 20);

  ScanStats stats;
  auto events = scan(track.fixes(), no_locations, ShiftStatus::Completed, &stats);
  auto cs = clusters(events);
  ASSERT_EQ(cs.size(), 2u);
  EXPECT_EQ(cs[0].gps_point_count, 20);
  EXPECT_EQ(cs[1].gps_point_count, 20);
  EXPECT_EQ(cs[1].started_at, kT0 + 350 * kMsPerSecond + 20 * kMsPerMinute);
  EXPECT_TRUE(trips(events).empty());
  EXPECT_EQ(stats.trips_rejected, 0);
  EXPECT_EQ(stats.gaps, 1);
}

TEST_F(ClusterDetectorTest, NoTrailingTripAcrossGap) {
  FixTrack track;
  track.stop(kA, kT0, 200 * kMsPerSecond, 20);
  track.stop(offset_m(kA, 1000.0, 0.0), kT0 + 230 * kMsPerSecond,
             60 * kMsPerSecond, 5);
  // back online mid-drive, never stopping again
  track.drive_north(offset_m(kA, 3000.0, 0.0),
                    kT0 + 290 * kMsPerSecond + 20 * kMsPerMinute,
                    10 * kMsPerSecond, 30, 100.0);

  ScanStats stats;
  auto events = scan(track.fixes(), no_locations, ShiftStatus::Completed, &stats);
  EXPECT_EQ(clusters(events).size(), 1u);
  EXPECT_TRUE(trips(events).empty());
  EXPECT_EQ(stats.trips_rejected, 0);
  EXPECT_EQ(stats.gaps, 1);
}

TEST_F(ClusterDetectorTest, DropsFixesAboveAccuracyCeiling) {
  FixTrack track;
  track.stop(kA, kT0, 200 * kMsPerSecond, 20);
  track.add(offset_m(kA, 500.0, 0.0), kT0 + 210 * kMsPerSecond, 250.0, 0.0);
  track.add(kA, kT0 + 220 * kMsPerSecond, 250.0, 0.0);
  ScanStats stats;
  auto cs = clusters(
      scan(track.fixes(), no_locations, ShiftStatus::Completed, &stats));
  ASSERT_EQ(cs.size(), 1u);
  EXPECT_EQ(cs[0].gps_point_count, 20);
  EXPECT_EQ(stats.fixes_seen, 22);
  EXPECT_EQ(stats.fixes_dropped, 2);
}

TEST_F(ClusterDetectorTest, TrailingTripOnlyForCompletedShift) {
  FixTrack track;
  track.stop(kA, kT0, 200 * kMsPerSecond, 20)
      .drive_north(kA, kT0 + 200 * kMsPerSecond, 10 * kMsPerSecond, 30, 100.0);

  auto done = scan(track.fixes(), no_locations, ShiftStatus::Completed);
  auto cs = clusters(done);
  auto ts = trips(done);
  ASSERT_EQ(cs.size(), 1u);
  ASSERT_EQ(ts.size(), 1u);
  EXPECT_EQ(ts[0].start_cluster_id, std::optional<std::string>(cs[0].id));
  EXPECT_FALSE(ts[0].end_cluster_id.has_value());
  EXPECT_EQ(ts[0].ended_at, kT0 + 500 * kMsPerSecond);
  EXPECT_EQ(ts[0].gps_point_count, 30);
  EXPECT_EQ(ts[0].transport_mode, TransportMode::Driving);

  auto active = scan(track.fixes(), no_locations, ShiftStatus::Active);
  EXPECT_EQ(clusters(active).size(), 1u);
  EXPECT_TRUE(trips(active).empty());
}

TEST_F(ClusterDetectorTest, IncoherentStopSplitsCluster) {
  ScanStats stats;
  auto events =
      scan(split_track().fixes(), no_locations, ShiftStatus::Completed, &stats);
  EXPECT_EQ(stats.splits, 1);

  auto cs = clusters(events);
  auto ts = trips(events);
  ASSERT_EQ(cs.size(), 1u);
  EXPECT_EQ(cs[0].gps_point_count, 25);
  EXPECT_EQ(cs[0].ended_at, kT0 + 210 * kMsPerSecond);

  ASSERT_EQ(ts.size(), 1u);
  EXPECT_EQ(ts[0].transport_mode, TransportMode::Walking);
  EXPECT_EQ(ts[0].start_cluster_id, std::optional<std::string>(cs[0].id));
  EXPECT_FALSE(ts[0].end_cluster_id.has_value());
  EXPECT_EQ(ts[0].point_ids,
            (std::vector<std::string>{"shift-1-fix-25", "shift-1-fix-26"}));
  EXPECT_EQ(ts[0].ended_at, kT0 + 510 * kMsPerSecond);
  EXPECT_DOUBLE_EQ(ts[0].confidence_score, 0.0);
}

TEST_F(ClusterDetectorTest, DriveAfterSplitBecomesTrailingTrip) {
  FixTrack track = split_track();
  track.drive_north(offset_m(kA, 245.0, 0.0), kT0 + 510 * kMsPerSecond,
                    10 * kMsPerSecond, 30, 100.0);

  ScanStats stats;
  auto events = scan(track.fixes(), no_locations, ShiftStatus::Completed, &stats);
  EXPECT_EQ(stats.splits, 1);
  EXPECT_EQ(clusters(events).size(), 1u);

  auto ts = trips(events);
  ASSERT_EQ(ts.size(), 2u);
  EXPECT_EQ(ts[0].transport_mode, TransportMode::Walking);
  const Trip &drive = ts[1];
  EXPECT_EQ(drive.transport_mode, TransportMode::Driving);
  EXPECT_FALSE(drive.start_cluster_id.has_value());
  EXPECT_FALSE(drive.end_cluster_id.has_value());
  EXPECT_EQ(drive.started_at, ts[0].ended_at);
  EXPECT_EQ(drive.started_at, kT0 + 510 * kMsPerSecond);
  EXPECT_EQ(drive.ended_at, kT0 + 810 * kMsPerSecond);
  ASSERT_EQ(drive.gps_point_count, 30);
  EXPECT_EQ(drive.point_ids.front(), "shift-1-fix-28");
  EXPECT_EQ(drive.point_ids.back(), "shift-1-fix-57");

  // an active shift may still stop again
  EXPECT_EQ(trips(scan(track.fixes(), no_locations, ShiftStatus::Active)).size(),
            1u);
}

TEST_F(ClusterDetectorTest, StreamIsLazyAndFinite) {
  ScanContext ctx;
  ctx.shift_id = "shift-1";
  DetectionStream stream(commute().fixes(), ctx, no_locations);
  auto first = stream.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_TRUE(std::holds_alternative<ClusterEvent>(*first));
  EXPECT_LT(stream.stats().fixes_seen, 158);
  EXPECT_EQ(stream.collect().size(), 2u);
  EXPECT_FALSE(stream.next().has_value());
}
