#include <gtest/gtest.h>
#include "InMemoryDetectionDB.hpp"
#include "TestFixes.hpp"
#include "core/CarpoolDetector.hpp"
#include "core/EntityIds.hpp"

namespace {

const Coordinate kHome{52.0, 4.0};
const Coordinate kSite = offset_m(kHome, 12000.0, 0.0);

Trip make_trip(const std::string &id, const std::string &employee_id,
               const Coordinate &start, const Coordinate &end, EpochMs from,
               EpochMs to) {
  Trip t;
  t.id = id;
  t.shift_id = "shift-" + employee_id;
  t.employee_id = employee_id;
  t.start = start;
  t.end = end;
  t.started_at = from;
  t.ended_at = to;
  t.transport_mode = TransportMode::Driving;
  return t;
}

class CarpoolDetectorTest : public ::testing::Test {
protected:
  ShiftLocks locks;
  CarpoolDetector detector{locks};
  InMemoryDetectionDB db;

  void SetUp() override {
    // 27 of 30 minutes overlap, endpoints 50 m and 80 m apart
    db.put_trip(make_trip("trip-ann", "emp-ann", kHome, kSite, kT0,
                          kT0 + 30 * kMsPerMinute));
    db.put_trip(make_trip("trip-bob", "emp-bob", offset_m(kHome, 0.0, 50.0),
                          offset_m(kSite, 0.0, 80.0), kT0 + 3 * kMsPerMinute,
                          kT0 + 33 * kMsPerMinute));
    // same time, somewhere else
    db.put_trip(make_trip("trip-cat", "emp-cat", offset_m(kHome, 3000.0, 0.0),
                          kSite, kT0, kT0 + 30 * kMsPerMinute));
    db.s.employee_names = {{"emp-ann", "Ann"}, {"emp-bob", "Bob"}};
  }

  void personal_vehicle(const std::string &employee_id) {
    db.s.vehicle_periods.push_back(
        {employee_id, VehicleType::Personal, "2024-01-01", std::nullopt});
  }

  const CarpoolGroup &only_group() const {
    EXPECT_EQ(db.s.carpool_groups.size(), 1u);
    return db.s.carpool_groups.begin()->second;
  }

  static CarpoolRole role_of(const CarpoolGroup &g, const std::string &trip) {
    for (const auto &m : g.members)
      if (m.trip_id == trip)
        return m.role;
    return CarpoolRole::Unassigned;
  }
};

} // namespace

TEST_F(CarpoolDetectorTest, PairTestNeedsDifferentEmployeesAndOverlap) {
  const Trip a = make_trip("a", "e1", kHome, kSite, kT0, kT0 + 30 * kMsPerMinute);
  Trip b = make_trip("b", "e2", kHome, kSite, kT0 + 3 * kMsPerMinute,
                     kT0 + 33 * kMsPerMinute);
  EXPECT_TRUE(detector.is_pair(a, b));

  Trip same = b;
  same.employee_id = "e1";
  EXPECT_FALSE(detector.is_pair(a, same));

  Trip late = b;
  late.started_at = kT0 + 10 * kMsPerMinute;
  late.ended_at = kT0 + 40 * kMsPerMinute;
  EXPECT_FALSE(detector.is_pair(a, late)); // 20 of 30 minutes

  Trip off = b;
  off.end = offset_m(kSite, 200.0, 0.0);
  EXPECT_FALSE(detector.is_pair(a, off));
}

TEST_F(CarpoolDetectorTest, GroupsAreTransitiveAndOrdered) {
  std::vector<Trip> trips = {
      make_trip("a", "e1", kHome, kSite, kT0, kT0 + 30 * kMsPerMinute),
      make_trip("x", "e9", kSite, kHome, kT0, kT0 + 30 * kMsPerMinute),
      make_trip("b", "e2", offset_m(kHome, 150.0, 0.0), kSite, kT0,
                kT0 + 30 * kMsPerMinute),
      make_trip("c", "e3", offset_m(kHome, 290.0, 0.0), kSite, kT0,
                kT0 + 30 * kMsPerMinute)};
  auto groups = detector.group_trips(trips);
  ASSERT_EQ(groups.size(), 1u);
  EXPECT_EQ(groups[0], (std::vector<size_t>{0, 2, 3}));
}

TEST_F(CarpoolDetectorTest, SingleVehicleOwnerDrives) {
  personal_vehicle("emp-bob");
  auto out = detector.detect(db, "2024-06-01");
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].member_count, 2);
  EXPECT_EQ(out[0].driver_employee_id, std::optional<std::string>("emp-bob"));
  EXPECT_FALSE(out[0].review_needed);

  const CarpoolGroup &g = only_group();
  EXPECT_EQ(g.id,
            EntityIds::carpool_group_id("2024-06-01", {"trip-ann", "trip-bob"}));
  EXPECT_EQ(g.status, "auto_detected");
  EXPECT_EQ(role_of(g, "trip-bob"), CarpoolRole::Driver);
  EXPECT_EQ(role_of(g, "trip-ann"), CarpoolRole::Passenger);
}

TEST_F(CarpoolDetectorTest, NoVehicleOwnerNeedsReview) {
  auto out = detector.detect(db, "2024-06-01");
  ASSERT_EQ(out.size(), 1u);
  EXPECT_FALSE(out[0].driver_employee_id.has_value());
  EXPECT_TRUE(out[0].review_needed);
  const CarpoolGroup &g = only_group();
  EXPECT_EQ(role_of(g, "trip-ann"), CarpoolRole::Unassigned);
  EXPECT_EQ(role_of(g, "trip-bob"), CarpoolRole::Unassigned);
}

TEST_F(CarpoolDetectorTest, SeveralOwnersPickFirstByName) {
  personal_vehicle("emp-bob");
  personal_vehicle("emp-ann");
  db.s.vehicle_periods.push_back(
      {"emp-cat", VehicleType::Company, "2024-01-01", std::nullopt});
  auto out = detector.detect(db, "2024-06-01");
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].driver_employee_id, std::optional<std::string>("emp-ann"));
  EXPECT_TRUE(out[0].review_needed);
}

TEST_F(CarpoolDetectorTest, ExpiredVehiclePeriodIgnored) {
  db.s.vehicle_periods.push_back(
      {"emp-bob", VehicleType::Personal, "2024-01-01", std::string("2024-05-31")});
  auto out = detector.detect(db, "2024-06-01");
  ASSERT_EQ(out.size(), 1u);
  EXPECT_FALSE(out[0].driver_employee_id.has_value());
}

TEST_F(CarpoolDetectorTest, RerunReplacesGroupsOfTheDay) {
  CarpoolGroup stale;
  stale.id = "stale";
  stale.trip_date = "2024-06-01";
  db.s.carpool_groups["stale"] = stale;
  CarpoolGroup other_day;
  other_day.id = "other-day";
  other_day.trip_date = "2024-05-31";
  db.s.carpool_groups["other-day"] = other_day;

  detector.detect(db, "2024-06-01");
  detector.detect(db, "2024-06-01");
  EXPECT_EQ(db.s.carpool_groups.size(), 2u);
  EXPECT_EQ(db.s.carpool_groups.count("stale"), 0u);
  EXPECT_EQ(db.s.carpool_groups.count("other-day"), 1u);
}

TEST_F(CarpoolDetectorTest, OnlyDrivingTripsOfTheDay) {
  db.s.trips["trip-bob"].transport_mode = TransportMode::Walking;
  EXPECT_TRUE(detector.detect(db, "2024-06-01").empty());
  EXPECT_TRUE(detector.detect(db, "2024-06-02").empty());
}

TEST_F(CarpoolDetectorTest, RejectsMalformedDate) {
  EXPECT_THROW(detector.detect(db, "2024-6-1"), std::invalid_argument);
  EXPECT_EQ(db.begins, 0);
}
