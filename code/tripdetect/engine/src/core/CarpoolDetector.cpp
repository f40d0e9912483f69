#include "core/CarpoolDetector.hpp"

#include "core/DetectionDB.hpp"
#include "core/EntityIds.hpp"
#include "core/GeoUtils.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <numeric>

UnionFind::UnionFind(size_t n) : parent_(n), size_(n, 1) {
  std::iota(parent_.begin(), parent_.end(), size_t{0});
}

size_t UnionFind::find(size_t x) {
  while (parent_[x] != x) {
    parent_[x] = parent_[parent_[x]];
    x = parent_[x];
  }
  return x;
}

void UnionFind::unite(size_t a, size_t b) {
  a = find(a);
  b = find(b);
  if (a == b)
    return;
  if (size_[a] < size_[b])
    std::swap(a, b);
  parent_[b] = a;
  size_[a] += size_[b];
}

bool CarpoolDetector::is_pair(const Trip &a, const Trip &b) const {
  if (a.employee_id == b.employee_id)
    return false;
  if (GeoUtils::haversine(a.start, b.start) >= P.max_endpoint_distance_m)
    return false;
  if (GeoUtils::haversine(a.end, b.end) >= P.max_endpoint_distance_m)
    return false;

  const EpochMs overlap = std::max<EpochMs>(
      0, std::min(a.ended_at, b.ended_at) - std::max(a.started_at, b.started_at));
  const EpochMs shorter =
      std::min(a.ended_at - a.started_at, b.ended_at - b.started_at);
  if (shorter <= 0)
    return false;
  return static_cast<double>(overlap) / static_cast<double>(shorter) >=
         P.min_overlap_ratio;
}

std::vector<std::vector<size_t>>
CarpoolDetector::group_trips(const std::vector<Trip> &trips) const {
  UnionFind uf(trips.size());
  for (size_t i = 0; i < trips.size(); ++i)
    for (size_t j = i + 1; j < trips.size(); ++j)
      if (is_pair(trips[i], trips[j]))
        uf.unite(i, j);

  std::map<size_t, std::vector<size_t>> by_root;
  for (size_t i = 0; i < trips.size(); ++i)
    by_root[uf.find(i)].push_back(i);

  std::vector<std::vector<size_t>> groups;
  for (auto &kv : by_root)
    if (kv.second.size() >= 2)
      groups.push_back(std::move(kv.second));
  std::sort(groups.begin(), groups.end(),
            [](const auto &a, const auto &b) { return a.front() < b.front(); });
  return groups;
}

CarpoolGroup CarpoolDetector::build_group(DetectionDB &db,
                                          const std::string &trip_date,
                                          const std::vector<Trip> &trips,
                                          const std::vector<size_t> &members) const {
  CarpoolGroup g;
  g.trip_date = trip_date;

  std::vector<std::string> trip_ids;
  std::vector<std::string> with_vehicle;
  for (size_t idx : members) {
    const Trip &t = trips[idx];
    trip_ids.push_back(t.id);
    if (std::find(with_vehicle.begin(), with_vehicle.end(), t.employee_id) ==
            with_vehicle.end() &&
        db.has_active_personal_vehicle(t.employee_id, trip_date))
      with_vehicle.push_back(t.employee_id);
  }
  g.id = EntityIds::carpool_group_id(trip_date, trip_ids);

  if (with_vehicle.size() == 1) {
    g.driver_employee_id = with_vehicle.front();
    g.review_needed = false;
  } else if (with_vehicle.empty()) {
    g.review_needed = true;
  } else {
    // several candidates: first by name, then by id
    std::vector<std::pair<std::string, std::string>> ranked;
    for (const auto &emp : with_vehicle)
      ranked.emplace_back(db.employee_name(emp).value_or(""), emp);
    std::sort(ranked.begin(), ranked.end());
    g.driver_employee_id = ranked.front().second;
    g.review_needed = true;
  }

  for (size_t idx : members) {
    const Trip &t = trips[idx];
    CarpoolMember m{t.id, t.employee_id, CarpoolRole::Unassigned};
    if (g.driver_employee_id)
      m.role = t.employee_id == *g.driver_employee_id ? CarpoolRole::Driver
                                                      : CarpoolRole::Passenger;
    g.members.push_back(std::move(m));
  }
  return g;
}

std::vector<CarpoolSummary>
CarpoolDetector::detect(DetectionDB &db, const std::string &trip_date) const {
  const EpochMs day_start = EntityIds::day_start_ms(trip_date);
  std::unique_lock<std::shared_mutex> gate(locks_.carpool_gate());

  db.begin();
  try {
    db.delete_carpool_groups(trip_date);
    std::vector<Trip> trips =
        db.driving_trips_between(day_start, day_start + kMsPerDay);
    std::sort(trips.begin(), trips.end(), [](const Trip &a, const Trip &b) {
      return a.started_at != b.started_at ? a.started_at < b.started_at
                                          : a.id < b.id;
    });

    std::vector<CarpoolSummary> out;
    for (const auto &members : group_trips(trips)) {
      CarpoolGroup g = build_group(db, trip_date, trips, members);
      db.insert_carpool_group(g);
      out.push_back({g.id, static_cast<int>(g.members.size()),
                     g.driver_employee_id, g.review_needed});
    }
    db.commit();
    std::cout << "[INFO] carpools date=" << trip_date
              << " driving_trips=" << trips.size()
              << " groups=" << out.size() << "\n";
    return out;
  } catch (const std::exception &e) {
    std::cerr << "[carpool] date " << trip_date
              << " rolled back: " << e.what() << "\n";
    db.rollback();
    throw;
  }
}
