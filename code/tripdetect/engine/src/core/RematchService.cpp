#include "core/RematchService.hpp"

#include "core/DetectionDB.hpp"
#include "core/GeoUtils.hpp"
#include "core/LocationMatcher.hpp"
#include <algorithm>
#include <iostream>
#include <unordered_set>

static GeoUtils::BBox box_around(const Location &loc, double pad_m) {
  return GeoUtils::inflate_bbox(GeoUtils::compute_bbox({loc.center}), pad_m);
}

static std::optional<Location> usable_location(DetectionDB &db,
                                               const std::string &id) {
  auto loc = db.find_location(id);
  if (!loc || !loc->is_active)
    return std::nullopt;
  return loc;
}

LocationCreatedResult
RematchService::match_unassigned(DetectionDB &db, const Location &loc) const {
  LocationCreatedResult out;

  const auto endpoint_box = box_around(loc, loc.radius_m + P.max_accuracy_m);
  for (TripEndpoint which : {TripEndpoint::Start, TripEndpoint::End}) {
    int &counter =
        which == TripEndpoint::Start ? out.matched_start : out.matched_end;
    for (const auto &row : db.unmatched_endpoints_in_bbox(which, endpoint_box)) {
      if (!LocationMatcher::contains(loc, row.coord, row.accuracy))
        continue;
      if (db.assign_endpoint(row.trip_id, which, loc.id))
        ++counter;
    }
  }

  const double voting_reach = loc.radius_m * P.voting_search_factor;
  const auto cluster_box = box_around(
      loc, std::max(loc.radius_m + P.max_accuracy_m, voting_reach));
  auto candidates = db.unmatched_clusters_in_bbox(cluster_box);

  // centroid containment first, then point voting for the rest
  std::unordered_set<std::string> assigned;
  for (const auto &c : candidates) {
    if (!LocationMatcher::contains(loc, c.centroid, c.centroid_accuracy))
      continue;
    if (db.assign_cluster(c.id, loc.id)) {
      assigned.insert(c.id);
      ++out.matched_clusters;
    }
  }
  for (const auto &c : candidates) {
    if (assigned.count(c.id))
      continue;
    if (GeoUtils::haversine(c.centroid, loc.center) > voting_reach)
      continue;
    const double frac = LocationMatcher::voting_fraction(
        loc, db.cluster_fixes(c.id), c.gps_point_count);
    if (frac >= P.voting_threshold && db.assign_cluster(c.id, loc.id))
      ++out.matched_clusters;
  }
  return out;
}

void RematchService::unmatch_outside(DetectionDB &db, const Location &loc,
                                     LocationUpdatedResult &out) const {
  for (TripEndpoint which : {TripEndpoint::Start, TripEndpoint::End}) {
    int &counter =
        which == TripEndpoint::Start ? out.unmatched_start : out.unmatched_end;
    for (const auto &row : db.auto_endpoints_at(which, loc.id)) {
      if (LocationMatcher::contains(loc, row.coord, row.accuracy))
        continue;
      if (db.clear_endpoint(row.trip_id, which, loc.id))
        ++counter;
    }
  }

  for (const auto &c : db.auto_clusters_at(loc.id)) {
    if (LocationMatcher::contains(loc, c.centroid, c.centroid_accuracy))
      continue;
    // keep clusters the raw fixes still vote into the zone
    const double frac = LocationMatcher::voting_fraction(
        loc, db.cluster_fixes(c.id), c.gps_point_count);
    if (frac >= P.voting_threshold)
      continue;
    if (db.clear_cluster(c.id, loc.id))
      ++out.unmatched_clusters;
  }
}

LocationCreatedResult
RematchService::on_location_created(DetectionDB &db,
                                    const std::string &location_id) const {
  auto loc = usable_location(db, location_id);
  if (!loc)
    return {};

  db.begin();
  try {
    LocationCreatedResult out = match_unassigned(db, *loc);
    db.commit();
    std::cout << "[INFO] rematch created location=" << location_id
              << " starts=" << out.matched_start
              << " ends=" << out.matched_end
              << " clusters=" << out.matched_clusters << "\n";
    return out;
  } catch (const std::exception &e) {
    std::cerr << "[rematch] location " << location_id
              << " rolled back: " << e.what() << "\n";
    db.rollback();
    throw;
  }
}

LocationUpdatedResult
RematchService::on_location_updated(DetectionDB &db,
                                    const std::string &location_id) const {
  auto loc = usable_location(db, location_id);
  if (!loc)
    return {};

  db.begin();
  try {
    LocationUpdatedResult out;
    unmatch_outside(db, *loc, out);
    const LocationCreatedResult added = match_unassigned(db, *loc);
    out.newly_matched_start = added.matched_start;
    out.newly_matched_end = added.matched_end;
    out.newly_matched_clusters = added.matched_clusters;
    db.commit();
    std::cout << "[INFO] rematch updated location=" << location_id
              << " +starts=" << out.newly_matched_start
              << " +ends=" << out.newly_matched_end
              << " -starts=" << out.unmatched_start
              << " -ends=" << out.unmatched_end
              << " +clusters=" << out.newly_matched_clusters
              << " -clusters=" << out.unmatched_clusters << "\n";
    return out;
  } catch (const std::exception &e) {
    std::cerr << "[rematch] location " << location_id
              << " rolled back: " << e.what() << "\n";
    db.rollback();
    throw;
  }
}
