#include "core/SuggestionService.hpp"

#include "core/CarpoolDetector.hpp"
#include "core/DetectionDB.hpp"
#include "core/EntityIds.hpp"
#include "core/GeoUtils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <numeric>
#include <stdexcept>

// Centroids are weighted by 1/accuracy with the accuracy floored at 0.1 m.
static double centroid_weight(double accuracy) {
  return 1.0 / std::max(accuracy, 0.1);
}

static std::vector<StationaryCluster> load_candidates(DetectionDB &db) {
  auto clusters = db.suggestion_candidates();
  std::sort(clusters.begin(), clusters.end(),
            [](const StationaryCluster &a, const StationaryCluster &b) {
              return a.started_at != b.started_at ? a.started_at < b.started_at
                                                  : a.id < b.id;
            });
  return clusters;
}

std::vector<std::vector<size_t>> SuggestionService::group_clusters(
    const std::vector<StationaryCluster> &clusters) const {
  // sweep in latitude order; pairs further apart in latitude alone can stop
  // the inner loop
  std::vector<size_t> by_lat(clusters.size());
  std::iota(by_lat.begin(), by_lat.end(), size_t{0});
  std::sort(by_lat.begin(), by_lat.end(), [&](size_t a, size_t b) {
    return clusters[a].centroid.lat < clusters[b].centroid.lat;
  });
  const double lat_reach =
      P.link_radius_m / GeoUtils::kEarthRadiusM * 180.0 / M_PI;

  UnionFind uf(clusters.size());
  for (size_t i = 0; i < by_lat.size(); ++i) {
    const Coordinate &a = clusters[by_lat[i]].centroid;
    for (size_t j = i + 1; j < by_lat.size(); ++j) {
      const Coordinate &b = clusters[by_lat[j]].centroid;
      if (b.lat - a.lat > lat_reach)
        break;
      if (GeoUtils::haversine(a, b) <= P.link_radius_m)
        uf.unite(by_lat[i], by_lat[j]);
    }
  }

  std::map<size_t, std::vector<size_t>> by_root;
  for (size_t i = 0; i < clusters.size(); ++i)
    by_root[uf.find(i)].push_back(i);

  std::vector<std::vector<size_t>> groups;
  for (auto &kv : by_root)
    groups.push_back(std::move(kv.second));
  std::sort(groups.begin(), groups.end(),
            [](const auto &a, const auto &b) { return a.front() < b.front(); });
  return groups;
}

SuggestedLocation
SuggestionService::aggregate(const std::vector<StationaryCluster> &clusters,
                             const std::vector<size_t> &members) {
  SuggestedLocation s;
  double wsum = 0.0, wlat = 0.0, wlon = 0.0, acc_sum = 0.0;
  for (size_t idx : members) {
    const StationaryCluster &c = clusters[idx];
    const double w = centroid_weight(c.centroid_accuracy);
    wsum += w;
    wlat += c.centroid.lat * w;
    wlon += c.centroid.lon * w;
    acc_sum += c.centroid_accuracy;

    if (s.cluster_ids.empty() || c.started_at < s.first_seen)
      s.first_seen = c.started_at;
    if (s.cluster_ids.empty() || c.started_at > s.last_seen)
      s.last_seen = c.started_at;
    s.total_duration_seconds += c.duration_seconds();
    s.cluster_ids.push_back(c.id);
    s.employee_ids.push_back(c.employee_id);
  }
  s.occurrence_count = static_cast<int>(members.size());
  if (wsum > 0.0)
    s.centroid = {wlat / wsum, wlon / wsum};
  if (!members.empty())
    s.avg_accuracy = acc_sum / static_cast<double>(members.size());

  std::sort(s.employee_ids.begin(), s.employee_ids.end());
  s.employee_ids.erase(
      std::unique(s.employee_ids.begin(), s.employee_ids.end()),
      s.employee_ids.end());
  return s;
}

bool SuggestionService::hidden(
    const SuggestedLocation &s,
    const std::vector<IgnoredSuggestion> &ignored) const {
  return std::any_of(ignored.begin(), ignored.end(),
                     [&](const IgnoredSuggestion &ig) {
                       return s.occurrence_count <= ig.occurrence_count &&
                              GeoUtils::haversine(s.centroid, ig.centroid) <=
                                  P.ignore_radius_m;
                     });
}

std::vector<SuggestedLocation>
SuggestionService::suggest(DetectionDB &db, int min_occurrences) const {
  if (min_occurrences <= 0)
    min_occurrences = P.min_occurrences;

  const auto clusters = load_candidates(db);
  const auto ignored = db.ignored_suggestions();

  std::vector<SuggestedLocation> out;
  int dismissed = 0;
  for (const auto &members : group_clusters(clusters)) {
    if (static_cast<int>(members.size()) < min_occurrences)
      continue;
    SuggestedLocation s = aggregate(clusters, members);
    if (hidden(s, ignored)) {
      ++dismissed;
      continue;
    }
    for (const auto &emp : s.employee_ids)
      if (auto name = db.employee_name(emp))
        s.employee_names.push_back(*name);
    std::sort(s.employee_names.begin(), s.employee_names.end());
    out.push_back(std::move(s));
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const SuggestedLocation &a, const SuggestedLocation &b) {
                     return a.occurrence_count > b.occurrence_count;
                   });

  std::cout << "[INFO] suggestions clusters=" << clusters.size()
            << " offered=" << out.size() << " dismissed=" << dismissed
            << "\n";
  return out;
}

std::vector<StationaryCluster>
SuggestionService::occurrences(DetectionDB &db, const Coordinate &at,
                               double radius_m) const {
  if (radius_m <= 0.0)
    radius_m = P.occurrence_radius_m;

  const auto clusters = load_candidates(db);
  const std::vector<size_t> *best = nullptr;
  double best_d = 0.0;
  const auto groups = group_clusters(clusters);
  for (const auto &members : groups) {
    const double d = GeoUtils::haversine(aggregate(clusters, members).centroid, at);
    if (d <= radius_m && (!best || d < best_d)) {
      best = &members;
      best_d = d;
    }
  }
  if (!best)
    return {};

  std::vector<StationaryCluster> out;
  for (size_t idx : *best)
    out.push_back(clusters[idx]);
  std::sort(out.begin(), out.end(),
            [](const StationaryCluster &a, const StationaryCluster &b) {
              return a.started_at > b.started_at;
            });
  return out;
}

IgnoredSuggestion SuggestionService::ignore_suggestion(
    DetectionDB &db, const Coordinate &centroid, int occurrence_count,
    EpochMs ignored_at) const {
  if (occurrence_count < 1)
    throw std::invalid_argument("occurrence_count must be positive");

  IgnoredSuggestion ig;
  ig.id = EntityIds::ignored_suggestion_id(centroid, ignored_at);
  ig.centroid = centroid;
  ig.occurrence_count = occurrence_count;
  ig.ignored_at = ignored_at;

  db.begin();
  try {
    db.insert_ignored_suggestion(ig);
    db.commit();
  } catch (const std::exception &e) {
    std::cerr << "[suggest] ignore at " << centroid.lat << "," << centroid.lon
              << " rolled back: " << e.what() << "\n";
    db.rollback();
    throw;
  }
  std::cout << "[INFO] suggestion dismissed at " << centroid.lat << ","
            << centroid.lon << " occurrences=" << occurrence_count << "\n";
  return ig;
}

bool SuggestionService::ignore_occurrence(DetectionDB &db,
                                          const std::string &cluster_id) const {
  db.begin();
  try {
    const bool changed = db.ignore_cluster(cluster_id);
    db.commit();
    return changed;
  } catch (const std::exception &e) {
    std::cerr << "[suggest] ignore cluster " << cluster_id
              << " rolled back: " << e.what() << "\n";
    db.rollback();
    throw;
  }
}
