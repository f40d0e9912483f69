#include "core/LocationMatcher.hpp"
#include "core/GeoUtils.hpp"
#include <algorithm>
#include <limits>

bool LocationMatcher::contains(const Location &loc, const Coordinate &point,
                               double accuracy_m) {
  return GeoUtils::haversine(loc.center, point) <= loc.radius_m + accuracy_m;
}

int LocationMatcher::votes_inside(const Location &loc,
                                  const std::vector<GpsFix> &fixes) {
  int inside = 0;
  for (const auto &f : fixes)
    if (contains(loc, f.coord, f.accuracy.value_or(0.0)))
      ++inside;
  return inside;
}

double LocationMatcher::voting_fraction(const Location &loc,
                                        const std::vector<GpsFix> &fixes,
                                        int denominator) {
  return static_cast<double>(votes_inside(loc, fixes)) /
         static_cast<double>(std::max(denominator, 1));
}

std::optional<LocationMatch>
LocationMatcher::match_point(const Coordinate &point, double accuracy_m) const {
  std::optional<LocationMatch> best;
  for (const auto &loc : locations_) {
    if (!loc.is_active)
      continue;
    const double d = GeoUtils::haversine(loc.center, point);
    if (d > loc.radius_m + accuracy_m)
      continue;
    if (!best || d < best->distance_m)
      best = LocationMatch{loc.id, d, 1.0};
  }
  return best;
}

std::optional<LocationMatch>
LocationMatcher::match_by_point_voting(const std::vector<GpsFix> &fixes) const {
  if (fixes.empty())
    return std::nullopt;

  const Coordinate raw_centroid = GeoUtils::unweighted_centroid(fixes);
  const int total = static_cast<int>(fixes.size());

  std::optional<LocationMatch> best;
  for (const auto &loc : locations_) {
    if (!loc.is_active)
      continue;
    const double frac = voting_fraction(loc, fixes, total);
    if (frac < params_.voting_threshold)
      continue;
    const double d = GeoUtils::haversine(loc.center, raw_centroid);
    if (!best || frac > best->voting_fraction ||
        (frac == best->voting_fraction && d < best->distance_m))
      best = LocationMatch{loc.id, d, frac};
  }
  return best;
}

std::optional<LocationMatch>
LocationMatcher::match_cluster(const Coordinate &centroid,
                               double centroid_accuracy,
                               const std::vector<GpsFix> &fixes) const {
  if (auto m = match_point(centroid, centroid_accuracy))
    return m;
  return match_by_point_voting(fixes);
}
