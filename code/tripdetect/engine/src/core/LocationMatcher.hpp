#pragma once
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <optional>
#include <string>
#include <vector>

struct LocationMatch {
  std::string location_id;
  double distance_m = 0.0;      // centre to matched point
  double voting_fraction = 1.0; // 1.0 for a direct geofence hit
};

// Geofence matching against a fixed reference set. Inactive locations in the
// set are ignored.
class LocationMatcher {
public:
  LocationMatcher(std::vector<Location> locations, DetectionParams params = {})
      : locations_(std::move(locations)), params_(params) {}

  // Nearest active location whose radius, widened by the point's accuracy,
  // contains the point.
  std::optional<LocationMatch> match_point(const Coordinate &point,
                                           double accuracy_m) const;

  // Fallback for clusters whose weighted centroid drifted outside every
  // geofence: the location containing the largest share of the raw fixes
  // wins, provided that share reaches the voting threshold. Ties go to the
  // location nearest the unweighted centroid of the fixes.
  std::optional<LocationMatch>
  match_by_point_voting(const std::vector<GpsFix> &fixes) const;

  // Primary match at the centroid accuracy, then point voting.
  std::optional<LocationMatch>
  match_cluster(const Coordinate &centroid, double centroid_accuracy,
                const std::vector<GpsFix> &fixes) const;

  const std::vector<Location> &locations() const { return locations_; }

  // Point-in-geofence test, buffered by accuracy.
  static bool contains(const Location &loc, const Coordinate &point,
                       double accuracy_m);

  // Number of fixes inside the location (missing accuracy buffers by 0).
  static int votes_inside(const Location &loc,
                          const std::vector<GpsFix> &fixes);

  // votes_inside / max(denominator, 1)
  static double voting_fraction(const Location &loc,
                                const std::vector<GpsFix> &fixes,
                                int denominator);

private:
  std::vector<Location> locations_;
  DetectionParams params_;
};
