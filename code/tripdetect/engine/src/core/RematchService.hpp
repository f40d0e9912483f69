#pragma once
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <string>

class DetectionDB;

struct LocationCreatedResult {
  int matched_start = 0;
  int matched_end = 0;
  int matched_clusters = 0;
};

struct LocationUpdatedResult {
  int newly_matched_start = 0;
  int newly_matched_end = 0;
  int unmatched_start = 0;
  int unmatched_end = 0;
  int newly_matched_clusters = 0;
  int unmatched_clusters = 0;
};

// Re-evaluates stored trip endpoints and clusters after a location is created
// or edited. Only rows an update actually changed are counted, and manual
// assignments are never touched.
class RematchService {
public:
  explicit RematchService(DetectionParams p = {}) : P(p) {}

  LocationCreatedResult on_location_created(DetectionDB &db,
                                            const std::string &location_id) const;
  LocationUpdatedResult on_location_updated(DetectionDB &db,
                                            const std::string &location_id) const;

private:
  DetectionParams P;

  LocationCreatedResult match_unassigned(DetectionDB &db,
                                         const Location &loc) const;
  void unmatch_outside(DetectionDB &db, const Location &loc,
                       LocationUpdatedResult &out) const;
};
