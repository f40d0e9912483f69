#pragma once
#include "core/LocationMatcher.hpp"
#include "core/TransportClassifier.hpp"
#include "models/DetectionModel.hpp"
#include "models/params.hpp"
#include <optional>
#include <string>
#include <vector>

// One end of a candidate trip: a cluster centroid or a raw fix.
struct TripAnchor {
  Coordinate coord;
  double accuracy = 0.0;
  EpochMs at = 0;
  std::optional<std::string> cluster_id; // confirmed cluster only
};

// Where the previously accepted trip ended; threaded through the scan so the
// next trip can inherit its start location.
struct PreviousTripEnd {
  Coordinate coord;
  std::optional<std::string> location_id;
};

enum class TripRejection : uint8_t {
  None = 0,
  TooShort,
  NonPositiveDuration,
  WalkingDisplacement,
  DrivingDistance,
  DrivingDisplacement,
  DrivingStraightness
};

const char *TripRejectionToString(TripRejection r);

class TripBuilder {
public:
  TripBuilder(const LocationMatcher &matcher, DetectionParams params = {})
      : matcher_(matcher), classifier_(params), params_(params) {}

  // Builds, classifies and filters the trip from `departure` to `arrival`
  // over `transit` (sequence order). Returns nullopt when the candidate is a
  // ghost; `rejection` receives the reason when non-null.
  std::optional<Trip>
  finalize_trip(const std::string &shift_id, const std::string &employee_id,
                const TripAnchor &departure, const TripAnchor &arrival,
                const std::vector<GpsFix> &transit,
                const std::optional<PreviousTripEnd> &previous,
                TripRejection *rejection = nullptr) const;

  // Post-classification ghost filters.
  TripRejection ghost_check(TransportMode mode, double distance_km,
                            double displacement_km, int point_count) const;

  // 0.80 without transit fixes, else 1 - low/total (2 decimals).
  double confidence(const std::vector<GpsFix> &transit) const;
  int low_accuracy_count(const std::vector<GpsFix> &transit) const;

  static int duration_minutes(EpochMs started_at, EpochMs ended_at);
  static double round_to(double v, int decimals);

private:
  const LocationMatcher &matcher_;
  TransportClassifier classifier_;
  DetectionParams params_;
};
