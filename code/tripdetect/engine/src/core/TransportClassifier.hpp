#pragma once
#include "models/CoreTypes.hpp"
#include "models/DetectionModel.hpp"
#include "models/params.hpp"
#include <vector>

// Per-segment speed summary over consecutive fixes.
struct SegmentSpeedStats {
  int total = 0; // valid segments (positive elapsed time, below glitch speed)
  int slow = 0;  // valid segments under the slow threshold

  double slow_ratio() const {
    return total > 0 ? static_cast<double>(slow) / total : 0.0;
  }
};

class TransportClassifier {
public:
  explicit TransportClassifier(DetectionParams params = {}) : params_(params) {}

  // Driving / walking / unknown from the trip's average speed, falling back
  // to consecutive-fix speeds in the grey zone between the walking and
  // driving thresholds. `fixes` are the trip's transit fixes in sequence.
  TransportMode classify(double distance_km, int duration_minutes,
                         const std::vector<GpsFix> &fixes) const;

  SegmentSpeedStats segment_speeds(const std::vector<GpsFix> &fixes) const;

  static double average_speed_kmh(double distance_km, int duration_minutes);

private:
  DetectionParams params_;
};
