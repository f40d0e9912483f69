#include "core/TransportClassifier.hpp"
#include "core/GeoUtils.hpp"

double TransportClassifier::average_speed_kmh(double distance_km,
                                              int duration_minutes) {
  if (duration_minutes <= 0)
    return 0.0;
  return distance_km * 60.0 / static_cast<double>(duration_minutes);
}

SegmentSpeedStats
TransportClassifier::segment_speeds(const std::vector<GpsFix> &fixes) const {
  SegmentSpeedStats s;
  for (size_t i = 1; i < fixes.size(); ++i) {
    const EpochMs dt_ms = fixes[i].captured_at - fixes[i - 1].captured_at;
    if (dt_ms <= 0)
      continue;
    const double hours = static_cast<double>(dt_ms) / (3600.0 * kMsPerSecond);
    const double kmh =
        GeoUtils::haversine_km(fixes[i - 1].coord, fixes[i].coord) / hours;
    if (kmh >= params_.glitch_speed_kmh)
      continue;
    ++s.total;
    if (kmh < params_.slow_segment_kmh)
      ++s.slow;
  }
  return s;
}

TransportMode
TransportClassifier::classify(double distance_km, int duration_minutes,
                              const std::vector<GpsFix> &fixes) const {
  if (distance_km <= 0.0 || duration_minutes <= 0)
    return TransportMode::Unknown;

  const double avg = average_speed_kmh(distance_km, duration_minutes);
  if (avg > params_.driving_speed_kmh)
    return TransportMode::Driving;
  if (avg < params_.walking_speed_kmh)
    return TransportMode::Walking;

  // grey zone
  const SegmentSpeedStats s = segment_speeds(fixes);
  if (s.total < 2)
    return avg >= params_.tiebreak_speed_kmh ? TransportMode::Driving
                                             : TransportMode::Walking;

  if (s.slow_ratio() > params_.slow_segment_ratio &&
      distance_km <= params_.walking_max_distance_km)
    return TransportMode::Walking;
  return TransportMode::Driving;
}
