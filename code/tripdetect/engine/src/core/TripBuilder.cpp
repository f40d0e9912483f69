#include "core/TripBuilder.hpp"
#include "core/EntityIds.hpp"
#include "core/GeoUtils.hpp"
#include <algorithm>
#include <cmath>

const char *TripRejectionToString(TripRejection r) {
  switch (r) {
  case TripRejection::TooShort:
    return "too_short";
  case TripRejection::NonPositiveDuration:
    return "non_positive_duration";
  case TripRejection::WalkingDisplacement:
    return "walking_displacement";
  case TripRejection::DrivingDistance:
    return "driving_distance";
  case TripRejection::DrivingDisplacement:
    return "driving_displacement";
  case TripRejection::DrivingStraightness:
    return "driving_straightness";
  default:
    return "none";
  }
}

double TripBuilder::round_to(double v, int decimals) {
  const double f = std::pow(10.0, decimals);
  return std::round(v * f) / f;
}

int TripBuilder::duration_minutes(EpochMs started_at, EpochMs ended_at) {
  const double minutes =
      static_cast<double>(ended_at - started_at) / kMsPerMinute;
  return std::max(1, static_cast<int>(std::lround(minutes)));
}

int TripBuilder::low_accuracy_count(const std::vector<GpsFix> &transit) const {
  return static_cast<int>(
      std::count_if(transit.begin(), transit.end(), [this](const GpsFix &f) {
        return f.accuracy && *f.accuracy > params_.low_accuracy_m;
      }));
}

double TripBuilder::confidence(const std::vector<GpsFix> &transit) const {
  if (transit.empty())
    return params_.default_confidence;
  const double low = low_accuracy_count(transit);
  const double c = std::max(0.0, 1.0 - low / static_cast<double>(transit.size()));
  return round_to(c, 2);
}

TripRejection TripBuilder::ghost_check(TransportMode mode, double distance_km,
                                       double displacement_km,
                                       int point_count) const {
  if (mode == TransportMode::Walking &&
      displacement_km < params_.min_displacement_walking_km)
    return TripRejection::WalkingDisplacement;
  if (mode != TransportMode::Driving)
    return TripRejection::None;

  if (distance_km < params_.min_distance_driving_km)
    return TripRejection::DrivingDistance;
  if (displacement_km < params_.min_displacement_driving_km)
    return TripRejection::DrivingDisplacement;
  if (point_count > 0 && point_count <= params_.straightness_max_points &&
      distance_km > 0.0 &&
      displacement_km / distance_km < params_.min_straightness)
    return TripRejection::DrivingStraightness;
  return TripRejection::None;
}

std::optional<Trip>
TripBuilder::finalize_trip(const std::string &shift_id,
                           const std::string &employee_id,
                           const TripAnchor &departure,
                           const TripAnchor &arrival,
                           const std::vector<GpsFix> &transit,
                           const std::optional<PreviousTripEnd> &previous,
                           TripRejection *rejection) const {
  auto reject = [rejection](TripRejection r) -> std::optional<Trip> {
    if (rejection)
      *rejection = r;
    return std::nullopt;
  };

  const double displacement_km =
      GeoUtils::haversine_km(departure.coord, arrival.coord);
  const double distance_km = displacement_km * params_.correction_factor;
  if (distance_km < params_.min_distance_km)
    return reject(TripRejection::TooShort);
  if (arrival.at <= departure.at)
    return reject(TripRejection::NonPositiveDuration);

  Trip t;
  t.shift_id = shift_id;
  t.employee_id = employee_id;
  t.started_at = departure.at;
  t.ended_at = arrival.at;
  t.id = EntityIds::trip_id(shift_id, t.started_at, t.ended_at);
  t.start = departure.coord;
  t.end = arrival.coord;
  t.start_accuracy = departure.accuracy;
  t.end_accuracy = arrival.accuracy;
  t.distance_km = round_to(distance_km, 3);
  t.duration_minutes = duration_minutes(t.started_at, t.ended_at);
  t.gps_point_count = static_cast<int>(transit.size());
  t.low_accuracy_segments = low_accuracy_count(transit);
  t.confidence_score = confidence(transit);
  t.start_cluster_id = departure.cluster_id;
  t.end_cluster_id = arrival.cluster_id;
  t.point_ids.reserve(transit.size());
  for (const auto &f : transit)
    t.point_ids.push_back(f.id);

  t.transport_mode =
      classifier_.classify(t.distance_km, t.duration_minutes, transit);
  const TripRejection ghost = ghost_check(t.transport_mode, distance_km,
                                          displacement_km, t.gps_point_count);
  if (ghost != TripRejection::None)
    return reject(ghost);

  // Continuity: inherit the previous trip's end location when this trip
  // starts where that one ended.
  if (previous && previous->location_id &&
      GeoUtils::haversine(previous->coord, t.start) <
          params_.continuity_radius_m) {
    t.start_location_id = previous->location_id;
  } else if (auto m = matcher_.match_point(t.start, t.start_accuracy)) {
    t.start_location_id = m->location_id;
  }
  if (auto m = matcher_.match_point(t.end, t.end_accuracy))
    t.end_location_id = m->location_id;
  if (t.start_location_id)
    t.start_location_match_method = MatchMethod::Auto;
  if (t.end_location_id)
    t.end_location_match_method = MatchMethod::Auto;

  if (rejection)
    *rejection = TripRejection::None;
  return t;
}
