#pragma once

#include "core/CarpoolDetector.hpp"
#include "core/DetectionEngine.hpp"
#include "core/RematchService.hpp"
#include "core/SuggestionService.hpp"
#include "models/CoreTypes.hpp"
#include "models/DetectionModel.hpp"

// to_json() overloads so response bodies can be built with Json j = value.

template <typename T>
inline Json optional_json(const std::optional<T> &v) {
  return v ? Json(*v) : Json(nullptr);
}

inline Json method_json(MatchMethod m) {
  return m == MatchMethod::None ? Json(nullptr) : Json(MatchMethodToString(m));
}

// --- Geometry ---
inline void to_json(Json &j, const Coordinate &c) {
  j = Json{{"lat", c.lat}, {"lon", c.lon}};
}

// --- Clusters ---
inline void to_json(Json &j, const StationaryCluster &c) {
  j = Json{{"id", c.id},
           {"shift_id", c.shift_id},
           {"employee_id", c.employee_id},
           {"centroid", c.centroid},
           {"centroid_accuracy", c.centroid_accuracy},
           {"started_at", c.started_at},
           {"ended_at", c.ended_at},
           {"duration_seconds", c.duration_seconds()},
           {"gps_point_count", c.gps_point_count},
           {"matched_location_id", optional_json(c.matched_location_id)},
           {"match_method", method_json(c.match_method)}};
}

// --- Trips ---
inline void to_json(Json &j, const Trip &t) {
  j = Json{{"id", t.id},
           {"shift_id", t.shift_id},
           {"employee_id", t.employee_id},
           {"started_at", t.started_at},
           {"ended_at", t.ended_at},
           {"start", t.start},
           {"end", t.end},
           {"start_accuracy", t.start_accuracy},
           {"end_accuracy", t.end_accuracy},
           {"distance_km", t.distance_km},
           {"duration_minutes", t.duration_minutes},
           {"classification", TripClassificationToString(t.classification)},
           {"transport_mode", TransportModeToString(t.transport_mode)},
           {"confidence_score", t.confidence_score},
           {"gps_point_count", t.gps_point_count},
           {"low_accuracy_segments", t.low_accuracy_segments},
           {"detection_method", t.detection_method},
           {"start_cluster_id", optional_json(t.start_cluster_id)},
           {"end_cluster_id", optional_json(t.end_cluster_id)},
           {"start_location_id", optional_json(t.start_location_id)},
           {"end_location_id", optional_json(t.end_location_id)},
           {"start_location_match_method",
            method_json(t.start_location_match_method)},
           {"end_location_match_method",
            method_json(t.end_location_match_method)},
           {"match_status", MatchStatusToString(t.match_status)}};
}

inline void to_json(Json &j, const ScanStats &s) {
  j = Json{{"fixes_seen", s.fixes_seen},
           {"fixes_dropped", s.fixes_dropped},
           {"gaps", s.gaps},
           {"splits", s.splits},
           {"clusters", s.clusters},
           {"trips", s.trips},
           {"trips_rejected", s.trips_rejected}};
}

inline void to_json(Json &j, const DetectionResult &r) {
  j = Json{{"shift_id", r.shift_id},
           {"status", ShiftStatusToString(r.status)},
           {"cutoff", optional_json(r.cutoff)},
           {"deleted_trips", r.deleted_trips},
           {"deleted_clusters", r.deleted_clusters},
           {"clusters", r.clusters},
           {"trips", r.trips},
           {"stats", r.stats}};
}

// --- Rematch ---
inline void to_json(Json &j, const LocationCreatedResult &r) {
  j = Json{{"matched_start", r.matched_start},
           {"matched_end", r.matched_end},
           {"matched_clusters", r.matched_clusters}};
}

inline void to_json(Json &j, const LocationUpdatedResult &r) {
  j = Json{{"newly_matched_start", r.newly_matched_start},
           {"newly_matched_end", r.newly_matched_end},
           {"unmatched_start", r.unmatched_start},
           {"unmatched_end", r.unmatched_end},
           {"newly_matched_clusters", r.newly_matched_clusters},
           {"unmatched_clusters", r.unmatched_clusters}};
}

// --- Carpools ---
inline void to_json(Json &j, const CarpoolSummary &s) {
  j = Json{{"group_id", s.group_id},
           {"member_count", s.member_count},
           {"driver_employee_id", optional_json(s.driver_employee_id)},
           {"review_needed", s.review_needed}};
}

// --- Suggestions ---
inline void to_json(Json &j, const SuggestedLocation &s) {
  j = Json{{"centroid", s.centroid},
           {"occurrence_count", s.occurrence_count},
           {"employee_ids", s.employee_ids},
           {"employee_names", s.employee_names},
           {"first_seen", s.first_seen},
           {"last_seen", s.last_seen},
           {"total_duration_seconds", s.total_duration_seconds},
           {"avg_accuracy", s.avg_accuracy},
           {"cluster_ids", s.cluster_ids}};
}

inline void to_json(Json &j, const IgnoredSuggestion &s) {
  j = Json{{"id", s.id},
           {"centroid", s.centroid},
           {"occurrence_count", s.occurrence_count},
           {"ignored_at", s.ignored_at}};
}
