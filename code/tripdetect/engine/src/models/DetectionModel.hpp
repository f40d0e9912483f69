#pragma once

#include "models/CoreTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Transport mode assigned by the classifier after a trip is built.
enum class TransportMode : uint8_t { Unknown = 0, Driving, Walking };

inline const char *TransportModeToString(TransportMode mode) {
  switch (mode) {
  case TransportMode::Driving:
    return "driving";
  case TransportMode::Walking:
    return "walking";
  default:
    return "unknown";
  }
}

inline TransportMode TransportModeFromString(const std::string &s) {
  if (s == "driving")
    return TransportMode::Driving;
  if (s == "walking")
    return TransportMode::Walking;
  return TransportMode::Unknown;
}

enum class TripClassification : uint8_t { Business = 0, Personal };

inline const char *TripClassificationToString(TripClassification c) {
  return c == TripClassification::Personal ? "personal" : "business";
}

inline TripClassification TripClassificationFromString(const std::string &s) {
  return s == "personal" ? TripClassification::Personal
                         : TripClassification::Business;
}

// Owned by the external road-matching collaborator. Anything other than
// pending/processing means the trip was consumed and must never be rewritten.
enum class MatchStatus : uint8_t {
  Pending = 0,
  Processing,
  Matched,
  Failed,
  Anomalous
};

inline const char *MatchStatusToString(MatchStatus s) {
  switch (s) {
  case MatchStatus::Processing:
    return "processing";
  case MatchStatus::Matched:
    return "matched";
  case MatchStatus::Failed:
    return "failed";
  case MatchStatus::Anomalous:
    return "anomalous";
  default:
    return "pending";
  }
}

inline MatchStatus MatchStatusFromString(const std::string &s) {
  if (s == "processing")
    return MatchStatus::Processing;
  if (s == "matched")
    return MatchStatus::Matched;
  if (s == "failed")
    return MatchStatus::Failed;
  if (s == "anomalous")
    return MatchStatus::Anomalous;
  return MatchStatus::Pending;
}

inline bool IsConsumed(MatchStatus s) {
  return s != MatchStatus::Pending && s != MatchStatus::Processing;
}

// How a location assignment was made. Only automatic assignments may be
// revoked by the rematch service.
enum class MatchMethod : uint8_t { None = 0, Auto, Manual };

inline const char *MatchMethodToString(MatchMethod m) {
  switch (m) {
  case MatchMethod::Auto:
    return "auto";
  case MatchMethod::Manual:
    return "manual";
  default:
    return "";
  }
}

inline MatchMethod MatchMethodFromString(const std::string &s) {
  if (s == "auto")
    return MatchMethod::Auto;
  if (s == "manual")
    return MatchMethod::Manual;
  return MatchMethod::None;
}

// A place where the employee stopped for at least the dwell threshold.
struct StationaryCluster {
  std::string id; // SHA-256 hex, see EntityIds
  std::string shift_id;
  std::string employee_id;
  Coordinate centroid;
  double centroid_accuracy = 0.0;
  EpochMs started_at = 0;
  EpochMs ended_at = 0;
  int gps_point_count = 0;
  std::vector<std::string> point_ids; // member fixes, capture order
  std::optional<std::string> matched_location_id;
  MatchMethod match_method = MatchMethod::None;

  int64_t duration_seconds() const {
    return (ended_at - started_at) / kMsPerSecond;
  }
};

// A movement between two stops.
struct Trip {
  std::string id;
  std::string shift_id;
  std::string employee_id;
  EpochMs started_at = 0;
  EpochMs ended_at = 0;
  Coordinate start;
  Coordinate end;
  double start_accuracy = 0.0;
  double end_accuracy = 0.0;
  double distance_km = 0.0;
  int duration_minutes = 0;
  TripClassification classification = TripClassification::Business;
  TransportMode transport_mode = TransportMode::Unknown;
  double confidence_score = 0.0;
  int gps_point_count = 0;
  int low_accuracy_segments = 0;
  std::string detection_method = "auto";
  std::optional<std::string> start_cluster_id;
  std::optional<std::string> end_cluster_id;
  std::optional<std::string> start_location_id;
  std::optional<std::string> end_location_id;
  MatchMethod start_location_match_method = MatchMethod::None;
  MatchMethod end_location_match_method = MatchMethod::None;
  MatchStatus match_status = MatchStatus::Pending;
  std::vector<std::string> point_ids; // transit fixes, sequence order
};

// Which end of a trip a rematch operation refers to.
enum class TripEndpoint : uint8_t { Start, End };

inline const char *TripEndpointToString(TripEndpoint e) {
  return e == TripEndpoint::Start ? "start" : "end";
}

// Endpoint projection used by the rematch service.
struct TripEndpointRow {
  std::string trip_id;
  Coordinate coord;
  double accuracy = 0.0; // accuracy of the first/last contributing fix
  std::optional<std::string> location_id;
  MatchMethod match_method = MatchMethod::None;
};

enum class VehicleType : uint8_t { Personal, Company };

inline const char *VehicleTypeToString(VehicleType v) {
  return v == VehicleType::Personal ? "personal" : "company";
}

enum class CarpoolRole : uint8_t { Unassigned = 0, Driver, Passenger };

inline const char *CarpoolRoleToString(CarpoolRole r) {
  switch (r) {
  case CarpoolRole::Driver:
    return "driver";
  case CarpoolRole::Passenger:
    return "passenger";
  default:
    return "unassigned";
  }
}

struct CarpoolMember {
  std::string trip_id;
  std::string employee_id;
  CarpoolRole role = CarpoolRole::Unassigned;
};

struct CarpoolGroup {
  std::string id;
  std::string trip_date; // YYYY-MM-DD
  std::string status = "auto_detected";
  std::optional<std::string> driver_employee_id;
  bool review_needed = false;
  std::vector<CarpoolMember> members;
};

// Unmatched clusters from any shift that stopped at roughly the same place.
struct SuggestedLocation {
  Coordinate centroid; // accuracy-weighted over the member centroids
  int occurrence_count = 0;
  std::vector<std::string> employee_ids; // distinct, sorted
  std::vector<std::string> employee_names;
  EpochMs first_seen = 0; // earliest member start
  EpochMs last_seen = 0;  // latest member start
  int64_t total_duration_seconds = 0;
  double avg_accuracy = 0.0;
  std::vector<std::string> cluster_ids;
};

// A dismissed suggestion. It keeps hiding suggestions near `centroid` until
// one of them has more occurrences than were seen when it was dismissed.
struct IgnoredSuggestion {
  std::string id;
  Coordinate centroid;
  int occurrence_count = 0;
  EpochMs ignored_at = 0;
};
