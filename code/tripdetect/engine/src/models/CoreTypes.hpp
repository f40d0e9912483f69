#pragma once

#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using Json = nlohmann::json;

// Milliseconds since the Unix epoch (UTC).
using EpochMs = int64_t;

constexpr EpochMs kMsPerSecond = 1000;
constexpr EpochMs kMsPerMinute = 60 * kMsPerSecond;
constexpr EpochMs kMsPerDay = 24 * 60 * kMsPerMinute;

// Basic spatial coordinate.
struct Coordinate {
  double lat = 0.0;
  double lon = 0.0;
};

// One stored sensor sample. Immutable once ingested; ordered by captured_at
// within a shift.
struct GpsFix {
  std::string id;
  std::string shift_id;
  std::string employee_id;
  Coordinate coord;
  std::optional<double> accuracy; // metres, smaller is better
  std::optional<double> speed;    // m/s as reported by the device
  std::optional<double> heading;  // degrees
  std::optional<double> altitude; // metres
  std::string activity;           // device activity label, e.g. "still"
  EpochMs captured_at = 0;
  bool is_mocked = false;
};

enum class ShiftStatus : uint8_t { Active, Completed };

inline const char *ShiftStatusToString(ShiftStatus s) {
  return s == ShiftStatus::Active ? "active" : "completed";
}

inline ShiftStatus ShiftStatusFromString(const std::string &s) {
  return s == "active" ? ShiftStatus::Active : ShiftStatus::Completed;
}

struct Shift {
  std::string id;
  std::string employee_id;
  ShiftStatus status = ShiftStatus::Completed;
  EpochMs clocked_in_at = 0;
  std::optional<EpochMs> clocked_out_at;
  std::optional<Coordinate> clock_in_location;
  std::optional<Coordinate> clock_out_location;
};

// Reference geofence.
struct Location {
  std::string id;
  std::string name;
  Coordinate center;
  double radius_m = 100.0;
  bool is_active = true;
};
