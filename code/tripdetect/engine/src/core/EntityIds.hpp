#pragma once
#include "models/CoreTypes.hpp"
#include <string>
#include <vector>

// Deterministic identifiers for derived rows. Every id is the hex SHA-256 of
// a normalized material string, so re-running detection over the same fixes
// reproduces the same ids.
namespace EntityIds {

std::string sha256_hex(const std::string &material);

// "v1|cluster|<shift>|<started_at>"
std::string cluster_id(const std::string &shift_id, EpochMs started_at);

// "v1|trip|<shift>|<started_at>|<ended_at>"
std::string trip_id(const std::string &shift_id, EpochMs started_at,
                    EpochMs ended_at);

// "v1|carpool|<date>|<trip>;<trip>;..." with trip ids sorted
std::string carpool_group_id(const std::string &trip_date,
                             std::vector<std::string> trip_ids);

// "v1|ignore|<lat>|<lon>|<ignored_at>" with coordinates to 7 decimals
std::string ignored_suggestion_id(const Coordinate &centroid,
                                  EpochMs ignored_at);

// Calendar helpers (proleptic Gregorian, UTC).
EpochMs day_start_ms(const std::string &yyyy_mm_dd);
std::string format_day(EpochMs t);

} // namespace EntityIds
