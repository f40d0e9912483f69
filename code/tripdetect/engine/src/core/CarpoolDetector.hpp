#pragma once
#include "core/ShiftLocks.hpp"
#include "models/DetectionModel.hpp"
#include "models/params.hpp"
#include <optional>
#include <string>
#include <vector>

class DetectionDB;

struct CarpoolSummary {
  std::string group_id;
  int member_count = 0;
  std::optional<std::string> driver_employee_id;
  bool review_needed = false;
};

// Disjoint-set forest over element indices (path halving, union by size).
class UnionFind {
public:
  explicit UnionFind(size_t n);
  size_t find(size_t x);
  void unite(size_t a, size_t b);

private:
  std::vector<size_t> parent_;
  std::vector<size_t> size_;
};

// Daily batch: groups simultaneous driving trips of different employees that
// start and end at the same places, then picks a driver from vehicle periods.
class CarpoolDetector {
public:
  CarpoolDetector(ShiftLocks &locks, CarpoolParams p = {})
      : locks_(locks), P(p) {}

  // Replaces every carpool group of `trip_date` (YYYY-MM-DD, UTC).
  std::vector<CarpoolSummary> detect(DetectionDB &db,
                                     const std::string &trip_date) const;

  // Pair test on two trips (different employees, close endpoints, enough
  // temporal overlap of the shorter trip).
  bool is_pair(const Trip &a, const Trip &b) const;

  // Groups of >= 2 trip indices, each sorted, in order of first index.
  std::vector<std::vector<size_t>>
  group_trips(const std::vector<Trip> &trips) const;

private:
  ShiftLocks &locks_;
  CarpoolParams P;

  CarpoolGroup build_group(DetectionDB &db, const std::string &trip_date,
                           const std::vector<Trip> &trips,
                           const std::vector<size_t> &members) const;
};
