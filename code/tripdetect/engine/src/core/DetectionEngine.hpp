#pragma once
#include "core/ClusterDetector.hpp"
#include "core/ShiftLocks.hpp"
#include "models/CoreTypes.hpp"
#include "models/DetectionModel.hpp"
#include "models/params.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Trip detection entry point: DetectionEngine class
//------------------------------------------------------------------------------
class DetectionDB;

class ShiftNotFoundError : public std::runtime_error {
public:
  explicit ShiftNotFoundError(const std::string &shift_id)
      : std::runtime_error("Shift not found: " + shift_id) {}
};

struct DetectionResult {
  std::string shift_id;
  ShiftStatus status = ShiftStatus::Completed;
  std::optional<EpochMs> cutoff; // where the consumed trips end
  int deleted_trips = 0;
  int deleted_clusters = 0;
  std::vector<StationaryCluster> clusters;
  std::vector<Trip> trips;
  ScanStats stats;
};

class DetectionEngine {
public:
  explicit DetectionEngine(ShiftLocks &locks, DetectionParams p = {})
      : locks_(locks), P(p) {}

  const DetectionParams &params() const noexcept { return P; }

  // Rewrites the shift's clusters and unconsumed trips from its fixes in one
  // transaction. Throws ShiftNotFoundError for an unknown shift; any other
  // failure rolls back and propagates.
  DetectionResult detect(DetectionDB &db, const std::string &shift_id) const;

private:
  ShiftLocks &locks_;
  DetectionParams P;

  DetectionResult run(DetectionDB &db, const Shift &shift) const;
};
