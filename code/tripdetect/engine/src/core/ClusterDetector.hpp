#pragma once
#include "core/GeoUtils.hpp"
#include "core/LocationMatcher.hpp"
#include "core/TripBuilder.hpp"
#include "models/CoreTypes.hpp"
#include "models/DetectionModel.hpp"
#include "models/params.hpp"
#include <deque>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Stationary cluster detector
//
// Single left-to-right pass over a shift's fixes. Stops are grown as
// accuracy-weighted clusters; a second (tentative) cluster forming away from
// the current one is promoted once it spans the dwell threshold, closing the
// current cluster and producing one trip out of the fixes seen in between.
//------------------------------------------------------------------------------

struct ClusterEvent {
  StationaryCluster cluster;
};

struct TripEvent {
  Trip trip;
};

using DetectionEvent = std::variant<ClusterEvent, TripEvent>;

struct ScanContext {
  std::string shift_id;
  std::string employee_id;
  ShiftStatus status = ShiftStatus::Completed;
  // End of the last trip already handed to the road matcher, if any.
  std::optional<PreviousTripEnd> previous_trip_end;
};

struct ScanStats {
  int fixes_seen = 0;
  int fixes_dropped = 0; // above the accuracy ceiling
  int gaps = 0;
  int splits = 0;
  int clusters = 0;
  int trips = 0;
  int trips_rejected = 0;
};

// Lazy, finite, non-restartable stream of detection events. Events are
// produced in the order their objects are finalized; a trip referencing its
// arrival cluster is yielded before that cluster closes.
class DetectionStream {
public:
  DetectionStream(std::vector<GpsFix> fixes, ScanContext ctx,
                  const LocationMatcher &matcher, DetectionParams params = {});

  // Next finalized event, or nullopt once the input is exhausted.
  std::optional<DetectionEvent> next();

  // Drains the remaining events.
  std::vector<DetectionEvent> collect();

  const ScanStats &stats() const noexcept { return stats_; }
  const std::optional<PreviousTripEnd> &previous_trip_end() const noexcept {
    return fold_.previous_trip_end;
  }

private:
  struct WorkingCluster {
    std::vector<GpsFix> members;
    CentroidAccumulator acc;
    bool confirmed = false;
    // Seed fix already copied to the transit buffer when this tentative
    // cluster was started from a fix that broke the previous one.
    bool seed_in_transit = false;

    EpochMs started_at() const { return members.front().captured_at; }
    EpochMs last_at() const { return members.back().captured_at; }
    EpochMs span_ms() const {
      return members.empty() ? 0 : last_at() - started_at();
    }
  };

  struct Idle {};
  struct Growing {
    WorkingCluster current;
  };
  struct GrowingWithTentative {
    WorkingCluster current;
    WorkingCluster tentative;
  };
  using ScanState = std::variant<Idle, Growing, GrowingWithTentative>;

  struct Fold {
    std::vector<GpsFix> transit;
    std::vector<GpsFix> unclaimed;
    std::optional<PreviousTripEnd> previous_trip_end;
    std::optional<GpsFix> previous_fix;
    // Where the shift was last known to stand still: the latest emitted
    // cluster or accepted trip arrival since the last gap.
    std::optional<TripAnchor> last_stop;
  };

  void step(const GpsFix &fix);
  void finish();

  void on_gap();
  void join_current(WorkingCluster &current, const GpsFix &fix);
  void confirm_tentative(WorkingCluster &current, WorkingCluster &tentative);
  void split(WorkingCluster &current, const GpsFix &fix);

  WorkingCluster start_cluster(const GpsFix &fix) const;
  void add_member(WorkingCluster &c, const GpsFix &fix) const;
  void remove_members(WorkingCluster &c,
                      const std::vector<GpsFix> &fixes) const;
  void release_tentative(const WorkingCluster &tentative);

  double fix_accuracy(const GpsFix &fix) const;
  bool is_stopped(const GpsFix &fix) const;
  bool is_slow_mover(const GpsFix &fix) const;
  bool meets_dwell(const WorkingCluster &c) const;

  std::string cluster_id(const WorkingCluster &c) const;
  void emit_cluster(const WorkingCluster &c);
  void emit_trip(const TripAnchor &departure, const TripAnchor &arrival,
                 const std::vector<GpsFix> &transit);
  void emit_trailing_trip(const WorkingCluster &current,
                          const WorkingCluster *tentative);

  std::vector<GpsFix> fixes_;
  size_t cursor_ = 0;
  bool finished_ = false;

  ScanContext ctx_;
  const LocationMatcher &matcher_;
  TripBuilder builder_;
  DetectionParams params_;

  ScanState state_;
  Fold fold_;
  std::deque<DetectionEvent> pending_;
  ScanStats stats_;
};
