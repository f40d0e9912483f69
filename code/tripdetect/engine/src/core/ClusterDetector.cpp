// DetectionStream: the cluster-first scan behind detect(shift).

#include "core/ClusterDetector.hpp"
#include "core/EntityIds.hpp"
#include <algorithm>
#include <iostream>
#include <unordered_set>

DetectionStream::DetectionStream(std::vector<GpsFix> fixes, ScanContext ctx,
                                 const LocationMatcher &matcher,
                                 DetectionParams params)
    : fixes_(std::move(fixes)), ctx_(std::move(ctx)), matcher_(matcher),
      builder_(matcher, params), params_(params), state_(Idle{}) {
  fold_.previous_trip_end = ctx_.previous_trip_end;
}

std::optional<DetectionEvent> DetectionStream::next() {
  while (pending_.empty() && !finished_) {
    if (cursor_ < fixes_.size()) {
      step(fixes_[cursor_++]);
    } else {
      finish();
      finished_ = true;
    }
  }
  if (pending_.empty())
    return std::nullopt;
  DetectionEvent ev = std::move(pending_.front());
  pending_.pop_front();
  return ev;
}

std::vector<DetectionEvent> DetectionStream::collect() {
  std::vector<DetectionEvent> out;
  while (auto ev = next())
    out.push_back(std::move(*ev));
  return out;
}

// ---- fix predicates --------------------------------------------------------

double DetectionStream::fix_accuracy(const GpsFix &fix) const {
  return fix.accuracy.value_or(params_.default_accuracy_m);
}

bool DetectionStream::is_stopped(const GpsFix &fix) const {
  return (fix.speed && *fix.speed < params_.stop_speed_mps) ||
         fix.activity == "still";
}

bool DetectionStream::is_slow_mover(const GpsFix &fix) const {
  return fix.speed && *fix.speed >= params_.stop_speed_mps &&
         *fix.speed * 3.6 < params_.slow_movement_kmh;
}

bool DetectionStream::meets_dwell(const WorkingCluster &c) const {
  return static_cast<double>(c.span_ms()) >=
         params_.min_dwell_minutes * kMsPerMinute;
}

// ---- working clusters ------------------------------------------------------

DetectionStream::WorkingCluster
DetectionStream::start_cluster(const GpsFix &fix) const {
  WorkingCluster c;
  add_member(c, fix);
  return c;
}

void DetectionStream::add_member(WorkingCluster &c, const GpsFix &fix) const {
  c.members.push_back(fix);
  c.acc.add(fix.coord, fix_accuracy(fix));
}

void DetectionStream::remove_members(WorkingCluster &c,
                                     const std::vector<GpsFix> &fixes) const {
  if (fixes.empty())
    return;
  std::unordered_set<std::string> ids;
  for (const auto &f : fixes)
    ids.insert(f.id);
  auto it = std::remove_if(c.members.begin(), c.members.end(),
                           [&](const GpsFix &m) {
                             if (!ids.count(m.id))
                               return false;
                             c.acc.remove(m.coord, fix_accuracy(m));
                             return true;
                           });
  c.members.erase(it, c.members.end());
}

// Returns a discarded tentative cluster's fixes to the transit buffer.
void DetectionStream::release_tentative(const WorkingCluster &tentative) {
  auto first = tentative.members.begin();
  if (tentative.seed_in_transit && first != tentative.members.end())
    ++first;
  fold_.transit.insert(fold_.transit.end(), first, tentative.members.end());
}

std::string DetectionStream::cluster_id(const WorkingCluster &c) const {
  return EntityIds::cluster_id(ctx_.shift_id, c.started_at());
}

// ---- emission --------------------------------------------------------------

void DetectionStream::emit_cluster(const WorkingCluster &c) {
  StationaryCluster sc;
  sc.id = cluster_id(c);
  sc.shift_id = ctx_.shift_id;
  sc.employee_id = ctx_.employee_id;
  sc.centroid = c.acc.centroid();
  sc.centroid_accuracy = c.acc.accuracy();
  sc.started_at = c.started_at();
  sc.ended_at = c.last_at();
  sc.gps_point_count = static_cast<int>(c.members.size());
  sc.point_ids.reserve(c.members.size());
  for (const auto &f : c.members)
    sc.point_ids.push_back(f.id);

  if (auto m = matcher_.match_cluster(sc.centroid, sc.centroid_accuracy,
                                      c.members)) {
    sc.matched_location_id = m->location_id;
    sc.match_method = MatchMethod::Auto;
  }
  fold_.last_stop =
      TripAnchor{sc.centroid, sc.centroid_accuracy, sc.ended_at, sc.id};
  ++stats_.clusters;
  pending_.emplace_back(ClusterEvent{std::move(sc)});
}

void DetectionStream::emit_trip(const TripAnchor &departure,
                                const TripAnchor &arrival,
                                const std::vector<GpsFix> &transit) {
  TripRejection why = TripRejection::None;
  auto trip =
      builder_.finalize_trip(ctx_.shift_id, ctx_.employee_id, departure,
                             arrival, transit, fold_.previous_trip_end, &why);
  if (!trip) {
    ++stats_.trips_rejected;
    std::cout << "[DEBUG] trip candidate rejected (" << TripRejectionToString(why)
              << ") shift=" << ctx_.shift_id << "\n";
    return;
  }
  fold_.previous_trip_end = PreviousTripEnd{trip->end, trip->end_location_id};
  fold_.last_stop = arrival;
  ++stats_.trips;
  pending_.emplace_back(TripEvent{std::move(*trip)});
}

// End of a completed shift whose current cluster never confirmed: everything
// seen after the last stop is one trip ending at the final fix.
void DetectionStream::emit_trailing_trip(const WorkingCluster &current,
                                         const WorkingCluster *tentative) {
  if (!fold_.last_stop || !fold_.previous_fix)
    return;
  const TripAnchor departure = *fold_.last_stop;

  std::vector<GpsFix> moving = fold_.transit;
  moving.insert(moving.end(), current.members.begin(), current.members.end());
  if (tentative) {
    auto first = tentative->members.begin();
    if (tentative->seed_in_transit && first != tentative->members.end())
      ++first;
    moving.insert(moving.end(), first, tentative->members.end());
  }
  moving.erase(std::remove_if(moving.begin(), moving.end(),
                              [&](const GpsFix &f) {
                                return f.captured_at <= departure.at;
                              }),
               moving.end());
  if (moving.empty())
    return;
  std::stable_sort(moving.begin(), moving.end(),
                   [](const GpsFix &a, const GpsFix &b) {
                     return a.captured_at < b.captured_at;
                   });

  const GpsFix &last = *fold_.previous_fix;
  TripAnchor arrival{last.coord, last.accuracy.value_or(0.0), last.captured_at,
                     std::nullopt};
  emit_trip(departure, arrival, moving);
  fold_.transit.clear();
}

// ---- transitions -----------------------------------------------------------

void DetectionStream::on_gap() {
  ++stats_.gaps;
  if (auto *g = std::get_if<Growing>(&state_)) {
    if (g->current.confirmed)
      emit_cluster(g->current);
  } else if (auto *gt = std::get_if<GrowingWithTentative>(&state_)) {
    if (gt->current.confirmed)
      emit_cluster(gt->current);
  }
  state_ = Idle{};
  fold_.transit.clear();
  fold_.unclaimed.clear();
  fold_.last_stop.reset();
}

void DetectionStream::join_current(WorkingCluster &current,
                                   const GpsFix &fix) {
  add_member(current, fix);
  if (is_stopped(fix))
    fold_.unclaimed.clear();
  else if (is_slow_mover(fix))
    fold_.unclaimed.push_back(fix);

  if (!current.confirmed && meets_dwell(current))
    current.confirmed = true;
}

void DetectionStream::confirm_tentative(WorkingCluster &current,
                                        WorkingCluster &tentative) {
  TripAnchor departure{current.acc.centroid(), current.acc.accuracy(),
                       current.last_at(), std::nullopt};
  if (current.confirmed) {
    departure.cluster_id = cluster_id(current);
    emit_cluster(current);
  }

  tentative.confirmed = true;
  tentative.seed_in_transit = false;
  TripAnchor arrival{tentative.acc.centroid(), tentative.acc.accuracy(),
                     tentative.started_at(), cluster_id(tentative)};

  emit_trip(departure, arrival, fold_.transit);

  WorkingCluster promoted = std::move(tentative);
  fold_.transit.clear();
  fold_.unclaimed.clear();
  state_ = Growing{std::move(promoted)};
}

// Coherence split: a stopped fix passed the weighted join test but sits too
// far from the members' plain average. The cluster is closed without its
// trailing slow-moving joiners, which become a trip to the fix.
void DetectionStream::split(WorkingCluster &current, const GpsFix &fix) {
  ++stats_.splits;
  if (auto *gt = std::get_if<GrowingWithTentative>(&state_))
    release_tentative(gt->tentative);

  remove_members(current, fold_.unclaimed);

  std::vector<GpsFix> trip_fixes = fold_.transit;
  trip_fixes.insert(trip_fixes.end(), fold_.unclaimed.begin(),
                    fold_.unclaimed.end());
  std::stable_sort(trip_fixes.begin(), trip_fixes.end(),
                   [](const GpsFix &a, const GpsFix &b) {
                     return a.captured_at < b.captured_at;
                   });

  if (!current.members.empty()) {
    TripAnchor departure{current.acc.centroid(), current.acc.accuracy(),
                         current.last_at(), std::nullopt};
    if (current.confirmed || meets_dwell(current)) {
      departure.cluster_id = cluster_id(current);
      emit_cluster(current);
    }
    TripAnchor arrival{fix.coord, fix.accuracy.value_or(0.0), fix.captured_at,
                       std::nullopt};
    emit_trip(departure, arrival, trip_fixes);
  }

  fold_.transit.clear();
  fold_.unclaimed.clear();
  state_ = Growing{start_cluster(fix)};
}

void DetectionStream::step(const GpsFix &fix) {
  ++stats_.fixes_seen;
  if (fix.accuracy && *fix.accuracy > params_.max_accuracy_m) {
    ++stats_.fixes_dropped;
    return;
  }

  if (fold_.previous_fix &&
      static_cast<double>(fix.captured_at - fold_.previous_fix->captured_at) >
          params_.gps_gap_minutes * kMsPerMinute)
    on_gap();
  fold_.previous_fix = fix;

  if (std::holds_alternative<Idle>(state_)) {
    state_ = Growing{start_cluster(fix)};
    return;
  }

  WorkingCluster *current = nullptr;
  WorkingCluster *tentative = nullptr;
  if (auto *g = std::get_if<Growing>(&state_)) {
    current = &g->current;
  } else {
    auto &gt = std::get<GrowingWithTentative>(state_);
    current = &gt.current;
    tentative = &gt.tentative;
  }

  const double accuracy = fix_accuracy(fix);
  const double radius = params_.cluster_radius_m;

  if (GeoUtils::adjusted_distance(current->acc.centroid(), fix.coord,
                                  accuracy) <= radius) {
    if (is_stopped(fix) &&
        static_cast<int>(current->members.size()) >=
            params_.coherence_min_points) {
      const Coordinate plain = GeoUtils::unweighted_centroid(current->members);
      if (GeoUtils::adjusted_distance(plain, fix.coord, accuracy) > radius) {
        split(*current, fix);
        return;
      }
    }
    if (tentative) {
      release_tentative(*tentative);
      WorkingCluster kept = std::move(*current);
      state_ = Growing{std::move(kept)};
      current = &std::get<Growing>(state_).current;
    }
    join_current(*current, fix);
    return;
  }

  if (!tentative) {
    WorkingCluster kept = std::move(*current);
    state_ = GrowingWithTentative{std::move(kept), start_cluster(fix)};
    return;
  }

  if (GeoUtils::adjusted_distance(tentative->acc.centroid(), fix.coord,
                                  accuracy) <= radius) {
    add_member(*tentative, fix);
    if (meets_dwell(*tentative))
      confirm_tentative(*current, *tentative);
    return;
  }

  // Beyond both: the fix is in transit and seeds a fresh tentative cluster.
  release_tentative(*tentative);
  fold_.transit.push_back(fix);
  WorkingCluster fresh = start_cluster(fix);
  fresh.seed_in_transit = true;
  *tentative = std::move(fresh);
}

void DetectionStream::finish() {
  WorkingCluster *current = nullptr;
  WorkingCluster *tentative = nullptr;
  if (auto *g = std::get_if<Growing>(&state_)) {
    current = &g->current;
  } else if (auto *gt = std::get_if<GrowingWithTentative>(&state_)) {
    current = &gt->current;
    tentative = &gt->tentative;
  }
  if (!current)
    return;

  if (ctx_.status == ShiftStatus::Active) {
    // Snapshot so pending trips can reference the cluster being grown.
    if (current->confirmed)
      emit_cluster(*current);
    return;
  }

  if (!current->confirmed && meets_dwell(*current))
    current->confirmed = true;
  if (!current->confirmed) {
    emit_trailing_trip(*current, tentative);
    return;
  }
  emit_cluster(*current);

  if (tentative)
    release_tentative(*tentative);
  if (fold_.transit.empty() || !fold_.previous_fix)
    return;

  const GpsFix &last = *fold_.previous_fix;
  TripAnchor departure{current->acc.centroid(), current->acc.accuracy(),
                       current->last_at(), cluster_id(*current)};
  TripAnchor arrival{last.coord, last.accuracy.value_or(0.0), last.captured_at,
                     std::nullopt};
  emit_trip(departure, arrival, fold_.transit);
  fold_.transit.clear();
}
