// DetectionEngine loads a shift, rewinds its derived rows to the last
// consumed trip and replays the cluster scan over the remaining fixes.

#include "core/DetectionEngine.hpp"

#include "core/DetectionDB.hpp"
#include "core/LocationMatcher.hpp"
#include <iostream>
#include <type_traits>

DetectionResult DetectionEngine::detect(DetectionDB &db,
                                        const std::string &shift_id) const {
  auto shift_mutex = locks_.for_shift(shift_id);
  std::lock_guard<std::mutex> shift_lock(*shift_mutex);
  std::shared_lock<std::shared_mutex> gate(locks_.carpool_gate());

  std::optional<Shift> shift = db.find_shift(shift_id);
  if (!shift)
    throw ShiftNotFoundError(shift_id);

  db.begin();
  try {
    DetectionResult out = run(db, *shift);
    db.commit();
    std::cout << "[INFO] detect shift=" << shift_id << " ("
              << ShiftStatusToString(out.status)
              << ") clusters=" << out.clusters.size()
              << " trips=" << out.trips.size()
              << " rejected=" << out.stats.trips_rejected << "\n";
    return out;
  } catch (const std::exception &e) {
    std::cerr << "[detect] shift " << shift_id
              << " rolled back: " << e.what() << "\n";
    db.rollback();
    throw;
  }
}

DetectionResult DetectionEngine::run(DetectionDB &db,
                                     const Shift &shift) const {
  DetectionResult out;
  out.shift_id = shift.id;
  out.status = shift.status;

  // 1) Rewind: pending/processing trips go, consumed ones pin the cutoff.
  out.deleted_trips = db.delete_unconsumed_trips(shift.id);
  out.cutoff = db.consumed_cutoff(shift.id);
  out.deleted_clusters = db.delete_clusters_from(shift.id, out.cutoff);

  ScanContext ctx;
  ctx.shift_id = shift.id;
  ctx.employee_id = shift.employee_id;
  ctx.status = shift.status;
  if (out.cutoff)
    ctx.previous_trip_end = db.last_consumed_trip_end(shift.id);

  // 2) Replay the scan over the fixes from the cutoff on.
  LocationMatcher matcher(db.active_locations(), P);
  DetectionStream stream(db.load_fixes(shift.id, out.cutoff), ctx, matcher, P);

  while (auto ev = stream.next()) {
    std::visit(
        [&](auto &&e) {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, ClusterEvent>) {
            db.upsert_cluster(e.cluster);
            out.clusters.push_back(std::move(e.cluster));
          } else {
            db.insert_trip(e.trip);
            out.trips.push_back(std::move(e.trip));
          }
        },
        *ev);
  }
  out.stats = stream.stats();
  return out;
}
