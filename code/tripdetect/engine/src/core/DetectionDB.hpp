#pragma once
#include "core/GeoUtils.hpp"
#include "core/TripBuilder.hpp"
#include "models/CoreTypes.hpp"
#include "models/DetectionModel.hpp"
#include <optional>
#include <string>
#include <vector>

// Transactional store behind detection, rematch and carpool grouping.
// MySQLDetectionDB is the production implementation; tests use an in-memory
// one.
class DetectionDB {
public:
  virtual ~DetectionDB() = default;

  // Round trip to the backing store; throws on failure.
  virtual void ping() = 0;

  virtual void begin() = 0;
  virtual void commit() = 0;
  virtual void rollback() = 0;

  // ---- shifts and fixes ----------------------------------------------------
  virtual std::optional<Shift> find_shift(const std::string &shift_id) = 0;

  // Fixes of the shift captured at or after `from` (all when absent),
  // ordered by capture time.
  virtual std::vector<GpsFix>
  load_fixes(const std::string &shift_id, std::optional<EpochMs> from) = 0;

  // ---- detection rewrite ---------------------------------------------------
  // Deletes pending/processing trips (and their point links); returns count.
  virtual int delete_unconsumed_trips(const std::string &shift_id) = 0;

  // Latest point reached by the shift's remaining trips: per trip, the later
  // of its last linked fix and its end time.
  virtual std::optional<EpochMs>
  consumed_cutoff(const std::string &shift_id) = 0;

  // End of the most recent remaining trip of the shift.
  virtual std::optional<PreviousTripEnd>
  last_consumed_trip_end(const std::string &shift_id) = 0;

  // Deletes clusters starting at or after `from` (all when absent) and clears
  // their member tags; returns count.
  virtual int delete_clusters_from(const std::string &shift_id,
                                   std::optional<EpochMs> from) = 0;

  // Insert or replace by id, tagging member fixes.
  virtual void upsert_cluster(const StationaryCluster &c) = 0;

  // Insert the trip with its point links in sequence order.
  virtual void insert_trip(const Trip &t) = 0;

  // ---- locations -----------------------------------------------------------
  virtual std::vector<Location> active_locations() = 0;
  virtual std::optional<Location> find_location(const std::string &id) = 0;

  // ---- rematch candidates --------------------------------------------------
  // Endpoints with no location and no manual assignment inside the box.
  virtual std::vector<TripEndpointRow>
  unmatched_endpoints_in_bbox(TripEndpoint which, const GeoUtils::BBox &box) = 0;

  // Endpoints auto-assigned to the location.
  virtual std::vector<TripEndpointRow>
  auto_endpoints_at(TripEndpoint which, const std::string &location_id) = 0;

  virtual std::vector<StationaryCluster>
  unmatched_clusters_in_bbox(const GeoUtils::BBox &box) = 0;

  // Clusters auto-assigned to the location.
  virtual std::vector<StationaryCluster>
  auto_clusters_at(const std::string &location_id) = 0;

  // Fixes tagged with the cluster id.
  virtual std::vector<GpsFix> cluster_fixes(const std::string &cluster_id) = 0;

  // Conditional updates: each returns true only if it changed a row.
  // assign_*: only when the row is unassigned and not manual.
  // clear_*: only when the row is auto-assigned to `location_id`.
  virtual bool assign_endpoint(const std::string &trip_id, TripEndpoint which,
                               const std::string &location_id) = 0;
  virtual bool clear_endpoint(const std::string &trip_id, TripEndpoint which,
                              const std::string &location_id) = 0;
  virtual bool assign_cluster(const std::string &cluster_id,
                              const std::string &location_id) = 0;
  virtual bool clear_cluster(const std::string &cluster_id,
                             const std::string &location_id) = 0;

  // ---- carpools --------------------------------------------------------------
  // Driving trips with positive duration starting in [day_start, day_end).
  virtual std::vector<Trip> driving_trips_between(EpochMs day_start,
                                                  EpochMs day_end) = 0;
  virtual int delete_carpool_groups(const std::string &trip_date) = 0;
  virtual void insert_carpool_group(const CarpoolGroup &g) = 0;

  // Personal vehicle period covering the date (YYYY-MM-DD).
  virtual bool has_active_personal_vehicle(const std::string &employee_id,
                                           const std::string &trip_date) = 0;
  virtual std::optional<std::string>
  employee_name(const std::string &employee_id) = 0;

  // ---- suggested locations -------------------------------------------------
  // Clusters with no location that were not dismissed one by one.
  virtual std::vector<StationaryCluster> suggestion_candidates() = 0;
  virtual std::vector<IgnoredSuggestion> ignored_suggestions() = 0;
  virtual void insert_ignored_suggestion(const IgnoredSuggestion &s) = 0;
  // Dismisses one cluster by id; the mark outlives re-detection because
  // cluster ids are deterministic. False when the cluster is unknown or
  // already dismissed.
  virtual bool ignore_cluster(const std::string &cluster_id) = 0;
};
