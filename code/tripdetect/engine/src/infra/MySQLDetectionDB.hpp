#pragma once
#include "core/DetectionDB.hpp"
#include <mysql/mysql.h>
#include <string>

class MySQLDetectionDB final : public DetectionDB {
public:
  // uri: "tcp://host:port" or "host:port" or "host"
  MySQLDetectionDB(const std::string &uri, const std::string &user,
                   const std::string &pass, const std::string &schema);
  ~MySQLDetectionDB();

  MySQLDetectionDB(const MySQLDetectionDB &) = delete;
  MySQLDetectionDB &operator=(const MySQLDetectionDB &) = delete;

  void ping() override;

  void begin() override;
  void commit() override;
  void rollback() override;

  std::optional<Shift> find_shift(const std::string &shift_id) override;
  std::vector<GpsFix> load_fixes(const std::string &shift_id,
                                 std::optional<EpochMs> from) override;

  int delete_unconsumed_trips(const std::string &shift_id) override;
  std::optional<EpochMs> consumed_cutoff(const std::string &shift_id) override;
  std::optional<PreviousTripEnd>
  last_consumed_trip_end(const std::string &shift_id) override;
  int delete_clusters_from(const std::string &shift_id,
                           std::optional<EpochMs> from) override;
  void upsert_cluster(const StationaryCluster &c) override;
  void insert_trip(const Trip &t) override;

  std::vector<Location> active_locations() override;
  std::optional<Location> find_location(const std::string &id) override;

  std::vector<TripEndpointRow>
  unmatched_endpoints_in_bbox(TripEndpoint which,
                              const GeoUtils::BBox &box) override;
  std::vector<TripEndpointRow>
  auto_endpoints_at(TripEndpoint which,
                    const std::string &location_id) override;
  std::vector<StationaryCluster>
  unmatched_clusters_in_bbox(const GeoUtils::BBox &box) override;
  std::vector<StationaryCluster>
  auto_clusters_at(const std::string &location_id) override;
  std::vector<GpsFix> cluster_fixes(const std::string &cluster_id) override;

  bool assign_endpoint(const std::string &trip_id, TripEndpoint which,
                       const std::string &location_id) override;
  bool clear_endpoint(const std::string &trip_id, TripEndpoint which,
                      const std::string &location_id) override;
  bool assign_cluster(const std::string &cluster_id,
                      const std::string &location_id) override;
  bool clear_cluster(const std::string &cluster_id,
                     const std::string &location_id) override;

  std::vector<Trip> driving_trips_between(EpochMs day_start,
                                          EpochMs day_end) override;
  int delete_carpool_groups(const std::string &trip_date) override;
  void insert_carpool_group(const CarpoolGroup &g) override;
  bool has_active_personal_vehicle(const std::string &employee_id,
                                   const std::string &trip_date) override;
  std::optional<std::string>
  employee_name(const std::string &employee_id) override;

  std::vector<StationaryCluster> suggestion_candidates() override;
  std::vector<IgnoredSuggestion> ignored_suggestions() override;
  void insert_ignored_suggestion(const IgnoredSuggestion &ig) override;
  bool ignore_cluster(const std::string &cluster_id) override;

private:
  MYSQL *conn_ = nullptr;
};
