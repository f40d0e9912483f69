// MySQLDetectionDB stores fixes, clusters, trips and carpool groups through
// the MySQL C API (prepared statements only). Schema: sql/schema.sql.

#include "MySQLDetectionDB.hpp"
#include <cstring>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace {

// MySQL 8 declares the null/error flags as bool, MariaDB as my_bool.
using mysql_flag = std::remove_pointer_t<decltype(MYSQL_BIND::is_null)>;

constexpr unsigned long kCellBytes = 1024;
constexpr EpochMs kNoCutoff = std::numeric_limits<EpochMs>::min();

struct Param {
  enum class Kind { Null, Int, Double, Text } kind = Kind::Null;
  long long i = 0;
  double d = 0.0;
  std::string s;

  static Param null() { return Param{}; }
  static Param integer(long long v) {
    Param p;
    p.kind = Kind::Int;
    p.i = v;
    return p;
  }
  static Param real(double v) {
    Param p;
    p.kind = Kind::Double;
    p.d = v;
    return p;
  }
  static Param text(std::string v) {
    Param p;
    p.kind = Kind::Text;
    p.s = std::move(v);
    return p;
  }
  static Param nullable(const std::optional<std::string> &v) {
    return v ? text(*v) : null();
  }
};

using Row = std::vector<std::optional<std::string>>;

// Owns one prepared statement. Parameters are rebound on every run so a
// statement can be reused across a loop of inserts.
class Statement {
public:
  Statement(MYSQL *conn, const std::string &sql)
      : stmt_(mysql_stmt_init(conn)) {
    if (!stmt_)
      throw std::runtime_error("mysql_stmt_init failed");
    if (mysql_stmt_prepare(stmt_, sql.c_str(), sql.size()))
      fail();
  }
  ~Statement() { mysql_stmt_close(stmt_); }
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  // Returns the number of rows changed.
  unsigned long long execute(std::vector<Param> params) {
    bind(params);
    if (mysql_stmt_execute(stmt_))
      fail();
    return mysql_stmt_affected_rows(stmt_);
  }

  std::vector<Row> query(std::vector<Param> params) {
    bind(params);
    if (mysql_stmt_execute(stmt_))
      fail();

    MYSQL_RES *meta = mysql_stmt_result_metadata(stmt_);
    if (!meta)
      fail();
    const unsigned cols = mysql_num_fields(meta);
    mysql_free_result(meta);

    std::vector<std::vector<char>> cells(cols, std::vector<char>(kCellBytes));
    std::vector<unsigned long> lengths(cols, 0);
    std::unique_ptr<mysql_flag[]> nulls(new mysql_flag[cols]());
    std::unique_ptr<mysql_flag[]> errors(new mysql_flag[cols]());
    std::vector<MYSQL_BIND> out(cols);
    std::memset(out.data(), 0, sizeof(MYSQL_BIND) * cols);
    for (unsigned c = 0; c < cols; ++c) {
      out[c].buffer_type = MYSQL_TYPE_STRING;
      out[c].buffer = cells[c].data();
      out[c].buffer_length = kCellBytes;
      out[c].length = &lengths[c];
      out[c].is_null = &nulls[c];
      out[c].error = &errors[c];
    }
    if (mysql_stmt_bind_result(stmt_, out.data()))
      fail();
    if (mysql_stmt_store_result(stmt_))
      fail();

    std::vector<Row> rows;
    for (;;) {
      const int rc = mysql_stmt_fetch(stmt_);
      if (rc == MYSQL_NO_DATA)
        break;
      if (rc == MYSQL_DATA_TRUNCATED) {
        mysql_stmt_free_result(stmt_);
        throw std::runtime_error("column value exceeds fetch buffer");
      }
      if (rc != 0)
        fail();
      Row r(cols);
      for (unsigned c = 0; c < cols; ++c)
        if (!nulls[c])
          r[c] = std::string(cells[c].data(), lengths[c]);
      rows.push_back(std::move(r));
    }
    mysql_stmt_free_result(stmt_);
    return rows;
  }

private:
  [[noreturn]] void fail() {
    throw std::runtime_error(mysql_stmt_error(stmt_));
  }

  void bind(std::vector<Param> &params) {
    if (mysql_stmt_param_count(stmt_) != params.size())
      throw std::runtime_error("parameter count mismatch");
    binds_.assign(params.size(), MYSQL_BIND{});
    if (!params.empty())
      std::memset(binds_.data(), 0, sizeof(MYSQL_BIND) * params.size());
    lengths_.assign(params.size(), 0);
    for (size_t k = 0; k < params.size(); ++k) {
      Param &p = params[k];
      MYSQL_BIND &b = binds_[k];
      switch (p.kind) {
      case Param::Kind::Null:
        b.buffer_type = MYSQL_TYPE_NULL;
        break;
      case Param::Kind::Int:
        b.buffer_type = MYSQL_TYPE_LONGLONG;
        b.buffer = &p.i;
        break;
      case Param::Kind::Double:
        b.buffer_type = MYSQL_TYPE_DOUBLE;
        b.buffer = &p.d;
        break;
      case Param::Kind::Text:
        b.buffer_type = MYSQL_TYPE_STRING;
        b.buffer = (void *)p.s.data();
        lengths_[k] = p.s.size();
        b.buffer_length = lengths_[k];
        b.length = &lengths_[k];
        break;
      }
    }
    if (!params.empty() && mysql_stmt_bind_param(stmt_, binds_.data()))
      fail();
  }

  MYSQL_STMT *stmt_;
  std::vector<MYSQL_BIND> binds_;
  std::vector<unsigned long> lengths_;
};

// ---- column conversion -----------------------------------------------------

const std::string &req(const std::optional<std::string> &v) {
  if (!v)
    throw std::runtime_error("unexpected NULL column");
  return *v;
}
double to_double(const std::optional<std::string> &v) {
  return std::stod(req(v));
}
long long to_ll(const std::optional<std::string> &v) {
  return std::stoll(req(v));
}
std::optional<double> opt_double(const std::optional<std::string> &v) {
  return v ? std::optional<double>(std::stod(*v)) : std::nullopt;
}

const char *kFixCols = "id, shift_id, employee_id, latitude, longitude, "
                       "accuracy, speed, heading, altitude, activity, "
                       "captured_at, is_mocked";

GpsFix fix_from_row(const Row &r) {
  GpsFix f;
  f.id = req(r[0]);
  f.shift_id = req(r[1]);
  f.employee_id = req(r[2]);
  f.coord = {to_double(r[3]), to_double(r[4])};
  f.accuracy = opt_double(r[5]);
  f.speed = opt_double(r[6]);
  f.heading = opt_double(r[7]);
  f.altitude = opt_double(r[8]);
  f.activity = r[9].value_or("");
  f.captured_at = to_ll(r[10]);
  f.is_mocked = r[11] && *r[11] != "0";
  return f;
}

const char *kClusterCols =
    "id, shift_id, employee_id, centroid_latitude, centroid_longitude, "
    "centroid_accuracy, started_at, ended_at, gps_point_count, "
    "matched_location_id, match_method";

StationaryCluster cluster_from_row(const Row &r) {
  StationaryCluster c;
  c.id = req(r[0]);
  c.shift_id = req(r[1]);
  c.employee_id = req(r[2]);
  c.centroid = {to_double(r[3]), to_double(r[4])};
  c.centroid_accuracy = opt_double(r[5]).value_or(0.0);
  c.started_at = to_ll(r[6]);
  c.ended_at = to_ll(r[7]);
  c.gps_point_count = static_cast<int>(to_ll(r[8]));
  c.matched_location_id = r[9];
  c.match_method = MatchMethodFromString(r[10].value_or(""));
  return c;
}

const char *kTripCols =
    "id, shift_id, employee_id, started_at, ended_at, start_latitude, "
    "start_longitude, end_latitude, end_longitude, distance_km, "
    "duration_minutes, transport_mode, match_status, start_location_id, "
    "end_location_id";

Trip trip_from_row(const Row &r) {
  Trip t;
  t.id = req(r[0]);
  t.shift_id = req(r[1]);
  t.employee_id = req(r[2]);
  t.started_at = to_ll(r[3]);
  t.ended_at = to_ll(r[4]);
  t.start = {to_double(r[5]), to_double(r[6])};
  t.end = {to_double(r[7]), to_double(r[8])};
  t.distance_km = to_double(r[9]);
  t.duration_minutes = static_cast<int>(to_ll(r[10]));
  t.transport_mode = TransportModeFromString(r[11].value_or(""));
  t.match_status = MatchStatusFromString(r[12].value_or(""));
  t.start_location_id = r[13];
  t.end_location_id = r[14];
  return t;
}

Location location_from_row(const Row &r) {
  Location l;
  l.id = req(r[0]);
  l.name = r[1].value_or("");
  l.center = {to_double(r[2]), to_double(r[3])};
  l.radius_m = to_double(r[4]);
  l.is_active = r[5] && *r[5] != "0";
  return l;
}

const char *kLocationCols =
    "id, name, latitude, longitude, radius_meters, is_active";

// Endpoint projection: coordinate plus accuracy of the first (start) or last
// (end) linked fix.
std::string endpoint_select(TripEndpoint which) {
  const std::string side = TripEndpointToString(which);
  const std::string order = which == TripEndpoint::Start ? "ASC" : "DESC";
  return "SELECT t.id, t." + side + "_latitude, t." + side +
         "_longitude, COALESCE((SELECT gp.accuracy FROM trip_gps_points tgp "
         "JOIN gps_points gp ON gp.id = tgp.gps_point_id "
         "WHERE tgp.trip_id = t.id ORDER BY tgp.sequence_order " +
         order + " LIMIT 1), 0), t." + side + "_location_id, t." + side +
         "_location_match_method FROM trips t ";
}

TripEndpointRow endpoint_from_row(const Row &r) {
  TripEndpointRow e;
  e.trip_id = req(r[0]);
  e.coord = {to_double(r[1]), to_double(r[2])};
  e.accuracy = to_double(r[3]);
  e.location_id = r[4];
  e.match_method = MatchMethodFromString(r[5].value_or(""));
  return e;
}

} // namespace

// Establish connection using URI and credentials
MySQLDetectionDB::MySQLDetectionDB(const std::string &uri,
                                   const std::string &user,
                                   const std::string &pass,
                                   const std::string &schema) {
  conn_ = mysql_init(nullptr);
  if (!conn_)
    throw std::runtime_error("mysql_init failed");
  std::string host = uri, port = "3306";
  if (auto pos = uri.find("://"); pos != std::string::npos) {
    host = uri.substr(pos + 3);
  }
  if (auto p = host.find(':'); p != std::string::npos) {
    port = host.substr(p + 1);
    host = host.substr(0, p);
  }
  if (!mysql_real_connect(conn_, host.c_str(), user.c_str(), pass.c_str(),
                          schema.c_str(), std::stoi(port), nullptr, 0)) {
    std::string err = mysql_error(conn_);
    mysql_close(conn_);
    throw std::runtime_error("connect failed: " + err);
  }
}

MySQLDetectionDB::~MySQLDetectionDB() { mysql_close(conn_); }

void MySQLDetectionDB::ping() {
  if (mysql_ping(conn_))
    throw std::runtime_error(mysql_error(conn_));
}

void MySQLDetectionDB::begin() {
  if (mysql_query(conn_, "START TRANSACTION"))
    throw std::runtime_error(mysql_error(conn_));
}

void MySQLDetectionDB::commit() {
  if (mysql_query(conn_, "COMMIT"))
    throw std::runtime_error(mysql_error(conn_));
}

void MySQLDetectionDB::rollback() {
  if (mysql_query(conn_, "ROLLBACK"))
    throw std::runtime_error(mysql_error(conn_));
}

// ---- shifts and fixes --------------------------------------------------------

std::optional<Shift> MySQLDetectionDB::find_shift(const std::string &shift_id) {
  Statement st(conn_, R"SQL(
      SELECT id, employee_id, status, clocked_in_at, clocked_out_at,
             clock_in_latitude, clock_in_longitude,
             clock_out_latitude, clock_out_longitude
      FROM shifts WHERE id = ?
    )SQL");
  auto rows = st.query({Param::text(shift_id)});
  if (rows.empty())
    return std::nullopt;
  const Row &r = rows.front();
  Shift s;
  s.id = req(r[0]);
  s.employee_id = req(r[1]);
  s.status = ShiftStatusFromString(r[2].value_or(""));
  s.clocked_in_at = to_ll(r[3]);
  if (r[4])
    s.clocked_out_at = to_ll(r[4]);
  if (r[5] && r[6])
    s.clock_in_location = Coordinate{to_double(r[5]), to_double(r[6])};
  if (r[7] && r[8])
    s.clock_out_location = Coordinate{to_double(r[7]), to_double(r[8])};
  return s;
}

std::vector<GpsFix> MySQLDetectionDB::load_fixes(const std::string &shift_id,
                                                 std::optional<EpochMs> from) {
  Statement st(conn_, std::string("SELECT ") + kFixCols +
                          " FROM gps_points WHERE shift_id = ? AND "
                          "captured_at >= ? ORDER BY captured_at ASC, id ASC");
  auto rows = st.query(
      {Param::text(shift_id), Param::integer(from.value_or(kNoCutoff))});
  std::vector<GpsFix> out;
  out.reserve(rows.size());
  for (const auto &r : rows)
    out.push_back(fix_from_row(r));
  return out;
}

// ---- detection rewrite -------------------------------------------------------

int MySQLDetectionDB::delete_unconsumed_trips(const std::string &shift_id) {
  Statement links(conn_, R"SQL(
      DELETE tgp FROM trip_gps_points tgp
      JOIN trips t ON t.id = tgp.trip_id
      WHERE t.shift_id = ? AND t.match_status IN ('pending', 'processing')
    )SQL");
  links.execute({Param::text(shift_id)});

  Statement trips(conn_, R"SQL(
      DELETE FROM trips
      WHERE shift_id = ? AND match_status IN ('pending', 'processing')
    )SQL");
  return static_cast<int>(trips.execute({Param::text(shift_id)}));
}

std::optional<EpochMs>
MySQLDetectionDB::consumed_cutoff(const std::string &shift_id) {
  Statement st(conn_, R"SQL(
      SELECT MAX(GREATEST(COALESCE(pt.last_at, t.started_at), t.ended_at))
      FROM trips t
      LEFT JOIN (
        SELECT tgp.trip_id, MAX(gp.captured_at) AS last_at
        FROM trip_gps_points tgp
        JOIN gps_points gp ON gp.id = tgp.gps_point_id
        GROUP BY tgp.trip_id
      ) pt ON pt.trip_id = t.id
      WHERE t.shift_id = ?
    )SQL");
  auto rows = st.query({Param::text(shift_id)});
  if (rows.empty() || !rows.front()[0])
    return std::nullopt;
  return to_ll(rows.front()[0]);
}

std::optional<PreviousTripEnd>
MySQLDetectionDB::last_consumed_trip_end(const std::string &shift_id) {
  Statement st(conn_, R"SQL(
      SELECT end_latitude, end_longitude, end_location_id
      FROM trips WHERE shift_id = ?
      ORDER BY ended_at DESC LIMIT 1
    )SQL");
  auto rows = st.query({Param::text(shift_id)});
  if (rows.empty())
    return std::nullopt;
  const Row &r = rows.front();
  return PreviousTripEnd{{to_double(r[0]), to_double(r[1])}, r[2]};
}

int MySQLDetectionDB::delete_clusters_from(const std::string &shift_id,
                                           std::optional<EpochMs> from) {
  const EpochMs start = from.value_or(kNoCutoff);
  Statement untag(conn_, R"SQL(
      UPDATE gps_points gp
      JOIN stationary_clusters sc ON sc.id = gp.stationary_cluster_id
      SET gp.stationary_cluster_id = NULL
      WHERE sc.shift_id = ? AND sc.started_at >= ?
    )SQL");
  untag.execute({Param::text(shift_id), Param::integer(start)});

  Statement del(conn_, R"SQL(
      DELETE FROM stationary_clusters WHERE shift_id = ? AND started_at >= ?
    )SQL");
  return static_cast<int>(
      del.execute({Param::text(shift_id), Param::integer(start)}));
}

void MySQLDetectionDB::upsert_cluster(const StationaryCluster &c) {
  Statement st(conn_, R"SQL(
      INSERT INTO stationary_clusters
        (id, shift_id, employee_id, centroid_latitude, centroid_longitude,
         centroid_accuracy, started_at, ended_at, duration_seconds,
         gps_point_count, matched_location_id, match_method)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
      ON DUPLICATE KEY UPDATE
        centroid_latitude = VALUES(centroid_latitude),
        centroid_longitude = VALUES(centroid_longitude),
        centroid_accuracy = VALUES(centroid_accuracy),
        ended_at = VALUES(ended_at),
        duration_seconds = VALUES(duration_seconds),
        gps_point_count = VALUES(gps_point_count),
        matched_location_id = VALUES(matched_location_id),
        match_method = VALUES(match_method)
    )SQL");
  st.execute({Param::text(c.id), Param::text(c.shift_id),
              Param::text(c.employee_id), Param::real(c.centroid.lat),
              Param::real(c.centroid.lon), Param::real(c.centroid_accuracy),
              Param::integer(c.started_at), Param::integer(c.ended_at),
              Param::integer(c.duration_seconds()),
              Param::integer(c.gps_point_count),
              Param::nullable(c.matched_location_id),
              c.match_method == MatchMethod::None
                  ? Param::null()
                  : Param::text(MatchMethodToString(c.match_method))});

  Statement tag(conn_,
                "UPDATE gps_points SET stationary_cluster_id = ? WHERE id = ?");
  for (const auto &pid : c.point_ids)
    tag.execute({Param::text(c.id), Param::text(pid)});
}

void MySQLDetectionDB::insert_trip(const Trip &t) {
  auto method = [](MatchMethod m) {
    return m == MatchMethod::None ? Param::null()
                                  : Param::text(MatchMethodToString(m));
  };
  Statement st(conn_, R"SQL(
      INSERT INTO trips
        (id, shift_id, employee_id, started_at, ended_at,
         start_latitude, start_longitude, end_latitude, end_longitude,
         start_accuracy, end_accuracy, distance_km, duration_minutes,
         classification, transport_mode, confidence_score, gps_point_count,
         low_accuracy_segments, detection_method, start_cluster_id,
         end_cluster_id, start_location_id, end_location_id,
         start_location_match_method, end_location_match_method, match_status)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?,
              ?, ?, ?, ?)
    )SQL");
  st.execute({Param::text(t.id), Param::text(t.shift_id),
              Param::text(t.employee_id), Param::integer(t.started_at),
              Param::integer(t.ended_at), Param::real(t.start.lat),
              Param::real(t.start.lon), Param::real(t.end.lat),
              Param::real(t.end.lon), Param::real(t.start_accuracy),
              Param::real(t.end_accuracy), Param::real(t.distance_km),
              Param::integer(t.duration_minutes),
              Param::text(TripClassificationToString(t.classification)),
              Param::text(TransportModeToString(t.transport_mode)),
              Param::real(t.confidence_score),
              Param::integer(t.gps_point_count),
              Param::integer(t.low_accuracy_segments),
              Param::text(t.detection_method), Param::nullable(t.start_cluster_id),
              Param::nullable(t.end_cluster_id), Param::nullable(t.start_location_id),
              Param::nullable(t.end_location_id),
              method(t.start_location_match_method),
              method(t.end_location_match_method),
              Param::text(MatchStatusToString(t.match_status))});

  Statement link(conn_, R"SQL(
      INSERT IGNORE INTO trip_gps_points (trip_id, gps_point_id, sequence_order)
      VALUES (?, ?, ?)
    )SQL");
  for (size_t i = 0; i < t.point_ids.size(); ++i)
    link.execute({Param::text(t.id), Param::text(t.point_ids[i]),
                  Param::integer(static_cast<long long>(i + 1))});
}

// ---- locations ---------------------------------------------------------------

std::vector<Location> MySQLDetectionDB::active_locations() {
  Statement st(conn_, std::string("SELECT ") + kLocationCols +
                          " FROM locations WHERE is_active = 1 ORDER BY id");
  std::vector<Location> out;
  for (const auto &r : st.query({}))
    out.push_back(location_from_row(r));
  return out;
}

std::optional<Location> MySQLDetectionDB::find_location(const std::string &id) {
  Statement st(conn_, std::string("SELECT ") + kLocationCols +
                          " FROM locations WHERE id = ?");
  auto rows = st.query({Param::text(id)});
  if (rows.empty())
    return std::nullopt;
  return location_from_row(rows.front());
}

// ---- rematch candidates --------------------------------------------------------

std::vector<TripEndpointRow>
MySQLDetectionDB::unmatched_endpoints_in_bbox(TripEndpoint which,
                                              const GeoUtils::BBox &box) {
  const std::string side = TripEndpointToString(which);
  Statement st(conn_, endpoint_select(which) + "WHERE t." + side +
                          "_location_id IS NULL AND COALESCE(t." + side +
                          "_location_match_method, '') <> 'manual' AND t." +
                          side + "_latitude BETWEEN ? AND ? AND t." + side +
                          "_longitude BETWEEN ? AND ?");
  std::vector<TripEndpointRow> out;
  for (const auto &r :
       st.query({Param::real(box.min_lat), Param::real(box.max_lat),
                 Param::real(box.min_lon), Param::real(box.max_lon)}))
    out.push_back(endpoint_from_row(r));
  return out;
}

std::vector<TripEndpointRow>
MySQLDetectionDB::auto_endpoints_at(TripEndpoint which,
                                    const std::string &location_id) {
  const std::string side = TripEndpointToString(which);
  Statement st(conn_, endpoint_select(which) + "WHERE t." + side +
                          "_location_id = ? AND t." + side +
                          "_location_match_method = 'auto'");
  std::vector<TripEndpointRow> out;
  for (const auto &r : st.query({Param::text(location_id)}))
    out.push_back(endpoint_from_row(r));
  return out;
}

std::vector<StationaryCluster>
MySQLDetectionDB::unmatched_clusters_in_bbox(const GeoUtils::BBox &box) {
  Statement st(conn_, std::string("SELECT ") + kClusterCols +
                          " FROM stationary_clusters WHERE matched_location_id "
                          "IS NULL AND centroid_latitude BETWEEN ? AND ? AND "
                          "centroid_longitude BETWEEN ? AND ?");
  std::vector<StationaryCluster> out;
  for (const auto &r :
       st.query({Param::real(box.min_lat), Param::real(box.max_lat),
                 Param::real(box.min_lon), Param::real(box.max_lon)}))
    out.push_back(cluster_from_row(r));
  return out;
}

std::vector<StationaryCluster>
MySQLDetectionDB::auto_clusters_at(const std::string &location_id) {
  Statement st(conn_, std::string("SELECT ") + kClusterCols +
                          " FROM stationary_clusters WHERE matched_location_id "
                          "= ? AND match_method = 'auto'");
  std::vector<StationaryCluster> out;
  for (const auto &r : st.query({Param::text(location_id)}))
    out.push_back(cluster_from_row(r));
  return out;
}

std::vector<GpsFix>
MySQLDetectionDB::cluster_fixes(const std::string &cluster_id) {
  Statement st(conn_, std::string("SELECT ") + kFixCols +
                          " FROM gps_points WHERE stationary_cluster_id = ? "
                          "ORDER BY captured_at ASC");
  std::vector<GpsFix> out;
  for (const auto &r : st.query({Param::text(cluster_id)}))
    out.push_back(fix_from_row(r));
  return out;
}

bool MySQLDetectionDB::assign_endpoint(const std::string &trip_id,
                                       TripEndpoint which,
                                       const std::string &location_id) {
  const std::string side = TripEndpointToString(which);
  Statement st(conn_, "UPDATE trips SET " + side + "_location_id = ?, " +
                          side + "_location_match_method = 'auto' WHERE id = ? "
                          "AND " + side + "_location_id IS NULL AND COALESCE(" +
                          side + "_location_match_method, '') <> 'manual'");
  return st.execute({Param::text(location_id), Param::text(trip_id)}) == 1;
}

bool MySQLDetectionDB::clear_endpoint(const std::string &trip_id,
                                      TripEndpoint which,
                                      const std::string &location_id) {
  const std::string side = TripEndpointToString(which);
  Statement st(conn_, "UPDATE trips SET " + side + "_location_id = NULL, " +
                          side + "_location_match_method = NULL WHERE id = ? "
                          "AND " + side + "_location_id = ? AND " + side +
                          "_location_match_method = 'auto'");
  return st.execute({Param::text(trip_id), Param::text(location_id)}) == 1;
}

bool MySQLDetectionDB::assign_cluster(const std::string &cluster_id,
                                      const std::string &location_id) {
  Statement st(conn_, R"SQL(
      UPDATE stationary_clusters
      SET matched_location_id = ?, match_method = 'auto'
      WHERE id = ? AND matched_location_id IS NULL
    )SQL");
  return st.execute({Param::text(location_id), Param::text(cluster_id)}) == 1;
}

bool MySQLDetectionDB::clear_cluster(const std::string &cluster_id,
                                     const std::string &location_id) {
  Statement st(conn_, R"SQL(
      UPDATE stationary_clusters
      SET matched_location_id = NULL, match_method = NULL
      WHERE id = ? AND matched_location_id = ? AND match_method = 'auto'
    )SQL");
  return st.execute({Param::text(cluster_id), Param::text(location_id)}) == 1;
}

// ---- carpools ----------------------------------------------------------------

std::vector<Trip> MySQLDetectionDB::driving_trips_between(EpochMs day_start,
                                                          EpochMs day_end) {
  Statement st(conn_, std::string("SELECT ") + kTripCols +
                          " FROM trips WHERE transport_mode = 'driving' AND "
                          "started_at >= ? AND started_at < ? AND "
                          "ended_at > started_at ORDER BY started_at, id");
  std::vector<Trip> out;
  for (const auto &r :
       st.query({Param::integer(day_start), Param::integer(day_end)}))
    out.push_back(trip_from_row(r));
  return out;
}

int MySQLDetectionDB::delete_carpool_groups(const std::string &trip_date) {
  Statement members(conn_, R"SQL(
      DELETE cm FROM carpool_members cm
      JOIN carpool_groups g ON g.id = cm.carpool_group_id
      WHERE g.trip_date = ?
    )SQL");
  members.execute({Param::text(trip_date)});

  Statement groups(conn_, "DELETE FROM carpool_groups WHERE trip_date = ?");
  return static_cast<int>(groups.execute({Param::text(trip_date)}));
}

void MySQLDetectionDB::insert_carpool_group(const CarpoolGroup &g) {
  Statement st(conn_, R"SQL(
      INSERT INTO carpool_groups
        (id, trip_date, status, driver_employee_id, review_needed)
      VALUES (?, ?, ?, ?, ?)
    )SQL");
  st.execute({Param::text(g.id), Param::text(g.trip_date),
              Param::text(g.status), Param::nullable(g.driver_employee_id),
              Param::integer(g.review_needed ? 1 : 0)});

  Statement member(conn_, R"SQL(
      INSERT INTO carpool_members (carpool_group_id, trip_id, employee_id, role)
      VALUES (?, ?, ?, ?)
    )SQL");
  for (const auto &m : g.members)
    member.execute({Param::text(g.id), Param::text(m.trip_id),
                    Param::text(m.employee_id),
                    Param::text(CarpoolRoleToString(m.role))});
}

bool MySQLDetectionDB::has_active_personal_vehicle(
    const std::string &employee_id, const std::string &trip_date) {
  Statement st(conn_, R"SQL(
      SELECT 1 FROM employee_vehicle_periods
      WHERE employee_id = ? AND vehicle_type = 'personal'
        AND started_on <= ? AND (ended_on IS NULL OR ended_on >= ?)
      LIMIT 1
    )SQL");
  return !st.query({Param::text(employee_id), Param::text(trip_date),
                    Param::text(trip_date)})
              .empty();
}

std::optional<std::string>
MySQLDetectionDB::employee_name(const std::string &employee_id) {
  Statement st(conn_, "SELECT name FROM employees WHERE id = ?");
  auto rows = st.query({Param::text(employee_id)});
  if (rows.empty())
    return std::nullopt;
  return rows.front()[0];
}

// ---- suggested locations -------------------------------------------------------

std::vector<StationaryCluster> MySQLDetectionDB::suggestion_candidates() {
  Statement st(conn_, std::string("SELECT ") + kClusterCols +
                          " FROM stationary_clusters sc WHERE "
                          "sc.matched_location_id IS NULL AND NOT EXISTS "
                          "(SELECT 1 FROM ignored_clusters ic WHERE "
                          "ic.cluster_id = sc.id)");
  std::vector<StationaryCluster> out;
  for (const auto &r : st.query({}))
    out.push_back(cluster_from_row(r));
  return out;
}

std::vector<IgnoredSuggestion> MySQLDetectionDB::ignored_suggestions() {
  Statement st(conn_, R"SQL(
      SELECT id, centroid_latitude, centroid_longitude,
             occurrence_count_at_ignore, ignored_at
      FROM ignored_suggestions
    )SQL");
  std::vector<IgnoredSuggestion> out;
  for (const auto &r : st.query({})) {
    IgnoredSuggestion ig;
    ig.id = req(r[0]);
    ig.centroid = {to_double(r[1]), to_double(r[2])};
    ig.occurrence_count = static_cast<int>(to_ll(r[3]));
    ig.ignored_at = to_ll(r[4]);
    out.push_back(ig);
  }
  return out;
}

void MySQLDetectionDB::insert_ignored_suggestion(const IgnoredSuggestion &ig) {
  Statement st(conn_, R"SQL(
      INSERT INTO ignored_suggestions
        (id, centroid_latitude, centroid_longitude,
         occurrence_count_at_ignore, ignored_at)
      VALUES (?, ?, ?, ?, ?)
    )SQL");
  st.execute({Param::text(ig.id), Param::real(ig.centroid.lat),
              Param::real(ig.centroid.lon),
              Param::integer(ig.occurrence_count),
              Param::integer(ig.ignored_at)});
}

bool MySQLDetectionDB::ignore_cluster(const std::string &cluster_id) {
  Statement st(conn_, R"SQL(
      INSERT IGNORE INTO ignored_clusters (cluster_id)
      SELECT id FROM stationary_clusters WHERE id = ?
    )SQL");
  return st.execute({Param::text(cluster_id)}) == 1;
}
