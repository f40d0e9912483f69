#include "http_handler.hpp"
#include "debug/json_debug.hpp"
#include "models/DetectionJson.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

// Reads a required string field; throws std::invalid_argument otherwise.
static std::string require_string(const json &body, const char *key) {
  if (!body.is_object() || !body.contains(key) || !body[key].is_string() ||
      body[key].get<std::string>().empty())
    throw std::invalid_argument(std::string("missing or empty field: ") + key);
  return body[key].get<std::string>();
}

static double require_number(const json &body, const char *key) {
  if (!body.is_object() || !body.contains(key) || !body[key].is_number())
    throw std::invalid_argument(std::string("missing or non-numeric field: ") +
                                key);
  return body[key].get<double>();
}

static Coordinate require_coordinate(const json &body) {
  const Coordinate c{require_number(body, "lat"), require_number(body, "lon")};
  if (c.lat < -90.0 || c.lat > 90.0 || c.lon < -180.0 || c.lon > 180.0)
    throw std::invalid_argument("lat/lon out of range");
  return c;
}

static EpochMs now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

static void send_error(httplib::Response &res, int status,
                       const std::string &kind, const std::string &what) {
  json err = {{"ok", false}, {"kind", kind}, {"what", what}};
  res.status = status;
  res.set_content(err.dump(), "application/json");
}

// ===== routes =====

void HttpHandler::callPostHandler(std::string action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (action != "detect" && action != "rematch" && action != "carpools" &&
      action != "suggestions" && action != "occurrences" &&
      action != "ignore") {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
    return;
  }

  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::parse_error &e) {
    json err = parse_error_json(req.body, e);
    res.status = 400;
    res.set_content(err.dump(2), "application/json");
    return;
  }

  try {
    if (action == "detect") {
      handleDetect(body, res);
    } else if (action == "rematch") {
      handleRematch(body, res);
    } else if (action == "carpools") {
      handleCarpools(body, res);
    } else if (action == "suggestions") {
      handleSuggestions(body, res);
    } else if (action == "occurrences") {
      handleOccurrences(body, res);
    } else {
      handleIgnore(body, res);
    }
  } catch (const ShiftNotFoundError &e) {
    send_error(res, 404, "not_found", e.what());
  } catch (const std::invalid_argument &e) {
    send_error(res, 400, "invalid_argument", e.what());
  }
}

void HttpHandler::callGetHandler(std::string action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "dbping") {
    handleDBPing(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

// ===== POST: /detect =====

void HttpHandler::handleDetect(const json &body, httplib::Response &res) {
  const std::string shift_id = require_string(body, "shift_id");
  auto db = connect_();
  DetectionResult result = engine_.detect(*db, shift_id);
  json out = result;
  out["ok"] = true;
  res.set_content(out.dump(), "application/json");
}

// ===== POST: /rematch =====

void HttpHandler::handleRematch(const json &body, httplib::Response &res) {
  const std::string location_id = require_string(body, "location_id");
  const std::string change = body.value("change", "created");
  if (change != "created" && change != "updated")
    throw std::invalid_argument("change must be \"created\" or \"updated\"");

  auto db = connect_();
  json out;
  if (change == "created")
    out = rematch_.on_location_created(*db, location_id);
  else
    out = rematch_.on_location_updated(*db, location_id);
  out["ok"] = true;
  out["location_id"] = location_id;
  out["change"] = change;
  res.set_content(out.dump(), "application/json");
}

// ===== POST: /carpools =====

void HttpHandler::handleCarpools(const json &body, httplib::Response &res) {
  const std::string date = require_string(body, "date");
  auto db = connect_();
  std::vector<CarpoolSummary> groups = carpools_.detect(*db, date);
  json out = {{"ok", true}, {"date", date}, {"groups", groups}};
  res.set_content(out.dump(), "application/json");
}

// ===== POST: /suggestions =====

void HttpHandler::handleSuggestions(const json &body, httplib::Response &res) {
  int min_occurrences = 0;
  if (body.is_object() && body.contains("min_occurrences")) {
    if (!body["min_occurrences"].is_number_integer() ||
        body["min_occurrences"].get<int>() < 1)
      throw std::invalid_argument("min_occurrences must be a positive integer");
    min_occurrences = body["min_occurrences"].get<int>();
  }
  auto db = connect_();
  json out = {{"ok", true},
              {"suggestions", suggestions_.suggest(*db, min_occurrences)}};
  res.set_content(out.dump(), "application/json");
}

// ===== POST: /occurrences =====

void HttpHandler::handleOccurrences(const json &body, httplib::Response &res) {
  const Coordinate at = require_coordinate(body);
  double radius_m = 0.0;
  if (body.contains("radius_m")) {
    radius_m = require_number(body, "radius_m");
    if (radius_m <= 0.0)
      throw std::invalid_argument("radius_m must be positive");
  }
  auto db = connect_();
  json out = {{"ok", true},
              {"clusters", suggestions_.occurrences(*db, at, radius_m)}};
  res.set_content(out.dump(), "application/json");
}

// ===== POST: /ignore =====
// {"cluster_id": ...} dismisses one occurrence; {"lat", "lon",
// "occurrence_count"} dismisses a whole suggestion.

void HttpHandler::handleIgnore(const json &body, httplib::Response &res) {
  if (body.is_object() && body.contains("cluster_id")) {
    const std::string cluster_id = require_string(body, "cluster_id");
    auto db = connect_();
    const bool changed = suggestions_.ignore_occurrence(*db, cluster_id);
    json out = {{"ok", true}, {"cluster_id", cluster_id}, {"ignored", changed}};
    res.set_content(out.dump(), "application/json");
    return;
  }

  const Coordinate at = require_coordinate(body);
  if (!body.contains("occurrence_count") ||
      !body["occurrence_count"].is_number_integer())
    throw std::invalid_argument("missing or non-integer field: occurrence_count");
  const int count = body["occurrence_count"].get<int>();
  auto db = connect_();
  json out = suggestions_.ignore_suggestion(*db, at, count, now_ms());
  out["ok"] = true;
  res.set_content(out.dump(), "application/json");
}

// ===== GET: /dbping =====

void HttpHandler::handleDBPing(const httplib::Request &,
                               httplib::Response &res) {
  try {
    auto db = connect_();
    db->ping();
  } catch (const std::exception &e) {
    std::cerr << "[dbping] " << e.what() << "\n";
    res.status = 500;
    res.set_content(json{{"ok", false}, {"error", e.what()}}.dump(),
                    "application/json");
    return;
  }
  res.set_content(R"({"ok":true})", "application/json");
}
