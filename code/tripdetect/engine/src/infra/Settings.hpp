#pragma once

#include "models/params.hpp"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

// Database credentials. Environment variables DB_HOST, DB_PORT, DB_USER,
// DB_PASS and DB_NAME override the settings file.
struct DbConfig {
  std::string host = "127.0.0.1";
  unsigned int port = 3306;
  std::string user = "tripdetect_user";
  std::string password = "changeme-user";
  std::string schema = "tripdetect";

  std::string uri() const {
    return "tcp://" + host + ":" + std::to_string(port);
  }

  static DbConfig from_json(const nlohmann::json &j) {
    DbConfig c;
    c.host = j.value("host", c.host);
    c.port = j.value("port", c.port);
    c.user = j.value("user", c.user);
    c.password = j.value("password", c.password);
    c.schema = j.value("schema", c.schema);
    return c;
  }

  void apply_env() {
    if (const char *v = std::getenv("DB_HOST"))
      host = v;
    if (const char *v = std::getenv("DB_PORT"))
      port = static_cast<unsigned int>(std::atoi(v));
    if (const char *v = std::getenv("DB_USER"))
      user = v;
    if (const char *v = std::getenv("DB_PASS"))
      password = v;
    if (const char *v = std::getenv("DB_NAME"))
      schema = v;
  }
};

struct Settings {
  int port = 5005;
  nlohmann::json post_endpoints = nlohmann::json::array();
  nlohmann::json get_endpoints = nlohmann::json::array();
  DbConfig db;
  DetectionParams detection;
  CarpoolParams carpool;
  SuggestionParams suggestions;

  static Settings from_json(const nlohmann::json &j) {
    Settings s;
    const auto server = j.value("server", nlohmann::json::object());
    s.port = server.value("port", s.port);
    s.post_endpoints = server.value("post_endpoints", s.post_endpoints);
    s.get_endpoints = server.value("get_endpoints", s.get_endpoints);
    s.db = DbConfig::from_json(j.value("database", nlohmann::json::object()));
    s.detection =
        DetectionParams::from_json(j.value("detection", nlohmann::json::object()));
    s.carpool =
        CarpoolParams::from_json(j.value("carpool", nlohmann::json::object()));
    s.suggestions = SuggestionParams::from_json(
        j.value("suggestions", nlohmann::json::object()));
    s.db.apply_env();
    return s;
  }

  // Throws std::runtime_error when the file is missing or not valid JSON.
  static Settings load(const std::string &path) {
    std::ifstream cfg(path);
    if (!cfg)
      throw std::runtime_error("Cannot open " + path);
    nlohmann::json j;
    try {
      cfg >> j;
    } catch (const nlohmann::json::parse_error &e) {
      throw std::runtime_error(path + ": " + e.what());
    }
    return from_json(j);
  }
};
