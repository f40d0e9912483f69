#pragma once

#include "core/CarpoolDetector.hpp"
#include "core/DetectionDB.hpp"
#include "core/DetectionEngine.hpp"
#include "core/RematchService.hpp"
#include "core/ShiftLocks.hpp"
#include "core/SuggestionService.hpp"
#include <functional>
#include <httplib.h>
#include <memory>
#include <nlohmann/json.hpp>

// Thin wrapper around httplib callbacks.  The main server forwards requests to
// these member functions based on the action string parsed from the URL.
// Every request opens its own store through `connect`.
class HttpHandler {
public:
  using Connector = std::function<std::unique_ptr<DetectionDB>()>;

  HttpHandler(Connector connect, ShiftLocks &locks, DetectionParams detection,
              CarpoolParams carpool, SuggestionParams suggestions = {})
      : connect_(std::move(connect)), engine_(locks, detection),
        rematch_(detection), carpools_(locks, carpool),
        suggestions_(suggestions) {}

  void callPostHandler(std::string action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(std::string action, const httplib::Request &req,
                      httplib::Response &res);

private:
  Connector connect_;
  DetectionEngine engine_;
  RematchService rematch_;
  CarpoolDetector carpools_;
  SuggestionService suggestions_;

  // Individual request handlers
  void handleDetect(const nlohmann::json &body, httplib::Response &res);
  void handleRematch(const nlohmann::json &body, httplib::Response &res);
  void handleCarpools(const nlohmann::json &body, httplib::Response &res);
  void handleSuggestions(const nlohmann::json &body, httplib::Response &res);
  void handleOccurrences(const nlohmann::json &body, httplib::Response &res);
  void handleIgnore(const nlohmann::json &body, httplib::Response &res);
  void handleDBPing(const httplib::Request &req, httplib::Response &res);
};
