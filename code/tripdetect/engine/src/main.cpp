// Entry point for the trip detection HTTP server.  It wires up the httplib
// server, loads configuration and exposes the REST endpoints handled by
// `HttpHandler`.

#include "http/http_handler.hpp"
#include "infra/MySQLDetectionDB.hpp"
#include "infra/Settings.hpp"

#include <execinfo.h>
#include <iostream>
#include <signal.h>
#include <unistd.h>

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

int main(int argc, char **argv) {
  install_bt_handlers();

  // ---------------------- Load configuration ------------------------------
  const std::string cfg_path = argc > 1 ? argv[1] : "config/settings.json";
  Settings settings;
  try {
    settings = Settings::load(cfg_path);
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 1;
  }
  std::cout << "[DEBUG] Starting server on port " << settings.port
            << std::endl;

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(1024ull * 1024ull * 16ull); // 16MB
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);

  // ---------------------- Database connection -----------------------------
  // one connection per request; MYSQL handles are not shared across threads
  const DbConfig dbcfg = settings.db;
  HttpHandler::Connector connect = [dbcfg]() -> std::unique_ptr<DetectionDB> {
    return std::make_unique<MySQLDetectionDB>(dbcfg.uri(), dbcfg.user,
                                              dbcfg.password, dbcfg.schema);
  };
  if (mysql_library_init(0, nullptr, nullptr)) {
    std::cerr << "[main] mysql_library_init failed\n";
    return 1;
  }

  ShiftLocks locks;
  HttpHandler handler(connect, locks, settings.detection, settings.carpool,
                      settings.suggestions);

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &ep : settings.post_endpoints) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callPostHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[POST λ] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      } catch (...) {
        std::cerr << "[POST λ] EXCEPTION: unknown\n";
        res.status = 500;
        res.set_content("exception: unknown", "text/plain");
      }
    });
  }

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &ep : settings.get_endpoints) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      handler.callGetHandler(action, req, res);
    });
  }

  // ---------------------- Start server ------------------------------------
  if (!server.listen("0.0.0.0", settings.port)) {
    std::cerr << "[main] cannot listen on port " << settings.port << "\n";
    mysql_library_end();
    return 1;
  }
  mysql_library_end();
  return 0;
}
