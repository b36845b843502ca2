#pragma once
#include "api.h"
#include "store.h"

#include "httplib.h"
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

struct ServiceConfig {
  std::string host = "0.0.0.0";
  int port = 3001;  // 0 binds any free port
  std::string log_path = "customers.jsonl";
  bool banner = true;
};

class Server {
 public:
  explicit Server(ServiceConfig cfg);

  // Returns the bound port, or -1 on failure.
  int bind();
  // Blocks until stop(). Returns false if the listen loop failed.
  bool run();
  void stop();
  bool is_running() const;
  int port() const { return port_; }

  using Route = std::function<ApiResponse(const httplib::Request&)>;

  // Runs one route; any std::exception it throws becomes the 500 response.
  static ApiResponse dispatch(const Route& fn, const httplib::Request& req, const CustomerApi& api);

 private:
  ServiceConfig cfg_;
  CustomerStore store_;
  CustomerApi api_;
  httplib::Server svr_;
  int port_ = -1;

  std::atomic<int64_t> op_seq_{0};

  void register_routes();
  httplib::Server::Handler guarded(Route fn);
  void print_banner() const;

  void log_event(const std::string& type,
                 const std::string& request_id,
                 const std::string& customer_id,
                 int64_t seq,
                 const nlohmann::json& extra);
};
