// src/server.cpp
#include "server.h"
#include "util.h"

#include <exception>
#include <iostream>
#include <utility>

using json = nlohmann::json;

static const char* kRequestIdHeader = "X-Request-Id";

Server::Server(ServiceConfig cfg) : cfg_(std::move(cfg)), api_(store_) {
  register_routes();
}

void Server::log_event(const std::string& type,
                       const std::string& request_id,
                       const std::string& customer_id,
                       int64_t seq,
                       const json& extra) {
  int64_t t = now_ms();
  json j;
  j["ts_ms"] = t;
  j["ts_iso"] = iso_time(t);
  j["type"] = type;
  if (!request_id.empty()) j["rid"] = request_id;
  if (!customer_id.empty()) j["customer_id"] = customer_id;
  if (seq > 0) j["seq"] = seq;

  if (extra.is_object()) {
    for (auto& [k, v] : extra.items()) j[k] = v;
  }
  append_jsonl(cfg_.log_path, j.dump(-1, ' ', false, json::error_handler_t::replace));
}

ApiResponse Server::dispatch(const Route& fn, const httplib::Request& req, const CustomerApi& api) {
  try {
    return fn(req);
  } catch (const std::exception& e) {
    return api.internal_error(e.what());
  }
}

// Every route runs inside this boundary: whatever escapes the api becomes a
// 500 with the exception's message.
httplib::Server::Handler Server::guarded(Route fn) {
  return [this, fn = std::move(fn)](const httplib::Request& req, httplib::Response& res) {
    int64_t seq = ++op_seq_;
    std::string rid = std::to_string(now_ms()) + "-" + std::to_string(seq);

    ApiResponse out = dispatch(fn, req, api_);

    res.status = out.status;
    res.set_header(kRequestIdHeader, rid);
    res.set_content(out.body.dump(-1, ' ', false, json::error_handler_t::replace),
                    "application/json");

    json extra = {{"status", out.status}};
    if (out.body.contains("count")) extra["count"] = out.body["count"];
    if (out.status >= 400 && out.body.contains("message")) extra["message"] = out.body["message"];
    log_event(out.event, rid, out.customer_id, seq, extra);
  };
}

void Server::register_routes() {
  svr_.Get("/", guarded([this](const httplib::Request&) { return api_.info(); }));

  svr_.Get(R"(/api/customers/?)",
           guarded([this](const httplib::Request&) { return api_.list_all(); }));

  svr_.Post(R"(/api/customers/?)",
            guarded([this](const httplib::Request& req) { return api_.create(req.body); }));

  // status/ and search/ must be registered before the bare id route. Paths
  // arrive URL-decoded, so the status and query captures may hold '/'.
  svr_.Get(R"(/api/customers/status/(.+?)/?)", guarded([this](const httplib::Request& req) {
             return api_.list_by_status(req.matches[1].str());
           }));

  svr_.Get(R"(/api/customers/search/(.+?)/?)", guarded([this](const httplib::Request& req) {
             return api_.search(req.matches[1].str());
           }));

  svr_.Get(R"(/api/customers/([^/]+)/?)", guarded([this](const httplib::Request& req) {
             return api_.get_one(req.matches[1].str());
           }));

  svr_.Put(R"(/api/customers/([^/]+)/?)", guarded([this](const httplib::Request& req) {
             return api_.update(req.matches[1].str(), req.body);
           }));

  svr_.Delete(R"(/api/customers/([^/]+)/?)", guarded([this](const httplib::Request& req) {
                return api_.remove(req.matches[1].str());
              }));

  auto unknown = [this](const httplib::Request&) { return api_.route_not_found(); };
  svr_.Get(".*", guarded(unknown));
  svr_.Post(".*", guarded(unknown));
  svr_.Put(".*", guarded(unknown));
  svr_.Patch(".*", guarded(unknown));
  svr_.Delete(".*", guarded(unknown));
  svr_.Options(".*", guarded(unknown));

  svr_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
    log_event("request", res.get_header_value(kRequestIdHeader), "", 0,
              json({{"method", req.method}, {"path", req.path}, {"status", res.status}}));
  });
}

int Server::bind() {
  if (cfg_.port == 0) {
    port_ = svr_.bind_to_any_port(cfg_.host);
  } else {
    port_ = svr_.bind_to_port(cfg_.host, cfg_.port) ? cfg_.port : -1;
  }
  return port_;
}

void Server::print_banner() const {
  std::cout << "Customer Management API listening on " << cfg_.host << ":" << port_ << "\n"
            << "Endpoints:\n";
  for (const auto& ep : CustomerApi::endpoints()) std::cout << "  " << ep << "\n";
  if (!cfg_.log_path.empty()) std::cout << "Event log: " << cfg_.log_path << "\n";
  std::cout.flush();
}

bool Server::run() {
  log_event("service_start", "", "", op_seq_.load(), json({{"host", cfg_.host}, {"port", port_}}));
  if (cfg_.banner) print_banner();

  bool ok = svr_.listen_after_bind();

  log_event("service_stop", "", "", op_seq_.load(), json({{"ok", ok}, {"customers", store_.size()}}));
  return ok;
}

void Server::stop() { svr_.stop(); }

bool Server::is_running() const { return svr_.is_running(); }
