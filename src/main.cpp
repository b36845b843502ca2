#include "server.h"
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

static Server* g_server = nullptr;

static void on_signal(int) {
  if (g_server) g_server->stop();
}

static void usage() {
  std::cerr
    << "Usage:\n"
    << "  customer_api [--host 0.0.0.0] [--port 3001] [--log customers.jsonl] [--quiet]\n"
    << "Options:\n"
    << "  --port 0     bind any free port\n"
    << "  --log \"\"     disable the event log file\n";
}

static bool parse_port(const std::string& s, int& out) {
  try {
    size_t used = 0;
    int p = std::stoi(s, &used);
    if (used != s.size() || p < 0 || p > 65535) return false;
    out = p;
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}

int main(int argc, char** argv) {
  ServiceConfig cfg;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](std::string& out) -> bool {
      if (i + 1 >= argc) return false;
      out = argv[++i];
      return true;
    };

    if (a == "--host") { std::string v; if (!next(v)) { usage(); return 1; } cfg.host = v; }
    else if (a == "--port") {
      std::string v;
      if (!next(v) || !parse_port(v, cfg.port)) { usage(); return 1; }
    }
    else if (a == "--log") { std::string v; if (!next(v)) { usage(); return 1; } cfg.log_path = v; }
    else if (a == "--quiet") { cfg.banner = false; }
    else if (a == "--help") { usage(); return 0; }
    else { std::cerr << "unknown option: " << a << "\n"; usage(); return 1; }
  }

  Server s(cfg);
  if (s.bind() < 0) {
    std::cerr << "failed to bind " << cfg.host << ":" << cfg.port << "\n";
    return 1;
  }

  g_server = &s;
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  bool ok = s.run();
  g_server = nullptr;
  return ok ? 0 : 1;
}
