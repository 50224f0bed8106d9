#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "bridge/discovery.hpp"
#include "bridge/logging.hpp"
#include "bridge/supervisor.hpp"
#include "platform/http_server.hpp"

namespace bridge {

class Router;

struct BridgeConfig {
  std::string host = "0.0.0.0";
  int port = 8000;
  std::chrono::milliseconds call_timeout{30000};
  std::chrono::milliseconds handshake_timeout{10000};
  int max_restarts = 5;
  std::chrono::milliseconds restart_window{60000};
  std::chrono::milliseconds backoff_initial{500};
  std::chrono::milliseconds backoff_max{30000};
  std::chrono::milliseconds shutdown_grace{5000};
  std::size_t http_threads = 8;
  // How long 503/Terminated stays observable before exiting on exhausted restarts.
  std::chrono::milliseconds exit_linger{2000};
  std::optional<logging::LogLevel> log_level;
  bool show_help = false;

  std::string command;
  std::vector<std::string> args;
};

// Defaults, then MCP_BRIDGE_* environment variables, then command-line flags.
// Throws std::invalid_argument on a bad flag or a missing tool server command.
BridgeConfig LoadBridgeConfig(int argc, const char* const* argv);

std::string UsageText(const std::string& program);

SupervisorOptions MakeSupervisorOptions(const BridgeConfig& config);
DiscoveryOptions MakeDiscoveryOptions(const BridgeConfig& config);
// Worker pool, body limit, permissive CORS on every response and debug access logging.
platform::HttpServerOptions MakeHttpServerOptions(const BridgeConfig& config);

// Discovers and publishes routes on every handshake, and republishes when the
// tool server reports a changed tool list.
void BindDiscovery(Supervisor& supervisor, Router& router, DiscoveryOptions options);

void ConfigureServer(platform::HttpServer& server, Router& router);

}  // namespace bridge
