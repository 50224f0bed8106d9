#include "bridge/app.hpp"

#include <cstdlib>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "bridge/framer.hpp"
#include "bridge/router.hpp"
#include "platform/http_server.hpp"

namespace bridge {
namespace {

using logging::LogDebug;
using logging::LogInfo;
using logging::LogWarn;

platform::HttpResponse HandleCorsPreflight(const platform::HttpRequest&) {
  platform::HttpResponse response;
  response.status = 204;
  response.content_type.clear();
  return response;
}

long long ParseInteger(const std::string& name, const std::string& text, long long min_value,
                       long long max_value) {
  std::size_t consumed = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::exception&) {
    throw std::invalid_argument(name + " expects an integer, got '" + text + "'");
  }
  if (consumed != text.size()) {
    throw std::invalid_argument(name + " expects an integer, got '" + text + "'");
  }
  if (value < min_value || value > max_value) {
    throw std::invalid_argument(name + " must be between " + std::to_string(min_value) +
                                " and " + std::to_string(max_value));
  }
  return value;
}

constexpr long long kMaxMillis = 24LL * 60 * 60 * 1000;

struct Setting {
  const char* flag;
  const char* env;
  std::function<void(BridgeConfig&, const std::string& name, const std::string& value)> apply;
};

std::function<void(BridgeConfig&, const std::string&, const std::string&)> Millis(
    std::chrono::milliseconds BridgeConfig::*field, long long min_value) {
  return [field, min_value](BridgeConfig& config, const std::string& name,
                            const std::string& value) {
    config.*field = std::chrono::milliseconds(ParseInteger(name, value, min_value, kMaxMillis));
  };
}

const std::vector<Setting>& Settings() {
  static const std::vector<Setting> kSettings = {
      {"--host", "MCP_BRIDGE_HOST",
       [](BridgeConfig& config, const std::string& name, const std::string& value) {
         if (value.empty()) {
           throw std::invalid_argument(name + " must not be empty");
         }
         config.host = value;
       }},
      {"--port", "MCP_BRIDGE_PORT",
       [](BridgeConfig& config, const std::string& name, const std::string& value) {
         config.port = static_cast<int>(ParseInteger(name, value, 1, 65535));
       }},
      {"--timeout-ms", "MCP_BRIDGE_TIMEOUT_MS", Millis(&BridgeConfig::call_timeout, 1)},
      {"--handshake-timeout-ms", "MCP_BRIDGE_HANDSHAKE_TIMEOUT_MS",
       Millis(&BridgeConfig::handshake_timeout, 1)},
      {"--max-restarts", "MCP_BRIDGE_MAX_RESTARTS",
       [](BridgeConfig& config, const std::string& name, const std::string& value) {
         config.max_restarts = static_cast<int>(ParseInteger(name, value, 0, 1000));
       }},
      {"--restart-window-ms", "MCP_BRIDGE_RESTART_WINDOW_MS",
       Millis(&BridgeConfig::restart_window, 1)},
      {"--backoff-initial-ms", "MCP_BRIDGE_BACKOFF_INITIAL_MS",
       Millis(&BridgeConfig::backoff_initial, 0)},
      {"--backoff-max-ms", "MCP_BRIDGE_BACKOFF_MAX_MS", Millis(&BridgeConfig::backoff_max, 0)},
      {"--shutdown-grace-ms", "MCP_BRIDGE_SHUTDOWN_GRACE_MS",
       Millis(&BridgeConfig::shutdown_grace, 0)},
      {"--exit-linger-ms", "MCP_BRIDGE_EXIT_LINGER_MS", Millis(&BridgeConfig::exit_linger, 0)},
      {"--http-threads", "MCP_BRIDGE_HTTP_THREADS",
       [](BridgeConfig& config, const std::string& name, const std::string& value) {
         config.http_threads = static_cast<std::size_t>(ParseInteger(name, value, 1, 1024));
       }},
      {"--log-level", nullptr,
       [](BridgeConfig& config, const std::string& name, const std::string& value) {
         const auto level = logging::ParseLogLevel(value);
         if (!level) {
           throw std::invalid_argument(name + " must be one of error, warn, info, debug");
         }
         config.log_level = level;
       }},
  };
  return kSettings;
}

const Setting* FindSetting(const std::string& flag) {
  for (const auto& setting : Settings()) {
    if (flag == setting.flag) {
      return &setting;
    }
  }
  return nullptr;
}

void LoadFromEnvironment(BridgeConfig& config) {
  for (const auto& setting : Settings()) {
    if (setting.env == nullptr) {
      continue;
    }
    const char* value = std::getenv(setting.env);
    if (value == nullptr) {
      continue;
    }
    try {
      setting.apply(config, setting.env, value);
    } catch (const std::invalid_argument& ex) {
      LogWarn(std::string{"Ignoring "} + setting.env + ": " + ex.what());
    }
  }
}

}  // namespace

BridgeConfig LoadBridgeConfig(int argc, const char* const* argv) {
  BridgeConfig config;
  LoadFromEnvironment(config);

  int index = 1;
  for (; index < argc; ++index) {
    std::string arg = argv[index];
    if (arg == "--") {
      ++index;
      break;
    }
    if (arg == "-h" || arg == "--help") {
      config.show_help = true;
      return config;
    }
    if (arg.rfind("--", 0) != 0) {
      break;
    }

    std::string value;
    bool has_value = false;
    if (const auto eq = arg.find('='); eq != std::string::npos) {
      value = arg.substr(eq + 1);
      arg = arg.substr(0, eq);
      has_value = true;
    }
    const Setting* setting = FindSetting(arg);
    if (setting == nullptr) {
      throw std::invalid_argument("Unknown option " + arg);
    }
    if (!has_value) {
      if (index + 1 >= argc) {
        throw std::invalid_argument(arg + " requires a value");
      }
      value = argv[++index];
    }
    setting->apply(config, arg, value);
  }

  if (index >= argc) {
    throw std::invalid_argument("Missing tool server command (expected '-- <command> [args...]')");
  }
  config.command = argv[index++];
  for (; index < argc; ++index) {
    config.args.emplace_back(argv[index]);
  }
  if (config.backoff_max < config.backoff_initial) {
    throw std::invalid_argument("--backoff-max-ms must not be smaller than --backoff-initial-ms");
  }
  return config;
}

std::string UsageText(const std::string& program) {
  std::ostringstream out;
  out << "Usage: " << program << " [options] -- <command> [args...]\n"
      << "\n"
      << "Runs an MCP tool server over stdio and serves its tools as an OpenAPI HTTP API.\n"
      << "\n"
      << "Options:\n"
      << "  --host <addr>                 listen address (default 0.0.0.0)\n"
      << "  --port <n>                    listen port (default 8000)\n"
      << "  --timeout-ms <n>              per tool call deadline (default 30000)\n"
      << "  --handshake-timeout-ms <n>    initialize/tools/list deadline (default 10000)\n"
      << "  --max-restarts <n>            restarts allowed inside the window (default 5)\n"
      << "  --restart-window-ms <n>       sliding restart window (default 60000)\n"
      << "  --backoff-initial-ms <n>      first restart delay (default 500)\n"
      << "  --backoff-max-ms <n>          restart delay cap (default 30000)\n"
      << "  --shutdown-grace-ms <n>       wait after closing stdin before SIGTERM (default 5000)\n"
      << "  --exit-linger-ms <n>          serve 503 this long after giving up (default 2000)\n"
      << "  --http-threads <n>            HTTP worker threads (default 8)\n"
      << "  --log-level <level>           error, warn, info or debug\n"
      << "  -h, --help                    show this text\n"
      << "\n"
      << "Every option can also be set through MCP_BRIDGE_<NAME>, e.g. MCP_BRIDGE_PORT.\n";
  return out.str();
}

SupervisorOptions MakeSupervisorOptions(const BridgeConfig& config) {
  SupervisorOptions options;
  options.process.command = config.command;
  options.process.args = config.args;
  options.max_restarts = config.max_restarts;
  options.restart_window = config.restart_window;
  options.backoff_initial = config.backoff_initial;
  options.backoff_max = config.backoff_max;
  options.shutdown_grace = config.shutdown_grace;
  return options;
}

platform::HttpServerOptions MakeHttpServerOptions(const BridgeConfig& config) {
  platform::HttpServerOptions options;
  options.threads = config.http_threads;
  // A body that cannot fit in one stdio frame could never reach the tool server.
  options.max_body_bytes = kMaxLineBytes;
  options.default_headers = {{"Access-Control-Allow-Origin", "*"},
                             {"Access-Control-Allow-Methods", "GET,POST,OPTIONS"},
                             {"Access-Control-Allow-Headers", "*"},
                             {"Access-Control-Allow-Credentials", "true"}};
  options.access_logger = [](const std::string& method, const std::string& path, int status) {
    LogDebug("[http] " + method + " " + path + " -> " + std::to_string(status));
  };
  return options;
}

DiscoveryOptions MakeDiscoveryOptions(const BridgeConfig& config) {
  DiscoveryOptions options;
  options.timeout = config.handshake_timeout;
  return options;
}

void BindDiscovery(Supervisor& supervisor, Router& router, DiscoveryOptions options) {
  supervisor.SetHandshakeHook([&router, options](Correlator& correlator) {
    Discovery discovery(correlator, options);
    router.Publish(BuildRouteTable(discovery.Discover()));
  });

  supervisor.SetToolsChangedHook([&router, options](Correlator& correlator) {
    const auto previous = router.Snapshot();
    DiscoveryResult result;
    result.generation = correlator.generation();
    if (previous) {
      result.server = previous->server;
    }
    Discovery discovery(correlator, options);
    result.tools = discovery.ListTools(result.warnings);
    result.fingerprint = FingerprintTools(result.tools);
    if (previous && previous->generation == result.generation &&
        previous->fingerprint == result.fingerprint) {
      LogInfo("[discovery] tool list unchanged (catalog " + result.fingerprint + ")");
      return;
    }
    router.Publish(BuildRouteTable(result));
  });
}

void ConfigureServer(platform::HttpServer& server, Router& router) {
  server.AddHandler(platform::HttpMethod::kGet, "/openapi.json",
                    [&router](const platform::HttpRequest& request) {
                      return router.HandleOpenApi(request);
                    });

  server.AddHandler(platform::HttpMethod::kGet, "/health",
                    [&router](const platform::HttpRequest&) {
                      return router.HandleHealth();
                    });

  server.AddHandler(platform::HttpMethod::kPost, R"(/([^/]+))",
                    [&router](const platform::HttpRequest& request) {
                      const std::string segment =
                          request.path_params.empty() ? std::string{} : request.path_params.front();
                      return router.HandleToolCall(segment, request.body);
                    });

  server.AddHandler(platform::HttpMethod::kOptions, R"(/.*)", HandleCorsPreflight);
}

}  // namespace bridge
