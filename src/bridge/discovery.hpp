#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "bridge/correlator.hpp"
#include "bridge/tool_descriptor.hpp"
#include "bridge/version.hpp"
#include "nlohmann/json.hpp"

namespace bridge {

struct DiscoveryOptions {
  std::chrono::milliseconds timeout{10000};
  std::string protocol_version = "2025-03-26";
  std::string client_name = kBridgeName;
  std::string client_version = kBridgeVersion;
  // Guards against a server that keeps returning a nextCursor.
  std::size_t max_pages = 64;
};

struct DiscoveryResult {
  std::uint64_t generation = 0;
  ServerInfo server;
  ToolList tools;
  std::vector<std::string> warnings;
  std::string fingerprint;
};

// Runs the MCP initialize handshake and tool listing over one generation's
// correlator.
class Discovery {
 public:
  explicit Discovery(Correlator& correlator, DiscoveryOptions options = {});

  // initialize + notifications/initialized. Throws ProtocolError when the
  // response is not a usable initialize result.
  ServerInfo Handshake();

  // tools/list, following pagination. Invalid entries are dropped and reported
  // through `warnings`.
  ToolList ListTools(std::vector<std::string>& warnings);

  DiscoveryResult Discover();

 private:
  Correlator& correlator_;
  DiscoveryOptions options_;
};

// Validates raw tools/list entries. Keeps the first of duplicate names, drops
// entries whose input schema is unusable, and drops every entry whose sanitized
// route segment collides with another's.
ToolList NormalizeTools(const nlohmann::json& entries, std::vector<std::string>& warnings);

// XXH3 hash of the canonical catalog, as 16 hex digits.
std::string FingerprintTools(const ToolList& tools);

bool IsSupportedProtocolVersion(const std::string& version);

}  // namespace bridge
