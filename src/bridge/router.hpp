#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "bridge/discovery.hpp"
#include "bridge/tool_descriptor.hpp"
#include "bridge/tool_invoker.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_server.hpp"

namespace bridge {

struct RouteBinding {
  std::string path;
  std::string method = "POST";
  std::shared_ptr<const ToolDescriptor> tool;
};

// Everything the HTTP surface serves for one discovered catalog. Never mutated
// after publication; a new discovery pass builds a new table.
struct RouteTable {
  std::uint64_t generation = 0;
  ServerInfo server;
  std::map<std::string, RouteBinding> routes;  // keyed by path segment
  nlohmann::json openapi;
  std::string fingerprint;
  std::string etag;
  std::vector<std::string> warnings;
};

std::shared_ptr<const RouteTable> BuildRouteTable(const DiscoveryResult& discovery);

struct RouterOptions {
  std::chrono::milliseconds call_timeout{30000};
};

// Serves tool calls, the OpenAPI document and the health report from the
// currently published route table.
class Router {
 public:
  explicit Router(ToolInvoker& invoker, RouterOptions options = {});

  Router(const Router&) = delete;
  Router& operator=(const Router&) = delete;

  void Publish(std::shared_ptr<const RouteTable> table);
  std::shared_ptr<const RouteTable> Snapshot() const;

  platform::HttpResponse HandleToolCall(const std::string& segment, const std::string& body);
  platform::HttpResponse HandleOpenApi(const platform::HttpRequest& request) const;
  platform::HttpResponse HandleHealth() const;

 private:
  ToolInvoker& invoker_;
  RouterOptions options_;
  std::shared_ptr<const RouteTable> table_;
  const std::chrono::steady_clock::time_point started_at_;
};

// structuredContent when present, else the content array with JSON text items
// decoded, else the result unchanged.
nlohmann::json ShapeToolResult(const nlohmann::json& result);

// HTTP status for a JSON-RPC error code returned by the tool server.
int StatusForJsonRpcError(int code);

// {"error": {"kind": ..., "message": ..., <extra fields>}}
platform::HttpResponse ErrorEnvelopeResponse(int status, const std::string& kind,
                                             const std::string& message,
                                             const nlohmann::json& extra = nlohmann::json::object());

}  // namespace bridge
