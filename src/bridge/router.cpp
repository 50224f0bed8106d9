#include "bridge/router.hpp"

#include <cstdio>
#include <utility>

#include "bridge/errors.hpp"
#include "bridge/logging.hpp"
#include "bridge/openapi.hpp"
#include "bridge/schema_validator.hpp"
#include "bridge/version.hpp"
#include "xxhash.h"

namespace bridge {
namespace {

using logging::LogDebug;
using logging::LogInfo;
using logging::LogWarn;
using nlohmann::json;

std::string EntityTag(const json& document) {
  const std::string text = document.dump();
  const XXH64_hash_t hash = XXH3_64bits(text.data(), text.size());
  char buffer[21];
  std::snprintf(buffer, sizeof(buffer), "\"%016llx\"", static_cast<unsigned long long>(hash));
  return buffer;
}

// Path segments arrive percent-decoded and may hold any byte; keep messages
// printable ASCII so they always serialize.
std::string PrintableSegment(const std::string& segment) {
  std::string printable;
  for (const char ch : segment) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte >= 0x20 && byte < 0x7f) {
      printable.push_back(ch);
    } else {
      char escaped[5];
      std::snprintf(escaped, sizeof(escaped), "\\x%02x", byte);
      printable += escaped;
    }
  }
  return printable;
}

platform::HttpResponse JsonResponse(const json& body, int status = 200) {
  platform::HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body.dump();
  return response;
}

platform::HttpResponse ErrorResponseFor(const BridgeError& error) {
  return ErrorEnvelopeResponse(500, std::string(ErrorKindName(error.kind())), error.what());
}

}  // namespace

std::shared_ptr<const RouteTable> BuildRouteTable(const DiscoveryResult& discovery) {
  auto table = std::make_shared<RouteTable>();
  table->generation = discovery.generation;
  table->server = discovery.server;
  table->fingerprint = discovery.fingerprint;
  table->warnings = discovery.warnings;
  for (const auto& tool : discovery.tools) {
    RouteBinding binding;
    binding.path = "/" + tool->route_segment;
    binding.tool = tool;
    table->routes.emplace(tool->route_segment, std::move(binding));
  }
  table->openapi = openapi::BuildOpenApiDocument(discovery.server, discovery.tools);
  table->etag = EntityTag(table->openapi);
  return table;
}

json ShapeToolResult(const json& result) {
  if (!result.is_object()) {
    return result;
  }
  if (const auto structured = result.find("structuredContent");
      structured != result.end() && !structured->is_null()) {
    return *structured;
  }
  const auto content = result.find("content");
  if (content == result.end() || !content->is_array()) {
    return result;
  }

  json shaped = json::array();
  for (const auto& item : *content) {
    if (item.is_object() && item.value("type", "") == "text") {
      const auto text = item.find("text");
      if (text != item.end() && text->is_string()) {
        json decoded = json::parse(text->get<std::string>(), nullptr, false);
        if (decoded.is_discarded()) {
          shaped.push_back(*text);
        } else {
          shaped.push_back(std::move(decoded));
        }
        continue;
      }
    }
    shaped.push_back(item);
  }
  return shaped;
}

int StatusForJsonRpcError(int code) {
  switch (code) {
    case jsonrpc::kMethodNotFound:
      return 404;
    case jsonrpc::kInvalidParams:
      return 400;
    case jsonrpc::kInvalidRequest:
    case jsonrpc::kParseError:
      return 502;
    default:
      return 500;
  }
}

platform::HttpResponse ErrorEnvelopeResponse(int status, const std::string& kind,
                                             const std::string& message, const json& extra) {
  json error = {{"kind", kind}, {"message", message}};
  if (extra.is_object()) {
    for (const auto& [key, value] : extra.items()) {
      error[key] = value;
    }
  }
  return JsonResponse(json{{"error", error}}, status);
}

Router::Router(ToolInvoker& invoker, RouterOptions options)
    : invoker_(invoker), options_(options), started_at_(std::chrono::steady_clock::now()) {}

void Router::Publish(std::shared_ptr<const RouteTable> table) {
  if (!table) {
    return;
  }
  const auto previous = Snapshot();
  LogInfo("[router] Publishing " + std::to_string(table->routes.size()) +
          " route(s) for generation " + std::to_string(table->generation) + " (catalog " +
          table->fingerprint + ")");
  if (previous && previous->fingerprint != table->fingerprint) {
    LogInfo("[router] Tool catalog changed since generation " +
            std::to_string(previous->generation));
  }
  std::atomic_store(&table_, std::move(table));
}

std::shared_ptr<const RouteTable> Router::Snapshot() const { return std::atomic_load(&table_); }

platform::HttpResponse Router::HandleToolCall(const std::string& segment, const std::string& body) {
  const ProcessState state = invoker_.State();
  if (state != ProcessState::kReady) {
    auto response = ErrorEnvelopeResponse(
        503, std::string(ErrorKindName(ErrorKind::kTransport)),
        "Tool server is not ready", {{"state", std::string(ProcessStateName(state))}});
    response.headers["Retry-After"] = "1";
    return response;
  }

  const auto table = Snapshot();
  const auto not_found = [&segment] {
    return ErrorEnvelopeResponse(404, "NotFound",
                                 "No tool is served at /" + PrintableSegment(segment));
  };
  if (!table) {
    return not_found();
  }
  const auto route = table->routes.find(segment);
  if (route == table->routes.end()) {
    return not_found();
  }
  const ToolDescriptor& tool = *route->second.tool;

  json arguments = json::object();
  if (body.find_first_not_of(" \t\r\n") != std::string::npos) {
    arguments = json::parse(body, nullptr, false);
    if (arguments.is_discarded()) {
      return ErrorEnvelopeResponse(400, "InvalidRequest", "Request body is not valid JSON");
    }
  }
  if (!arguments.is_object()) {
    return ErrorEnvelopeResponse(422, std::string(ErrorKindName(ErrorKind::kSchemaValidation)),
                                 "Request body must be a JSON object",
                                 {{"violations", json::array({"/: expected object"})}});
  }

  const auto violations = schema::Validate(arguments, tool.input_schema);
  if (!violations.empty()) {
    LogDebug("[router] Rejected call to '" + tool.name + "': " + violations.front());
    return ErrorEnvelopeResponse(422, std::string(ErrorKindName(ErrorKind::kSchemaValidation)),
                                 "Request body does not match the input schema of '" +
                                     tool.name + "'",
                                 {{"violations", violations}});
  }

  try {
    const json result = invoker_.CallTool(tool.name, arguments, options_.call_timeout);
    const auto is_error = result.is_object() ? result.find("isError") : result.end();
    if (is_error != result.end() && is_error->is_boolean() && is_error->get<bool>()) {
      return ErrorEnvelopeResponse(502, std::string(ErrorKindName(ErrorKind::kToolInvocation)),
                                   "Tool '" + tool.name + "' reported an error",
                                   {{"content", ShapeToolResult(result)}});
    }
    return JsonResponse(ShapeToolResult(result));
  } catch (const ToolInvocationError& ex) {
    LogDebug("[router] Tool '" + tool.name + "' failed with code " + std::to_string(ex.code()));
    json extra = ex.ToJson();
    extra.erase("message");
    return ErrorEnvelopeResponse(StatusForJsonRpcError(ex.code()),
                                 std::string(ErrorKindName(ex.kind())), ex.what(), extra);
  } catch (const TimeoutError& ex) {
    LogWarn("[router] " + std::string(ex.what()));
    return ErrorEnvelopeResponse(504, std::string(ErrorKindName(ex.kind())), ex.what());
  } catch (const TransportError& ex) {
    LogWarn("[router] Call to '" + tool.name + "' lost its transport: " + ex.what());
    auto response = ErrorEnvelopeResponse(
        503, std::string(ErrorKindName(ex.kind())), ex.what(),
        {{"state", std::string(ProcessStateName(invoker_.State()))}});
    response.headers["Retry-After"] = "1";
    return response;
  } catch (const BridgeError& ex) {
    return ErrorResponseFor(ex);
  }
}

platform::HttpResponse Router::HandleOpenApi(const platform::HttpRequest& request) const {
  const auto table = Snapshot();
  if (!table) {
    return ErrorEnvelopeResponse(503, std::string(ErrorKindName(ErrorKind::kTransport)),
                                 "No tool catalog has been discovered yet",
                                 {{"state", std::string(ProcessStateName(invoker_.State()))}});
  }
  if (platform::FindHeader(request, "If-None-Match") == table->etag) {
    platform::HttpResponse response;
    response.status = 304;
    response.headers["ETag"] = table->etag;
    return response;
  }
  auto response = JsonResponse(table->openapi);
  response.headers["ETag"] = table->etag;
  return response;
}

platform::HttpResponse Router::HandleHealth() const {
  const auto table = Snapshot();
  const ProcessState state = invoker_.State();
  const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::steady_clock::now() - started_at_)
                          .count();

  json body = {{"status", state == ProcessState::kReady ? "ok" : "unavailable"},
               {"state", std::string(ProcessStateName(state))},
               {"generation", invoker_.Generation()},
               {"uptimeSeconds", uptime},
               {"version", kBridgeVersion}};
  if (table) {
    body["tools"] = table->routes.size();
    body["catalog"] = {{"generation", table->generation},
                       {"fingerprint", table->fingerprint},
                       {"warnings", table->warnings}};
    body["server"] = {{"name", table->server.name},
                      {"version", table->server.version},
                      {"protocolVersion", table->server.protocol_version}};
  } else {
    body["tools"] = 0;
  }
  for (const auto& [key, value] : invoker_.Diagnostics().items()) {
    body[key] = value;
  }
  return JsonResponse(body, state == ProcessState::kReady ? 200 : 503);
}

}  // namespace bridge
