#include "bridge/openapi.hpp"

#include <cctype>

namespace bridge::openapi {
namespace {

using nlohmann::json;

constexpr char kOpenApiVersion[] = "3.1.0";
constexpr char kErrorEnvelopeRef[] = "#/components/schemas/ErrorEnvelope";

bool IsSafeSegmentChar(unsigned char ch) {
  return std::isalnum(ch) != 0 || ch == '_' || ch == '-' || ch == '.';
}

json ErrorResponse(const std::string& description) {
  return {{"description", description},
          {"content", {{"application/json", {{"schema", {{"$ref", kErrorEnvelopeRef}}}}}}}};
}

json OperationFor(const ToolDescriptor& tool) {
  json success_schema = tool.output_schema
                            ? *tool.output_schema
                            : json{{"type", "object"}, {"additionalProperties", true}};

  json operation = {
      {"operationId", tool.route_segment},
      {"summary", tool.title.empty() ? SummaryFromName(tool.name) : tool.title},
      {"description", tool.description},
      {"requestBody",
       {{"required", true},
        {"content", {{"application/json", {{"schema", tool.input_schema}}}}}}},
      {"responses",
       {{"200",
         {{"description", "Tool result"},
          {"content", {{"application/json", {{"schema", success_schema}}}}}}},
        {"400", ErrorResponse("Request body is not valid JSON or was rejected by the tool")},
        {"422", ErrorResponse("Request body does not match the tool's input schema")},
        {"500", ErrorResponse("The tool server reported an error")},
        {"502", ErrorResponse("The tool reported a failed invocation")},
        {"503", ErrorResponse("The tool server is not ready")},
        {"504", ErrorResponse("The tool did not answer before the deadline")}}},
      {"x-mcp-tool-name", tool.name},
  };
  if (tool.annotations) {
    operation["x-mcp-annotations"] = *tool.annotations;
  }
  return operation;
}

}  // namespace

std::string SanitizeToolName(const std::string& name) {
  std::string segment;
  segment.reserve(name.size());
  bool has_safe_char = false;
  for (unsigned char ch : name) {
    if (IsSafeSegmentChar(ch)) {
      segment.push_back(static_cast<char>(ch));
      has_safe_char = true;
    } else {
      segment.push_back('_');
    }
  }
  if (!has_safe_char || segment == "." || segment == "..") {
    return {};
  }
  return segment;
}

std::string SummaryFromName(const std::string& name) {
  std::string summary;
  summary.reserve(name.size());
  bool previous_is_letter = false;
  for (unsigned char ch : name) {
    const char mapped = ch == '_' ? ' ' : static_cast<char>(ch);
    const bool is_letter = std::isalpha(static_cast<unsigned char>(mapped)) != 0;
    if (is_letter) {
      summary.push_back(static_cast<char>(
          previous_is_letter ? std::tolower(static_cast<unsigned char>(mapped))
                             : std::toupper(static_cast<unsigned char>(mapped))));
    } else {
      summary.push_back(mapped);
    }
    previous_is_letter = is_letter;
  }
  return summary;
}

json ErrorEnvelopeSchema() {
  return {
      {"type", "object"},
      {"required", {"error"}},
      {"properties",
       {{"error",
         {{"type", "object"},
          {"required", {"kind", "message"}},
          {"properties",
           {{"kind",
             {{"type", "string"},
              {"description",
               "TransportError, ProtocolError, ToolInvocationError, TimeoutError, "
               "SchemaValidationError, InvalidRequest or NotFound"}}},
            {"message", {{"type", "string"}}},
            {"code", {{"type", "integer"}, {"description", "JSON-RPC error code"}}},
            {"data", {{"description", "JSON-RPC error data as sent by the tool server"}}},
            {"violations", {{"type", "array"}, {"items", {{"type", "string"}}}}},
            {"state", {{"type", "string"}, {"description", "Tool server lifecycle state"}}}}}}}}},
  };
}

json BuildOpenApiDocument(const ServerInfo& server, const ToolList& tools) {
  std::string title = server.name.empty() ? "MCP OpenAPI Proxy" : server.name;
  std::string description = "Automatically generated API endpoints based on MCP tool schemas.";
  if (!server.name.empty()) {
    std::string capitalized = server.name;
    capitalized[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(capitalized[0])));
    description = capitalized + " MCP OpenAPI Proxy";
  }
  if (!server.instructions.empty()) {
    description += "\n\n" + server.instructions;
  }

  json info = {{"title", title},
               {"description", description},
               {"version", server.version.empty() ? "1.0" : server.version}};
  if (!server.protocol_version.empty()) {
    info["x-mcp-protocol-version"] = server.protocol_version;
  }

  json paths = json::object();
  for (const auto& tool : tools) {
    paths["/" + tool->route_segment] = {{"post", OperationFor(*tool)}};
  }

  return {{"openapi", kOpenApiVersion},
          {"info", info},
          {"paths", paths},
          {"components", {{"schemas", {{"ErrorEnvelope", ErrorEnvelopeSchema()}}}}}};
}

}  // namespace bridge::openapi
