#pragma once

#include <string>

#include "bridge/tool_descriptor.hpp"
#include "nlohmann/json.hpp"

namespace bridge::openapi {

// Maps a tool name onto a URL path segment: characters outside [A-Za-z0-9._-]
// become '_'. Returns an empty string when no usable segment remains.
std::string SanitizeToolName(const std::string& name);

// "get_current_time" -> "Get Current Time".
std::string SummaryFromName(const std::string& name);

nlohmann::json ErrorEnvelopeSchema();

// Builds the OpenAPI 3.1 document for a tool catalog. Deterministic for a given
// input.
nlohmann::json BuildOpenApiDocument(const ServerInfo& server, const ToolList& tools);

}  // namespace bridge::openapi
