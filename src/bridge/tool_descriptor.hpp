#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace bridge {

// Identity reported by the tool server in its initialize response.
struct ServerInfo {
  std::string name;
  std::string version;
  std::string protocol_version;
  std::string instructions;
};

struct ToolDescriptor {
  std::string name;
  std::string title;
  std::string description;
  nlohmann::json input_schema;
  std::optional<nlohmann::json> output_schema;
  std::optional<nlohmann::json> annotations;
  // Path segment the tool is served under, see openapi::SanitizeToolName.
  std::string route_segment;
};

using ToolList = std::vector<std::shared_ptr<const ToolDescriptor>>;

}  // namespace bridge
