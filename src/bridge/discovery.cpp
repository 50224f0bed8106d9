#include "bridge/discovery.hpp"

#include <cstdio>
#include <map>
#include <set>
#include <utility>

#include "bridge/errors.hpp"
#include "bridge/logging.hpp"
#include "bridge/openapi.hpp"
#include "bridge/schema_validator.hpp"
#include "xxhash.h"

namespace bridge {
namespace {

using logging::LogInfo;
using logging::LogWarn;
using nlohmann::json;

const std::set<std::string>& SupportedProtocolVersions() {
  static const std::set<std::string> kVersions = {"2024-11-05", "2025-03-26", "2025-06-18"};
  return kVersions;
}

std::string StringField(const json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

std::string Join(const std::vector<std::string>& parts) {
  std::string joined;
  for (const auto& part : parts) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += part;
  }
  return joined;
}

}  // namespace

bool IsSupportedProtocolVersion(const std::string& version) {
  return SupportedProtocolVersions().count(version) > 0;
}

Discovery::Discovery(Correlator& correlator, DiscoveryOptions options)
    : correlator_(correlator), options_(std::move(options)) {}

ServerInfo Discovery::Handshake() {
  const json params = {
      {"protocolVersion", options_.protocol_version},
      {"capabilities", json::object()},
      {"clientInfo", {{"name", options_.client_name}, {"version", options_.client_version}}},
  };
  const json result = correlator_.Call("initialize", params, options_.timeout);

  if (!result.is_object()) {
    throw ProtocolError("initialize result must be an object");
  }
  ServerInfo info;
  info.protocol_version = StringField(result, "protocolVersion");
  if (info.protocol_version.empty()) {
    throw ProtocolError("initialize result is missing 'protocolVersion'");
  }
  if (!IsSupportedProtocolVersion(info.protocol_version)) {
    throw ProtocolError("Tool server negotiated unsupported protocol version " +
                        info.protocol_version);
  }
  if (const auto server = result.find("serverInfo"); server != result.end() && server->is_object()) {
    info.name = StringField(*server, "name");
    info.version = StringField(*server, "version");
  }
  info.instructions = StringField(result, "instructions");

  const auto capabilities = result.find("capabilities");
  if (capabilities == result.end() || !capabilities->is_object() ||
      !capabilities->contains("tools")) {
    LogWarn("[discovery] tool server does not advertise the tools capability; listing anyway");
  }

  correlator_.Notify("notifications/initialized", json::object());
  LogInfo("[discovery] generation " + std::to_string(correlator_.generation()) +
          " handshake complete: " + (info.name.empty() ? "<unnamed>" : info.name) + " " +
          info.version + " (protocol " + info.protocol_version + ")");
  return info;
}

ToolList Discovery::ListTools(std::vector<std::string>& warnings) {
  json entries = json::array();
  std::string cursor;
  for (std::size_t page = 0;; ++page) {
    if (page >= options_.max_pages) {
      warnings.push_back("tools/list pagination stopped after " +
                         std::to_string(options_.max_pages) + " pages");
      break;
    }
    json params = json::object();
    if (!cursor.empty()) {
      params["cursor"] = cursor;
    }
    const json result = correlator_.Call("tools/list", params, options_.timeout);
    if (!result.is_object()) {
      throw ProtocolError("tools/list result must be an object");
    }
    const auto tools = result.find("tools");
    if (tools == result.end() || !tools->is_array()) {
      throw ProtocolError("tools/list result is missing the 'tools' array");
    }
    for (const auto& entry : *tools) {
      entries.push_back(entry);
    }
    cursor = StringField(result, "nextCursor");
    if (cursor.empty()) {
      break;
    }
  }

  ToolList normalized = NormalizeTools(entries, warnings);
  for (const auto& warning : warnings) {
    LogWarn("[discovery] " + warning);
  }
  return normalized;
}

DiscoveryResult Discovery::Discover() {
  DiscoveryResult result;
  result.generation = correlator_.generation();
  result.server = Handshake();
  result.tools = ListTools(result.warnings);
  result.fingerprint = FingerprintTools(result.tools);
  LogInfo("[discovery] generation " + std::to_string(result.generation) + " exposes " +
          std::to_string(result.tools.size()) + " tool(s), catalog " + result.fingerprint);
  return result;
}

ToolList NormalizeTools(const json& entries, std::vector<std::string>& warnings) {
  std::vector<ToolDescriptor> accepted;
  std::set<std::string> names;

  for (std::size_t index = 0; index < entries.size(); ++index) {
    const json& entry = entries.at(index);
    const std::string where = "tool #" + std::to_string(index);
    if (!entry.is_object()) {
      warnings.push_back(where + " dropped: entry is not an object");
      continue;
    }
    ToolDescriptor tool;
    tool.name = StringField(entry, "name");
    if (tool.name.empty()) {
      warnings.push_back(where + " dropped: missing or empty 'name'");
      continue;
    }
    if (names.count(tool.name) != 0) {
      warnings.push_back("tool '" + tool.name + "' dropped: duplicate name");
      continue;
    }

    const auto input = entry.find("inputSchema");
    if (input == entry.end()) {
      warnings.push_back("tool '" + tool.name + "' dropped: missing 'inputSchema'");
      continue;
    }
    const auto problems = schema::CheckSchema(*input);
    if (!problems.empty()) {
      warnings.push_back("tool '" + tool.name + "' dropped: invalid inputSchema: " +
                         Join(problems));
      continue;
    }
    tool.input_schema = *input;

    if (const auto output = entry.find("outputSchema"); output != entry.end()) {
      const auto output_problems = schema::CheckSchema(*output);
      if (output_problems.empty()) {
        tool.output_schema = *output;
      } else {
        warnings.push_back("tool '" + tool.name + "' outputSchema ignored: " +
                           Join(output_problems));
      }
    }

    tool.route_segment = openapi::SanitizeToolName(tool.name);
    if (tool.route_segment.empty()) {
      warnings.push_back("tool '" + tool.name + "' dropped: name has no usable path characters");
      continue;
    }

    tool.title = StringField(entry, "title");
    tool.description = StringField(entry, "description");
    if (const auto annotations = entry.find("annotations");
        annotations != entry.end() && annotations->is_object()) {
      tool.annotations = *annotations;
      if (tool.title.empty()) {
        tool.title = StringField(*annotations, "title");
      }
    }
    // Only entries that survived validation claim their name.
    names.insert(tool.name);
    accepted.push_back(std::move(tool));
  }

  std::map<std::string, std::vector<std::string>> by_segment;
  for (const auto& tool : accepted) {
    by_segment[tool.route_segment].push_back(tool.name);
  }

  ToolList tools;
  for (auto& tool : accepted) {
    const auto& sharing = by_segment[tool.route_segment];
    if (sharing.size() > 1) {
      warnings.push_back("tool '" + tool.name + "' dropped: path /" + tool.route_segment +
                         " is shared by " + std::to_string(sharing.size()) + " tools");
      continue;
    }
    tools.push_back(std::make_shared<const ToolDescriptor>(std::move(tool)));
  }
  return tools;
}

std::string FingerprintTools(const ToolList& tools) {
  std::map<std::string, json> canonical;
  for (const auto& tool : tools) {
    canonical[tool->name] = {
        {"name", tool->name},
        {"description", tool->description},
        {"inputSchema", tool->input_schema},
        {"outputSchema", tool->output_schema ? *tool->output_schema : json()},
    };
  }
  json ordered = json::array();
  for (auto& [name, value] : canonical) {
    ordered.push_back(std::move(value));
  }
  const std::string text = ordered.dump();
  const XXH64_hash_t hash = XXH3_64bits(text.data(), text.size());

  char hex[17];
  std::snprintf(hex, sizeof(hex), "%016llx", static_cast<unsigned long long>(hash));
  return hex;
}

}  // namespace bridge
