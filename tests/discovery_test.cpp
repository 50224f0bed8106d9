#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "bridge/correlator.hpp"
#include "bridge/discovery.hpp"
#include "bridge/errors.hpp"
#include "bridge/framer.hpp"
#include "nlohmann/json.hpp"
#include "pipe_peer.hpp"

namespace {

using nlohmann::json;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

bool Contains(const std::vector<std::string>& values, const std::string& needle) {
  for (const auto& value : values) {
    if (value.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

json Tool(const std::string& name) {
  return {{"name", name},
          {"description", "Tool " + name},
          {"inputSchema", {{"type", "object"}, {"properties", json::object()}}}};
}

json InitializeResult(const std::string& version) {
  return {{"protocolVersion", version},
          {"capabilities", {{"tools", {{"listChanged", true}}}}},
          {"serverInfo", {{"name", "scripted"}, {"version", "0.9.1"}}},
          {"instructions", "Use with care."}};
}

bridge::DiscoveryOptions FastOptions() {
  bridge::DiscoveryOptions options;
  options.timeout = std::chrono::milliseconds(5000);
  return options;
}

void TestHandshakeAndPagination() {
  test::PipePeer server;
  bridge::Framer framer(server.framer_write_fd, server.framer_read_fd, "discovery");
  bridge::Correlator correlator(framer, 7);
  framer.Start();

  std::vector<json> seen;
  std::thread script([&] {
    json request = server.ReadRequest();
    seen.push_back(request);
    server.Reply(request.at("id"), InitializeResult("2025-03-26"));

    seen.push_back(server.ReadRequest());  // notifications/initialized

    request = server.ReadRequest();
    seen.push_back(request);
    server.Reply(request.at("id"),
                 {{"tools", json::array({Tool("alpha"), Tool("beta")})}, {"nextCursor", "p2"}});

    request = server.ReadRequest();
    seen.push_back(request);
    server.Reply(request.at("id"), {{"tools", json::array({Tool("gamma")})}});
  });

  bridge::Discovery discovery(correlator, FastOptions());
  const bridge::DiscoveryResult result = discovery.Discover();
  script.join();

  const json& initialize = seen.at(0);
  Assert(initialize.at("method") == "initialize", "Handshake must start with initialize");
  Assert(initialize.at("params").at("protocolVersion") == "2025-03-26",
         "initialize must request the default protocol version");
  Assert(initialize.at("params").at("clientInfo").at("name") == "mcp-openapi-bridge",
         "clientInfo must name the bridge");
  Assert(seen.at(1).at("method") == "notifications/initialized" && !seen.at(1).contains("id"),
         "initialized must be sent as a notification");
  Assert(!seen.at(2).at("params").contains("cursor"), "First page has no cursor");
  Assert(seen.at(3).at("params").at("cursor") == "p2", "Second page must send nextCursor");

  Assert(result.generation == 7, "Result should carry the correlator generation");
  Assert(result.server.name == "scripted" && result.server.version == "0.9.1",
         "serverInfo should be captured");
  Assert(result.server.instructions == "Use with care.", "instructions should be captured");
  Assert(result.tools.size() == 3, "Both pages should be collected");
  Assert(result.tools[2]->name == "gamma", "Order of tools is preserved");
  Assert(result.warnings.empty(), "Valid catalog produces no warnings");
  Assert(result.fingerprint.size() == 16, "Fingerprint is 16 hex digits");
  framer.Stop();
}

void TestHandshakeMismatch() {
  for (const json& reply : {InitializeResult("1999-01-01"),
                            json{{"serverInfo", {{"name", "no-version"}}}}}) {
    test::PipePeer server;
    bridge::Framer framer(server.framer_write_fd, server.framer_read_fd, "mismatch");
    bridge::Correlator correlator(framer, 1);
    framer.Start();

    std::thread script([&] {
      const json request = server.ReadRequest();
      server.Reply(request.at("id"), reply);
    });

    bool rejected = false;
    try {
      bridge::Discovery(correlator, FastOptions()).Handshake();
    } catch (const bridge::ProtocolError&) {
      rejected = true;
    }
    script.join();
    Assert(rejected, "Unusable initialize result must be a ProtocolError");
    framer.Stop();
  }
}

void TestInvalidEntriesAreDropped() {
  json entries = json::array();
  entries.push_back(Tool("good"));
  entries.push_back(Tool("good"));                            // duplicate
  entries.push_back({{"description", "no name"}});             // missing name
  entries.push_back({{"name", "noschema"}});                   // missing inputSchema
  entries.push_back({{"name", "badschema"}, {"inputSchema", {{"type", "blob"}}}});
  entries.push_back({{"name", "///"}, {"inputSchema", {{"type", "object"}}}});
  json with_bad_output = Tool("loose");
  with_bad_output["outputSchema"] = "not a schema";
  entries.push_back(with_bad_output);
  entries.push_back(42);

  std::vector<std::string> warnings;
  const auto tools = bridge::NormalizeTools(entries, warnings);

  Assert(tools.size() == 2, "Only the valid entries survive");
  Assert(tools[0]->name == "good" && tools[1]->name == "loose", "Survivors keep their order");
  Assert(!tools[1]->output_schema.has_value(), "Invalid output schema is ignored");
  Assert(Contains(warnings, "duplicate name"), "Duplicates are reported");
  Assert(Contains(warnings, "missing or empty 'name'"), "Missing names are reported");
  Assert(Contains(warnings, "missing 'inputSchema'"), "Missing schemas are reported");
  Assert(Contains(warnings, "invalid inputSchema"), "Invalid schemas are reported");
  Assert(Contains(warnings, "no usable path characters"), "Unroutable names are reported");
  Assert(Contains(warnings, "outputSchema ignored"), "Ignored output schemas are reported");
  Assert(Contains(warnings, "not an object"), "Non-object entries are reported");
}

void TestRejectedEntryDoesNotClaimName() {
  json entries = json::array();
  entries.push_back({{"name", "lookup"}, {"inputSchema", {{"type", "blob"}}}});
  entries.push_back({{"name", "lookup"}});
  entries.push_back(Tool("lookup"));
  entries.push_back(Tool("lookup"));

  std::vector<std::string> warnings;
  const auto tools = bridge::NormalizeTools(entries, warnings);

  Assert(tools.size() == 1 && tools[0]->name == "lookup",
         "The first valid entry is kept after invalid ones");
  Assert(warnings.size() == 3, "Two invalid entries and one duplicate are reported");
  Assert(Contains(warnings, "duplicate name"), "Later valid copies are still duplicates");
}

void TestSanitizedCollisionsDropAllColliders() {
  const json entries = json::array({Tool("read file"), Tool("read/file"), Tool("write_file")});
  std::vector<std::string> warnings;
  const auto tools = bridge::NormalizeTools(entries, warnings);

  Assert(tools.size() == 1 && tools[0]->name == "write_file",
         "Every entry sharing a sanitized path is dropped");
  Assert(tools[0]->route_segment == "write_file", "Survivor keeps its segment");
  Assert(warnings.size() == 2 && Contains(warnings, "/read_file"),
         "Each collision is reported with its path");
}

void TestFingerprint() {
  std::vector<std::string> warnings;
  const auto forward =
      bridge::NormalizeTools(json::array({Tool("a"), Tool("b")}), warnings);
  const auto reversed =
      bridge::NormalizeTools(json::array({Tool("b"), Tool("a")}), warnings);
  const auto changed =
      bridge::NormalizeTools(json::array({Tool("a"), Tool("c")}), warnings);

  Assert(bridge::FingerprintTools(forward) == bridge::FingerprintTools(reversed),
         "Fingerprint must not depend on listing order");
  Assert(bridge::FingerprintTools(forward) != bridge::FingerprintTools(changed),
         "Fingerprint must change with the catalog");
  Assert(bridge::IsSupportedProtocolVersion("2024-11-05"), "2024-11-05 is supported");
  Assert(!bridge::IsSupportedProtocolVersion("2023-01-01"), "Unknown versions are rejected");
}

void RunTests() {
  TestHandshakeAndPagination();
  TestHandshakeMismatch();
  TestInvalidEntriesAreDropped();
  TestRejectedEntryDoesNotClaimName();
  TestSanitizedCollisionsDropAllColliders();
  TestFingerprint();
}

}  // namespace

int main() {
  try {
    RunTests();
  } catch (const std::exception& ex) {
    std::cerr << "Discovery test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
