#pragma once

namespace bridge {

constexpr char kBridgeName[] = "mcp-openapi-bridge";
constexpr char kBridgeVersion[] = "0.3.0";

}  // namespace bridge
