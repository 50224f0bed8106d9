#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"

namespace bridge {

enum class ProcessState { kStarting = 0, kHandshaking, kReady, kDegraded, kRestarting, kTerminated };

std::string_view ProcessStateName(ProcessState state);

// What the HTTP routes need from the supervised tool server.
class ToolInvoker {
 public:
  virtual ~ToolInvoker() = default;

  virtual ProcessState State() const = 0;
  virtual std::uint64_t Generation() const = 0;

  // Issues tools/call {name, arguments} and returns the JSON-RPC result.
  // Throws ToolInvocationError, TimeoutError or TransportError.
  virtual nlohmann::json CallTool(const std::string& name, const nlohmann::json& arguments,
                                  std::chrono::milliseconds timeout) = 0;

  // Extra fields for the health report.
  virtual nlohmann::json Diagnostics() const { return nlohmann::json::object(); }
};

}  // namespace bridge
