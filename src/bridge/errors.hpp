#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

namespace bridge {

enum class ErrorKind {
  kTransport = 0,
  kProtocol,
  kToolInvocation,
  kTimeout,
  kSchemaValidation,
};

// Name used in the HTTP error envelope's "kind" field.
std::string_view ErrorKindName(ErrorKind kind);

class BridgeError : public std::runtime_error {
 public:
  BridgeError(ErrorKind kind, const std::string& message);

  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

// Broken pipe, unexpected exit, or a call issued against a drained generation.
class TransportError : public BridgeError {
 public:
  explicit TransportError(const std::string& message);
};

// Malformed or unexpected message. Scoped to the offending message.
class ProtocolError : public BridgeError {
 public:
  explicit ProtocolError(const std::string& message);
};

// The subprocess answered a call with a JSON-RPC error object.
class ToolInvocationError : public BridgeError {
 public:
  ToolInvocationError(int code, const std::string& message, nlohmann::json data = nullptr);

  int code() const { return code_; }
  const nlohmann::json& data() const { return data_; }

  // The error object as received, suitable for relaying to HTTP callers.
  nlohmann::json ToJson() const;

 private:
  int code_;
  nlohmann::json data_;
};

class TimeoutError : public BridgeError {
 public:
  explicit TimeoutError(const std::string& message);
};

class SchemaValidationError : public BridgeError {
 public:
  explicit SchemaValidationError(std::vector<std::string> violations);

  const std::vector<std::string>& violations() const { return violations_; }

 private:
  std::vector<std::string> violations_;
};

// JSON-RPC 2.0 reserved error codes.
namespace jsonrpc {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
}  // namespace jsonrpc

}  // namespace bridge
