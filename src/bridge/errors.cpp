#include "bridge/errors.hpp"

#include <sstream>
#include <utility>

namespace bridge {
namespace {

std::string JoinViolations(const std::vector<std::string>& violations) {
  if (violations.empty()) {
    return "Request body does not match the tool's input schema";
  }
  std::ostringstream stream;
  for (std::size_t i = 0; i < violations.size(); ++i) {
    if (i > 0) {
      stream << "; ";
    }
    stream << violations[i];
  }
  return stream.str();
}

}  // namespace

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kTransport:
      return "TransportError";
    case ErrorKind::kProtocol:
      return "ProtocolError";
    case ErrorKind::kToolInvocation:
      return "ToolInvocationError";
    case ErrorKind::kTimeout:
      return "TimeoutError";
    case ErrorKind::kSchemaValidation:
      return "SchemaValidationError";
  }
  return "BridgeError";
}

BridgeError::BridgeError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

TransportError::TransportError(const std::string& message)
    : BridgeError(ErrorKind::kTransport, message) {}

ProtocolError::ProtocolError(const std::string& message)
    : BridgeError(ErrorKind::kProtocol, message) {}

ToolInvocationError::ToolInvocationError(int code, const std::string& message,
                                         nlohmann::json data)
    : BridgeError(ErrorKind::kToolInvocation, message), code_(code), data_(std::move(data)) {}

nlohmann::json ToolInvocationError::ToJson() const {
  nlohmann::json error = {{"code", code_}, {"message", what()}};
  if (!data_.is_null()) {
    error["data"] = data_;
  }
  return error;
}

TimeoutError::TimeoutError(const std::string& message)
    : BridgeError(ErrorKind::kTimeout, message) {}

SchemaValidationError::SchemaValidationError(std::vector<std::string> violations)
    : BridgeError(ErrorKind::kSchemaValidation, JoinViolations(violations)),
      violations_(std::move(violations)) {}

}  // namespace bridge
