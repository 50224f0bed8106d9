#pragma once

#include <optional>
#include <string>
#include <variant>

#include "nlohmann/json.hpp"

namespace bridge {

struct Request {
  nlohmann::json id;
  std::string method;
  nlohmann::json params;
};

struct Response {
  nlohmann::json id;
  nlohmann::json result;
  std::optional<nlohmann::json> error;
};

struct Notification {
  std::string method;
  nlohmann::json params;
};

using Message = std::variant<Request, Response, Notification>;

nlohmann::json ToJson(const Message& message);

// Single-line JSON text, without the trailing newline.
std::string Serialize(const Message& message);

// Throws ProtocolError when the text is not a JSON-RPC 2.0 message.
Message ParseMessage(const std::string& line);
Message MessageFromJson(const nlohmann::json& payload);

std::string DescribeId(const nlohmann::json& id);

}  // namespace bridge
