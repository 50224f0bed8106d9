#include "bridge/message.hpp"

#include <type_traits>

#include "bridge/errors.hpp"

namespace bridge {
namespace {

constexpr char kJsonRpcVersion[] = "2.0";

bool IsValidId(const nlohmann::json& id) {
  return id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

void CheckErrorObject(const nlohmann::json& error) {
  if (!error.is_object()) {
    throw ProtocolError("JSON-RPC error must be an object");
  }
  const auto code = error.find("code");
  if (code == error.end() || !code->is_number_integer()) {
    throw ProtocolError("JSON-RPC error is missing an integer 'code'");
  }
  const auto message = error.find("message");
  if (message == error.end() || !message->is_string()) {
    throw ProtocolError("JSON-RPC error is missing a string 'message'");
  }
}

}  // namespace

nlohmann::json ToJson(const Message& message) {
  return std::visit(
      [](const auto& value) -> nlohmann::json {
        using T = std::decay_t<decltype(value)>;
        nlohmann::json payload = {{"jsonrpc", kJsonRpcVersion}};
        if constexpr (std::is_same_v<T, Request>) {
          payload["id"] = value.id;
          payload["method"] = value.method;
          if (!value.params.is_null()) {
            payload["params"] = value.params;
          }
        } else if constexpr (std::is_same_v<T, Response>) {
          payload["id"] = value.id;
          if (value.error) {
            payload["error"] = *value.error;
          } else {
            payload["result"] = value.result;
          }
        } else {
          payload["method"] = value.method;
          if (!value.params.is_null()) {
            payload["params"] = value.params;
          }
        }
        return payload;
      },
      message);
}

std::string Serialize(const Message& message) {
  // dump() escapes control characters, so the text never contains a raw newline.
  return ToJson(message).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Message ParseMessage(const std::string& line) {
  nlohmann::json payload = nlohmann::json::parse(line, nullptr, false);
  if (payload.is_discarded()) {
    throw ProtocolError("Malformed JSON line");
  }
  return MessageFromJson(payload);
}

Message MessageFromJson(const nlohmann::json& payload) {
  if (payload.is_array()) {
    throw ProtocolError("JSON-RPC batches are not supported");
  }
  if (!payload.is_object()) {
    throw ProtocolError("JSON-RPC message must be an object");
  }
  const auto version = payload.find("jsonrpc");
  if (version == payload.end() || !version->is_string() ||
      version->get<std::string>() != kJsonRpcVersion) {
    throw ProtocolError("Message does not declare jsonrpc \"2.0\"");
  }

  const auto id = payload.find("id");
  const auto method = payload.find("method");
  const auto params_it = payload.find("params");
  const nlohmann::json params = params_it != payload.end() ? *params_it : nlohmann::json();

  if (method != payload.end()) {
    if (!method->is_string()) {
      throw ProtocolError("JSON-RPC 'method' must be a string");
    }
    if (!params.is_null() && !params.is_object() && !params.is_array()) {
      throw ProtocolError("JSON-RPC 'params' must be an object or array");
    }
    if (id == payload.end() || id->is_null()) {
      return Notification{method->get<std::string>(), params};
    }
    if (!IsValidId(*id)) {
      throw ProtocolError("JSON-RPC 'id' must be a string or integer");
    }
    return Request{*id, method->get<std::string>(), params};
  }

  if (id == payload.end()) {
    throw ProtocolError("Message has neither 'method' nor 'id'");
  }
  if (!id->is_null() && !IsValidId(*id)) {
    throw ProtocolError("JSON-RPC 'id' must be a string or integer");
  }

  const auto result = payload.find("result");
  const auto error = payload.find("error");
  if (result != payload.end() && error != payload.end()) {
    throw ProtocolError("Response carries both 'result' and 'error'");
  }
  if (error != payload.end()) {
    CheckErrorObject(*error);
    return Response{*id, nullptr, *error};
  }
  if (result == payload.end()) {
    throw ProtocolError("Response carries neither 'result' nor 'error'");
  }
  return Response{*id, *result, std::nullopt};
}

std::string DescribeId(const nlohmann::json& id) {
  if (id.is_string()) {
    return id.get<std::string>();
  }
  return id.dump();
}

}  // namespace bridge
