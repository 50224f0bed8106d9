#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "nlohmann/json.hpp"

namespace {

using nlohmann::json;

struct Options {
  bool crash_on_start = false;
  long exit_after = 0;
  bool notify_list_changed = false;
  // Keep running after stdin closes, until a signal ends the process.
  bool ignore_eof = false;
  bool ignore_sigterm = false;
};

std::mutex output_mutex;
std::atomic<long> calls_answered{0};
std::atomic<bool> extra_tool_listed{false};

void WriteMessage(const json& payload) {
  std::lock_guard<std::mutex> lock(output_mutex);
  std::cout << payload.dump() << '\n';
  std::cout.flush();
}

json MakeResultPayload(const json& id, const json& result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json MakeErrorPayload(const json& id, int code, const std::string& message,
                      const json& data = nullptr) {
  json error = {{"code", code}, {"message", message}};
  if (!data.is_null()) {
    error["data"] = data;
  }
  return {{"jsonrpc", "2.0"}, {"id", id}, {"error", error}};
}

json TextContent(const std::string& text) {
  return json::array({{{"type", "text"}, {"text", text}}});
}

json ToolSchemas() {
  json tools = json::array();
  tools.push_back({{"name", "echo"},
                   {"description", "Returns the text it was given."},
                   {"inputSchema",
                    {{"type", "object"},
                     {"properties", {{"text", {{"type", "string"}}}}},
                     {"required", {"text"}},
                     {"additionalProperties", false}}},
                   {"outputSchema",
                    {{"type", "object"},
                     {"properties", {{"text", {{"type", "string"}}}}},
                     {"required", {"text"}}}}});
  tools.push_back({{"name", "add"},
                   {"description", "Adds two numbers."},
                   {"inputSchema",
                    {{"type", "object"},
                     {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
                     {"required", {"a", "b"}}}},
                   {"annotations", {{"readOnlyHint", true}}}});
  tools.push_back({{"name", "sleep"},
                   {"description", "Waits before answering."},
                   {"inputSchema",
                    {{"type", "object"},
                     {"properties",
                      {{"ms", {{"type", "integer"}, {"minimum", 0}, {"maximum", 60000}}}}},
                     {"required", {"ms"}}}}});
  tools.push_back({{"name", "fail"},
                   {"description", "Answers with a JSON-RPC error."},
                   {"inputSchema",
                    {{"type", "object"},
                     {"properties",
                      {{"code", {{"type", "integer"}}}, {"message", {{"type", "string"}}}}}}}});
  tools.push_back({{"name", "reject"},
                   {"description", "Answers with a tool result flagged isError."},
                   {"inputSchema", {{"type", "object"}}}});
  tools.push_back({{"name", "env"},
                   {"description", "Reads an environment variable of the server process."},
                   {"inputSchema",
                    {{"type", "object"},
                     {"properties", {{"name", {{"type", "string"}}}}},
                     {"required", {"name"}}}}});
  tools.push_back({{"name", "crash"},
                   {"description", "Exits the server immediately."},
                   {"inputSchema", {{"type", "object"}}}});
  if (extra_tool_listed.load()) {
    tools.push_back({{"name", "reverse"},
                     {"description", "Reverses the text it was given."},
                     {"inputSchema",
                      {{"type", "object"},
                       {"properties", {{"text", {{"type", "string"}}}}},
                       {"required", {"text"}}}}});
  }
  return tools;
}

// Returns the response payload for one tools/call.
json CallTool(const json& id, const std::string& name, const json& arguments) {
  if (name == "echo") {
    const std::string text = arguments.at("text").get<std::string>();
    return MakeResultPayload(id, {{"content", TextContent(text)},
                                  {"structuredContent", {{"text", text}}}});
  }
  if (name == "add") {
    const double sum = arguments.at("a").get<double>() + arguments.at("b").get<double>();
    const json value = {{"sum", sum}};
    return MakeResultPayload(id, {{"content", TextContent(value.dump())}});
  }
  if (name == "sleep") {
    const auto ms = arguments.at("ms").get<long>();
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    return MakeResultPayload(id, {{"content", TextContent("slept " + std::to_string(ms) + "ms")}});
  }
  if (name == "fail") {
    const int code = arguments.value("code", -32000);
    const std::string message = arguments.value("message", std::string{"requested failure"});
    return MakeErrorPayload(id, code, message, {{"tool", name}});
  }
  if (name == "reject") {
    return MakeResultPayload(id, {{"content", TextContent("rejected")}, {"isError", true}});
  }
  if (name == "env") {
    const char* value = std::getenv(arguments.at("name").get<std::string>().c_str());
    return MakeResultPayload(
        id, {{"structuredContent", {{"value", value ? json(value) : json(nullptr)}}}});
  }
  if (name == "reverse" && extra_tool_listed.load()) {
    std::string text = arguments.at("text").get<std::string>();
    return MakeResultPayload(id, {{"structuredContent", {{"text", std::string(text.rbegin(), text.rend())}}}});
  }
  if (name == "crash") {
    std::cerr << "crash requested" << std::endl;
    std::_Exit(3);
  }
  return MakeErrorPayload(id, -32602, "Unknown tool: " + name);
}

void HandleToolCall(const Options& options, const json& message) {
  const json id = message.value("id", json());
  json response;
  try {
    const auto& params = message.at("params");
    const std::string name = params.at("name").get<std::string>();
    const json arguments = params.contains("arguments") ? params.at("arguments") : json::object();
    response = CallTool(id, name, arguments);
  } catch (const json::exception& ex) {
    response = MakeErrorPayload(id, -32602, ex.what());
  }
  WriteMessage(response);

  const long answered = ++calls_answered;
  if (options.notify_list_changed && !extra_tool_listed.exchange(true)) {
    WriteMessage({{"jsonrpc", "2.0"}, {"method", "notifications/tools/list_changed"}});
  }
  if (options.exit_after > 0 && answered >= options.exit_after) {
    std::cerr << "exiting after " << answered << " call(s)" << std::endl;
    std::_Exit(0);
  }
}

Options ParseOptions(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--crash-on-start") {
      options.crash_on_start = true;
    } else if (arg == "--notify-list-changed") {
      options.notify_list_changed = true;
    } else if (arg == "--ignore-eof") {
      options.ignore_eof = true;
    } else if (arg == "--ignore-sigterm") {
      options.ignore_sigterm = true;
    } else if (arg == "--exit-after" && i + 1 < argc) {
      options.exit_after = std::stol(argv[++i]);
    } else {
      throw std::invalid_argument("Unknown argument: " + arg);
    }
  }
  return options;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const Options options = ParseOptions(argc, argv);
    if (options.crash_on_start) {
      std::cerr << "mcp_echo_server: crashing on start" << std::endl;
      return 3;
    }
    if (options.ignore_sigterm) {
      std::signal(SIGTERM, SIG_IGN);
    }
    std::cerr << "mcp_echo_server: ready" << std::endl;

    std::vector<std::thread> workers;
    std::string line;
    while (std::getline(std::cin, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.empty()) {
        continue;
      }
      const json message = json::parse(line, nullptr, false);
      if (message.is_discarded() || !message.is_object()) {
        WriteMessage(MakeErrorPayload(nullptr, -32700, "Parse error"));
        continue;
      }

      const auto method = message.value("method", std::string{});
      const json id = message.value("id", json());
      const bool is_request = message.contains("id");

      if (method == "initialize") {
        json result = {
            {"protocolVersion", "2025-03-26"},
            {"serverInfo", {{"name", "mcp_echo_server"}, {"version", "1.2.0"}}},
            {"capabilities", {{"tools", {{"listChanged", options.notify_list_changed}}}}},
            {"instructions", "Tools for exercising an MCP client."},
        };
        WriteMessage(MakeResultPayload(id, result));
        continue;
      }

      if (method == "tools/list") {
        WriteMessage(MakeResultPayload(id, {{"tools", ToolSchemas()}}));
        continue;
      }

      if (method == "tools/call") {
        workers.emplace_back(HandleToolCall, options, message);
        continue;
      }

      if (method == "ping") {
        WriteMessage(MakeResultPayload(id, json::object()));
        continue;
      }

      if (is_request && !method.empty()) {
        WriteMessage(MakeErrorPayload(id, -32601, "Unsupported method: " + method));
      }
    }

    if (options.ignore_eof) {
      std::cerr << "mcp_echo_server: input closed, staying up" << std::endl;
      while (true) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
      }
    }

    for (auto& worker : workers) {
      worker.join();
    }
  } catch (const std::exception& ex) {
    std::cerr << "Fatal MCP echo server error: " << ex.what() << std::endl;
    return 1;
  }

  return 0;
}
