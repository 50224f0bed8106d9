#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace platform {

enum class HttpMethod { kGet = 0, kPost, kOptions };

struct HttpRequest {
  std::string method;
  std::string path;
  std::string body;
  std::vector<std::string> path_params;
  std::map<std::string, std::string> query_params;
  std::map<std::string, std::string> headers;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::map<std::string, std::string> headers;
};

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;
using HttpAccessLogger =
    std::function<void(const std::string& method, const std::string& path, int status)>;

struct HttpServerOptions {
  std::size_t threads = 8;
  // Larger request bodies are answered with 413 before any handler runs.
  std::size_t max_body_bytes = 10 * 1024 * 1024;
  std::chrono::seconds read_timeout{30};
  std::chrono::seconds write_timeout{30};
  // Sent with every response, including the server's own 404 and 413.
  std::map<std::string, std::string> default_headers;
  HttpAccessLogger access_logger;
};

// Case-insensitive header lookup; returns an empty string when absent.
std::string FindHeader(const HttpRequest& request, const std::string& name);

// Blocking HTTP/1.1 server over a fixed worker pool. Handler exceptions become
// 500 responses; statuses produced without a handler get a JSON error body.
class HttpServer {
 public:
  explicit HttpServer(HttpServerOptions options = {});
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Path patterns are regular expressions; capture groups become path_params.
  void AddHandler(HttpMethod method, const std::string& path, HttpHandler handler);
  // Blocks until Stop(), returning at once if Stop() already ran. Throws if
  // the address cannot be bound.
  void Start(const std::string& host, int port);
  // Safe to call from any thread, before or during Start().
  void Stop();
  bool IsRunning() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace platform
