#include "platform/http_server.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "httplib.h"
#include "nlohmann/json.hpp"

namespace platform {

class HttpServer::Impl {
 public:
  explicit Impl(HttpServerOptions server_options) : options(std::move(server_options)) {}

  HttpServerOptions options;
  httplib::Server server;
  std::mutex lifecycle_mutex;
  bool started = false;
  // Set by Stop(); httplib ignores stop() until its accept loop is running.
  std::atomic<bool> stop_requested{false};

  // Delivers stop() to a running accept loop at most once.
  void SendStop() {
    std::lock_guard<std::mutex> lock(stop_mutex);
    if (!stop_sent && server.is_running()) {
      server.stop();
      stop_sent = true;
    }
  }

 private:
  std::mutex stop_mutex;
  bool stop_sent = false;
};

namespace {

bool EqualsIgnoreCase(const std::string& left, const std::string& right) {
  return left.size() == right.size() &&
         std::equal(left.begin(), left.end(), right.begin(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) ==
                  std::tolower(static_cast<unsigned char>(b));
         });
}

std::string ErrorBody(const std::string& kind, const std::string& message) {
  return nlohmann::json{{"error", {{"kind", kind}, {"message", message}}}}.dump();
}

std::string KindForStatus(int status) {
  switch (status) {
    case 404:
      return "NotFound";
    case 405:
      return "MethodNotAllowed";
    case 413:
      return "PayloadTooLarge";
    default:
      return status >= 500 ? "InternalError" : "InvalidRequest";
  }
}

HttpRequest ConvertRequest(const httplib::Request& req) {
  HttpRequest request;
  request.method = req.method;
  request.path = req.path;
  request.body = req.body;
  for (std::size_t i = 1; i < req.matches.size(); ++i) {
    request.path_params.push_back(req.matches[i].str());
  }
  for (const auto& [key, value] : req.params) {
    request.query_params[key] = value;
  }
  for (const auto& [key, value] : req.headers) {
    request.headers[key] = value;
  }
  return request;
}

void ApplyResponse(const HttpResponse& response, httplib::Response& res) {
  for (const auto& [key, value] : response.headers) {
    res.set_header(key, value);
  }
  res.status = response.status;
  if (!response.body.empty()) {
    res.set_content(response.body,
                    response.content_type.empty() ? "text/plain" : response.content_type);
  }
}

httplib::Server::Handler WrapHandler(HttpHandler handler) {
  return [handler = std::move(handler)](const httplib::Request& req, httplib::Response& res) {
    try {
      ApplyResponse(handler(ConvertRequest(req)), res);
    } catch (const std::exception& ex) {
      res.status = 500;
      res.set_content(ErrorBody("InternalError", ex.what()), "application/json");
    }
  };
}

}  // namespace

std::string FindHeader(const HttpRequest& request, const std::string& name) {
  for (const auto& [key, value] : request.headers) {
    if (EqualsIgnoreCase(key, name)) {
      return value;
    }
  }
  return {};
}

HttpServer::HttpServer(HttpServerOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {
  const HttpServerOptions& opts = impl_->options;
  if (opts.threads == 0) {
    throw std::invalid_argument("HTTP server needs at least one worker thread");
  }

  httplib::Server& server = impl_->server;
  const std::size_t threads = opts.threads;
  server.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  server.set_payload_max_length(opts.max_body_bytes);
  server.set_read_timeout(opts.read_timeout.count(), 0);
  server.set_write_timeout(opts.write_timeout.count(), 0);

  httplib::Headers defaults;
  for (const auto& [key, value] : opts.default_headers) {
    defaults.emplace(key, value);
  }
  server.set_default_headers(std::move(defaults));

  server.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
    if (!res.body.empty()) {
      return;
    }
    res.set_content(ErrorBody(KindForStatus(res.status),
                              "HTTP " + std::to_string(res.status) + " for " + req.method +
                                  " " + req.path),
                    "application/json");
  });

  if (opts.access_logger) {
    server.set_logger([logger = opts.access_logger](const httplib::Request& req,
                                                    const httplib::Response& res) {
      logger(req.method, req.path, res.status);
    });
  }
}

HttpServer::~HttpServer() = default;

void HttpServer::AddHandler(HttpMethod method, const std::string& path, HttpHandler handler) {
  if (!handler) {
    throw std::invalid_argument("HTTP handler must not be empty");
  }

  auto wrapped_handler = WrapHandler(std::move(handler));

  switch (method) {
    case HttpMethod::kGet:
      impl_->server.Get(path, std::move(wrapped_handler));
      break;
    case HttpMethod::kPost:
      impl_->server.Post(path, std::move(wrapped_handler));
      break;
    case HttpMethod::kOptions:
      impl_->server.Options(path, std::move(wrapped_handler));
      break;
    default:
      throw std::invalid_argument("Unsupported HTTP method");
  }
}

void HttpServer::Start(const std::string& host, int port) {
  {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    if (impl_->started) {
      throw std::runtime_error("HTTP server can only be started once");
    }
    impl_->started = true;
  }

  if (!impl_->server.bind_to_port(host, port)) {
    throw std::runtime_error("Failed to bind HTTP server to " + host + ":" +
                             std::to_string(port));
  }
  if (impl_->stop_requested) {
    return;
  }

  // Replays a Stop() that arrived before the accept loop started.
  std::atomic<bool> listen_returned{false};
  std::thread replay_stop([this, &listen_returned] {
    while (!listen_returned) {
      if (impl_->server.is_running()) {
        if (impl_->stop_requested) {
          impl_->SendStop();
        }
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  });

  const bool ok = impl_->server.listen_after_bind();
  listen_returned = true;
  replay_stop.join();
  if (!ok) {
    throw std::runtime_error("HTTP server on " + host + ":" + std::to_string(port) +
                             " stopped unexpectedly");
  }
}

void HttpServer::Stop() {
  impl_->stop_requested = true;
  impl_->SendStop();
}

bool HttpServer::IsRunning() const { return impl_->server.is_running(); }

}  // namespace platform
