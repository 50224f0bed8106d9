#pragma once

#include <functional>
#include <map>
#include <string>

namespace httplib {
class Client;
class Response;
}  // namespace httplib

namespace platform {

using HttpHeaders = std::map<std::string, std::string>;

struct HttpClientResponse {
  int status = 0;
  std::string content_type;
  std::string body;
  HttpHeaders headers;

  // Case-insensitive; empty when the header is absent.
  std::string Header(const std::string& name) const;
};

// Plain-HTTP client for a single host. Each request opens its own connection,
// so one instance can be shared between threads. Throws std::runtime_error when
// no response arrives.
class HttpClient {
 public:
  HttpClient(std::string host, int port);

  void SetTimeoutSeconds(int seconds) { timeout_seconds_ = seconds; }

  HttpClientResponse Get(const std::string& path, const HttpHeaders& headers = {}) const;
  HttpClientResponse Post(const std::string& path, const std::string& body,
                          const HttpHeaders& headers = {},
                          const std::string& content_type = "application/json") const;
  HttpClientResponse Options(const std::string& path, const HttpHeaders& headers = {}) const;

 private:
  using Exchange = std::function<bool(httplib::Client&, httplib::Response&)>;

  HttpClientResponse Send(const std::string& method, const std::string& path,
                          const Exchange& exchange) const;

  std::string host_;
  int port_;
  int timeout_seconds_ = 5;
};

}  // namespace platform
