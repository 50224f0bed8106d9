#include "platform/http_client.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>

#include "httplib.h"

namespace platform {
namespace {

bool EqualsIgnoreCase(const std::string& left, const std::string& right) {
  return left.size() == right.size() &&
         std::equal(left.begin(), left.end(), right.begin(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) ==
                  std::tolower(static_cast<unsigned char>(b));
         });
}

httplib::Headers ToHeaders(const HttpHeaders& headers) {
  return httplib::Headers(headers.begin(), headers.end());
}

}  // namespace

std::string HttpClientResponse::Header(const std::string& name) const {
  for (const auto& [key, value] : headers) {
    if (EqualsIgnoreCase(key, name)) {
      return value;
    }
  }
  return {};
}

HttpClient::HttpClient(std::string host, int port) : host_(std::move(host)), port_(port) {
  if (host_.empty()) {
    throw std::invalid_argument("HTTP client needs a host");
  }
  if (port_ <= 0 || port_ > 65535) {
    throw std::invalid_argument("HTTP client port out of range: " + std::to_string(port_));
  }
}

HttpClientResponse HttpClient::Get(const std::string& path, const HttpHeaders& headers) const {
  return Send("GET", path, [&](httplib::Client& client, httplib::Response& out) {
    auto result = client.Get(path, ToHeaders(headers));
    if (result) {
      out = *result;
    }
    return static_cast<bool>(result);
  });
}

HttpClientResponse HttpClient::Post(const std::string& path, const std::string& body,
                                    const HttpHeaders& headers,
                                    const std::string& content_type) const {
  return Send("POST", path, [&](httplib::Client& client, httplib::Response& out) {
    auto result = client.Post(path, ToHeaders(headers), body, content_type);
    if (result) {
      out = *result;
    }
    return static_cast<bool>(result);
  });
}

HttpClientResponse HttpClient::Options(const std::string& path,
                                       const HttpHeaders& headers) const {
  return Send("OPTIONS", path, [&](httplib::Client& client, httplib::Response& out) {
    auto result = client.Options(path, ToHeaders(headers));
    if (result) {
      out = *result;
    }
    return static_cast<bool>(result);
  });
}

HttpClientResponse HttpClient::Send(const std::string& method, const std::string& path,
                                    const Exchange& exchange) const {
  httplib::Client client(host_, port_);
  client.set_connection_timeout(timeout_seconds_);
  client.set_read_timeout(timeout_seconds_);
  client.set_write_timeout(timeout_seconds_);

  httplib::Response raw;
  if (!exchange(client, raw)) {
    throw std::runtime_error("HTTP " + method + " " + path + " to " + host_ + ":" +
                             std::to_string(port_) + " got no response");
  }

  HttpClientResponse response;
  response.status = raw.status;
  response.content_type = raw.get_header_value("Content-Type");
  response.body = std::move(raw.body);
  for (const auto& [key, value] : raw.headers) {
    response.headers[key] = value;
  }
  return response;
}

}  // namespace platform
