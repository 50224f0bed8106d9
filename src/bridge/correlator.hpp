#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>

#include "bridge/framer.hpp"
#include "bridge/message.hpp"
#include "nlohmann/json.hpp"

namespace bridge {

// Matches JSON-RPC responses to outstanding requests by id for one process
// generation. A pending call is completed only by whoever erases it from the
// table, so each call resolves exactly once.
class Correlator {
 public:
  using NotificationHandler = std::function<void(const Notification&)>;

  Correlator(Framer& framer, std::uint64_t generation);
  ~Correlator();

  Correlator(const Correlator&) = delete;
  Correlator& operator=(const Correlator&) = delete;

  // Blocks until the response arrives or the deadline passes. Throws
  // ToolInvocationError, TimeoutError or TransportError.
  nlohmann::json Call(const std::string& method, const nlohmann::json& params,
                      std::chrono::milliseconds timeout);

  void Notify(const std::string& method, const nlohmann::json& params);

  // Fails every pending call with TransportError and refuses new ones.
  void FailAll(const std::string& reason);

  void SetNotificationHandler(NotificationHandler handler);

  std::size_t PendingCount() const;
  std::uint64_t generation() const { return generation_; }
  bool IsClosed() const;

 private:
  struct PendingCall {
    std::int64_t id = 0;
    std::string method;
    std::chrono::steady_clock::time_point created_at;
    std::promise<nlohmann::json> completion;
  };

  void HandleMessage(const Message& message);
  void HandleResponse(const Response& response);

  Framer& framer_;
  const std::uint64_t generation_;

  mutable std::mutex mutex_;
  std::map<std::int64_t, PendingCall> pending_;
  std::int64_t next_id_ = 1;
  bool closed_ = false;
  std::string close_reason_;

  std::mutex notification_mutex_;
  NotificationHandler notification_handler_;
};

}  // namespace bridge
