#include "bridge/correlator.hpp"

#include <exception>
#include <utility>
#include <vector>

#include "bridge/errors.hpp"
#include "bridge/logging.hpp"

namespace bridge {
namespace {

using logging::LogDebug;
using logging::LogWarn;

std::int64_t ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

}  // namespace

Correlator::Correlator(Framer& framer, std::uint64_t generation)
    : framer_(framer), generation_(generation) {
  framer_.Subscribe([this](const Message& message) { HandleMessage(message); });
  framer_.OnClosed([this](const std::string& reason) { FailAll(reason); });
}

Correlator::~Correlator() { FailAll("correlator destroyed"); }

nlohmann::json Correlator::Call(const std::string& method, const nlohmann::json& params,
                                std::chrono::milliseconds timeout) {
  std::int64_t id = 0;
  std::future<nlohmann::json> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      throw TransportError("Generation " + std::to_string(generation_) +
                           " is no longer accepting calls: " + close_reason_);
    }
    id = next_id_++;
    PendingCall call;
    call.id = id;
    call.method = method;
    call.created_at = std::chrono::steady_clock::now();
    result = call.completion.get_future();
    pending_.emplace(id, std::move(call));
  }

  try {
    framer_.Send(Request{id, method, params});
  } catch (const TransportError&) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(id);
    throw;
  }

  if (result.wait_for(timeout) != std::future_status::ready) {
    bool removed = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      removed = pending_.erase(id) > 0;
    }
    if (removed) {
      LogWarn("[correlator] " + method + " id=" + std::to_string(id) + " timed out after " +
              std::to_string(timeout.count()) + "ms");
      throw TimeoutError(method + " did not respond within " + std::to_string(timeout.count()) +
                         "ms");
    }
    // Someone else erased the slot and is completing it right now.
  }
  return result.get();
}

void Correlator::Notify(const std::string& method, const nlohmann::json& params) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      throw TransportError("Generation " + std::to_string(generation_) + " is closed");
    }
  }
  framer_.Send(Notification{method, params});
}

void Correlator::FailAll(const std::string& reason) {
  std::map<std::int64_t, PendingCall> drained;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
      closed_ = true;
      close_reason_ = reason;
    }
    drained.swap(pending_);
  }
  if (!drained.empty()) {
    LogWarn("[correlator] generation " + std::to_string(generation_) + " draining " +
            std::to_string(drained.size()) + " pending call(s): " + reason);
  }
  for (auto& [id, call] : drained) {
    call.completion.set_exception(std::make_exception_ptr(
        TransportError(call.method + " id=" + std::to_string(id) + " aborted: " + reason)));
  }
}

void Correlator::SetNotificationHandler(NotificationHandler handler) {
  std::lock_guard<std::mutex> lock(notification_mutex_);
  notification_handler_ = std::move(handler);
}

std::size_t Correlator::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

bool Correlator::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

void Correlator::HandleMessage(const Message& message) {
  if (const auto* response = std::get_if<Response>(&message)) {
    HandleResponse(*response);
    return;
  }
  if (const auto* notification = std::get_if<Notification>(&message)) {
    LogDebug("[correlator] notification " + notification->method);
    NotificationHandler handler;
    {
      std::lock_guard<std::mutex> lock(notification_mutex_);
      handler = notification_handler_;
    }
    if (handler) {
      handler(*notification);
    }
    return;
  }
  // Server-initiated requests have no bridge-side handler.
  const auto& request = std::get<Request>(message);
  LogWarn("[correlator] " +
          std::string{ErrorKindName(ErrorKind::kProtocol)} +
          ": unsupported server-initiated request '" + request.method +
          "' id=" + DescribeId(request.id));
}

void Correlator::HandleResponse(const Response& response) {
  if (!response.id.is_number_integer()) {
    LogWarn("[correlator] discarding response with foreign id " + DescribeId(response.id));
    return;
  }
  const auto id = response.id.get<std::int64_t>();

  PendingCall call;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = pending_.find(id);
    if (it == pending_.end()) {
      LogWarn("[correlator] discarding response for unknown or expired id " +
              std::to_string(id));
      return;
    }
    call = std::move(it->second);
    pending_.erase(it);
  }

  LogDebug("[correlator] " + call.method + " id=" + std::to_string(id) + " completed in " +
           std::to_string(ElapsedMs(call.created_at)) + "ms");

  if (response.error) {
    const auto& error = *response.error;
    call.completion.set_exception(std::make_exception_ptr(ToolInvocationError(
        error.value("code", jsonrpc::kInternalError), error.value("message", std::string{}),
        error.contains("data") ? error.at("data") : nlohmann::json())));
    return;
  }
  call.completion.set_value(response.result);
}

}  // namespace bridge
