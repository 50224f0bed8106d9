#include "bridge/framer.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>

#include <poll.h>
#include <unistd.h>

#include "bridge/logging.hpp"

namespace bridge {
namespace {

using logging::LogDebug;
using logging::LogError;
using logging::LogInfo;
using logging::LogWarn;

constexpr int kPollIntervalMs = 100;
constexpr std::size_t kReadChunkBytes = 64 * 1024;
constexpr std::size_t kLogPreviewBytes = 200;

void IgnoreSigpipeOnce() {
  // A write to a dead subprocess must surface as EPIPE, not kill the bridge.
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

std::string Preview(const std::string& text) {
  if (text.size() <= kLogPreviewBytes) {
    return text;
  }
  return text.substr(0, kLogPreviewBytes) + "...";
}

}  // namespace

LineBuffer::LineBuffer(std::size_t max_line_bytes) : max_line_bytes_(max_line_bytes) {}

std::vector<std::string> LineBuffer::Append(const char* data, std::size_t size) {
  std::vector<std::string> lines;
  std::size_t offset = 0;
  while (offset < size) {
    const void* found = std::memchr(data + offset, '\n', size - offset);
    const std::size_t end =
        found ? static_cast<std::size_t>(static_cast<const char*>(found) - data) : size;

    if (discarding_) {
      if (found) {
        discarding_ = false;
      }
      offset = found ? end + 1 : size;
      continue;
    }

    buffer_.append(data + offset, end - offset);
    if (!found) {
      if (buffer_.size() > max_line_bytes_) {
        buffer_.clear();
        discarding_ = true;
        overflow_ = true;
      }
      break;
    }

    if (buffer_.size() > max_line_bytes_) {
      overflow_ = true;
    } else {
      if (!buffer_.empty() && buffer_.back() == '\r') {
        buffer_.pop_back();
      }
      if (!buffer_.empty()) {
        lines.push_back(std::move(buffer_));
      }
    }
    buffer_.clear();
    offset = end + 1;
  }
  return lines;
}

bool LineBuffer::TakeOverflow() { return std::exchange(overflow_, false); }

std::string LineBuffer::TakeRemainder() {
  std::string remainder = std::move(buffer_);
  buffer_.clear();
  discarding_ = false;
  return remainder;
}

Framer::Framer(int write_fd, int read_fd, std::string name)
    : name_(std::move(name)), write_fd_(write_fd), read_fd_(read_fd) {
  IgnoreSigpipeOnce();
}

Framer::~Framer() {
  Stop();
  CloseInput();
  if (read_fd_ >= 0) {
    ::close(read_fd_);
    read_fd_ = -1;
  }
}

void Framer::Subscribe(MessageHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  message_handlers_.push_back(std::move(handler));
}

void Framer::OnProtocolError(ProtocolErrorHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  error_handlers_.push_back(std::move(handler));
}

void Framer::OnClosed(ClosedHandler handler) {
  std::string reason;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    if (!closed_.load()) {
      closed_handlers_.push_back(std::move(handler));
      return;
    }
    reason = close_reason_;
  }
  handler(reason);
}

void Framer::Start() {
  if (read_thread_.joinable()) {
    throw std::logic_error("Framer already started: " + name_);
  }
  if (read_fd_ < 0) {
    throw TransportError("Framer has no readable stream: " + name_);
  }
  read_thread_ = std::thread(&Framer::ReadLoop, this);
}

void Framer::Send(const Message& message) {
  std::string line = Serialize(message);
  LogDebug("[framer] -> " + name_ + ": " + Preview(line));
  line.push_back('\n');

  std::string failure;
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_fd_ < 0 || closed_.load()) {
      throw TransportError("Input stream of " + name_ + " is closed");
    }
    std::size_t written = 0;
    while (written < line.size()) {
      const ssize_t n = ::write(write_fd_, line.data() + written, line.size() - written);
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
          continue;
        }
        failure = std::string{"write to "} + name_ + " failed: " + std::strerror(errno);
        break;
      }
      written += static_cast<std::size_t>(n);
    }
  }

  if (!failure.empty()) {
    MarkClosed(failure);
    throw TransportError(failure);
  }
}

void Framer::CloseInput() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (write_fd_ >= 0) {
    ::close(write_fd_);
    write_fd_ = -1;
  }
}

void Framer::Stop() {
  stop_requested_ = true;
  if (read_thread_.joinable() && read_thread_.get_id() != std::this_thread::get_id()) {
    read_thread_.join();
  }
  MarkClosed("framer stopped");
}

std::string Framer::CloseReason() const {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  return close_reason_;
}

void Framer::ReadLoop() {
  LineBuffer lines;
  std::vector<char> buffer(kReadChunkBytes);
  std::string reason = "end of stream";

  LogDebug("[framer] read loop started for " + name_);

  while (!stop_requested_) {
    pollfd pfd{};
    pfd.fd = read_fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, kPollIntervalMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      reason = std::string{"poll failed: "} + std::strerror(errno);
      break;
    }
    if (ready == 0) {
      continue;
    }

    // POLLHUP still lets us drain whatever the writer left in the pipe.
    const ssize_t n = ::read(read_fd_, buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      reason = std::string{"read failed: "} + std::strerror(errno);
      break;
    }
    if (n == 0) {
      break;
    }

    for (const auto& line : lines.Append(buffer.data(), static_cast<std::size_t>(n))) {
      DispatchLine(line);
    }
    if (lines.TakeOverflow()) {
      ReportProtocolError(ProtocolError("Line exceeded " + std::to_string(kMaxLineBytes) +
                                        " bytes and was dropped"));
    }
  }

  if (stop_requested_) {
    reason = "framer stopped";
  } else {
    const std::string remainder = lines.TakeRemainder();
    if (!remainder.empty()) {
      ReportProtocolError(ProtocolError("Unterminated line at end of stream: " +
                                        Preview(remainder)));
    }
  }

  LogInfo("[framer] read loop ended for " + name_ + " (" + reason + ")");
  MarkClosed(reason);
}

void Framer::DispatchLine(const std::string& line) {
  LogDebug("[framer] <- " + name_ + ": " + Preview(line));

  Message message;
  try {
    message = ParseMessage(line);
  } catch (const ProtocolError& error) {
    ReportProtocolError(ProtocolError(std::string{error.what()} + ": " + Preview(line)));
    return;
  }

  std::vector<MessageHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers = message_handlers_;
  }
  for (const auto& handler : handlers) {
    try {
      handler(message);
    } catch (const std::exception& ex) {
      LogError("[framer] message handler for " + name_ + " threw: " + ex.what());
    }
  }
}

void Framer::ReportProtocolError(const ProtocolError& error) {
  LogWarn("[framer] protocol error from " + name_ + ": " + error.what());
  std::vector<ProtocolErrorHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers = error_handlers_;
  }
  for (const auto& handler : handlers) {
    handler(error);
  }
}

void Framer::MarkClosed(const std::string& reason) {
  std::vector<ClosedHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    if (closed_.exchange(true)) {
      return;
    }
    close_reason_ = reason;
    handlers.swap(closed_handlers_);
  }
  for (const auto& handler : handlers) {
    handler(reason);
  }
}

}  // namespace bridge
