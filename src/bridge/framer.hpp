#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "bridge/errors.hpp"
#include "bridge/message.hpp"

namespace bridge {

constexpr std::size_t kMaxLineBytes = 10 * 1024 * 1024;

// Splits a byte stream into newline-terminated lines. A line that grows past
// the limit is dropped up to its terminating newline.
class LineBuffer {
 public:
  explicit LineBuffer(std::size_t max_line_bytes = kMaxLineBytes);

  // Complete lines found so far, without the terminator. Blank lines and a
  // trailing '\r' are stripped.
  std::vector<std::string> Append(const char* data, std::size_t size);

  // True once per oversized line, then reset.
  bool TakeOverflow();

  std::size_t buffered() const { return buffer_.size(); }
  std::string TakeRemainder();

 private:
  std::size_t max_line_bytes_;
  std::string buffer_;
  bool discarding_ = false;
  bool overflow_ = false;
};

// Newline-delimited JSON-RPC framing over a pair of file descriptors.
// Owns both descriptors. One read thread decodes messages and fans them out to
// every subscriber; writers are serialized by a mutex.
class Framer {
 public:
  using MessageHandler = std::function<void(const Message&)>;
  using ProtocolErrorHandler = std::function<void(const ProtocolError&)>;
  using ClosedHandler = std::function<void(const std::string& reason)>;

  Framer(int write_fd, int read_fd, std::string name);
  ~Framer();

  Framer(const Framer&) = delete;
  Framer& operator=(const Framer&) = delete;

  // Handlers run on the read thread. Register them before Start().
  void Subscribe(MessageHandler handler);
  void OnProtocolError(ProtocolErrorHandler handler);
  // Runs exactly once, on end-of-stream, read error, failed write or Stop().
  // Registering after the stream closed runs the handler immediately.
  void OnClosed(ClosedHandler handler);

  void Start();

  // Throws TransportError if the input side is closed or the write fails.
  void Send(const Message& message);

  // Closes the subprocess's input so it sees end-of-file. Reading continues.
  void CloseInput();

  // Stops the read thread and marks the stream closed.
  void Stop();

  bool IsClosed() const { return closed_.load(); }
  std::string CloseReason() const;
  const std::string& name() const { return name_; }

 private:
  void ReadLoop();
  void DispatchLine(const std::string& line);
  void ReportProtocolError(const ProtocolError& error);
  void MarkClosed(const std::string& reason);

  std::string name_;

  std::mutex write_mutex_;
  int write_fd_;
  int read_fd_;

  mutable std::mutex handlers_mutex_;
  std::vector<MessageHandler> message_handlers_;
  std::vector<ProtocolErrorHandler> error_handlers_;
  std::vector<ClosedHandler> closed_handlers_;
  std::string close_reason_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> closed_{false};
  std::thread read_thread_;
};

}  // namespace bridge
