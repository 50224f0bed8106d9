#include <chrono>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <unistd.h>

#include "bridge/errors.hpp"
#include "bridge/framer.hpp"
#include "bridge/message.hpp"
#include "nlohmann/json.hpp"

namespace {

using nlohmann::json;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

// Records everything a framer reports, for polling from the test thread.
class Recorder {
 public:
  void AddMessage(const bridge::Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(message);
    cv_.notify_all();
  }

  void AddError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.push_back(error);
    cv_.notify_all();
  }

  void AddClosed(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_.push_back(reason);
    cv_.notify_all();
  }

  bool WaitFor(std::size_t messages, std::size_t errors, std::size_t closed) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, std::chrono::seconds(5), [&] {
      return messages_.size() >= messages && errors_.size() >= errors && closed_.size() >= closed;
    });
  }

  std::vector<bridge::Message> messages() {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }
  std::vector<std::string> errors() {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
  }
  std::vector<std::string> closed() {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<bridge::Message> messages_;
  std::vector<std::string> errors_;
  std::vector<std::string> closed_;
};

struct Pipe {
  Pipe() {
    if (::pipe(fds) != 0) {
      throw std::runtime_error("pipe() failed");
    }
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }
  int TakeRead() { return std::exchange(fds[0], -1); }
  int TakeWrite() { return std::exchange(fds[1], -1); }
  void CloseRead() {
    if (fds[0] >= 0) {
      ::close(fds[0]);
      fds[0] = -1;
    }
  }
  void CloseWrite() {
    if (fds[1] >= 0) {
      ::close(fds[1]);
      fds[1] = -1;
    }
  }
  void Write(const std::string& text) {
    Assert(::write(fds[1], text.data(), text.size()) == static_cast<ssize_t>(text.size()),
           "short write to test pipe");
  }
  std::string ReadLine() {
    std::string line;
    char ch = 0;
    while (::read(fds[0], &ch, 1) == 1) {
      if (ch == '\n') {
        return line;
      }
      line.push_back(ch);
    }
    return line;
  }

  int fds[2] = {-1, -1};
};

std::vector<std::string> Feed(bridge::LineBuffer& buffer, const std::string& text) {
  return buffer.Append(text.data(), text.size());
}

void TestLineBufferSplitsAndStrips() {
  bridge::LineBuffer buffer;
  auto lines = Feed(buffer, "{\"a\":1}\r\n\n{\"b\"");
  Assert(lines.size() == 1 && lines[0] == "{\"a\":1}", "CRLF line should be split and trimmed");
  Assert(buffer.buffered() == 4, "Partial line should stay buffered");
  lines = Feed(buffer, ":2}\n");
  Assert(lines.size() == 1 && lines[0] == "{\"b\":2}", "Partial line should complete");
  Assert(buffer.buffered() == 0, "Buffer should be empty after a full line");
}

void TestLineBufferDropsOversizedLine() {
  bridge::LineBuffer buffer(8);
  auto lines = Feed(buffer, "0123456789");
  Assert(lines.empty(), "Oversized partial line must not be emitted");
  Assert(buffer.TakeOverflow(), "Overflow should be reported");
  Assert(!buffer.TakeOverflow(), "Overflow is reported once");

  lines = Feed(buffer, "abc\nok\n");
  Assert(lines.size() == 1 && lines[0] == "ok", "Tail of the dropped line must be skipped");

  lines = Feed(buffer, "0123456789\nnext\n");
  Assert(lines.size() == 1 && lines[0] == "next", "Complete oversized line must be dropped");
  Assert(buffer.TakeOverflow(), "Complete oversized line reports overflow");
}

void TestFanOutAndMalformedLines() {
  Pipe to_child;
  Pipe from_child;
  Recorder first;
  Recorder second;
  bridge::Framer framer(to_child.TakeWrite(), from_child.TakeRead(), "fanout");
  framer.Subscribe([&](const bridge::Message& m) { first.AddMessage(m); });
  framer.Subscribe([&](const bridge::Message& m) { second.AddMessage(m); });
  framer.OnProtocolError([&](const bridge::ProtocolError& e) { first.AddError(e.what()); });
  framer.Start();

  from_child.Write(
      "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"ok\":true}}\n"
      "this is not json\n"
      "{\"jsonrpc\":\"1.0\",\"id\":2,\"result\":{}}\n"
      "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/progress\",\"params\":{\"p\":1}}\r\n");

  Assert(first.WaitFor(2, 2, 0), "Expected two messages and two protocol errors");
  Assert(second.WaitFor(2, 0, 0), "Second subscriber should see every message");

  const auto messages = first.messages();
  Assert(std::holds_alternative<bridge::Response>(messages[0]), "First message is a response");
  Assert(std::get<bridge::Response>(messages[0]).id == 1, "Response id should be 1");
  Assert(std::holds_alternative<bridge::Notification>(messages[1]),
         "Second message is a notification");
  Assert(std::get<bridge::Notification>(messages[1]).method == "notifications/progress",
         "Notification method should survive framing");
  Assert(!framer.IsClosed(), "Malformed lines must not close the stream");

  framer.Stop();
}

void TestEndOfStreamClosesOnce() {
  Pipe to_child;
  Pipe from_child;
  Recorder recorder;
  bridge::Framer framer(to_child.TakeWrite(), from_child.TakeRead(), "eof");
  framer.OnClosed([&](const std::string& reason) { recorder.AddClosed(reason); });
  framer.Start();

  from_child.Write("{\"jsonrpc\":\"2.0\",\"method\":\"ping\"}\n");
  from_child.CloseWrite();

  Assert(recorder.WaitFor(0, 0, 1), "End of stream should invoke the closed handler");
  Assert(framer.IsClosed(), "Framer should report closed after EOF");
  Assert(recorder.closed().front() == "end of stream", "Close reason should name EOF");

  Recorder late;
  framer.OnClosed([&](const std::string& reason) { late.AddClosed(reason); });
  Assert(late.closed().size() == 1, "Late closed handler should run immediately");

  framer.Stop();
  Assert(recorder.closed().size() == 1, "Closed handler must run exactly once");
}

void TestSendWritesOneLine() {
  Pipe to_child;
  Pipe from_child;
  bridge::Framer framer(to_child.TakeWrite(), from_child.TakeRead(), "send");
  framer.Start();

  framer.Send(bridge::Request{
      7, "tools/call", json{{"name", "echo"}, {"arguments", {{"text", "a\nb"}}}}});
  const json sent = json::parse(to_child.ReadLine());
  Assert(sent.at("jsonrpc") == "2.0", "Sent line should declare jsonrpc 2.0");
  Assert(sent.at("id") == 7, "Sent line should carry the request id");
  Assert(sent.at("params").at("arguments").at("text") == "a\nb",
         "Embedded newlines must be escaped, not framed");

  framer.CloseInput();
  bool threw = false;
  try {
    framer.Send(bridge::Notification{"notifications/initialized", nullptr});
  } catch (const bridge::TransportError&) {
    threw = true;
  }
  Assert(threw, "Send after CloseInput must throw TransportError");
  framer.Stop();
}

void TestBrokenPipeIsTransportError() {
  Pipe to_child;
  Pipe from_child;
  Recorder recorder;
  bridge::Framer framer(to_child.TakeWrite(), from_child.TakeRead(), "broken");
  framer.OnClosed([&](const std::string& reason) { recorder.AddClosed(reason); });
  framer.Start();

  to_child.CloseRead();
  bool threw = false;
  try {
    framer.Send(bridge::Request{1, "ping", nullptr});
  } catch (const bridge::TransportError& ex) {
    threw = ex.kind() == bridge::ErrorKind::kTransport;
  }
  Assert(threw, "Writing to a closed pipe must throw TransportError");
  Assert(recorder.WaitFor(0, 0, 1), "A failed write should close the stream");
  framer.Stop();
}

void RunTests() {
  TestLineBufferSplitsAndStrips();
  TestLineBufferDropsOversizedLine();
  TestFanOutAndMalformedLines();
  TestEndOfStreamClosesOnce();
  TestSendWritesOneLine();
  TestBrokenPipeIsTransportError();
}

}  // namespace

int main() {
  try {
    RunTests();
  } catch (const std::exception& ex) {
    std::cerr << "Framer test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
