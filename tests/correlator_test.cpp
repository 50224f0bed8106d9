#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "bridge/correlator.hpp"
#include "bridge/errors.hpp"
#include "bridge/framer.hpp"
#include "nlohmann/json.hpp"
#include "pipe_peer.hpp"

namespace {

using nlohmann::json;
using std::chrono::milliseconds;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestOutOfOrderResponses() {
  test::PipePeer server;
  bridge::Framer framer(server.framer_write_fd, server.framer_read_fd, "reorder");
  bridge::Correlator correlator(framer, 1);
  framer.Start();

  std::vector<std::future<json>> calls;
  for (int n = 0; n < 3; ++n) {
    calls.push_back(std::async(std::launch::async, [&correlator, n] {
      return correlator.Call("tools/call", {{"n", n}}, milliseconds(5000));
    }));
  }

  std::vector<json> requests;
  for (int i = 0; i < 3; ++i) {
    requests.push_back(server.ReadRequest());
  }
  for (auto it = requests.rbegin(); it != requests.rend(); ++it) {
    server.Reply(it->at("id"), {{"n", it->at("params").at("n")}});
  }

  for (int n = 0; n < 3; ++n) {
    Assert(calls[n].get().at("n") == n, "Each caller must receive its own response");
  }
  Assert(correlator.PendingCount() == 0, "No call should remain pending");

  std::vector<std::int64_t> ids;
  for (const auto& request : requests) {
    ids.push_back(request.at("id").get<std::int64_t>());
  }
  std::sort(ids.begin(), ids.end());
  Assert(ids == std::vector<std::int64_t>({1, 2, 3}), "Ids should count up from 1");
  framer.Stop();
}

void TestConcurrentCallsResolveOnce() {
  constexpr int kCalls = 40;
  test::PipePeer server;
  bridge::Framer framer(server.framer_write_fd, server.framer_read_fd, "concurrent");
  bridge::Correlator correlator(framer, 2);
  framer.Start();

  std::thread responder([&server] {
    for (int i = 0; i < kCalls; ++i) {
      const json request = server.ReadRequest();
      server.Reply(request.at("id"), request.at("params"));
      // Duplicate responses must be discarded.
      server.Reply(request.at("id"), {{"duplicate", true}});
    }
  });

  std::atomic<int> correct{0};
  std::vector<std::thread> callers;
  for (int n = 0; n < kCalls; ++n) {
    callers.emplace_back([&correlator, &correct, n] {
      const json result = correlator.Call("tools/call", {{"n", n}}, milliseconds(5000));
      if (result.value("n", -1) == n) {
        ++correct;
      }
    });
  }
  for (auto& caller : callers) {
    caller.join();
  }
  responder.join();

  Assert(correct.load() == kCalls, "Every concurrent call must get its own result");
  Assert(correlator.PendingCount() == 0, "Pending table must be empty");
  framer.Stop();
}

void TestTimeoutFreesSlotAndLateResponseIsDiscarded() {
  test::PipePeer server;
  bridge::Framer framer(server.framer_write_fd, server.framer_read_fd, "timeout");
  bridge::Correlator correlator(framer, 3);
  framer.Start();

  const bool timed_out = Throws<bridge::TimeoutError>(
      [&] { correlator.Call("tools/call", json::object(), milliseconds(100)); });
  Assert(timed_out, "Unanswered call must time out");
  Assert(correlator.PendingCount() == 0, "Timed out slot must be removed");

  const json late = server.ReadRequest();
  server.Reply(late.at("id"), {{"late", true}});

  auto next = std::async(std::launch::async, [&correlator] {
    return correlator.Call("ping", json::object(), milliseconds(5000));
  });
  const json request = server.ReadRequest();
  Assert(request.at("id") != late.at("id"), "A new call must get a fresh id");
  server.Reply(request.at("id"), {{"pong", true}});
  Assert(next.get().value("pong", false), "Late response must not satisfy the next call");
  framer.Stop();
}

void TestJsonRpcErrorBecomesToolInvocationError() {
  test::PipePeer server;
  bridge::Framer framer(server.framer_write_fd, server.framer_read_fd, "error");
  bridge::Correlator correlator(framer, 4);
  framer.Start();

  auto call = std::async(std::launch::async, [&correlator] {
    return correlator.Call("tools/call", json::object(), milliseconds(5000));
  });
  const json request = server.ReadRequest();
  server.Write({{"jsonrpc", "2.0"},
                {"id", request.at("id")},
                {"error", {{"code", -32602}, {"message", "bad args"}, {"data", {{"field", "a"}}}}}});

  bool mapped = false;
  try {
    call.get();
  } catch (const bridge::ToolInvocationError& ex) {
    mapped = ex.code() == -32602 && std::string(ex.what()) == "bad args" &&
             ex.data().at("field") == "a";
  }
  Assert(mapped, "JSON-RPC error must surface code, message and data");
  Assert(!correlator.IsClosed(), "A tool error must not close the correlator");
  framer.Stop();
}

void TestEndOfStreamDrainsPendingCalls() {
  test::PipePeer server;
  bridge::Framer framer(server.framer_write_fd, server.framer_read_fd, "drain");
  bridge::Correlator correlator(framer, 5);
  framer.Start();

  auto call = std::async(std::launch::async, [&correlator] {
    return correlator.Call("tools/call", json::object(), milliseconds(30000));
  });
  server.ReadRequest();
  const auto started = std::chrono::steady_clock::now();
  server.CloseOutput();

  const bool drained = Throws<bridge::TransportError>([&] { call.get(); });
  Assert(drained, "Pending call must fail with TransportError on end of stream");
  Assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5),
         "Drain must not wait for the call deadline");
  Assert(correlator.IsClosed(), "Correlator must refuse calls after the stream closed");
  Assert(Throws<bridge::TransportError>(
             [&] { correlator.Call("ping", json::object(), milliseconds(100)); }),
         "New calls after drain must fail fast");
  framer.Stop();
}

void TestNotificationsReachHandler() {
  test::PipePeer server;
  bridge::Framer framer(server.framer_write_fd, server.framer_read_fd, "notify");
  bridge::Correlator correlator(framer, 6);

  std::mutex mutex;
  std::condition_variable cv;
  std::vector<std::string> methods;
  correlator.SetNotificationHandler([&](const bridge::Notification& notification) {
    std::lock_guard<std::mutex> lock(mutex);
    methods.push_back(notification.method);
    cv.notify_all();
  });
  framer.Start();

  correlator.Notify("notifications/initialized", json::object());
  const json sent = server.ReadRequest();
  Assert(!sent.contains("id"), "Notify must not carry an id");
  Assert(sent.at("method") == "notifications/initialized", "Notify must send the method");

  // A server-initiated request is reported and ignored.
  server.Write({{"jsonrpc", "2.0"}, {"id", "srv-1"}, {"method", "sampling/createMessage"}});
  server.Write({{"jsonrpc", "2.0"}, {"method", "notifications/tools/list_changed"}});

  std::unique_lock<std::mutex> lock(mutex);
  Assert(cv.wait_for(lock, std::chrono::seconds(5), [&] { return !methods.empty(); }),
         "Notification handler should be invoked");
  Assert(methods.size() == 1 && methods.front() == "notifications/tools/list_changed",
         "Only the notification should reach the handler");
  lock.unlock();
  Assert(!correlator.IsClosed(), "Server requests must not close the correlator");
  framer.Stop();
}

void RunTests() {
  TestOutOfOrderResponses();
  TestConcurrentCallsResolveOnce();
  TestTimeoutFreesSlotAndLateResponseIsDiscarded();
  TestJsonRpcErrorBecomesToolInvocationError();
  TestEndOfStreamDrainsPendingCalls();
  TestNotificationsReachHandler();
}

}  // namespace

int main() {
  try {
    RunTests();
  } catch (const std::exception& ex) {
    std::cerr << "Correlator test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
