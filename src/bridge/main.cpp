#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "bridge/app.hpp"
#include "bridge/logging.hpp"
#include "bridge/router.hpp"
#include "bridge/supervisor.hpp"
#include "bridge/version.hpp"
#include "platform/http_server.hpp"

namespace {

// Only async-signal-safe work happens in the handler; the exit watcher thread
// notices the pending signal and stops the server.
std::atomic<int> pending_signal{0};
std::atomic_flag is_terminating = ATOMIC_FLAG_INIT;

void HandleSignal(int signal) {
  if (is_terminating.test_and_set()) {
    std::fprintf(stderr, "Received second interrupt, terminating immediately.\n");
    std::_Exit(1);
  }
  pending_signal.store(signal);
}

void InstallSignalHandlers() {
  struct sigaction action {};
  action.sa_handler = HandleSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

}  // namespace

int main(int argc, char** argv) {
  bridge::logging::InitializeFromEnvironment();
  const std::string program = argc > 0 ? argv[0] : bridge::kBridgeName;

  bridge::BridgeConfig config;
  try {
    config = bridge::LoadBridgeConfig(argc, argv);
  } catch (const std::invalid_argument& ex) {
    bridge::logging::LogError(ex.what());
    std::cerr << bridge::UsageText(program);
    return 2;
  }
  if (config.show_help) {
    std::cout << bridge::UsageText(program);
    return 0;
  }
  if (config.log_level) {
    bridge::logging::SetLogLevel(*config.log_level);
  }

  bridge::Supervisor supervisor(bridge::MakeSupervisorOptions(config));
  bridge::Router router(supervisor, bridge::RouterOptions{config.call_timeout});
  bridge::BindDiscovery(supervisor, router, bridge::MakeDiscoveryOptions(config));

  platform::HttpServer server(bridge::MakeHttpServerOptions(config));
  bridge::ConfigureServer(server, router);

  // Exhausted restarts keep serving 503 for a moment, then take the server down.
  std::mutex exit_mutex;
  std::condition_variable exit_cv;
  bool exhausted = false;
  bool server_done = false;

  supervisor.AddStateListener([&](bridge::ProcessState state, std::uint64_t) {
    if (state != bridge::ProcessState::kTerminated || !supervisor.RestartsExhausted()) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(exit_mutex);
      exhausted = true;
    }
    exit_cv.notify_all();
  });

  std::thread exit_watcher([&] {
    constexpr auto kSignalPoll = std::chrono::milliseconds(50);
    std::unique_lock<std::mutex> lock(exit_mutex);
    while (!server_done && !exhausted && pending_signal.load() == 0) {
      exit_cv.wait_for(lock, kSignalPoll);
    }
    if (server_done) {
      return;
    }
    if (exhausted) {
      bridge::logging::LogError("Tool server could not be kept running; exiting in " +
                                std::to_string(config.exit_linger.count()) + "ms");
      const auto deadline = std::chrono::steady_clock::now() + config.exit_linger;
      while (!server_done && pending_signal.load() == 0 &&
             std::chrono::steady_clock::now() < deadline) {
        exit_cv.wait_for(lock, kSignalPoll);
      }
    } else {
      bridge::logging::LogInfo("Received signal " + std::to_string(pending_signal.load()) +
                               ", shutting down");
    }
    // Start() returns at once if this lands before it begins listening.
    server.Stop();
  });

  InstallSignalHandlers();

  bridge::logging::LogInfo(std::string{"Starting "} + bridge::kBridgeName + " " +
                           bridge::kBridgeVersion + " for '" + config.command + "' on " +
                           config.host + ":" + std::to_string(config.port) + " (log level " +
                           std::string(bridge::logging::LogLevelName(
                               bridge::logging::GetLogLevel())) +
                           ")");
  supervisor.Start();

  int exit_code = 0;
  try {
    server.Start(config.host, config.port);
  } catch (const std::exception& ex) {
    bridge::logging::LogError(std::string{"Server terminated with error: "} + ex.what());
    exit_code = 1;
  }

  {
    std::lock_guard<std::mutex> lock(exit_mutex);
    server_done = true;
    if (exhausted) {
      exit_code = 1;
    }
  }
  exit_cv.notify_all();
  exit_watcher.join();

  supervisor.Stop();
  if (exit_code == 0) {
    bridge::logging::LogInfo("Server shut down gracefully.");
  }
  return exit_code;
}
