#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "bridge/correlator.hpp"
#include "bridge/framer.hpp"
#include "bridge/tool_invoker.hpp"
#include "platform/subprocess.hpp"

namespace bridge {

struct SupervisorOptions {
  platform::SubprocessOptions process;
  int max_restarts = 5;
  std::chrono::milliseconds restart_window{60000};
  std::chrono::milliseconds backoff_initial{500};
  std::chrono::milliseconds backoff_max{30000};
  double backoff_jitter = 0.2;
  // Time the child gets to exit after its input is closed, then after SIGTERM.
  std::chrono::milliseconds shutdown_grace{5000};
  std::chrono::milliseconds terminate_grace{1000};
  std::size_t stderr_tail_lines = 20;
};

// Exponential backoff bounded by `max_delay`, with +/- jitter, and a cap on the
// number of restarts inside a sliding window.
class RestartPolicy {
 public:
  RestartPolicy(int max_restarts, std::chrono::milliseconds window,
                std::chrono::milliseconds initial_delay, std::chrono::milliseconds max_delay,
                double jitter, std::uint32_t seed = std::random_device{}());

  // Records a restart at `now` and returns how long to wait before it, or
  // nullopt when the window already holds max_restarts restarts.
  std::optional<std::chrono::milliseconds> NextDelay(std::chrono::steady_clock::time_point now);

  // Delay for the n-th consecutive restart (n >= 1), before jitter.
  std::chrono::milliseconds BaseDelay(std::size_t attempt) const;

  std::size_t RecentRestarts(std::chrono::steady_clock::time_point now);

 private:
  void Prune(std::chrono::steady_clock::time_point now);

  int max_restarts_;
  std::chrono::milliseconds window_;
  std::chrono::milliseconds initial_delay_;
  std::chrono::milliseconds max_delay_;
  double jitter_;
  std::mt19937 rng_;
  std::deque<std::chrono::steady_clock::time_point> restarts_;
};

// One process generation: the child, its framing and its pending-call table.
class Session {
 public:
  using StderrSink = std::function<void(const std::string& line)>;

  Session(std::uint64_t generation, std::unique_ptr<platform::Subprocess> process,
          StderrSink stderr_sink);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  std::uint64_t generation() const { return generation_; }
  Framer& framer() { return *framer_; }
  Correlator& correlator() { return *correlator_; }
  pid_t pid() const { return pid_; }

  bool IsAlive();
  std::optional<int> ExitStatus();

  // Close input, wait, SIGTERM, wait, SIGKILL. Idempotent.
  void Shutdown(std::chrono::milliseconds grace, std::chrono::milliseconds terminate_grace);

 private:
  void DrainStderr(int fd);

  const std::uint64_t generation_;
  pid_t pid_;

  std::mutex process_mutex_;
  bool shut_down_ = false;
  std::unique_ptr<platform::Subprocess> process_;
  std::unique_ptr<Framer> framer_;
  std::unique_ptr<Correlator> correlator_;

  StderrSink stderr_sink_;
  std::atomic<bool> stderr_stop_{false};
  std::thread stderr_thread_;
};

// Owns the tool server process: spawns it, runs the handshake hook, watches for
// failure, restarts with backoff and gives up after too many restarts.
class Supervisor : public ToolInvoker {
 public:
  using StateListener = std::function<void(ProcessState state, std::uint64_t generation)>;
  using SessionHook = std::function<void(Correlator& correlator)>;

  explicit Supervisor(SupervisorOptions options);
  ~Supervisor() override;

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  // Runs in Handshaking for every generation; throwing fails the generation.
  void SetHandshakeHook(SessionHook hook);
  // Runs when the server reports notifications/tools/list_changed.
  void SetToolsChangedHook(SessionHook hook);
  void AddStateListener(StateListener listener);

  void Start();
  void Stop();

  // True if `state` was reached before the timeout.
  bool WaitForState(ProcessState state, std::chrono::milliseconds timeout);

  ProcessState State() const override;
  std::uint64_t Generation() const override;
  nlohmann::json CallTool(const std::string& name, const nlohmann::json& arguments,
                          std::chrono::milliseconds timeout) override;
  nlohmann::json Diagnostics() const override;

  bool RestartsExhausted() const;
  std::vector<std::string> StderrTail() const;
  // Exit status of the most recently shut down process: the exit code, or
  // 128 + signal number.
  std::optional<int> LastExitStatus() const;

 private:
  void Run();
  std::shared_ptr<Session> SpawnSession();
  std::string WaitForFailure(Session& session);
  bool WaitForStop(std::chrono::milliseconds delay);
  void SetState(ProcessState state);
  void RecordStderr(std::uint64_t generation, const std::string& line);
  void ShutdownSession(Session& session, std::chrono::milliseconds grace);

  SupervisorOptions options_;
  RestartPolicy policy_;
  SessionHook handshake_hook_;
  SessionHook tools_changed_hook_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  ProcessState state_ = ProcessState::kStarting;
  bool state_announced_ = false;
  std::uint64_t generation_ = 0;
  std::shared_ptr<Session> current_;
  bool stop_requested_ = false;
  bool tools_changed_ = false;
  bool exhausted_ = false;
  std::optional<int> last_exit_status_;
  std::vector<StateListener> listeners_;

  mutable std::mutex stderr_mutex_;
  std::deque<std::string> stderr_tail_;

  std::thread monitor_;
};

}  // namespace bridge
