#include "bridge/supervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <utility>

#include <poll.h>
#include <unistd.h>

#include "bridge/errors.hpp"
#include "bridge/logging.hpp"

namespace bridge {
namespace {

using logging::LogDebug;
using logging::LogError;
using logging::LogInfo;
using logging::LogWarn;

constexpr auto kLivenessInterval = std::chrono::milliseconds(250);
constexpr int kStderrPollMs = 100;
constexpr char kToolsListChanged[] = "notifications/tools/list_changed";

std::string GenerationTag(std::uint64_t generation) {
  return "generation " + std::to_string(generation);
}

}  // namespace

std::string_view ProcessStateName(ProcessState state) {
  switch (state) {
    case ProcessState::kStarting:
      return "Starting";
    case ProcessState::kHandshaking:
      return "Handshaking";
    case ProcessState::kReady:
      return "Ready";
    case ProcessState::kDegraded:
      return "Degraded";
    case ProcessState::kRestarting:
      return "Restarting";
    case ProcessState::kTerminated:
      return "Terminated";
  }
  return "Unknown";
}

RestartPolicy::RestartPolicy(int max_restarts, std::chrono::milliseconds window,
                             std::chrono::milliseconds initial_delay,
                             std::chrono::milliseconds max_delay, double jitter,
                             std::uint32_t seed)
    : max_restarts_(std::max(0, max_restarts)),
      window_(window),
      initial_delay_(initial_delay),
      max_delay_(std::max(max_delay, initial_delay)),
      jitter_(std::clamp(jitter, 0.0, 1.0)),
      rng_(seed) {}

std::optional<std::chrono::milliseconds> RestartPolicy::NextDelay(
    std::chrono::steady_clock::time_point now) {
  Prune(now);
  if (restarts_.size() >= static_cast<std::size_t>(max_restarts_)) {
    return std::nullopt;
  }
  restarts_.push_back(now);

  const auto base = BaseDelay(restarts_.size());
  if (jitter_ <= 0.0) {
    return base;
  }
  std::uniform_real_distribution<double> spread(1.0 - jitter_, 1.0 + jitter_);
  const auto jittered = static_cast<std::int64_t>(std::llround(base.count() * spread(rng_)));
  return std::chrono::milliseconds(std::clamp<std::int64_t>(jittered, 0, max_delay_.count()));
}

std::chrono::milliseconds RestartPolicy::BaseDelay(std::size_t attempt) const {
  std::int64_t delay = initial_delay_.count();
  for (std::size_t i = 1; i < attempt && delay < max_delay_.count(); ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min(delay, max_delay_.count()));
}

std::size_t RestartPolicy::RecentRestarts(std::chrono::steady_clock::time_point now) {
  Prune(now);
  return restarts_.size();
}

void RestartPolicy::Prune(std::chrono::steady_clock::time_point now) {
  while (!restarts_.empty() && now - restarts_.front() >= window_) {
    restarts_.pop_front();
  }
}

Session::Session(std::uint64_t generation, std::unique_ptr<platform::Subprocess> process,
                 StderrSink stderr_sink)
    : generation_(generation),
      pid_(process->pid()),
      process_(std::move(process)),
      stderr_sink_(std::move(stderr_sink)) {
  const std::string name = "pid " + std::to_string(pid_) + " (" + GenerationTag(generation_) + ")";
  framer_ = std::make_unique<Framer>(process_->TakeStdin(), process_->TakeStdout(), name);
  correlator_ = std::make_unique<Correlator>(*framer_, generation_);

  framer_->Start();
  const int stderr_fd = process_->TakeStderr();
  stderr_thread_ = std::thread([this, stderr_fd] { DrainStderr(stderr_fd); });
}

Session::~Session() { Shutdown(std::chrono::milliseconds(0), std::chrono::milliseconds(0)); }

bool Session::IsAlive() {
  std::lock_guard<std::mutex> lock(process_mutex_);
  return process_->IsAlive();
}

std::optional<int> Session::ExitStatus() {
  std::lock_guard<std::mutex> lock(process_mutex_);
  process_->IsAlive();
  return process_->ExitStatus();
}

void Session::Shutdown(std::chrono::milliseconds grace,
                       std::chrono::milliseconds terminate_grace) {
  std::lock_guard<std::mutex> lock(process_mutex_);
  if (shut_down_) {
    return;
  }
  shut_down_ = true;

  framer_->CloseInput();
  if (!process_->WaitFor(grace)) {
    LogWarn("[supervisor] pid " + std::to_string(pid_) + " still running " +
            std::to_string(grace.count()) + "ms after input closed, sending SIGTERM");
    process_->Terminate();
    if (!process_->WaitFor(terminate_grace)) {
      LogWarn("[supervisor] pid " + std::to_string(pid_) + " ignored SIGTERM, killing");
      process_->Kill();
    }
  }

  framer_->Stop();
  correlator_->FailAll("tool server process shut down");

  stderr_stop_ = true;
  if (stderr_thread_.joinable()) {
    stderr_thread_.join();
  }

  const auto status = process_->ExitStatus();
  LogInfo("[supervisor] " + GenerationTag(generation_) + " pid " + std::to_string(pid_) +
          " exited with status " + (status ? std::to_string(*status) : std::string{"unknown"}));
}

void Session::DrainStderr(int fd) {
  LineBuffer lines;
  char buffer[4096];
  while (true) {
    // Once stopping, read only what is already buffered.
    const bool stopping = stderr_stop_;
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, stopping ? 0 : kStderrPollMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      if (stopping) {
        break;
      }
      continue;
    }
    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    for (const auto& line : lines.Append(buffer, static_cast<std::size_t>(n))) {
      stderr_sink_(line);
    }
  }
  const std::string remainder = lines.TakeRemainder();
  if (!remainder.empty()) {
    stderr_sink_(remainder);
  }
  ::close(fd);
}

Supervisor::Supervisor(SupervisorOptions options)
    : options_(std::move(options)),
      policy_(options_.max_restarts, options_.restart_window, options_.backoff_initial,
              options_.backoff_max, options_.backoff_jitter) {
  // Interpreted tool servers buffer stdout when it is a pipe.
  if (std::getenv("PYTHONUNBUFFERED") == nullptr &&
      options_.process.env.find("PYTHONUNBUFFERED") == options_.process.env.end()) {
    options_.process.env["PYTHONUNBUFFERED"] = "1";
  }
}

Supervisor::~Supervisor() { Stop(); }

void Supervisor::SetHandshakeHook(SessionHook hook) { handshake_hook_ = std::move(hook); }

void Supervisor::SetToolsChangedHook(SessionHook hook) { tools_changed_hook_ = std::move(hook); }

void Supervisor::AddStateListener(StateListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.push_back(std::move(listener));
}

void Supervisor::Start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (monitor_.joinable() || stop_requested_) {
      throw std::logic_error("Supervisor can only be started once");
    }
  }
  LogInfo("[supervisor] launching tool server: " + platform::DescribeCommand(options_.process));
  monitor_ = std::thread(&Supervisor::Run, this);
}

void Supervisor::Stop() {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_requested_ && !monitor_.joinable()) {
      return;
    }
    stop_requested_ = true;
    session = current_;
  }
  cv_.notify_all();

  if (session) {
    LogInfo("[supervisor] stopping " + GenerationTag(session->generation()));
    ShutdownSession(*session, options_.shutdown_grace);
  }
  if (monitor_.joinable()) {
    monitor_.join();
  }
  SetState(ProcessState::kTerminated);
}

bool Supervisor::WaitForState(ProcessState state, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [&] {
    return state_ == state || state_ == ProcessState::kTerminated;
  });
  return state_ == state;
}

ProcessState Supervisor::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::uint64_t Supervisor::Generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

bool Supervisor::RestartsExhausted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return exhausted_;
}

std::vector<std::string> Supervisor::StderrTail() const {
  std::lock_guard<std::mutex> lock(stderr_mutex_);
  return {stderr_tail_.begin(), stderr_tail_.end()};
}

nlohmann::json Supervisor::CallTool(const std::string& name, const nlohmann::json& arguments,
                                    std::chrono::milliseconds timeout) {
  std::shared_ptr<Session> session;
  ProcessState state;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    session = current_;
    state = state_;
  }
  if (!session) {
    throw TransportError("No tool server process is running (state " +
                         std::string{ProcessStateName(state)} + ")");
  }
  return session->correlator().Call("tools/call", {{"name", name}, {"arguments", arguments}},
                                    timeout);
}

std::optional<int> Supervisor::LastExitStatus() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_exit_status_;
}

nlohmann::json Supervisor::Diagnostics() const {
  nlohmann::json diagnostics = {{"restarts_exhausted", RestartsExhausted()},
                                {"stderr_tail", StderrTail()}};
  std::lock_guard<std::mutex> lock(mutex_);
  if (current_) {
    diagnostics["pid"] = current_->pid();
  }
  if (last_exit_status_) {
    diagnostics["last_exit_status"] = *last_exit_status_;
  }
  return diagnostics;
}

void Supervisor::ShutdownSession(Session& session, std::chrono::milliseconds grace) {
  session.Shutdown(grace, options_.terminate_grace);
  const auto status = session.ExitStatus();
  if (status) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_exit_status_ = status;
  }
}

void Supervisor::Run() {
  std::shared_ptr<Session> session;
  while (true) {
    std::string failure;
    try {
      SetState(ProcessState::kStarting);
      session = SpawnSession();
      {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = session;
        if (stop_requested_) {
          break;
        }
      }
      SetState(ProcessState::kHandshaking);
      if (handshake_hook_) {
        handshake_hook_(session->correlator());
      }
      SetState(ProcessState::kReady);
      LogInfo("[supervisor] " + GenerationTag(session->generation()) + " ready (pid " +
              std::to_string(session->pid()) + ")");
      failure = WaitForFailure(*session);
    } catch (const std::exception& ex) {
      failure = ex.what();
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stop_requested_) {
        break;
      }
      current_.reset();
    }

    LogError("[supervisor] tool server failed: " + failure);
    SetState(ProcessState::kDegraded);
    if (session) {
      session->correlator().FailAll(failure);
      ShutdownSession(*session, options_.terminate_grace);
      session.reset();
    }

    const auto delay = policy_.NextDelay(std::chrono::steady_clock::now());
    if (!delay) {
      LogError("[supervisor] giving up: " + std::to_string(options_.max_restarts) +
               " restarts within " + std::to_string(options_.restart_window.count()) + "ms");
      std::lock_guard<std::mutex> lock(mutex_);
      exhausted_ = true;
      break;
    }
    LogWarn("[supervisor] restarting in " + std::to_string(delay->count()) + "ms");
    if (WaitForStop(*delay)) {
      break;
    }
    SetState(ProcessState::kRestarting);
  }

  if (session) {
    ShutdownSession(*session, options_.shutdown_grace);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.reset();
  }
  SetState(ProcessState::kTerminated);
}

std::shared_ptr<Session> Supervisor::SpawnSession() {
  auto process = platform::Subprocess::Spawn(options_.process);
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    generation = ++generation_;
  }
  LogInfo("[supervisor] spawned pid " + std::to_string(process->pid()) + " for " +
          GenerationTag(generation));

  auto session = std::make_shared<Session>(
      generation, std::move(process),
      [this, generation](const std::string& line) { RecordStderr(generation, line); });

  session->correlator().SetNotificationHandler([this](const Notification& notification) {
    if (notification.method == kToolsListChanged) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_changed_ = true;
      }
      cv_.notify_all();
    }
  });
  session->framer().OnClosed([this](const std::string&) {
    { std::lock_guard<std::mutex> lock(mutex_); }
    cv_.notify_all();
  });
  return session;
}

std::string Supervisor::WaitForFailure(Session& session) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    if (stop_requested_) {
      return {};
    }
    if (session.framer().IsClosed()) {
      return "stdout of " + GenerationTag(session.generation()) +
             " closed: " + session.framer().CloseReason();
    }
    if (tools_changed_) {
      tools_changed_ = false;
      lock.unlock();
      if (tools_changed_hook_) {
        LogInfo("[supervisor] tool list changed, rediscovering");
        try {
          tools_changed_hook_(session.correlator());
        } catch (const std::exception& ex) {
          LogWarn(std::string{"[supervisor] rediscovery failed, keeping previous routes: "} +
                  ex.what());
        }
      }
      lock.lock();
      continue;
    }

    cv_.wait_for(lock, kLivenessInterval);

    lock.unlock();
    const bool alive = session.IsAlive();
    std::optional<int> status;
    if (!alive) {
      status = session.ExitStatus();
    }
    lock.lock();
    if (!alive && !stop_requested_) {
      return "pid " + std::to_string(session.pid()) + " exited with status " +
             (status ? std::to_string(*status) : std::string{"unknown"});
    }
  }
}

bool Supervisor::WaitForStop(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, delay, [this] { return stop_requested_; });
}

void Supervisor::SetState(ProcessState state) {
  std::vector<StateListener> listeners;
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if ((state_ == state && state_announced_) || state_ == ProcessState::kTerminated) {
      return;
    }
    state_announced_ = true;
    LogDebug(std::string{"[supervisor] "} + std::string{ProcessStateName(state_)} + " -> " +
             std::string{ProcessStateName(state)});
    state_ = state;
    generation = generation_;
    listeners = listeners_;
  }
  cv_.notify_all();
  for (const auto& listener : listeners) {
    listener(state, generation);
  }
}

void Supervisor::RecordStderr(std::uint64_t generation, const std::string& line) {
  LogInfo("[tool stderr] " + GenerationTag(generation) + ": " + line);
  std::lock_guard<std::mutex> lock(stderr_mutex_);
  stderr_tail_.push_back(line);
  while (stderr_tail_.size() > options_.stderr_tail_lines) {
    stderr_tail_.pop_front();
  }
}

}  // namespace bridge
