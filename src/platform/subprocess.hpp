#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace platform {

struct SubprocessOptions {
  std::string command;
  std::vector<std::string> args;
  // Added to (or overriding) the inherited environment.
  std::map<std::string, std::string> env;
  std::string working_directory;
};

// A child process with piped stdin/stdout/stderr. The destructor kills and
// reaps the child if it is still running.
class Subprocess {
 public:
  // Throws std::runtime_error if the pipes cannot be created, fork fails, or
  // the command cannot be executed.
  static std::unique_ptr<Subprocess> Spawn(const SubprocessOptions& options);

 private:
  // Only Spawn() can name the key, so only Spawn() constructs.
  struct SpawnKey {
    explicit SpawnKey() = default;
  };

 public:
  explicit Subprocess(SpawnKey) {}

  ~Subprocess();

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  pid_t pid() const { return pid_; }

  // Transfer ownership of a pipe end to the caller. Returns -1 once taken.
  int TakeStdin();
  int TakeStdout();
  int TakeStderr();

  bool IsAlive();
  // Exit status once reaped: the exit code, or 128 + signal number.
  std::optional<int> ExitStatus() const { return exit_status_; }

  // Waits up to `timeout` for the child to exit.
  std::optional<int> WaitFor(std::chrono::milliseconds timeout);

  void Terminate();  // SIGTERM
  void Kill();       // SIGKILL, then reap

 private:
  bool Reap(bool block);

  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  std::optional<int> exit_status_;
};

std::string DescribeCommand(const SubprocessOptions& options);

}  // namespace platform
