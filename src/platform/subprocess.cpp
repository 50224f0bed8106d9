#include "platform/subprocess.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {
namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

struct Pipe {
  int read_end = -1;
  int write_end = -1;

  ~Pipe() {
    CloseFd(read_end);
    CloseFd(write_end);
  }

  void Open(const char* label) {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      throw std::runtime_error(std::string{"pipe for "} + label + " failed: " +
                               std::strerror(errno));
    }
    read_end = fds[0];
    write_end = fds[1];
  }
};

int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Runs in the forked child; only async-signal-safe calls until exec.
[[noreturn]] void ExecChild(const SubprocessOptions& options, char* const* argv,
                            Pipe& in, Pipe& out, Pipe& err, int exec_error_fd) {
  if (::dup2(in.read_end, STDIN_FILENO) < 0 || ::dup2(out.write_end, STDOUT_FILENO) < 0 ||
      ::dup2(err.write_end, STDERR_FILENO) < 0) {
    const int code = errno;
    (void)!::write(exec_error_fd, &code, sizeof(code));
    ::_exit(126);
  }
  if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0) {
    const int code = errno;
    (void)!::write(exec_error_fd, &code, sizeof(code));
    ::_exit(126);
  }
  ::execvp(argv[0], argv);
  const int code = errno;
  (void)!::write(exec_error_fd, &code, sizeof(code));
  ::_exit(127);
}

}  // namespace

std::unique_ptr<Subprocess> Subprocess::Spawn(const SubprocessOptions& options) {
  if (options.command.empty()) {
    throw std::invalid_argument("Subprocess command must not be empty");
  }

  std::vector<char*> argv;
  argv.push_back(const_cast<char*>(options.command.c_str()));
  for (const auto& arg : options.args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  Pipe in;
  Pipe out;
  Pipe err;
  Pipe exec_status;
  in.Open("stdin");
  out.Open("stdout");
  err.Open("stderr");
  exec_status.Open("exec status");

  // setenv() is not safe between fork and exec in a threaded process, so the
  // overrides are applied to a copy of the environment built up front.
  std::vector<std::string> env_strings;
  for (char** entry = environ; entry && *entry; ++entry) {
    const std::string value = *entry;
    const auto eq = value.find('=');
    const std::string key = value.substr(0, eq);
    if (options.env.find(key) == options.env.end()) {
      env_strings.push_back(value);
    }
  }
  for (const auto& [key, value] : options.env) {
    env_strings.push_back(key + "=" + value);
  }
  std::vector<char*> envp;
  for (auto& entry : env_strings) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::runtime_error(std::string{"fork failed: "} + std::strerror(errno));
  }
  if (pid == 0) {
    environ = envp.data();
    ExecChild(options, argv.data(), in, out, err, exec_status.write_end);
  }

  CloseFd(exec_status.write_end);
  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_status.read_end, &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);

  auto process = std::make_unique<Subprocess>(SpawnKey{});
  process->pid_ = pid;

  if (n > 0) {
    process->Reap(/*block=*/true);
    throw std::runtime_error("Failed to execute '" + options.command +
                             "': " + std::strerror(exec_errno));
  }

  process->stdin_fd_ = std::exchange(in.write_end, -1);
  process->stdout_fd_ = std::exchange(out.read_end, -1);
  process->stderr_fd_ = std::exchange(err.read_end, -1);
  return process;
}

Subprocess::~Subprocess() {
  CloseFd(stdin_fd_);
  CloseFd(stdout_fd_);
  CloseFd(stderr_fd_);
  if (!exit_status_ && pid_ > 0) {
    Kill();
  }
}

int Subprocess::TakeStdin() { return std::exchange(stdin_fd_, -1); }

int Subprocess::TakeStdout() { return std::exchange(stdout_fd_, -1); }

int Subprocess::TakeStderr() { return std::exchange(stderr_fd_, -1); }

bool Subprocess::IsAlive() { return !Reap(/*block=*/false); }

std::optional<int> Subprocess::WaitFor(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!Reap(/*block=*/false)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }
    std::this_thread::sleep_for(kReapPollInterval);
  }
  return exit_status_;
}

void Subprocess::Terminate() {
  if (!exit_status_ && pid_ > 0) {
    ::kill(pid_, SIGTERM);
  }
}

void Subprocess::Kill() {
  if (!exit_status_ && pid_ > 0) {
    ::kill(pid_, SIGKILL);
    Reap(/*block=*/true);
  }
}

bool Subprocess::Reap(bool block) {
  if (exit_status_) {
    return true;
  }
  if (pid_ <= 0) {
    return true;
  }
  int status = 0;
  pid_t result = 0;
  do {
    result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (result < 0 && errno == EINTR);

  if (result == pid_) {
    exit_status_ = DecodeWaitStatus(status);
    return true;
  }
  if (result < 0) {
    // ECHILD: somebody else reaped it; treat as exited with unknown status.
    exit_status_ = -1;
    return true;
  }
  return false;
}

std::string DescribeCommand(const SubprocessOptions& options) {
  std::string description = options.command;
  for (const auto& arg : options.args) {
    description.push_back(' ');
    if (arg.find(' ') != std::string::npos) {
      description += "\"" + arg + "\"";
    } else {
      description += arg;
    }
  }
  return description;
}

}  // namespace platform
