#include "bridge/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace {

using bridge::logging::LogLevel;

std::atomic<LogLevel> current_level{LogLevel::kInfo};
std::mutex output_mutex;

void FormatTimestamp(std::ostream& out) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm local {};
  localtime_r(&seconds, &local);
  out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << std::setfill(' ');
}

// Four hex digits are enough to tell the reader, monitor and worker threads apart.
void FormatThreadTag(std::ostream& out) {
  const auto id = std::hash<std::thread::id>{}(std::this_thread::get_id());
  out << 't' << std::hex << std::setw(4) << std::setfill('0') << (id & 0xffff) << std::dec
      << std::setfill(' ');
}

}  // namespace

namespace bridge::logging {

void InitializeFromEnvironment() {
  const char* env = std::getenv("MCP_BRIDGE_LOG_LEVEL");
  if (env == nullptr || *env == '\0') {
    return;
  }
  const auto level = ParseLogLevel(env);
  if (!level) {
    LogWarn(std::string{"Ignoring unknown MCP_BRIDGE_LOG_LEVEL value: "} + env);
    return;
  }
  SetLogLevel(*level);
}

void SetLogLevel(LogLevel level) { current_level.store(level); }

LogLevel GetLogLevel() { return current_level.load(); }

bool IsDebugEnabled() { return GetLogLevel() == LogLevel::kDebug; }

std::optional<LogLevel> ParseLogLevel(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (value == "warning") {
    return LogLevel::kWarn;
  }
  for (const LogLevel level :
       {LogLevel::kError, LogLevel::kWarn, LogLevel::kInfo, LogLevel::kDebug}) {
    std::string name(LogLevelName(level));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (value == name) {
      return level;
    }
  }
  return std::nullopt;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kDebug:
      return "DEBUG";
  }
  return "INFO";
}

void Log(LogLevel level, const std::string& message) {
  if (static_cast<int>(level) > static_cast<int>(GetLogLevel())) {
    return;
  }

  std::ostringstream line;
  FormatTimestamp(line);
  line << ' ';
  FormatThreadTag(line);
  line << " [" << LogLevelName(level) << "] " << message << '\n';

  const bool to_stderr = level == LogLevel::kError || level == LogLevel::kWarn;
  std::lock_guard<std::mutex> lock(output_mutex);
  std::ostream& stream = to_stderr ? std::cerr : std::cout;
  stream << line.str() << std::flush;
}

void LogInfo(const std::string& message) { Log(LogLevel::kInfo, message); }

void LogWarn(const std::string& message) { Log(LogLevel::kWarn, message); }

void LogError(const std::string& message) { Log(LogLevel::kError, message); }

void LogDebug(const std::string& message) { Log(LogLevel::kDebug, message); }

}  // namespace bridge::logging
