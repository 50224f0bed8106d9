#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace bridge::logging {

enum class LogLevel { kError = 0, kWarn, kInfo, kDebug };

// Reads MCP_BRIDGE_LOG_LEVEL; unknown names are reported and ignored.
void InitializeFromEnvironment();
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();
bool IsDebugEnabled();

// Returns nullopt for names other than error/warn/warning/info/debug.
std::optional<LogLevel> ParseLogLevel(std::string value);
std::string_view LogLevelName(LogLevel level);

// Error and warn go to stderr, the rest to stdout. Each line carries a
// timestamp, the level and a short tag for the calling thread.
void Log(LogLevel level, const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);

}  // namespace bridge::logging
