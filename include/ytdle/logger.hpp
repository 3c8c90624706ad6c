#pragma once

#include <string>

namespace ytdle {

enum class LogLevel { Debug = 0, Info, Warn, Error };

// Mirror log lines into a size-capped file (rotated to <path>.1). Safe to call again
// to switch files; an empty path disables file output.
bool initLogFile(const std::string& path, std::string& outError);
void closeLogFile();
void setLogLevel(LogLevel level);
void setLogLevelFromString(const std::string& level);
LogLevel logLevel();
// Silence stderr output (file output is unaffected). Used by tests.
void setLogToStderr(bool enabled);

// Tagged logging helpers. logLine is Info level with the "APP" tag.
void logLine(const std::string& msg);
void logDebug(const std::string& msg, const std::string& tag = "DBG");
void logInfo(const std::string& msg, const std::string& tag = "APP");
void logWarn(const std::string& msg, const std::string& tag = "APP");
void logError(const std::string& msg, const std::string& tag = "APP");

} // namespace ytdle
