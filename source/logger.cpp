#include "ytdle/logger.hpp"
#include "ytdle/util.hpp"
#include "ytdle/version.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace ytdle {

static constexpr size_t kMaxLogBytes = 512 * 1024;
static std::atomic<int> gMinLevel{static_cast<int>(LogLevel::Info)};
static std::atomic<bool> gToStderr{true};
static std::mutex gLogMutex;
static std::ofstream gLogFile;
static std::string gLogPath;
static size_t gLogBytes = 0;

static const char* levelLabel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "D";
        case LogLevel::Info: return "I";
        case LogLevel::Warn: return "W";
        case LogLevel::Error: return "E";
        default: return "?";
    }
}

bool initLogFile(const std::string& path, std::string& outError) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogPath.clear();
    gLogBytes = 0;
    if (path.empty()) return true;

    // ensureDirectory logs, which would re-enter gLogMutex.
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            outError = "Failed to create log directory for " + path + " err=" + ec.message();
            return false;
        }
    }
    // Start a fresh log file on launch
    gLogFile.open(path, std::ios::trunc);
    if (!gLogFile) {
        outError = "Failed to open log file: " + path;
        return false;
    }
    gLogFile << "ytdle " << appVersion() << " log start\n";
    gLogFile.flush();
    gLogBytes = static_cast<size_t>(gLogFile.tellp());
    gLogPath = path;
    return true;
}

void closeLogFile() {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogPath.clear();
    gLogBytes = 0;
}

void setLogLevel(LogLevel level) { gMinLevel.store(static_cast<int>(level)); }

void setLogLevelFromString(const std::string& level) {
    std::string l;
    l.reserve(level.size());
    for (char c : level) l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (l == "debug") setLogLevel(LogLevel::Debug);
    else if (l == "warn") setLogLevel(LogLevel::Warn);
    else if (l == "error") setLogLevel(LogLevel::Error);
    else setLogLevel(LogLevel::Info);
}

LogLevel logLevel() { return static_cast<LogLevel>(gMinLevel.load()); }

void setLogToStderr(bool enabled) { gToStderr.store(enabled); }

static void rotateLocked() {
    if (gLogFile.is_open()) gLogFile.close();
    std::error_code ec;
    std::filesystem::path p(gLogPath);
    std::filesystem::path rotated = p;
    rotated += ".1";
    std::filesystem::remove(rotated, ec);
    ec.clear();
    std::filesystem::rename(p, rotated, ec); // best-effort
    gLogFile.open(gLogPath, std::ios::trunc);
    gLogBytes = 0;
    if (gLogFile) {
        gLogFile << "ytdle " << appVersion() << " log start (rotated)\n";
        gLogFile.flush();
        gLogBytes = static_cast<size_t>(gLogFile.tellp());
    }
}

static void logInternal(LogLevel level, const std::string& tag, const std::string& msg) {
    if (static_cast<int>(level) < gMinLevel.load()) return;
    std::string line = util::formatIsoTime(std::chrono::system_clock::now()) + " " + levelLabel(level) +
                       " [" + tag + "] " + msg;

    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gToStderr.load()) std::cerr << line << std::endl;
    if (gLogPath.empty()) return;

    size_t writeBytes = line.size() + 1; // newline
    if (gLogBytes + writeBytes > kMaxLogBytes) {
        rotateLocked();
    }
    if (gLogFile) {
        gLogFile << line << "\n";
        gLogFile.flush();
        gLogBytes += writeBytes;
    }
}

void logLine(const std::string& msg) { logInternal(LogLevel::Info, "APP", msg); }
void logDebug(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Debug, tag, msg); }
void logInfo(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Info, tag, msg); }
void logWarn(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Warn, tag, msg); }
void logError(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Error, tag, msg); }

} // namespace ytdle
