#pragma once

#include <chrono>
#include <string>
#include <sys/types.h>
#include <vector>

#include "ytdle/raii.hpp"

namespace ytdle {

// Resolve a program name against PATH (names containing '/' are checked as-is).
// Returns an empty string when nothing executable is found.
std::string findExecutable(const std::string& name);

// One external program with stdout+stderr merged into a pipe. The child runs in
// its own process group so signals reach the tools it spawns (ffmpeg, aria2c).
// The destructor kills and reaps a child that is still running.
class ChildProcess {
public:
    enum class ReadStatus { Line, Timeout, Eof, Error };

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool start(const std::vector<std::string>& argv, std::string& outError);

    // Read one line (without the terminator). '\r' also ends a line. Partial
    // text still buffered at EOF is returned as a final Line.
    ReadStatus readLine(std::string& outLine, int timeoutMs);

    bool suspend();
    bool resume();
    // SIGTERM, then SIGKILL once `grace` passes; always reaps.
    void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(3000));
    // Blocks until exit. Returns the exit code, or 128+signal when killed.
    int wait();

    bool running() const { return pid_ > 0 && !reaped_; }
    pid_t pid() const { return pid_; }

private:
    bool tryReap(bool block);

    pid_t pid_{-1};
    bool reaped_{false};
    int exitCode_{-1};
    UniqueFd out_;
    std::string buffer_;
    bool eof_{false};
};

} // namespace ytdle
