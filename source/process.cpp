#include "ytdle/process.hpp"
#include "ytdle/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace ytdle {

namespace {

bool isExecutableFile(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

std::string findExecutable(const std::string& name) {
    if (name.empty()) return {};
    if (name.find('/') != std::string::npos) {
        return isExecutableFile(name) ? name : std::string{};
    }
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return {};
    std::stringstream ss(pathEnv);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (isExecutableFile(candidate)) return candidate;
    }
    return {};
}

ChildProcess::~ChildProcess() {
    if (running()) {
        logWarn("Child " + std::to_string(pid_) + " still running at teardown; killing", "PROC");
        terminate(std::chrono::milliseconds(500));
    }
}

bool ChildProcess::start(const std::vector<std::string>& argv, std::string& outError) {
    if (argv.empty()) {
        outError = "Empty command line.";
        return false;
    }
    if (pid_ > 0) {
        outError = "Process already started.";
        return false;
    }

    int outPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        outError = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    UniqueFd readEnd(outPipe[0]);
    UniqueFd writeEnd(outPipe[1]);

    // Carries the exec errno back to the parent; closes on successful exec.
    int errPipe[2];
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        outError = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    UniqueFd errRead(errPipe[0]);
    UniqueFd errWrite(errPipe[1]);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        outError = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }
    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        ::dup2(writeEnd.fd, STDOUT_FILENO);
        ::dup2(writeEnd.fd, STDERR_FILENO);
        ::execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = ::write(errWrite.fd, &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    pid_ = pid;
    reaped_ = false;
    exitCode_ = -1;
    eof_ = false;
    buffer_.clear();
    writeEnd.reset();
    errWrite.reset();

    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(errRead.fd, &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        tryReap(true);
        outError = "Failed to launch " + argv[0] + ": " + std::strerror(childErr);
        return false;
    }

    out_ = std::move(readEnd);
    logDebug("Launched " + argv[0] + " pid=" + std::to_string(pid_), "PROC");
    return true;
}

ChildProcess::ReadStatus ChildProcess::readLine(std::string& outLine, int timeoutMs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (true) {
        auto pos = buffer_.find_first_of("\r\n");
        while (pos == 0) {
            buffer_.erase(0, 1);
            pos = buffer_.find_first_of("\r\n");
        }
        if (pos != std::string::npos) {
            outLine = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            return ReadStatus::Line;
        }
        if (eof_ || !out_) {
            if (!buffer_.empty()) {
                outLine.swap(buffer_);
                buffer_.clear();
                return ReadStatus::Line;
            }
            return ReadStatus::Eof;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return ReadStatus::Timeout;
        int waitMs = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());

        struct pollfd pfd{};
        pfd.fd = out_.fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, waitMs);
        if (rc == 0) return ReadStatus::Timeout;
        if (rc < 0) {
            if (errno == EINTR) continue;
            return ReadStatus::Error;
        }
        char chunk[4096];
        ssize_t n = ::read(out_.fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            return ReadStatus::Error;
        }
    }
}

bool ChildProcess::suspend() {
    if (!running()) return false;
    if (::kill(-pid_, SIGSTOP) != 0) {
        logWarn("SIGSTOP failed for pid " + std::to_string(pid_) + ": " + std::strerror(errno), "PROC");
        return false;
    }
    return true;
}

bool ChildProcess::resume() {
    if (!running()) return false;
    if (::kill(-pid_, SIGCONT) != 0) {
        logWarn("SIGCONT failed for pid " + std::to_string(pid_) + ": " + std::strerror(errno), "PROC");
        return false;
    }
    return true;
}

bool ChildProcess::tryReap(bool block) {
    if (pid_ <= 0 || reaped_) return true;
    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (rc < 0 && errno == EINTR);
    if (rc == 0) return false;
    reaped_ = true;
    exitCode_ = rc == pid_ ? decodeWaitStatus(status) : -1;
    return true;
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (!running()) return;
    ::kill(-pid_, SIGTERM);
    // A stopped group never sees SIGTERM until continued.
    ::kill(-pid_, SIGCONT);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (tryReap(false)) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (!reaped_) {
        logWarn("pid " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL", "PROC");
        ::kill(-pid_, SIGKILL);
        tryReap(true);
    }
    // Stragglers in the group (ffmpeg spawned by the fetch tool).
    ::kill(-pid_, SIGKILL);
    out_.reset();
}

int ChildProcess::wait() {
    if (pid_ <= 0) return -1;
    tryReap(true);
    return exitCode_;
}

} // namespace ytdle
