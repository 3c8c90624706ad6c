#pragma once

#include <atomic>
#include <string>

namespace ytdle {

enum class NetworkStatus { Checking, Online, Offline };

inline const char* networkStatusLabel(NetworkStatus s) {
    switch (s) {
        case NetworkStatus::Online: return "Online";
        case NetworkStatus::Offline: return "Offline";
        default: return "Checking";
    }
}

// Consulted before dispatching a job; while it reports down, queued jobs wait.
class ReachabilityProbe {
public:
    virtual ~ReachabilityProbe() = default;
    virtual bool reachable() = 0;
};

// Plain TCP connect to a well-known endpoint (DNS resolver by default).
// Callers serialize reachable(); the dispatch gate does.
class TcpReachabilityProbe : public ReachabilityProbe {
public:
    TcpReachabilityProbe(std::string host, int port, int timeoutMs);

    bool reachable() override;
    NetworkStatus status() const { return status_.load(); }
    const std::string& lastError() const { return lastError_; }

private:
    std::string host_;
    int port_;
    int timeoutMs_;
    std::atomic<NetworkStatus> status_{NetworkStatus::Checking};
    std::string lastError_;
};

} // namespace ytdle
