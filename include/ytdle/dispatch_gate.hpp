#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

#include "ytdle/reachability.hpp"

namespace ytdle {

// Workers pass through the gate before starting a job. It is closed while
// pause-all is active or the reachability probe reports the network down.
class DispatchGate {
public:
    DispatchGate(ReachabilityProbe* probe, std::chrono::milliseconds recheckInterval);
    DispatchGate(const DispatchGate&) = delete;
    DispatchGate& operator=(const DispatchGate&) = delete;

    void hold();
    void release();
    bool held() const;
    void shutdown();

    // Blocks until dispatch is allowed. Returns false once shut down.
    bool waitUntilOpen();

private:
    bool probeReachable();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool held_{false};
    bool stopping_{false};

    ReachabilityProbe* probe_;
    const std::chrono::milliseconds interval_;
    std::mutex probeMutex_;
    std::optional<std::chrono::steady_clock::time_point> lastProbeAt_;
    bool lastReachable_{true};
};

} // namespace ytdle
