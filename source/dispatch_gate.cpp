#include "ytdle/dispatch_gate.hpp"
#include "ytdle/logger.hpp"

namespace ytdle {

DispatchGate::DispatchGate(ReachabilityProbe* probe, std::chrono::milliseconds recheckInterval)
    : probe_(probe), interval_(recheckInterval) {}

void DispatchGate::hold() {
    std::lock_guard<std::mutex> lock(mutex_);
    held_ = true;
}

void DispatchGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = false;
    }
    cv_.notify_all();
}

bool DispatchGate::held() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_;
}

void DispatchGate::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
}

bool DispatchGate::probeReachable() {
    std::lock_guard<std::mutex> lock(probeMutex_);
    auto now = std::chrono::steady_clock::now();
    if (lastProbeAt_ && now - *lastProbeAt_ < interval_) return lastReachable_;
    bool up = probe_->reachable();
    if (!up && lastReachable_) logWarn("Network unreachable; holding dispatch", "NET");
    if (up && !lastReachable_) logInfo("Network reachable; resuming dispatch", "NET");
    lastReachable_ = up;
    lastProbeAt_ = std::chrono::steady_clock::now();
    return up;
}

bool DispatchGate::waitUntilOpen() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (stopping_) return false;
        if (held_) {
            cv_.wait(lock);
            continue;
        }
        if (!probe_) return true;

        lock.unlock();
        bool up = probeReachable();
        lock.lock();
        if (stopping_) return false;
        if (held_) continue;
        if (up) return true;
        cv_.wait_for(lock, interval_);
    }
}

} // namespace ytdle
