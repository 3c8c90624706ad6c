#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ytdle/models.hpp"

namespace ytdle {

// Pull-based event stream for one subscriber.
// Progress events are coalesced to the latest value per job; state events are
// queued and never dropped. A job's pending progress is always delivered
// before that job's next state event.
class ProgressSubscription {
public:
    explicit ProgressSubscription(std::string batchFilter);
    ProgressSubscription(const ProgressSubscription&) = delete;
    ProgressSubscription& operator=(const ProgressSubscription&) = delete;

    // Next event, waiting up to `timeout`. Empty on timeout or once closed and drained.
    std::optional<ProgressEvent> next(std::chrono::milliseconds timeout);
    void close();
    bool closed() const;
    // Closed and nothing left to deliver.
    bool finished() const;
    size_t pending() const;

    const std::string& batchFilter() const { return batchFilter_; }

private:
    friend class ProgressReporter;

    // Non-blocking; called by the publisher.
    void push(const ProgressEvent& ev);

    struct Slot {
        bool progressMarker{false};
        std::string jobId;
        ProgressEvent event;
    };

    const std::string batchFilter_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Slot> slots_;
    std::unordered_map<std::string, ProgressEvent> latestProgress_;
    bool closed_{false};
};

// Fan-out of job events to subscriptions. publish never blocks on a subscriber.
class ProgressReporter {
public:
    ProgressReporter() = default;
    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    // Registers a subscription seeded with `replay` (matching events only).
    std::shared_ptr<ProgressSubscription> subscribe(const std::string& batchFilter,
                                                    const std::vector<ProgressEvent>& replay);
    void publish(const ProgressEvent& ev);
    // Close every subscription; later subscribe calls return closed subscriptions.
    void closeAll();
    size_t subscriberCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<ProgressSubscription>> subs_;
    bool closed_{false};
};

} // namespace ytdle
