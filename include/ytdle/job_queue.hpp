#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace ytdle {

// FIFO backlog of pending job ids shared by all workers.
// - enqueue never blocks; it fails only once the queue is closed.
// - dequeue blocks until an id is available or the queue is closed and drained.
// - remove excises a still-pending id (cancel before dispatch).
class JobQueue {
public:
    JobQueue() = default;
    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    bool enqueue(const std::string& jobId);
    std::optional<std::string> dequeue();
    // Same as dequeue but gives up after timeout (returns empty).
    std::optional<std::string> dequeueFor(std::chrono::milliseconds timeout);
    std::optional<std::string> tryDequeue();
    bool remove(const std::string& jobId);
    bool contains(const std::string& jobId) const;

    void close();
    bool closed() const;
    size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> items_;
    bool closed_{false};
};

} // namespace ytdle
