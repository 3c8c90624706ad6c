#include "ytdle/job_queue.hpp"

#include <algorithm>

namespace ytdle {

bool JobQueue::enqueue(const std::string& jobId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        items_.push_back(jobId);
    }
    cv_.notify_one();
    return true;
}

std::optional<std::string> JobQueue::dequeue() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return closed_ || !items_.empty(); });
    if (items_.empty()) return std::nullopt;
    std::string id = std::move(items_.front());
    items_.pop_front();
    return id;
}

std::optional<std::string> JobQueue::dequeueFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return closed_ || !items_.empty(); });
    if (items_.empty()) return std::nullopt;
    std::string id = std::move(items_.front());
    items_.pop_front();
    return id;
}

std::optional<std::string> JobQueue::tryDequeue() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) return std::nullopt;
    std::string id = std::move(items_.front());
    items_.pop_front();
    return id;
}

bool JobQueue::remove(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(items_.begin(), items_.end(), jobId);
    if (it == items_.end()) return false;
    items_.erase(it);
    return true;
}

bool JobQueue::contains(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(items_.begin(), items_.end(), jobId) != items_.end();
}

void JobQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool JobQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t JobQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

bool JobQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
}

} // namespace ytdle
