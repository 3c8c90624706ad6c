#include "ytdle/progress_reporter.hpp"

#include <algorithm>

namespace ytdle {

ProgressSubscription::ProgressSubscription(std::string batchFilter) : batchFilter_(std::move(batchFilter)) {}

void ProgressSubscription::push(const ProgressEvent& ev) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        if (ev.kind == ProgressEvent::Kind::Progress) {
            auto it = latestProgress_.find(ev.jobId);
            if (it != latestProgress_.end()) {
                it->second = ev;
                return;
            }
            latestProgress_.emplace(ev.jobId, ev);
            Slot marker;
            marker.progressMarker = true;
            marker.jobId = ev.jobId;
            slots_.push_back(std::move(marker));
        } else {
            // Pin the job's pending progress in place so later progress queues behind this event.
            auto pending = latestProgress_.find(ev.jobId);
            if (pending != latestProgress_.end()) {
                for (auto it = slots_.rbegin(); it != slots_.rend(); ++it) {
                    if (it->progressMarker && it->jobId == ev.jobId) {
                        it->progressMarker = false;
                        it->event = std::move(pending->second);
                        break;
                    }
                }
                latestProgress_.erase(pending);
            }
            Slot slot;
            slot.jobId = ev.jobId;
            slot.event = ev;
            slots_.push_back(std::move(slot));
        }
    }
    cv_.notify_one();
}

std::optional<ProgressEvent> ProgressSubscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return closed_ || !slots_.empty(); });
    if (slots_.empty()) return std::nullopt;
    Slot slot = std::move(slots_.front());
    slots_.pop_front();
    if (!slot.progressMarker) return slot.event;
    auto it = latestProgress_.find(slot.jobId);
    if (it == latestProgress_.end()) return std::nullopt;
    ProgressEvent ev = std::move(it->second);
    latestProgress_.erase(it);
    return ev;
}

void ProgressSubscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressSubscription::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool ProgressSubscription::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && slots_.empty();
}

size_t ProgressSubscription::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

std::shared_ptr<ProgressSubscription> ProgressReporter::subscribe(const std::string& batchFilter,
                                                                  const std::vector<ProgressEvent>& replay) {
    auto sub = std::make_shared<ProgressSubscription>(batchFilter);
    for (const auto& ev : replay) {
        if (batchFilter.empty() || ev.batchId == batchFilter) sub->push(ev);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        sub->close();
        return sub;
    }
    subs_.push_back(sub);
    return sub;
}

void ProgressReporter::publish(const ProgressEvent& ev) {
    std::vector<std::shared_ptr<ProgressSubscription>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subs_.erase(std::remove_if(subs_.begin(), subs_.end(),
                                   [](const std::weak_ptr<ProgressSubscription>& w) { return w.expired(); }),
                    subs_.end());
        targets.reserve(subs_.size());
        for (const auto& w : subs_) {
            if (auto s = w.lock()) targets.push_back(std::move(s));
        }
    }
    for (const auto& s : targets) {
        if (s->batchFilter().empty() || s->batchFilter() == ev.batchId) s->push(ev);
    }
}

void ProgressReporter::closeAll() {
    std::vector<std::shared_ptr<ProgressSubscription>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        for (const auto& w : subs_) {
            if (auto s = w.lock()) targets.push_back(std::move(s));
        }
        subs_.clear();
    }
    for (const auto& s : targets) s->close();
}

size_t ProgressReporter::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& w : subs_) {
        if (!w.expired()) n++;
    }
    return n;
}

} // namespace ytdle
