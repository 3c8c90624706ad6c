#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ytdle/fetch_adapter.hpp"

namespace ytdle::testing {

// Scripted stand-in for the fetch tool, keyed by URL. Each attempt plays the
// step at index attempt-1 (the last step repeats). URLs without a script
// complete after `defaultDelayMs`.
class FakeFetchAdapter : public FetchAdapter {
public:
    struct Step {
        enum class Kind { Succeed, Fail, Throw, RunUntilStopped, FailOnPause };
        Kind kind{Kind::Succeed};
        ErrorCode error{ErrorCode::None};
        std::string detail;
        int delayMs{20};
    };

    struct Call {
        std::string jobId;
        int attempt{0};
        std::string quality;
        bool relaxed{false};
        // Directive in force when the attempt started.
        Directive initial{Directive::Run};
    };

    static Step succeed(int delayMs = 20) {
        Step s;
        s.delayMs = delayMs;
        return s;
    }
    static Step fail(ErrorCode code, std::string detail = "scripted failure", int delayMs = 10) {
        Step s;
        s.kind = Step::Kind::Fail;
        s.error = code;
        s.detail = std::move(detail);
        s.delayMs = delayMs;
        return s;
    }
    static Step raise() {
        Step s;
        s.kind = Step::Kind::Throw;
        return s;
    }
    // Runs until paused, then fails without waiting for resume.
    static Step failOnPause(ErrorCode code, std::string detail = "failed while paused") {
        Step s;
        s.kind = Step::Kind::FailOnPause;
        s.error = code;
        s.detail = std::move(detail);
        return s;
    }
    static Step runUntilStopped() {
        Step s;
        s.kind = Step::Kind::RunUntilStopped;
        return s;
    }

    void script(const std::string& url, std::vector<Step> steps) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[url] = std::move(steps);
    }

    FetchResult run(const FetchRequest& req, JobControl& control, const ProgressFn& onProgress) override {
        Step step = stepFor(req);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back({req.jobId, req.attempt, req.quality, req.relaxed, control.directive()});
        }
        int now = ++running_;
        int seen = maxRunning_.load();
        while (now > seen && !maxRunning_.compare_exchange_weak(seen, now)) {
        }
        struct Leave {
            std::atomic<int>& n;
            ~Leave() { --n; }
        } leave{running_};

        if (step.kind == Step::Kind::Throw) throw std::runtime_error("scripted adapter fault");

        const std::string path = req.request.outputDir + "/" + req.jobId + ".out";
        FetchProgress p;
        p.bytesTotal = 1000;
        p.bytesDownloaded = 0;
        onProgress(p);

        int elapsed = 0;
        const bool untilStopped =
            step.kind == Step::Kind::RunUntilStopped || step.kind == Step::Kind::FailOnPause;
        while (untilStopped || elapsed < step.delayMs) {
            Directive d = control.directive();
            if (JobControl::isStopDirective(d)) return FetchResult::aborted();
            if (d == Directive::Pause && step.kind == Step::Kind::FailOnPause) {
                pausedObserved_ = true;
                return FetchResult::failure(makeError(step.error, step.detail));
            }
            if (d == Directive::Pause) {
                pausedObserved_ = true;
                control.waitForChange(Directive::Pause, std::chrono::milliseconds(50));
                continue;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            elapsed += 5;
        }

        if (step.kind == Step::Kind::Fail) return FetchResult::failure(makeError(step.error, step.detail));
        p.bytesDownloaded = 1000;
        p.outputPath = path;
        onProgress(p);
        return FetchResult::success(path);
    }

    void discardPartial(const FetchRequest& req, const FetchResult& result) override {
        (void)result;
        std::lock_guard<std::mutex> lock(mutex_);
        discarded_.push_back(req.jobId);
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }
    std::vector<Call> callsFor(const std::string& jobId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Call> out;
        for (const auto& c : calls_) {
            if (c.jobId == jobId) out.push_back(c);
        }
        return out;
    }
    std::vector<std::string> discarded() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return discarded_;
    }
    int running() const { return running_.load(); }
    int maxRunning() const { return maxRunning_.load(); }
    bool pausedObserved() const { return pausedObserved_.load(); }

    int defaultDelayMs{20};

private:
    Step stepFor(const FetchRequest& req) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = scripts_.find(req.request.url);
        if (it == scripts_.end() || it->second.empty()) return succeed(defaultDelayMs);
        size_t idx = static_cast<size_t>(req.attempt > 0 ? req.attempt - 1 : 0);
        if (idx >= it->second.size()) idx = it->second.size() - 1;
        return it->second[idx];
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<Step>> scripts_;
    std::vector<Call> calls_;
    std::vector<std::string> discarded_;
    std::atomic<int> running_{0};
    std::atomic<int> maxRunning_{0};
    std::atomic<bool> pausedObserved_{false};
};

// Polls `pred` until it holds or `timeout` passes.
template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace ytdle::testing
