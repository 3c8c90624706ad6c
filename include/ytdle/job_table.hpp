#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ytdle/fetch_adapter.hpp"
#include "ytdle/job_control.hpp"
#include "ytdle/job_queue.hpp"
#include "ytdle/models.hpp"
#include "ytdle/progress_reporter.hpp"
#include "ytdle/retry_policy.hpp"

namespace ytdle {

// Single source of truth for job run state. Every transition goes through
// canTransition() under one mutex and is published to the reporter while the
// lock is held, so subscribers see each job's events in commit order.
class JobTable {
public:
    struct BeginResult {
        enum class Kind { Start, NotRunnable, Parked };
        Kind kind{Kind::NotRunnable};
        FetchRequest request;
        std::shared_ptr<JobControl> control;
        std::string outputKey;
    };

    struct FinishResult {
        JobState state{JobState::Cancelled};
        // Job went back to the queue; partial output must go before the next attempt.
        bool requeue{false};
        std::optional<FinalizeRecord> record;
    };

    JobTable(ProgressReporter& reporter, const RetryPolicy& policy, JobQueue& queue);
    JobTable(const JobTable&) = delete;
    JobTable& operator=(const JobTable&) = delete;

    std::string nextJobId();
    std::string nextBatchId();

    // New Queued job. DuplicateId when a live job already uses the id,
    // EngineClosed once closing.
    ControlResult add(const std::string& id, const std::string& batchId, const JobRequest& request);

    // Queued -> Running for the worker that dequeued `id`. Parked when another
    // running job holds the same output key.
    BeginResult beginAttempt(const std::string& id);
    void reportProgress(const std::string& id, const FetchProgress& p);
    // Apply an attempt outcome (retry decision included).
    FinishResult finishAttempt(const std::string& id, const FetchResult& result);
    // Drop the output claim; returns parked ids that must go back to the queue.
    std::vector<std::string> releaseOutput(const std::string& id, const std::string& key);

    ControlResult pause(const std::string& id);
    ControlResult resume(const std::string& id);
    // Cancel or skip (`target` is Cancelled or Skipped).
    ControlResult stop(const std::string& id, JobState target, std::optional<FinalizeRecord>& outRecord);
    std::vector<FinalizeRecord> stopAll(JobState target, bool includeQueued, bool includeActive);
    size_t pauseAll();
    size_t resumeAll();
    ControlResult acknowledge(const std::string& id);

    // From now on add() is refused and recoverable failures finalize as Cancelled.
    void setClosing();
    bool closing() const;

    std::optional<JobSnapshot> get(const std::string& id) const;
    std::vector<JobSnapshot> list() const;
    BatchSummary summary(const std::string& batchId) const;
    // True once every job of the batch is terminal (also for unknown batches).
    bool waitForBatch(const std::string& batchId, std::chrono::milliseconds timeout) const;
    std::shared_ptr<ProgressSubscription> subscribe(const std::string& batchId);

private:
    struct Record {
        JobSnapshot snap;
        std::shared_ptr<JobControl> control;
        std::string outputKey;
        bool parked{false};
    };

    Record* findLocked(const std::string& id);
    const Record* findLocked(const std::string& id) const;
    bool transitionLocked(Record& rec, JobState to);
    void publishStateLocked(const Record& rec);
    ProgressEvent stateEventLocked(const Record& rec) const;
    FinalizeRecord finalizeLocked(Record& rec, JobState finalState);
    void unparkLocked(Record& rec);
    BatchSummary summaryLocked(const std::string& batchId) const;

    ProgressReporter& reporter_;
    const RetryPolicy& policy_;
    JobQueue& queue_;

    mutable std::mutex mutex_;
    mutable std::condition_variable terminalCv_;
    std::unordered_map<std::string, Record> jobs_;
    // Submission order, for listJobs().
    std::vector<std::string> order_;
    std::map<std::string, std::vector<std::string>> batches_;
    std::unordered_map<std::string, std::string> claims_;
    std::unordered_map<std::string, std::deque<std::string>> parked_;
    uint64_t jobSeq_{0};
    uint64_t batchSeq_{0};
    bool closing_{false};
};

} // namespace ytdle
