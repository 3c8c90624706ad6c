#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ytdle/dispatch_gate.hpp"
#include "ytdle/engine.hpp"
#include "ytdle/job_queue.hpp"
#include "ytdle/job_table.hpp"

namespace ytdle {

// Shared engine state and job processing. Subclasses decide how worker
// threads are created and reaped.
class EngineCore : public DownloadEngine {
public:
    EngineCore(EngineOptions opts, std::shared_ptr<FetchAdapter> adapter, HistorySink* history,
               ReachabilityProbe* probe);
    ~EngineCore() override = default;

    SubmitResult submit(const std::vector<JobSpec>& specs, const std::string& batchId = "") override;

    ControlResult pause(const std::string& jobId) override;
    ControlResult resume(const std::string& jobId) override;
    ControlResult cancel(const std::string& jobId) override;
    ControlResult skip(const std::string& jobId) override;
    ControlResult cancelAll() override;
    ControlResult pauseAll() override;
    ControlResult resumeAll() override;
    ControlResult acknowledge(const std::string& jobId) override;

    std::optional<JobSnapshot> getStatus(const std::string& jobId) const override;
    std::vector<JobSnapshot> listJobs() const override;
    BatchSummary batchSummary(const std::string& batchId) const override;
    bool waitForBatch(const std::string& batchId, std::chrono::milliseconds timeout) override;
    std::shared_ptr<ProgressSubscription> subscribe(const std::string& batchId = "") override;

    void shutdown(bool cancelInFlight) override;

    const EngineOptions& options() const { return opts_; }

protected:
    // New ids were enqueued.
    virtual void onJobsQueued() {}
    // Queue is closed; join every worker thread before returning.
    virtual void stopWorkers() = 0;

    // Run one dequeued job id to the end of its current attempt.
    void processJob(const std::string& jobId);

    JobQueue& queue() { return queue_; }
    DispatchGate& gate() { return gate_; }

private:
    ControlResult stopJob(const std::string& jobId, JobState target);
    void emitHistory(const FinalizeRecord& record);
    void emitHistory(const std::vector<FinalizeRecord>& records);
    FetchResult runAdapter(const FetchRequest& req, JobControl& control);

    const EngineOptions opts_;
    std::shared_ptr<FetchAdapter> adapter_;
    HistorySink* history_;

    JobQueue queue_;
    ProgressReporter reporter_;
    RetryPolicy policy_;
    JobTable table_;
    DispatchGate gate_;

    std::mutex shutdownMutex_;
    bool shutdownDone_{false};
};

} // namespace ytdle
