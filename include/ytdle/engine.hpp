#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ytdle/config.hpp"
#include "ytdle/errors.hpp"
#include "ytdle/fetch_adapter.hpp"
#include "ytdle/history.hpp"
#include "ytdle/models.hpp"
#include "ytdle/progress_reporter.hpp"
#include "ytdle/reachability.hpp"
#include "ytdle/retry_policy.hpp"

namespace ytdle {

// Public contract of the download engine. Every method is thread-safe and
// none of them throws; control calls report through ControlResult.
class DownloadEngine {
public:
    virtual ~DownloadEngine() = default;

    // Accepts the specs as Queued jobs and returns immediately. An empty
    // batchId gets a generated "batch-<n>".
    virtual SubmitResult submit(const std::vector<JobSpec>& specs, const std::string& batchId = "") = 0;

    virtual ControlResult pause(const std::string& jobId) = 0;
    virtual ControlResult resume(const std::string& jobId) = 0;
    virtual ControlResult cancel(const std::string& jobId) = 0;
    virtual ControlResult skip(const std::string& jobId) = 0;
    virtual ControlResult cancelAll() = 0;
    virtual ControlResult pauseAll() = 0;
    virtual ControlResult resumeAll() = 0;
    // Forget a terminal job.
    virtual ControlResult acknowledge(const std::string& jobId) = 0;

    virtual std::optional<JobSnapshot> getStatus(const std::string& jobId) const = 0;
    virtual std::vector<JobSnapshot> listJobs() const = 0;
    virtual BatchSummary batchSummary(const std::string& batchId) const = 0;
    // True once every job of the batch is terminal; false on timeout.
    virtual bool waitForBatch(const std::string& batchId, std::chrono::milliseconds timeout) = 0;
    // Empty batchId subscribes to every job.
    virtual std::shared_ptr<ProgressSubscription> subscribe(const std::string& batchId = "") = 0;

    // Stops accepting work, finalizes queued jobs as Cancelled and waits for
    // in-flight jobs. With cancelInFlight they are cancelled, otherwise they
    // run to their natural end. Idempotent.
    virtual void shutdown(bool cancelInFlight) = 0;
};

struct EngineOptions {
    int workers{4};
    bool keepPartial{false};
    int maxAttempts{3};
    QualityLadder ladder;
    std::chrono::milliseconds reachabilityInterval{5000};
};

EngineOptions engineOptionsFromConfig(const EngineConfig& cfg);

// Builds the engine named by cfg.engine ("pool" or "sequential"). `history`
// and `probe` are optional and must outlive the engine.
std::unique_ptr<DownloadEngine> makeEngine(const EngineConfig& cfg, std::shared_ptr<FetchAdapter> adapter,
                                           HistorySink* history = nullptr, ReachabilityProbe* probe = nullptr);

} // namespace ytdle
