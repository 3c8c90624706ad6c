#include "ytdle/engine_core.hpp"
#include "ytdle/logger.hpp"
#include "ytdle/util.hpp"

namespace ytdle {

EngineCore::EngineCore(EngineOptions opts, std::shared_ptr<FetchAdapter> adapter, HistorySink* history,
                       ReachabilityProbe* probe)
    : opts_(std::move(opts)),
      adapter_(std::move(adapter)),
      history_(history),
      policy_(opts_.maxAttempts, opts_.ladder),
      table_(reporter_, policy_, queue_),
      gate_(probe, opts_.reachabilityInterval) {}

SubmitResult EngineCore::submit(const std::vector<JobSpec>& specs, const std::string& batchId) {
    SubmitResult out;
    out.batchId = batchId.empty() ? table_.nextBatchId() : batchId;
    bool queued = false;
    for (const auto& spec : specs) {
        JobRequest req = spec.request;
        if (util::trim(req.filenameTemplate).empty()) req.filenameTemplate = kDefaultFilenameTemplate;
        const std::string id = spec.id.empty() ? table_.nextJobId() : spec.id;

        ControlResult res = table_.add(id, out.batchId, req);
        if (res == ControlResult::Ok) {
            if (queue_.enqueue(id)) {
                queued = true;
            } else {
                // Raced with shutdown, which already finalized the job.
                logDebug(id + ": queue closed during submit", "QUEUE");
            }
        } else {
            logWarn("Rejected job " + id + ": " + controlResultLabel(res), "ENGINE");
        }
        out.jobs.push_back({id, res});
    }
    if (queued) {
        logInfo("Queued batch " + out.batchId + " (" + std::to_string(specs.size()) + " item(s))", "ENGINE");
        onJobsQueued();
    }
    return out;
}

ControlResult EngineCore::pause(const std::string& jobId) {
    if (table_.closing()) return ControlResult::EngineClosed;
    return table_.pause(jobId);
}

ControlResult EngineCore::resume(const std::string& jobId) {
    return table_.resume(jobId);
}

ControlResult EngineCore::stopJob(const std::string& jobId, JobState target) {
    std::optional<FinalizeRecord> record;
    ControlResult res = table_.stop(jobId, target, record);
    if (res == ControlResult::Ok) {
        logInfo(jobId + ": " + jobStateLabel(target), "ENGINE");
        if (record) emitHistory(*record);
    }
    return res;
}

ControlResult EngineCore::cancel(const std::string& jobId) {
    return stopJob(jobId, JobState::Cancelled);
}

ControlResult EngineCore::skip(const std::string& jobId) {
    return stopJob(jobId, JobState::Skipped);
}

ControlResult EngineCore::cancelAll() {
    auto records = table_.stopAll(JobState::Cancelled, true, true);
    if (!records.empty()) logInfo("Cancelled " + std::to_string(records.size()) + " job(s)", "ENGINE");
    emitHistory(records);
    return ControlResult::Ok;
}

ControlResult EngineCore::pauseAll() {
    if (table_.closing()) return ControlResult::EngineClosed;
    gate_.hold();
    size_t n = table_.pauseAll();
    logInfo("Paused dispatch (" + std::to_string(n) + " running job(s) suspended)", "ENGINE");
    return ControlResult::Ok;
}

ControlResult EngineCore::resumeAll() {
    gate_.release();
    size_t n = table_.resumeAll();
    logInfo("Resumed dispatch (" + std::to_string(n) + " job(s) continued)", "ENGINE");
    return ControlResult::Ok;
}

ControlResult EngineCore::acknowledge(const std::string& jobId) {
    return table_.acknowledge(jobId);
}

std::optional<JobSnapshot> EngineCore::getStatus(const std::string& jobId) const {
    return table_.get(jobId);
}

std::vector<JobSnapshot> EngineCore::listJobs() const {
    return table_.list();
}

BatchSummary EngineCore::batchSummary(const std::string& batchId) const {
    return table_.summary(batchId);
}

bool EngineCore::waitForBatch(const std::string& batchId, std::chrono::milliseconds timeout) {
    return table_.waitForBatch(batchId, timeout);
}

std::shared_ptr<ProgressSubscription> EngineCore::subscribe(const std::string& batchId) {
    return table_.subscribe(batchId);
}

void EngineCore::emitHistory(const FinalizeRecord& record) {
    if (!history_) return;
    try {
        history_->recordFinal(record);
    } catch (const std::exception& e) {
        logError(record.id + ": history sink failed: " + e.what(), "HISTORY");
    }
}

void EngineCore::emitHistory(const std::vector<FinalizeRecord>& records) {
    for (const auto& r : records) emitHistory(r);
}

FetchResult EngineCore::runAdapter(const FetchRequest& req, JobControl& control) {
    ProgressFn onProgress = [this, &req](const FetchProgress& p) { table_.reportProgress(req.jobId, p); };
    try {
        return adapter_->run(req, control, onProgress);
    } catch (const std::exception& e) {
        logError(req.jobId + ": fetch adapter threw: " + e.what(), "ENGINE");
        return FetchResult::failure(makeError(ErrorCode::InternalFault, e.what()));
    } catch (...) {
        logError(req.jobId + ": fetch adapter threw a non-standard exception", "ENGINE");
        return FetchResult::failure(makeError(ErrorCode::InternalFault, "unknown exception in fetch adapter"));
    }
}

void EngineCore::processJob(const std::string& jobId) {
    // A job dequeued right before pause-all waits here, still Queued.
    if (!gate_.waitUntilOpen()) return;

    JobTable::BeginResult begin = table_.beginAttempt(jobId);
    if (begin.kind != JobTable::BeginResult::Kind::Start) return;

    logDebug(jobId + ": attempt " + std::to_string(begin.request.attempt) + " at quality " +
                 begin.request.quality + (begin.request.relaxed ? " (relaxed)" : ""),
             "ENGINE");
    FetchResult result = runAdapter(begin.request, *begin.control);
    logDebug(jobId + ": attempt " + std::to_string(begin.request.attempt) + " ended " +
                 fetchResultLabel(result.kind),
             "ENGINE");

    JobTable::FinishResult fin = table_.finishAttempt(jobId, result);
    if (fin.requeue || (fin.state != JobState::Completed && !opts_.keepPartial)) {
        try {
            adapter_->discardPartial(begin.request, result);
        } catch (const std::exception& e) {
            logWarn(jobId + ": partial cleanup failed: " + e.what(), "FS");
        }
    }

    for (const auto& parkedId : table_.releaseOutput(jobId, begin.outputKey)) {
        if (!queue_.enqueue(parkedId)) logDebug(parkedId + ": queue closed, not resuming", "QUEUE");
    }
    if (fin.requeue && !queue_.enqueue(jobId)) logDebug(jobId + ": queue closed, retry dropped", "QUEUE");
    if (fin.record) {
        logInfo(jobId + ": " + jobStateLabel(fin.state) +
                    (fin.state == JobState::Completed ? " -> " + fin.record->outputPath
                                                      : " (" + std::string(errorCodeLabel(fin.record->error.code)) + ")"),
                "ENGINE");
        emitHistory(*fin.record);
    }
}

void EngineCore::shutdown(bool cancelInFlight) {
    std::lock_guard<std::mutex> lock(shutdownMutex_);
    if (shutdownDone_) return;
    shutdownDone_ = true;

    logInfo(std::string("Shutting down") + (cancelInFlight ? ", cancelling in-flight jobs" : ""), "ENGINE");
    table_.setClosing();
    auto records = table_.stopAll(JobState::Cancelled, true, false);
    while (queue_.tryDequeue()) {
    }
    if (cancelInFlight) {
        auto active = table_.stopAll(JobState::Cancelled, false, true);
        records.insert(records.end(), active.begin(), active.end());
    } else {
        // Paused jobs would hold their worker forever.
        table_.resumeAll();
    }
    emitHistory(records);

    gate_.shutdown();
    queue_.close();
    stopWorkers();
    reporter_.closeAll();
    logInfo("Engine stopped", "ENGINE");
}

} // namespace ytdle
