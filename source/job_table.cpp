#include "ytdle/job_table.hpp"
#include "ytdle/filesystem.hpp"
#include "ytdle/logger.hpp"
#include "ytdle/state_machine.hpp"

#include <algorithm>

namespace ytdle {

JobTable::JobTable(ProgressReporter& reporter, const RetryPolicy& policy, JobQueue& queue)
    : reporter_(reporter), policy_(policy), queue_(queue) {}

std::string JobTable::nextJobId() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id;
    do {
        id = "job-" + std::to_string(++jobSeq_);
    } while (jobs_.count(id) > 0);
    return id;
}

std::string JobTable::nextBatchId() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id;
    do {
        id = "batch-" + std::to_string(++batchSeq_);
    } while (batches_.count(id) > 0);
    return id;
}

JobTable::Record* JobTable::findLocked(const std::string& id) {
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : &it->second;
}

const JobTable::Record* JobTable::findLocked(const std::string& id) const {
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : &it->second;
}

ProgressEvent JobTable::stateEventLocked(const Record& rec) const {
    ProgressEvent ev;
    ev.kind = ProgressEvent::Kind::StateChanged;
    ev.jobId = rec.snap.id;
    ev.batchId = rec.snap.batchId;
    ev.state = rec.snap.state;
    ev.attempt = rec.snap.attempts;
    ev.bytesDownloaded = rec.snap.bytesDownloaded;
    ev.bytesTotal = rec.snap.bytesTotal;
    ev.speedBytesPerSec = rec.snap.speedBytesPerSec;
    ev.etaSeconds = rec.snap.etaSeconds;
    ev.outputPath = rec.snap.outputPath;
    ev.error = rec.snap.lastError;
    ev.terminal = isTerminalState(rec.snap.state);
    return ev;
}

void JobTable::publishStateLocked(const Record& rec) {
    reporter_.publish(stateEventLocked(rec));
}

bool JobTable::transitionLocked(Record& rec, JobState to) {
    const JobState from = rec.snap.state;
    if (!canTransition(from, to)) {
        logWarn(rec.snap.id + ": rejected transition " + jobStateLabel(from) + " -> " + jobStateLabel(to), "ENGINE");
        return false;
    }
    rec.snap.state = to;
    if (isTerminalState(to)) {
        rec.snap.finishedAt = Clock::now();
        rec.snap.speedBytesPerSec.reset();
        rec.snap.etaSeconds.reset();
    }
    logDebug(rec.snap.id + ": " + jobStateLabel(from) + " -> " + jobStateLabel(to), "ENGINE");
    publishStateLocked(rec);
    if (isTerminalState(to)) terminalCv_.notify_all();
    return true;
}

FinalizeRecord JobTable::finalizeLocked(Record& rec, JobState finalState) {
    FinalizeRecord out;
    out.id = rec.snap.id;
    out.batchId = rec.snap.batchId;
    out.request = rec.snap.request;
    out.finalState = finalState;
    out.outputPath = rec.snap.outputPath;
    out.error = rec.snap.lastError;
    out.attempts = rec.snap.attempts;
    out.enqueuedAt = rec.snap.enqueuedAt;
    out.startedAt = rec.snap.startedAt;
    out.finishedAt = rec.snap.finishedAt;
    return out;
}

void JobTable::unparkLocked(Record& rec) {
    if (!rec.parked) return;
    rec.parked = false;
    auto it = parked_.find(rec.outputKey);
    if (it == parked_.end()) return;
    auto& list = it->second;
    list.erase(std::remove(list.begin(), list.end(), rec.snap.id), list.end());
    if (list.empty()) parked_.erase(it);
}

ControlResult JobTable::add(const std::string& id, const std::string& batchId, const JobRequest& request) {
    const std::string key = outputKey(request);
    std::lock_guard<std::mutex> lock(mutex_);
    if (closing_) return ControlResult::EngineClosed;
    if (jobs_.count(id) > 0) return ControlResult::DuplicateId;

    Record rec;
    rec.snap.id = id;
    rec.snap.batchId = batchId;
    rec.snap.request = request;
    rec.snap.state = JobState::Queued;
    rec.snap.effectiveQuality = request.quality;
    rec.snap.enqueuedAt = Clock::now();
    rec.control = std::make_shared<JobControl>();
    rec.outputKey = key;

    auto inserted = jobs_.emplace(id, std::move(rec));
    order_.push_back(id);
    batches_[batchId].push_back(id);
    publishStateLocked(inserted.first->second);
    return ControlResult::Ok;
}

JobTable::BeginResult JobTable::beginAttempt(const std::string& id) {
    BeginResult out;
    std::lock_guard<std::mutex> lock(mutex_);
    Record* rec = findLocked(id);
    if (!rec || rec->snap.state != JobState::Queued) return out;

    auto claim = claims_.find(rec->outputKey);
    if (claim != claims_.end() && claim->second != id) {
        parked_[rec->outputKey].push_back(id);
        rec->parked = true;
        out.kind = BeginResult::Kind::Parked;
        logInfo(id + ": output in use by " + claim->second + ", waiting", "QUEUE");
        return out;
    }
    claims_[rec->outputKey] = id;

    // A pause left over from the previous attempt must not suspend this one.
    if (rec->control->directive() == Directive::Pause) rec->control->request(Directive::Run);
    rec->snap.attempts++;
    if (!rec->snap.startedAt) rec->snap.startedAt = Clock::now();
    rec->snap.effectiveQuality = policy_.effectiveQuality(rec->snap.request, rec->snap.degradeLevel);
    rec->snap.speedBytesPerSec.reset();
    rec->snap.etaSeconds.reset();
    transitionLocked(*rec, JobState::Running);

    out.kind = BeginResult::Kind::Start;
    out.request.jobId = id;
    out.request.attempt = rec->snap.attempts;
    out.request.request = rec->snap.request;
    out.request.quality = rec->snap.effectiveQuality;
    out.request.relaxed = RetryPolicy::relaxed(rec->snap.degradeLevel);
    out.control = rec->control;
    out.outputKey = rec->outputKey;
    return out;
}

void JobTable::reportProgress(const std::string& id, const FetchProgress& p) {
    std::lock_guard<std::mutex> lock(mutex_);
    Record* rec = findLocked(id);
    if (!rec) return;
    if (rec->snap.state != JobState::Running && rec->snap.state != JobState::Paused) return;
    if (p.bytesDownloaded) rec->snap.bytesDownloaded = p.bytesDownloaded;
    if (p.bytesTotal) rec->snap.bytesTotal = p.bytesTotal;
    if (p.speedBytesPerSec) rec->snap.speedBytesPerSec = p.speedBytesPerSec;
    if (p.etaSeconds) rec->snap.etaSeconds = p.etaSeconds;
    if (!p.outputPath.empty()) rec->snap.outputPath = p.outputPath;

    ProgressEvent ev = stateEventLocked(*rec);
    ev.kind = ProgressEvent::Kind::Progress;
    ev.terminal = false;
    reporter_.publish(ev);
}

JobTable::FinishResult JobTable::finishAttempt(const std::string& id, const FetchResult& result) {
    FinishResult out;
    std::lock_guard<std::mutex> lock(mutex_);
    Record* rec = findLocked(id);
    if (!rec) return out; // cancelled and already acknowledged

    Record& r = *rec;
    if (isTerminalState(r.snap.state)) {
        // The control plane committed the outcome while the attempt wound down.
        out.state = r.snap.state;
        return out;
    }
    if (r.snap.state == JobState::Paused) {
        r.control->request(Directive::Run);
        transitionLocked(r, JobState::Running);
    }
    if (!result.outputPath.empty()) r.snap.outputPath = result.outputPath;

    switch (result.kind) {
        case FetchResult::Kind::Success: {
            if (r.snap.bytesTotal) r.snap.bytesDownloaded = r.snap.bytesTotal;
            r.snap.lastError = ErrorInfo{};
            transitionLocked(r, JobState::Completed);
            out.state = JobState::Completed;
            out.record = finalizeLocked(r, JobState::Completed);
            break;
        }
        case FetchResult::Kind::Aborted: {
            JobState target = r.control->directive() == Directive::Skip ? JobState::Skipped : JobState::Cancelled;
            transitionLocked(r, target);
            out.state = target;
            out.record = finalizeLocked(r, target);
            break;
        }
        case FetchResult::Kind::RecoverableFailure:
        case FetchResult::Kind::FatalFailure: {
            r.snap.lastError = result.error;
            if (closing_ && result.error.recoverable) {
                transitionLocked(r, JobState::Cancelled);
                out.state = JobState::Cancelled;
                out.record = finalizeLocked(r, JobState::Cancelled);
                break;
            }
            RetryDecision d = policy_.decide(result.error, r.snap.attempts, r.snap.degradeLevel);
            if (d.retry) {
                // Failed -> Retrying -> Queued in one critical section; Failed is never published.
                r.snap.state = JobState::Failed;
                transitionLocked(r, JobState::Retrying);
                r.snap.degradeLevel = d.nextDegradeLevel;
                r.snap.effectiveQuality = policy_.effectiveQuality(r.snap.request, r.snap.degradeLevel);
                transitionLocked(r, JobState::Queued);
                logInfo(id + ": " + errorCodeLabel(result.error.code) + " on attempt " +
                            std::to_string(r.snap.attempts) + ", retrying at quality " + r.snap.effectiveQuality,
                        "POLICY");
                out.state = JobState::Queued;
                out.requeue = true;
            } else {
                r.snap.lastError = d.finalError;
                transitionLocked(r, JobState::Failed);
                out.state = JobState::Failed;
                out.record = finalizeLocked(r, JobState::Failed);
                logWarn(id + ": failed (" + errorCodeLabel(d.finalError.code) + ") " + d.finalError.detail, "POLICY");
            }
            break;
        }
    }
    return out;
}

std::vector<std::string> JobTable::releaseOutput(const std::string& id, const std::string& key) {
    std::vector<std::string> out;
    std::lock_guard<std::mutex> lock(mutex_);
    auto claim = claims_.find(key);
    if (claim == claims_.end() || claim->second != id) return out;
    claims_.erase(claim);
    auto parked = parked_.find(key);
    if (parked == parked_.end()) return out;
    for (const auto& pid : parked->second) {
        Record* rec = findLocked(pid);
        if (!rec || !rec->parked) continue;
        rec->parked = false;
        if (rec->snap.state == JobState::Queued) out.push_back(pid);
    }
    parked_.erase(parked);
    return out;
}

ControlResult JobTable::pause(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Record* rec = findLocked(id);
    if (!rec) return ControlResult::NotFound;
    if (rec->snap.state != JobState::Running) return ControlResult::InvalidTransition;
    rec->control->request(Directive::Pause);
    transitionLocked(*rec, JobState::Paused);
    return ControlResult::Ok;
}

ControlResult JobTable::resume(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Record* rec = findLocked(id);
    if (!rec) return ControlResult::NotFound;
    if (rec->snap.state != JobState::Paused) return ControlResult::InvalidTransition;
    rec->control->request(Directive::Run);
    transitionLocked(*rec, JobState::Running);
    return ControlResult::Ok;
}

ControlResult JobTable::stop(const std::string& id, JobState target, std::optional<FinalizeRecord>& outRecord) {
    std::lock_guard<std::mutex> lock(mutex_);
    Record* rec = findLocked(id);
    if (!rec) return ControlResult::NotFound;
    const JobState st = rec->snap.state;
    if (st == JobState::Queued) {
        queue_.remove(id);
        unparkLocked(*rec);
    } else if (st == JobState::Running || st == JobState::Paused) {
        rec->control->request(target == JobState::Skipped ? Directive::Skip : Directive::Cancel);
    } else {
        return ControlResult::InvalidTransition;
    }
    if (!transitionLocked(*rec, target)) return ControlResult::InvalidTransition;
    outRecord = finalizeLocked(*rec, target);
    return ControlResult::Ok;
}

std::vector<FinalizeRecord> JobTable::stopAll(JobState target, bool includeQueued, bool includeActive) {
    std::vector<FinalizeRecord> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : order_) {
        Record* rec = findLocked(id);
        if (!rec) continue;
        const JobState st = rec->snap.state;
        if (st == JobState::Queued && includeQueued) {
            queue_.remove(id);
            unparkLocked(*rec);
        } else if ((st == JobState::Running || st == JobState::Paused) && includeActive) {
            rec->control->request(target == JobState::Skipped ? Directive::Skip : Directive::Cancel);
        } else {
            continue;
        }
        if (transitionLocked(*rec, target)) out.push_back(finalizeLocked(*rec, target));
    }
    return out;
}

size_t JobTable::pauseAll() {
    size_t n = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : order_) {
        Record* rec = findLocked(id);
        if (!rec || rec->snap.state != JobState::Running) continue;
        rec->control->request(Directive::Pause);
        if (transitionLocked(*rec, JobState::Paused)) n++;
    }
    return n;
}

size_t JobTable::resumeAll() {
    size_t n = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : order_) {
        Record* rec = findLocked(id);
        if (!rec || rec->snap.state != JobState::Paused) continue;
        rec->control->request(Directive::Run);
        if (transitionLocked(*rec, JobState::Running)) n++;
    }
    return n;
}

ControlResult JobTable::acknowledge(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Record* rec = findLocked(id);
    if (!rec) return ControlResult::NotFound;
    if (!isTerminalState(rec->snap.state)) return ControlResult::InvalidTransition;
    auto batch = batches_.find(rec->snap.batchId);
    if (batch != batches_.end()) {
        auto& ids = batch->second;
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        if (ids.empty()) batches_.erase(batch);
    }
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    jobs_.erase(id);
    return ControlResult::Ok;
}

void JobTable::setClosing() {
    std::lock_guard<std::mutex> lock(mutex_);
    closing_ = true;
}

bool JobTable::closing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closing_;
}

std::optional<JobSnapshot> JobTable::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Record* rec = findLocked(id);
    if (!rec) return std::nullopt;
    return rec->snap;
}

std::vector<JobSnapshot> JobTable::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobSnapshot> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        if (const Record* rec = findLocked(id)) out.push_back(rec->snap);
    }
    return out;
}

BatchSummary JobTable::summaryLocked(const std::string& batchId) const {
    BatchSummary s;
    s.batchId = batchId;
    auto it = batches_.find(batchId);
    if (it == batches_.end()) return s;
    for (const auto& id : it->second) {
        const Record* rec = findLocked(id);
        if (!rec) continue;
        s.total++;
        switch (rec->snap.state) {
            case JobState::Queued: s.queued++; break;
            case JobState::Running: s.running++; break;
            case JobState::Paused: s.paused++; break;
            case JobState::Retrying: s.retrying++; break;
            case JobState::Completed: s.completed++; break;
            case JobState::Failed: s.failed++; break;
            case JobState::Cancelled: s.cancelled++; break;
            case JobState::Skipped: s.skipped++; break;
        }
        if (rec->snap.bytesDownloaded) s.bytesDownloaded += *rec->snap.bytesDownloaded;
    }
    return s;
}

BatchSummary JobTable::summary(const std::string& batchId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summaryLocked(batchId);
}

bool JobTable::waitForBatch(const std::string& batchId, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return terminalCv_.wait_for(lock, timeout, [&] {
        BatchSummary s = summaryLocked(batchId);
        return s.terminal() == s.total;
    });
}

std::shared_ptr<ProgressSubscription> JobTable::subscribe(const std::string& batchId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProgressEvent> replay;
    for (const auto& id : order_) {
        const Record* rec = findLocked(id);
        if (!rec) continue;
        if (!batchId.empty() && rec->snap.batchId != batchId) continue;
        replay.push_back(stateEventLocked(*rec));
    }
    return reporter_.subscribe(batchId, replay);
}

} // namespace ytdle
