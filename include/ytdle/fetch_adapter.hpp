#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ytdle/errors.hpp"
#include "ytdle/job_control.hpp"
#include "ytdle/models.hpp"

namespace ytdle {

// Parameters for one attempt of one job.
struct FetchRequest {
    std::string jobId;
    int attempt{1};
    JobRequest request;
    // Quality after degradation for this attempt.
    std::string quality;
    bool relaxed{false};
};

struct FetchProgress {
    std::optional<uint64_t> bytesDownloaded;
    std::optional<uint64_t> bytesTotal;
    std::optional<double> speedBytesPerSec;
    std::optional<int64_t> etaSeconds;
    // Set when the tool names its (final or intermediate) output file.
    std::string outputPath;
};

struct FetchResult {
    enum class Kind { Success, RecoverableFailure, FatalFailure, Aborted };
    Kind kind{Kind::FatalFailure};
    std::string outputPath;
    ErrorInfo error;
    // Files the tool reported writing during this attempt.
    std::vector<std::string> artifacts;

    static FetchResult success(std::string path) {
        FetchResult r;
        r.kind = Kind::Success;
        r.outputPath = std::move(path);
        return r;
    }
    static FetchResult failure(const ErrorInfo& e) {
        FetchResult r;
        r.kind = e.recoverable ? Kind::RecoverableFailure : Kind::FatalFailure;
        r.error = e;
        return r;
    }
    static FetchResult aborted() {
        FetchResult r;
        r.kind = Kind::Aborted;
        return r;
    }
};

inline const char* fetchResultLabel(FetchResult::Kind k) {
    switch (k) {
        case FetchResult::Kind::Success: return "success";
        case FetchResult::Kind::RecoverableFailure: return "recoverable";
        case FetchResult::Kind::FatalFailure: return "fatal";
        case FetchResult::Kind::Aborted: return "aborted";
        default: return "?";
    }
}

using ProgressFn = std::function<void(const FetchProgress&)>;

// Runs one attempt of a job to exactly one terminal outcome. Implementations
// must watch `control`: Pause suspends the transfer (holding the worker), and
// Cancel/Skip end it promptly with Aborted.
class FetchAdapter {
public:
    virtual ~FetchAdapter() = default;
    virtual FetchResult run(const FetchRequest& req, JobControl& control, const ProgressFn& onProgress) = 0;
    // Drop partial output of a finished attempt (before a retry, or after an
    // unsuccessful end when partial files are not kept).
    virtual void discardPartial(const FetchRequest& req, const FetchResult& result) {
        (void)req;
        (void)result;
    }
};

struct ProcessFetchOptions {
    std::string fetchTool{"yt-dlp"};
    std::string accelerator{"aria2c"};
    std::string ffmpegLocation;
    int stallTimeoutSeconds{120};
    // Poll tick for output and control directives.
    int pollIntervalMs{100};
    int terminateGraceMs{3000};
};

// URL accepted for launching: http(s) scheme with a non-empty host.
bool validateSourceUrl(const std::string& url, std::string& outError);

// Drives the external fetch tool as a child process.
class ProcessFetchAdapter : public FetchAdapter {
public:
    explicit ProcessFetchAdapter(ProcessFetchOptions opts);

    FetchResult run(const FetchRequest& req, JobControl& control, const ProgressFn& onProgress) override;
    void discardPartial(const FetchRequest& req, const FetchResult& result) override;

    // Run `<tool> --version` once and return the first output line.
    bool probeVersion(std::string& outVersion, std::string& outError);
    // Path of the accelerator binary, empty when it does not resolve. Cached.
    std::string acceleratorPath();

    const ProcessFetchOptions& options() const { return opts_; }

private:
    ProcessFetchOptions opts_;
    std::mutex accelMutex_;
    bool accelResolved_{false};
    std::string accelPath_;
};

} // namespace ytdle
