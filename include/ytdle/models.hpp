#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ytdle/errors.hpp"

namespace ytdle {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

constexpr const char* kDefaultFilenameTemplate = "%(title).150s";

enum class MediaFormat { Audio, Video };

inline const char* mediaFormatLabel(MediaFormat f) {
    return f == MediaFormat::Audio ? "audio" : "video";
}

// One requested download. Immutable once the engine has accepted it.
struct JobRequest {
    std::string url;
    MediaFormat format{MediaFormat::Audio};
    // "best", "1080p", "720", "192k", ...
    std::string quality{"best"};
    std::string outputDir{"."};
    std::string filenameTemplate{kDefaultFilenameTemplate};
    bool playlist{false};
    bool restrictFilenames{false};
    bool checkCertificate{true};
    std::string cookieFile;
    // Browser cookie source; wins over cookieFile when both are set.
    std::string cookiesFromBrowser;
    // Post-processor argument strings, shell-quoted.
    std::string ffmpegArgs;
    std::string ffmpegAddArgs;
    std::string ffmpegOverrideArgs;
    bool useAccelerator{false};
    int acceleratorConnections{16};
    int retries{10};
    int fragmentRetries{10};
    int concurrentFragments{3};
};

struct JobSpec {
    // Empty means the engine assigns "job-<n>".
    std::string id;
    JobRequest request;
};

enum class JobState { Queued, Running, Paused, Retrying, Completed, Failed, Cancelled, Skipped };

inline const char* jobStateLabel(JobState s) {
    switch (s) {
        case JobState::Queued: return "Queued";
        case JobState::Running: return "Running";
        case JobState::Paused: return "Paused";
        case JobState::Retrying: return "Retrying";
        case JobState::Completed: return "Completed";
        case JobState::Failed: return "Failed";
        case JobState::Cancelled: return "Cancelled";
        case JobState::Skipped: return "Skipped";
        default: return "Unknown";
    }
}

inline std::optional<JobState> jobStateFromLabel(const std::string& label) {
    static const JobState kAll[] = {JobState::Queued, JobState::Running, JobState::Paused,
                                    JobState::Retrying, JobState::Completed, JobState::Failed,
                                    JobState::Cancelled, JobState::Skipped};
    for (JobState s : kAll) {
        if (label == jobStateLabel(s)) return s;
    }
    return std::nullopt;
}

// Copy of a job's run state handed out to callers.
struct JobSnapshot {
    std::string id;
    std::string batchId;
    JobRequest request;
    JobState state{JobState::Queued};
    int attempts{0};
    int degradeLevel{0};
    // Quality used by the current/last attempt after degradation.
    std::string effectiveQuality;
    ErrorInfo lastError;
    std::optional<uint64_t> bytesDownloaded;
    std::optional<uint64_t> bytesTotal;
    std::optional<double> speedBytesPerSec;
    std::optional<int64_t> etaSeconds;
    std::string outputPath;
    std::optional<TimePoint> enqueuedAt;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> finishedAt;
};

struct ProgressEvent {
    enum class Kind { StateChanged, Progress };
    Kind kind{Kind::Progress};
    std::string jobId;
    std::string batchId;
    JobState state{JobState::Queued};
    int attempt{0};
    std::optional<uint64_t> bytesDownloaded;
    std::optional<uint64_t> bytesTotal;
    std::optional<double> speedBytesPerSec;
    std::optional<int64_t> etaSeconds;
    std::string outputPath;
    ErrorInfo error;
    bool terminal{false};
};

// Emitted to the history collaborator once per terminal job.
struct FinalizeRecord {
    std::string id;
    std::string batchId;
    JobRequest request;
    JobState finalState{JobState::Completed};
    std::string outputPath;
    ErrorInfo error;
    int attempts{0};
    std::optional<TimePoint> enqueuedAt;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> finishedAt;
};

struct BatchSummary {
    std::string batchId;
    size_t total{0};
    size_t queued{0};
    size_t running{0};
    size_t paused{0};
    size_t retrying{0};
    size_t completed{0};
    size_t failed{0};
    size_t cancelled{0};
    size_t skipped{0};
    uint64_t bytesDownloaded{0};

    size_t terminal() const { return completed + failed + cancelled + skipped; }
    bool done() const { return total > 0 && terminal() == total; }
};

struct SubmitResult {
    struct Entry {
        std::string id;
        ControlResult result{ControlResult::Ok};
    };
    std::string batchId;
    std::vector<Entry> jobs;
};

} // namespace ytdle
