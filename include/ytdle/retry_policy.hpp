#pragma once

#include <string>
#include <vector>

#include "ytdle/errors.hpp"
#include "ytdle/models.hpp"

namespace ytdle {

// Quality tiers walked downward when a job has to degrade. Highest first.
struct QualityLadder {
    std::vector<int> videoHeights{2160, 1440, 1080, 720, 480, 360};
    std::vector<int> audioBitrates{320, 256, 192, 160, 128, 96};
};

struct RetryDecision {
    bool retry{false};
    int nextDegradeLevel{0};
    // Classification to finalize with when retry is false.
    ErrorInfo finalError;
};

// Bounded retry with quality fallback:
// - fatal classifications fail immediately
// - the first retry repeats the same parameters
// - later retries, or any retry caused by a format/merge problem, step one tier down
// - once `maxAttempts` attempts were made the job fails with RetryCeilingExceeded
class RetryPolicy {
public:
    RetryPolicy() = default;
    RetryPolicy(int maxAttempts, QualityLadder ladder);

    int maxAttempts() const { return maxAttempts_; }
    const QualityLadder& ladder() const { return ladder_; }

    // `attemptsMade` counts the attempt that just failed.
    RetryDecision decide(const ErrorInfo& error, int attemptsMade, int degradeLevel) const;

    // Quality string for an attempt at `degradeLevel` (0 = as requested).
    // Walking past the lowest tier yields "best".
    std::string effectiveQuality(const JobRequest& request, int degradeLevel) const;

    // Relaxed attempts prefer single-file formats that need no merge step.
    static bool relaxed(int degradeLevel) { return degradeLevel > 0; }

private:
    int maxAttempts_{3};
    QualityLadder ladder_;
};

} // namespace ytdle
