#include "ytdle/retry_policy.hpp"
#include "ytdle/fetch_output.hpp"
#include "ytdle/logger.hpp"

#include <algorithm>

namespace ytdle {

RetryPolicy::RetryPolicy(int maxAttempts, QualityLadder ladder)
    : maxAttempts_(std::max(1, maxAttempts)), ladder_(std::move(ladder)) {}

RetryDecision RetryPolicy::decide(const ErrorInfo& error, int attemptsMade, int degradeLevel) const {
    RetryDecision out;
    out.nextDegradeLevel = degradeLevel;
    if (!error.recoverable) {
        out.finalError = error;
        return out;
    }
    if (attemptsMade >= maxAttempts_) {
        std::string detail = std::string(errorCodeLabel(error.code)) + ": " + error.detail;
        out.finalError = makeError(ErrorCode::RetryCeilingExceeded, detail);
        logDebug("Ceiling reached after " + std::to_string(attemptsMade) + " attempts (" + detail + ")", "POLICY");
        return out;
    }
    out.retry = true;
    const bool formatRelated =
        error.code == ErrorCode::FormatUnavailable || error.code == ErrorCode::MergeCodecMissing;
    // attemptsMade == 1 means the upcoming attempt is the first retry.
    if (formatRelated || attemptsMade >= 2) {
        out.nextDegradeLevel = degradeLevel + 1;
    }
    return out;
}

std::string RetryPolicy::effectiveQuality(const JobRequest& request, int degradeLevel) const {
    if (degradeLevel <= 0) return request.quality;
    if (isBestQuality(request.quality)) return "best";
    const int requested = qualityNumber(request.quality);
    const std::vector<int>& tiers =
        request.format == MediaFormat::Video ? ladder_.videoHeights : ladder_.audioBitrates;
    auto below = std::find_if(tiers.begin(), tiers.end(), [&](int t) { return t < requested; });
    size_t idx = static_cast<size_t>(below - tiers.begin()) + static_cast<size_t>(degradeLevel - 1);
    if (idx >= tiers.size()) return "best";
    return std::to_string(tiers[idx]) + (request.format == MediaFormat::Video ? "p" : "k");
}

} // namespace ytdle
