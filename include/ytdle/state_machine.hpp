#pragma once

#include "ytdle/models.hpp"

namespace ytdle {

// Completed, Cancelled and Skipped never leave their state. Failed is only
// left through Retrying while the retry policy still allows an attempt.
inline bool isTerminalState(JobState s) {
    return s == JobState::Completed || s == JobState::Failed ||
           s == JobState::Cancelled || s == JobState::Skipped;
}

inline bool canTransition(JobState from, JobState to) {
    switch (from) {
        case JobState::Queued:
            return to == JobState::Running || to == JobState::Cancelled || to == JobState::Skipped;
        case JobState::Running:
            return to == JobState::Completed || to == JobState::Failed || to == JobState::Cancelled ||
                   to == JobState::Skipped || to == JobState::Paused;
        case JobState::Paused:
            return to == JobState::Running || to == JobState::Cancelled || to == JobState::Skipped;
        case JobState::Failed:
            return to == JobState::Retrying;
        case JobState::Retrying:
            return to == JobState::Queued;
        default:
            return false;
    }
}

} // namespace ytdle
