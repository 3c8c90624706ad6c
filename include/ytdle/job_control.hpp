#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ytdle {

enum class Directive { Run, Pause, Cancel, Skip };

inline const char* directiveLabel(Directive d) {
    switch (d) {
        case Directive::Run: return "run";
        case Directive::Pause: return "pause";
        case Directive::Cancel: return "cancel";
        case Directive::Skip: return "skip";
        default: return "?";
    }
}

// Per-job control cell shared between the control plane and the worker running
// the job. Cancel and Skip are sticky: once set, later requests are ignored.
class JobControl {
public:
    JobControl() = default;
    JobControl(const JobControl&) = delete;
    JobControl& operator=(const JobControl&) = delete;

    Directive directive() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return directive_;
    }

    // Returns false when the cell already holds a sticky directive.
    bool request(Directive d) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (isStopDirective(directive_)) return false;
            directive_ = d;
        }
        cv_.notify_all();
        return true;
    }

    bool stopRequested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return isStopDirective(directive_);
    }

    // Block until the directive differs from `seen` or the timeout passes.
    Directive waitForChange(Directive seen, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [&] { return directive_ != seen; });
        return directive_;
    }

    static bool isStopDirective(Directive d) { return d == Directive::Cancel || d == Directive::Skip; }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    Directive directive_{Directive::Run};
};

} // namespace ytdle
