#include "ytdle/console_report.hpp"
#include "ytdle/util.hpp"

#include <cstdio>
#include <sstream>

namespace ytdle {

const char* resultLabel(JobState s) {
    switch (s) {
        case JobState::Completed: return "SUCCESS";
        case JobState::Cancelled: return "CANCELLED";
        case JobState::Skipped: return "SKIPPED";
        default: return "FAILED";
    }
}

void ConsoleReport::addItem(const std::string& jobId, const std::string& url) {
    urls_[jobId] = url;
}

void ConsoleReport::onEvent(const ProgressEvent& ev) {
    if (ev.kind == ProgressEvent::Kind::Progress) {
        printProgress(ev);
        return;
    }
    if (ev.state == JobState::Running) {
        // Resume and retry also enter Running; announce each job once.
        if (!announced_.insert(ev.jobId).second) return;
        auto it = urls_.find(ev.jobId);
        out_ << "\n\n[Item] " << (it != urls_.end() ? it->second : ev.jobId) << "\n";
    } else if (ev.state == JobState::Retrying) {
        out_ << "\nRetrying after: " << ev.error.userMessage << " " << ev.error.detail << "\n";
    } else if (ev.terminal) {
        out_ << "\nResult: " << resultLabel(ev.state) << "\n";
        if (ev.state == JobState::Completed)
            out_ << "Info: " << ev.outputPath << "\n";
        else if (ev.state == JobState::Failed)
            out_ << "Info: " << ev.error.userMessage << " " << ev.error.detail << "\n";
    }
}

void ConsoleReport::printProgress(const ProgressEvent& ev) {
    std::ostringstream line;
    if (ev.bytesTotal && *ev.bytesTotal > 0 && ev.bytesDownloaded) {
        double fraction = static_cast<double>(*ev.bytesDownloaded) / static_cast<double>(*ev.bytesTotal);
        char pct[16];
        std::snprintf(pct, sizeof(pct), "%5.1f%%", fraction * 100.0);
        line << util::progressBar(fraction, 30) << ' ' << pct << " of " << util::formatBytes(*ev.bytesTotal);
    } else if (ev.bytesDownloaded) {
        line << util::formatBytes(*ev.bytesDownloaded);
    } else {
        return;
    }
    if (ev.speedBytesPerSec)
        line << " at " << util::formatBytes(static_cast<uint64_t>(*ev.speedBytesPerSec)) << "/s";
    if (ev.etaSeconds) line << " ETA " << util::formatEta(*ev.etaSeconds);
    out_ << '\r' << line.str() << "   " << std::flush;
}

} // namespace ytdle
