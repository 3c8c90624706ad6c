#pragma once

#include <map>
#include <ostream>
#include <set>
#include <string>

#include "ytdle/models.hpp"

namespace ytdle {

// Renders a job event stream for the terminal: one "[Item]" header per job,
// an in-place progress bar, retry notes and a result block per terminal job.
class ConsoleReport {
public:
    explicit ConsoleReport(std::ostream& out) : out_(out) {}

    void addItem(const std::string& jobId, const std::string& url);
    void onEvent(const ProgressEvent& ev);

private:
    void printProgress(const ProgressEvent& ev);

    std::ostream& out_;
    std::map<std::string, std::string> urls_;
    std::set<std::string> announced_;
};

const char* resultLabel(JobState s);

} // namespace ytdle
