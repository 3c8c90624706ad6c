#include <catch2/catch.hpp>
#include "ytdle/console_report.hpp"
#include "ytdle/state_machine.hpp"

#include <sstream>

namespace {

ytdle::ProgressEvent stateEvent(const std::string& id, ytdle::JobState s, int attempt) {
    ytdle::ProgressEvent ev;
    ev.kind = ytdle::ProgressEvent::Kind::StateChanged;
    ev.jobId = id;
    ev.state = s;
    ev.attempt = attempt;
    ev.terminal = ytdle::isTerminalState(s);
    return ev;
}

size_t countOf(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) n++;
    return n;
}

} // namespace

TEST_CASE("each item is announced once across pause, resume and retry") {
    std::ostringstream out;
    ytdle::ConsoleReport report(out);
    report.addItem("item-1", "https://e/v");

    report.onEvent(stateEvent("item-1", ytdle::JobState::Running, 1));
    report.onEvent(stateEvent("item-1", ytdle::JobState::Paused, 1));
    report.onEvent(stateEvent("item-1", ytdle::JobState::Running, 1));
    report.onEvent(stateEvent("item-1", ytdle::JobState::Retrying, 1));
    report.onEvent(stateEvent("item-1", ytdle::JobState::Queued, 2));
    report.onEvent(stateEvent("item-1", ytdle::JobState::Running, 2));

    CHECK(countOf(out.str(), "[Item] https://e/v") == 1);
    CHECK(countOf(out.str(), "Retrying after:") == 1);
}

TEST_CASE("terminal events print the result block") {
    std::ostringstream out;
    ytdle::ConsoleReport report(out);
    report.addItem("a", "https://e/a");
    report.addItem("b", "https://e/b");

    auto done = stateEvent("a", ytdle::JobState::Completed, 1);
    done.outputPath = "/dl/a.mp4";
    report.onEvent(stateEvent("a", ytdle::JobState::Running, 1));
    report.onEvent(done);
    auto failed = stateEvent("b", ytdle::JobState::Failed, 1);
    failed.error = ytdle::makeError(ytdle::ErrorCode::AccessDenied, "HTTP Error 403");
    report.onEvent(stateEvent("b", ytdle::JobState::Running, 1));
    report.onEvent(failed);

    const std::string text = out.str();
    CHECK(countOf(text, "[Item] https://e/a") == 1);
    CHECK(countOf(text, "[Item] https://e/b") == 1);
    CHECK(text.find("Result: SUCCESS\nInfo: /dl/a.mp4") != std::string::npos);
    CHECK(text.find("Result: FAILED") != std::string::npos);
    CHECK(text.find("HTTP Error 403") != std::string::npos);
}

TEST_CASE("progress without byte counts prints nothing") {
    std::ostringstream out;
    ytdle::ConsoleReport report(out);
    ytdle::ProgressEvent ev;
    ev.kind = ytdle::ProgressEvent::Kind::Progress;
    ev.jobId = "x";
    report.onEvent(ev);
    CHECK(out.str().empty());

    ev.bytesDownloaded = 512;
    ev.bytesTotal = 1024;
    report.onEvent(ev);
    CHECK(out.str().find("50.0%") != std::string::npos);
}
