#include <catch2/catch.hpp>
#include "ytdle/history.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

fs::path historyPath(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("ytdle_hist_" + name + "_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    return dir / "nested" / "history.json";
}

ytdle::FinalizeRecord finalRecord(const std::string& id, ytdle::JobState state, const std::string& url) {
    ytdle::FinalizeRecord r;
    r.id = id;
    r.batchId = "b1";
    r.request.url = url;
    r.request.format = ytdle::MediaFormat::Audio;
    r.request.quality = "192k";
    r.finalState = state;
    r.attempts = 3;
    r.finishedAt = ytdle::Clock::now();
    if (state == ytdle::JobState::Completed) {
        r.outputPath = "/music/" + id + " song.mp3";
    } else {
        r.error = ytdle::makeError(ytdle::ErrorCode::RetryCeilingExceeded, "TransientNetworkError: timed out");
    }
    return r;
}

std::string readAll(const fs::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("history keeps completed and failed jobs only") {
    fs::path path = historyPath("final");
    ytdle::HistoryStore store;
    std::string err;
    REQUIRE(store.open(path.string(), err));
    store.recordFinal(finalRecord("a", ytdle::JobState::Completed, "https://example.com/a"));
    store.recordFinal(finalRecord("b", ytdle::JobState::Failed, "https://example.com/b"));
    store.recordFinal(finalRecord("c", ytdle::JobState::Cancelled, "https://example.com/c"));
    store.recordFinal(finalRecord("d", ytdle::JobState::Skipped, "https://example.com/d"));

    auto all = store.all();
    REQUIRE(all.size() == 2);
    auto done = store.completed();
    REQUIRE(done.size() == 1);
    REQUIRE(done[0].title == "a song");
    REQUIRE(done[0].format == "mp3");
    REQUIRE(done[0].outputPath == "/music/a song.mp3");
    auto failed = store.failed();
    REQUIRE(failed.size() == 1);
    REQUIRE(failed[0].errorCode == "RetryCeilingExceeded");
    REQUIRE(failed[0].retryCount == 2);

    auto stats = store.stats();
    REQUIRE(stats.total == 2);
    REQUIRE(stats.completed == 1);
    REQUIRE(stats.successRate == Approx(50.0));
    REQUIRE(readAll(path).find("\"version\":2") != std::string::npos);
    fs::remove_all(path.parent_path().parent_path());
}

TEST_CASE("history survives reopen and supports search and clear") {
    fs::path path = historyPath("reopen");
    std::string err;
    {
        ytdle::HistoryStore store;
        REQUIRE(store.open(path.string(), err));
        store.recordFinal(finalRecord("one", ytdle::JobState::Completed, "https://Example.com/One"));
        store.recordFinal(finalRecord("two", ytdle::JobState::Failed, "https://example.com/two"));
    }
    ytdle::HistoryStore store;
    REQUIRE(store.open(path.string(), err));
    REQUIRE(store.all().size() == 2);
    REQUIRE(store.search("example.com/one").size() == 1);
    REQUIRE(store.search("ONE SONG").size() == 1);
    REQUIRE(store.all(1).size() == 1);

    REQUIRE(store.clearCompleted(err));
    REQUIRE(store.completed().empty());
    REQUIRE(store.failed().size() == 1);
    REQUIRE(store.clear(err));
    REQUIRE(store.all().empty());

    store.close();
    REQUIRE_FALSE(store.isOpen());
    REQUIRE_FALSE(store.clear(err));
    fs::remove_all(path.parent_path().parent_path());
}

TEST_CASE("legacy array files are migrated on open") {
    fs::path path = historyPath("legacy");
    fs::create_directories(path.parent_path());
    {
        std::ofstream out(path);
        out << R"([{"url":"https://example.com/old","title":"Old","format":"mp3","quality":"192k",)"
            << R"("timestamp":"2023-01-01T10:00:00","output_path":"/m/Old.mp3","success":true,)"
            << R"("error_message":null,"retry_count":0}])";
    }
    ytdle::HistoryStore store;
    std::string err;
    REQUIRE(store.open(path.string(), err));
    auto all = store.all();
    REQUIRE(all.size() == 1);
    REQUIRE(all[0].title == "Old");
    REQUIRE(all[0].success);
    const std::string migrated = readAll(path);
    REQUIRE(migrated.find("\"version\":2") != std::string::npos);
    REQUIRE(migrated.find("https://example.com/old") != std::string::npos);
    fs::remove_all(path.parent_path().parent_path());
}

TEST_CASE("corrupt history is reported") {
    fs::path path = historyPath("corrupt");
    fs::create_directories(path.parent_path());
    {
        std::ofstream out(path);
        out << "{oops";
    }
    ytdle::HistoryStore store;
    std::string err;
    REQUIRE_FALSE(store.open(path.string(), err));
    REQUIRE_FALSE(err.empty());
    REQUIRE_FALSE(store.isOpen());
    fs::remove_all(path.parent_path().parent_path());
}

TEST_CASE("exportFailed writes retry lists") {
    fs::path path = historyPath("export");
    ytdle::HistoryStore store;
    std::string err;
    REQUIRE(store.open(path.string(), err));
    store.recordFinal(finalRecord("bad", ytdle::JobState::Failed, "https://example.com/bad"));
    store.recordFinal(finalRecord("ok", ytdle::JobState::Completed, "https://example.com/ok"));
    fs::path exported = path.parent_path() / "failed.txt";
    REQUIRE(store.exportFailed(exported.string(), err));
    const std::string text = readAll(exported);
    REQUIRE(text.find("# Failed: TransientNetworkError: timed out\n") != std::string::npos);
    REQUIRE(text.find("# Retry count: 2\n") != std::string::npos);
    REQUIRE(text.find("# Date: ") != std::string::npos);
    REQUIRE(text.find("https://example.com/bad\n") != std::string::npos);
    REQUIRE(text.find("https://example.com/ok") == std::string::npos);
    fs::remove_all(path.parent_path().parent_path());
}

TEST_CASE("history written by a newer release is refused") {
    fs::path path = historyPath("newer");
    fs::create_directories(path.parent_path());
    {
        std::ofstream out(path);
        out << R"({"version":9,"records":[]})";
    }
    ytdle::HistoryStore store;
    std::string err;
    REQUIRE_FALSE(store.open(path.string(), err));
    REQUIRE(err.find("newer") != std::string::npos);
    fs::remove_all(path.parent_path().parent_path());
}
