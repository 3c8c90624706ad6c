#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "ytdle/models.hpp"

namespace ytdle {

// Receives one record per job that reaches a terminal state. Called from
// engine threads; implementations must be thread-safe.
class HistorySink {
public:
    virtual ~HistorySink() = default;
    virtual void recordFinal(const FinalizeRecord& record) = 0;
};

struct HistoryRecord {
    std::string id;
    std::string batchId;
    std::string url;
    std::string title;
    std::string format;
    std::string quality;
    // ISO local time, "2024-05-01T12:30:00".
    std::string timestamp;
    std::string outputPath;
    bool success{false};
    std::string errorCode;
    std::string errorMessage;
    int retryCount{0};
};

struct HistoryStats {
    size_t total{0};
    size_t completed{0};
    size_t failed{0};
    // Percent of all records that completed.
    double successRate{0.0};
};

// JSON-file history of completed and failed downloads.
// File format: {"version":2,"records":[...]}; a bare top-level array written
// by older releases is migrated on open. Cancelled and skipped jobs are not kept.
class HistoryStore : public HistorySink {
public:
    HistoryStore() = default;
    ~HistoryStore() override;

    bool open(const std::string& path, std::string& outError);
    void close();
    bool isOpen() const;

    void recordFinal(const FinalizeRecord& record) override;
    bool add(const HistoryRecord& record, std::string& outError);

    // Newest first; limit 0 returns everything.
    std::vector<HistoryRecord> all(size_t limit = 0) const;
    std::vector<HistoryRecord> completed(size_t limit = 0) const;
    std::vector<HistoryRecord> failed(size_t limit = 0) const;
    // Case-insensitive substring match on URL and title.
    std::vector<HistoryRecord> search(const std::string& query, size_t limit = 0) const;
    HistoryStats stats() const;

    bool exportFailed(const std::string& path, std::string& outError) const;
    bool clearCompleted(std::string& outError);
    bool clearFailed(std::string& outError);
    bool clear(std::string& outError);

private:
    bool saveLocked(std::string& outError) const;

    mutable std::mutex mutex_;
    std::string path_;
    bool open_{false};
    std::vector<HistoryRecord> records_;
};

} // namespace ytdle
