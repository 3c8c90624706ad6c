#include "ytdle/history.hpp"

#include "ytdle/logger.hpp"
#include "ytdle/raii.hpp"
#include "ytdle/util.hpp"
#include "mini/json.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace ytdle {

namespace {

constexpr int kHistoryVersion = 2;

std::string recordToJson(const HistoryRecord& r) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"id\":\"" << mini::escape(r.id) << "\",";
    oss << "\"batch_id\":\"" << mini::escape(r.batchId) << "\",";
    oss << "\"url\":\"" << mini::escape(r.url) << "\",";
    oss << "\"title\":\"" << mini::escape(r.title) << "\",";
    oss << "\"format\":\"" << mini::escape(r.format) << "\",";
    oss << "\"quality\":\"" << mini::escape(r.quality) << "\",";
    oss << "\"timestamp\":\"" << mini::escape(r.timestamp) << "\",";
    oss << "\"output_path\":\"" << mini::escape(r.outputPath) << "\",";
    oss << "\"success\":" << (r.success ? "true" : "false") << ",";
    oss << "\"error_code\":\"" << mini::escape(r.errorCode) << "\",";
    oss << "\"error_message\":\"" << mini::escape(r.errorMessage) << "\",";
    oss << "\"retry_count\":" << r.retryCount;
    oss << "}";
    return oss.str();
}

std::string historyToJson(const std::vector<HistoryRecord>& records) {
    std::ostringstream oss;
    oss << "{\"version\":" << kHistoryVersion << ",\"records\":[";
    for (size_t i = 0; i < records.size(); ++i) {
        if (i > 0) oss << ",";
        oss << "\n" << recordToJson(records[i]);
    }
    oss << "\n]}\n";
    return oss.str();
}

bool parseRecord(const mini::Object& o, HistoryRecord& r) {
    r.id = mini::get_string(o, "id");
    r.batchId = mini::get_string(o, "batch_id");
    r.url = mini::get_string(o, "url");
    r.title = mini::get_string(o, "title");
    r.format = mini::get_string(o, "format");
    r.quality = mini::get_string(o, "quality");
    r.timestamp = mini::get_string(o, "timestamp");
    r.outputPath = mini::get_string(o, "output_path");
    r.success = mini::get_bool(o, "success");
    r.errorCode = mini::get_string(o, "error_code");
    r.errorMessage = mini::get_string(o, "error_message");
    r.retryCount = static_cast<int>(mini::get_int(o, "retry_count"));
    return !r.url.empty();
}

// Titles are not reported separately; the output file stem stands in.
std::string titleFromPath(const std::string& path) {
    if (path.empty()) return "Unknown title";
    std::filesystem::path p(path);
    std::string stem = p.stem().string();
    return stem.empty() ? std::string("Unknown title") : stem;
}

std::vector<HistoryRecord> newestFirst(std::vector<HistoryRecord> in, size_t limit) {
    std::reverse(in.begin(), in.end());
    std::stable_sort(in.begin(), in.end(),
                     [](const HistoryRecord& a, const HistoryRecord& b) { return a.timestamp > b.timestamp; });
    if (limit > 0 && in.size() > limit) in.resize(limit);
    return in;
}

} // namespace

HistoryStore::~HistoryStore() { close(); }

bool HistoryStore::open(const std::string& path, std::string& outError) {
    std::lock_guard<std::mutex> lock(mutex_);
    outError.clear();
    records_.clear();
    path_ = path;
    open_ = false;

    std::error_code ec;
    std::filesystem::path filePath(path);
    std::filesystem::path parent = filePath.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            outError = "Failed to create history dir: " + parent.string() + " err=" + ec.message();
            return false;
        }
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        open_ = true; // nothing recorded yet
        return true;
    }
    std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (util::trim(json).empty()) {
        open_ = true;
        return true;
    }

    mini::Value root;
    if (!mini::parse(json, root)) {
        outError = "Invalid history JSON: " + path;
        return false;
    }

    const mini::Array* items = nullptr;
    bool legacy = false;
    if (root.type == mini::Value::Type::Array) {
        items = &root.array;
        legacy = true;
    } else if (root.type == mini::Value::Type::Object) {
        auto it = root.object.find("records");
        if (it == root.object.end() || it->second.type != mini::Value::Type::Array) {
            outError = "History file missing records array.";
            return false;
        }
        int64_t version = mini::get_int(root.object, "version", 0);
        if (version > kHistoryVersion) {
            outError = "History file version " + std::to_string(version) + " is newer than supported.";
            return false;
        }
        items = &it->second.array;
        legacy = version < kHistoryVersion;
    } else {
        outError = "Unexpected history file layout.";
        return false;
    }

    for (const auto& v : *items) {
        if (v.type != mini::Value::Type::Object) continue;
        HistoryRecord r;
        if (parseRecord(v.object, r)) records_.push_back(std::move(r));
    }
    open_ = true;

    if (legacy) {
        logInfo("Migrating history (" + std::to_string(records_.size()) + " records) to version " +
                    std::to_string(kHistoryVersion),
                "HISTORY");
        if (!saveLocked(outError)) {
            open_ = false;
            return false;
        }
    }
    return true;
}

void HistoryStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    records_.clear();
}

bool HistoryStore::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

bool HistoryStore::saveLocked(std::string& outError) const {
    const std::string tmp = path_ + ".tmp." + std::to_string(::getpid());
    auto cleanup = makeScopeGuard([&tmp] {
        std::error_code rmEc;
        std::filesystem::remove(tmp, rmEc);
    });
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            outError = "Failed to open history file for write: " + tmp;
            return false;
        }
        out << historyToJson(records_);
        out.flush();
        if (!out.good()) {
            outError = "Failed writing history file: " + tmp;
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        outError = "Failed to replace history file: " + path_ + " (" + ec.message() + ")";
        return false;
    }
    cleanup.dismiss();
    return true;
}

bool HistoryStore::add(const HistoryRecord& record, std::string& outError) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        outError = "History store is not open.";
        return false;
    }
    records_.push_back(record);
    return saveLocked(outError);
}

void HistoryStore::recordFinal(const FinalizeRecord& fin) {
    if (fin.finalState != JobState::Completed && fin.finalState != JobState::Failed) {
        logDebug(fin.id + ": " + jobStateLabel(fin.finalState) + " not kept in history", "HISTORY");
        return;
    }
    HistoryRecord r;
    r.id = fin.id;
    r.batchId = fin.batchId;
    r.url = fin.request.url;
    r.title = titleFromPath(fin.outputPath);
    r.format = fin.request.format == MediaFormat::Audio ? "mp3" : "mp4";
    r.quality = fin.request.quality;
    r.timestamp = util::formatIsoTime(fin.finishedAt ? *fin.finishedAt : Clock::now());
    r.success = fin.finalState == JobState::Completed;
    r.outputPath = r.success ? fin.outputPath : std::string{};
    if (!r.success) {
        r.errorCode = errorCodeLabel(fin.error.code);
        r.errorMessage = fin.error.detail.empty() ? fin.error.userMessage : fin.error.detail;
        r.retryCount = fin.attempts > 0 ? fin.attempts - 1 : 0;
    }
    std::string err;
    if (!add(r, err)) logWarn("Failed to record history for " + fin.id + ": " + err, "HISTORY");
}

std::vector<HistoryRecord> HistoryStore::all(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return newestFirst(records_, limit);
}

std::vector<HistoryRecord> HistoryStore::completed(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HistoryRecord> out;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(out),
                 [](const HistoryRecord& r) { return r.success; });
    return newestFirst(std::move(out), limit);
}

std::vector<HistoryRecord> HistoryStore::failed(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HistoryRecord> out;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(out),
                 [](const HistoryRecord& r) { return !r.success; });
    return newestFirst(std::move(out), limit);
}

std::vector<HistoryRecord> HistoryStore::search(const std::string& query, size_t limit) const {
    const std::string q = toLowerCopy(query);
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HistoryRecord> out;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(out), [&](const HistoryRecord& r) {
        return toLowerCopy(r.url).find(q) != std::string::npos || toLowerCopy(r.title).find(q) != std::string::npos;
    });
    return newestFirst(std::move(out), limit);
}

HistoryStats HistoryStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    HistoryStats s;
    s.total = records_.size();
    for (const auto& r : records_) {
        if (r.success) s.completed++;
        else s.failed++;
    }
    s.successRate = s.total > 0 ? 100.0 * static_cast<double>(s.completed) / static_cast<double>(s.total) : 0.0;
    return s;
}

bool HistoryStore::exportFailed(const std::string& path, std::string& outError) const {
    std::vector<HistoryRecord> list = failed();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        outError = "Failed to open export file: " + path;
        return false;
    }
    for (const auto& r : list) {
        out << "# Failed: " << r.errorMessage << "\n";
        out << "# Retry count: " << r.retryCount << "\n";
        out << "# Date: " << r.timestamp << "\n";
        out << r.url << "\n\n";
    }
    if (!out.good()) {
        outError = "Failed writing export file: " + path;
        return false;
    }
    return true;
}

bool HistoryStore::clearCompleted(std::string& outError) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        outError = "History store is not open.";
        return false;
    }
    records_.erase(std::remove_if(records_.begin(), records_.end(), [](const HistoryRecord& r) { return r.success; }),
                   records_.end());
    return saveLocked(outError);
}

bool HistoryStore::clearFailed(std::string& outError) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        outError = "History store is not open.";
        return false;
    }
    records_.erase(std::remove_if(records_.begin(), records_.end(), [](const HistoryRecord& r) { return !r.success; }),
                   records_.end());
    return saveLocked(outError);
}

bool HistoryStore::clear(std::string& outError) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        outError = "History store is not open.";
        return false;
    }
    records_.clear();
    return saveLocked(outError);
}

} // namespace ytdle
