#include "ytdle/filesystem.hpp"
#include "ytdle/logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

namespace ytdle {

namespace fs = std::filesystem;

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "Title.f137.mp4" -> "Title", "Title.mp4" -> "Title"
std::string coreStem(const std::string& filename) {
    std::string stem = filename;
    for (const char* suffix : {".part", ".ytdl", ".temp", ".tmp"}) {
        if (endsWith(stem, suffix)) stem.erase(stem.size() - std::string(suffix).size());
    }
    auto dot = stem.rfind('.');
    if (dot != std::string::npos && dot > 0) stem.erase(dot);
    dot = stem.rfind('.');
    if (dot != std::string::npos && dot + 1 < stem.size() && stem[dot + 1] == 'f') {
        std::string id = stem.substr(dot + 2);
        if (!id.empty() && std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isalnum(c) || c == '-'; })) {
            stem.erase(dot);
        }
    }
    return stem;
}

// Leftover names after "<stem>." that belong to an unfinished transfer.
bool isPartialRemainder(const std::string& rest) {
    if (rest.empty()) return false;
    if (endsWith(rest, ".part") || endsWith(rest, ".ytdl") || endsWith(rest, ".temp") || endsWith(rest, ".tmp")) {
        return true;
    }
    if (rest.find(".part-Frag") != std::string::npos) return true;
    if (rest.rfind("temp.", 0) == 0) return true;
    if (rest == "webp" || rest == "jpg" || rest == "png") return true;
    // f<format id>.<ext>
    if (rest[0] == 'f' && rest.size() > 2) {
        auto dot = rest.find('.');
        if (dot != std::string::npos && dot > 1) {
            std::string id = rest.substr(1, dot - 1);
            return std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isalnum(c) || c == '-'; }) &&
                   std::isdigit(static_cast<unsigned char>(id[0]));
        }
    }
    return false;
}

bool removeFile(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return false;
    bool removed = fs::remove(p, ec);
    if (ec) {
        logWarn("Failed to remove " + p.string() + " err=" + ec.message(), "FS");
        return false;
    }
    if (removed) logDebug("Removed partial " + p.string(), "FS");
    return removed;
}

} // namespace

bool ensureDirectory(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    bool ok = fs::create_directories(p, ec) || fs::is_directory(p, ec);
    if (!ok) logWarn("Failed to ensure directory: " + path, "FS");
    return ok;
}

bool fileExists(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    return fs::exists(p, ec);
}

std::string normalizeDirectory(const std::string& path) {
    fs::path p(path.empty() ? std::string(".") : path);
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) abs = p;
    std::string out = abs.lexically_normal().string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

std::string outputKey(const JobRequest& request) {
    std::string tmpl = request.filenameTemplate.empty() ? std::string(kDefaultFilenameTemplate)
                                                        : request.filenameTemplate;
    return normalizeDirectory(request.outputDir) + "\n" + tmpl + "\n" + request.url + "\n" +
           mediaFormatLabel(request.format);
}

size_t removePartialArtifacts(const std::vector<std::string>& knownPaths) {
    size_t removed = 0;
    std::set<std::pair<std::string, std::string>> scanned;
    for (const auto& known : knownPaths) {
        if (known.empty()) continue;
        fs::path p(known);
        for (const char* suffix : {"", ".part", ".ytdl", ".temp", ".tmp"}) {
            if (removeFile(fs::path(known + suffix))) removed++;
        }

        fs::path dir = p.has_parent_path() ? p.parent_path() : fs::path(".");
        std::string stem = coreStem(p.filename().string());
        if (stem.empty()) continue;
        if (!scanned.insert({dir.string(), stem}).second) continue;

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) continue;
        std::vector<fs::path> victims;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            std::string name = it->path().filename().string();
            if (name.size() <= stem.size() + 1 || name.compare(0, stem.size() + 1, stem + ".") != 0) continue;
            if (isPartialRemainder(name.substr(stem.size() + 1))) victims.push_back(it->path());
        }
        for (const auto& v : victims) {
            if (removeFile(v)) removed++;
        }
    }
    return removed;
}

} // namespace ytdle
