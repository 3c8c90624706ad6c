#include "ytdle/fetch_output.hpp"
#include "ytdle/util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace ytdle {

namespace {

std::vector<std::string> splitWs(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

std::optional<uint64_t> parseUnsignedField(const std::string& tok) {
    if (tok.empty() || tok == "NA" || tok == "None") return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(tok.c_str(), &end);
    if (end == tok.c_str() || v < 0) return std::nullopt;
    return static_cast<uint64_t>(v);
}

std::optional<double> parseDoubleField(const std::string& tok) {
    if (tok.empty() || tok == "NA" || tok == "None") return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(tok.c_str(), &end);
    if (end == tok.c_str() || v < 0) return std::nullopt;
    return v;
}

std::string afterPrefix(const std::string& line, const std::string& prefix) {
    return util::trim(line.substr(prefix.size()));
}

// "[ytdle-progress] <downloaded> <total> <estimate> <speed> <eta>"
FetchLine parseTemplateProgress(const std::string& body) {
    FetchLine out;
    out.kind = FetchLine::Kind::Progress;
    auto toks = splitWs(body);
    if (toks.size() > 0) out.bytesDownloaded = parseUnsignedField(toks[0]);
    if (toks.size() > 1) out.bytesTotal = parseUnsignedField(toks[1]);
    if (!out.bytesTotal && toks.size() > 2) out.bytesTotal = parseUnsignedField(toks[2]);
    if (toks.size() > 3) out.speedBytesPerSec = parseDoubleField(toks[3]);
    if (toks.size() > 4) {
        if (auto eta = parseDoubleField(toks[4])) out.etaSeconds = static_cast<int64_t>(*eta);
    }
    return out;
}

// "45.3% of ~150.23MiB at 10.50MiB/s ETA 00:09" or "100% of 50.23MiB in 00:05"
bool parseClassicProgress(const std::string& body, FetchLine& out) {
    auto toks = splitWs(body);
    if (toks.empty() || toks[0].back() != '%') return false;
    std::optional<double> percent = parseDoubleField(toks[0].substr(0, toks[0].size() - 1));
    if (!percent) return false;
    out.kind = FetchLine::Kind::Progress;
    for (size_t i = 1; i + 1 < toks.size(); ++i) {
        const std::string& key = toks[i];
        std::string val = toks[i + 1];
        if (key == "of") {
            if (!val.empty() && val[0] == '~') val.erase(0, 1);
            if (auto total = parseSizeWithUnit(val)) {
                out.bytesTotal = static_cast<uint64_t>(*total);
                out.bytesDownloaded = static_cast<uint64_t>(*total * std::min(*percent, 100.0) / 100.0);
            }
        } else if (key == "at") {
            if (val.size() > 2 && val.compare(val.size() - 2, 2, "/s") == 0) {
                if (auto speed = parseSizeWithUnit(val.substr(0, val.size() - 2))) out.speedBytesPerSec = *speed;
            }
        } else if (key == "ETA") {
            out.etaSeconds = parseClock(val);
        }
    }
    return true;
}

} // namespace

std::optional<double> parseSizeWithUnit(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || v < 0) return std::nullopt;
    std::string unit(end);
    double mult = 1.0;
    if (unit == "B" || unit.empty()) mult = 1.0;
    else if (unit == "KiB") mult = 1024.0;
    else if (unit == "MiB") mult = 1024.0 * 1024.0;
    else if (unit == "GiB") mult = 1024.0 * 1024.0 * 1024.0;
    else if (unit == "TiB") mult = 1024.0 * 1024.0 * 1024.0 * 1024.0;
    else if (unit == "KB" || unit == "kB") mult = 1000.0;
    else if (unit == "MB") mult = 1000.0 * 1000.0;
    else if (unit == "GB") mult = 1000.0 * 1000.0 * 1000.0;
    else if (unit == "TB") mult = 1000.0 * 1000.0 * 1000.0 * 1000.0;
    else return std::nullopt;
    return v * mult;
}

std::optional<int64_t> parseClock(const std::string& text) {
    if (text.empty()) return std::nullopt;
    int64_t total = 0;
    std::stringstream ss(text);
    std::string part;
    int parts = 0;
    while (std::getline(ss, part, ':')) {
        if (part.empty() || !std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        total = total * 60 + std::atoll(part.c_str());
        parts++;
    }
    if (parts == 0 || parts > 3) return std::nullopt;
    return total;
}

FetchLine parseFetchLine(const std::string& rawLine) {
    const std::string line = util::trim(rawLine);
    FetchLine out;
    if (line.empty()) return out;

    if (util::startsWith(line, kProgressMarker)) {
        return parseTemplateProgress(line.substr(std::string(kProgressMarker).size()));
    }
    if (util::startsWith(line, "ERROR:")) {
        out.kind = FetchLine::Kind::Error;
        out.text = afterPrefix(line, "ERROR:");
        return out;
    }
    if (util::startsWith(line, "WARNING:")) {
        out.kind = FetchLine::Kind::Warning;
        out.text = afterPrefix(line, "WARNING:");
        return out;
    }
    if (util::startsWith(line, "[Merger]")) {
        const std::string key = "Merging formats into";
        auto pos = line.find(key);
        if (pos != std::string::npos) {
            std::string path = util::trim(line.substr(pos + key.size()));
            if (path.size() >= 2 && path.front() == '"' && path.back() == '"') {
                path = path.substr(1, path.size() - 2);
            }
            out.kind = FetchLine::Kind::Destination;
            out.text = path;
            out.finalOutput = true;
        }
        return out;
    }
    if (util::startsWith(line, "[ExtractAudio]")) {
        const std::string key = "Destination:";
        auto pos = line.find(key);
        if (pos != std::string::npos) {
            out.kind = FetchLine::Kind::Destination;
            out.text = util::trim(line.substr(pos + key.size()));
            out.finalOutput = true;
        }
        return out;
    }
    if (util::startsWith(line, "[download]")) {
        std::string body = afterPrefix(line, "[download]");
        const std::string destKey = "Destination:";
        if (util::startsWith(body, destKey)) {
            out.kind = FetchLine::Kind::Destination;
            out.text = util::trim(body.substr(destKey.size()));
            return out;
        }
        const std::string doneKey = " has already been downloaded";
        auto done = body.find(doneKey);
        if (done != std::string::npos) {
            out.kind = FetchLine::Kind::Destination;
            out.text = body.substr(0, done);
            out.finalOutput = true;
            return out;
        }
        parseClassicProgress(body, out);
        return out;
    }
    return out;
}

int qualityNumber(const std::string& quality) {
    std::string digits;
    for (char c : quality) {
        if (std::isdigit(static_cast<unsigned char>(c))) digits.push_back(c);
    }
    if (digits.empty() || digits.size() > 6) return 0;
    return std::atoi(digits.c_str());
}

bool isBestQuality(const std::string& quality) {
    std::string q = util::trim(quality);
    std::transform(q.begin(), q.end(), q.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return q.empty() || q == "best" || qualityNumber(q) == 0;
}

std::string buildFormatSelector(MediaFormat format, const std::string& quality, bool relaxed) {
    if (format == MediaFormat::Audio) return "bestaudio/best";
    if (isBestQuality(quality)) {
        return relaxed ? "best[ext=mp4]/best" : "bv*+ba/best";
    }
    const std::string h = std::to_string(qualityNumber(quality));
    if (relaxed) {
        return "best[height<=" + h + "][ext=mp4]/best[height<=" + h + "]/best";
    }
    return "bv*[height<=" + h + "]+ba/b[height<=" + h + "]/best[height<=" + h + "]/best";
}

bool splitShellArgs(const std::string& text, std::vector<std::string>& out, std::string& outError) {
    out.clear();
    std::string cur;
    bool inToken = false;
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote == '\'') {
            if (c == '\'') quote = 0;
            else cur.push_back(c);
            continue;
        }
        if (quote == '"') {
            if (c == '"') {
                quote = 0;
            } else if (c == '\\' && i + 1 < text.size() &&
                       (text[i + 1] == '"' || text[i + 1] == '\\' || text[i + 1] == '$' || text[i + 1] == '`')) {
                cur.push_back(text[++i]);
            } else {
                cur.push_back(c);
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            inToken = true;
        } else if (c == '\\') {
            if (i + 1 < text.size()) cur.push_back(text[++i]);
            inToken = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (inToken) {
                out.push_back(cur);
                cur.clear();
                inToken = false;
            }
        } else {
            cur.push_back(c);
            inToken = true;
        }
    }
    if (quote != 0) {
        outError = "Unbalanced quote in argument string: " + text;
        return false;
    }
    if (inToken) out.push_back(cur);
    return true;
}

std::string quoteShellArg(const std::string& arg) {
    if (!arg.empty() && std::all_of(arg.begin(), arg.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '/' || c == ':' || c == '=' ||
                   c == ',' || c == '+';
        })) {
        return arg;
    }
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out += "'";
    return out;
}

bool buildFetchArgs(const FetchArgsInput& in, std::vector<std::string>& outArgs, std::string& outError) {
    const JobRequest& r = in.request;
    std::vector<std::string> args;
    args.push_back(in.fetchTool);
    args.push_back("--newline");
    args.push_back("--progress-template");
    args.push_back(std::string("download:") + kProgressMarker +
                   " %(progress.downloaded_bytes)s %(progress.total_bytes)s"
                   " %(progress.total_bytes_estimate)s %(progress.speed)s %(progress.eta)s");
    args.push_back("--continue");

    std::string tmpl = util::trim(r.filenameTemplate);
    if (tmpl.empty()) tmpl = kDefaultFilenameTemplate;
    const std::string extSuffix = ".%(ext)s";
    if (tmpl.size() > extSuffix.size() && tmpl.compare(tmpl.size() - extSuffix.size(), extSuffix.size(), extSuffix) == 0) {
        tmpl.erase(tmpl.size() - extSuffix.size());
    }
    std::string dir = r.outputDir.empty() ? std::string(".") : r.outputDir;
    while (dir.size() > 1 && dir.back() == '/') dir.pop_back();
    args.push_back("-o");
    args.push_back(dir + "/" + tmpl + extSuffix);

    args.push_back("--retries");
    args.push_back(std::to_string(std::max(0, r.retries)));
    args.push_back("--fragment-retries");
    args.push_back(std::to_string(std::max(0, r.fragmentRetries)));
    args.push_back("--concurrent-fragments");
    args.push_back(std::to_string(std::max(1, r.concurrentFragments)));
    args.push_back(r.playlist ? "--yes-playlist" : "--no-playlist");
    if (r.restrictFilenames) args.push_back("--restrict-filenames");
    if (!r.checkCertificate) args.push_back("--no-check-certificates");
    if (!r.cookiesFromBrowser.empty()) {
        args.push_back("--cookies-from-browser");
        args.push_back(r.cookiesFromBrowser);
    } else if (!r.cookieFile.empty()) {
        args.push_back("--cookies");
        args.push_back(r.cookieFile);
    }
    if (!in.ffmpegLocation.empty()) {
        args.push_back("--ffmpeg-location");
        args.push_back(in.ffmpegLocation);
    }

    if (r.format == MediaFormat::Audio) {
        int kbps = qualityNumber(in.quality);
        if (kbps <= 0) kbps = 192;
        args.push_back("-f");
        args.push_back(buildFormatSelector(r.format, in.quality, in.relaxed));
        args.push_back("--extract-audio");
        args.push_back("--audio-format");
        args.push_back("mp3");
        args.push_back("--audio-quality");
        args.push_back(std::to_string(kbps) + "K");
        args.push_back("--embed-metadata");
        args.push_back("--embed-thumbnail");
    } else {
        args.push_back("-f");
        args.push_back(buildFormatSelector(r.format, in.quality, in.relaxed));
        args.push_back("--merge-output-format");
        args.push_back("mp4");
        args.push_back("--embed-metadata");
    }

    if (!in.acceleratorPath.empty()) {
        int n = std::min(16, std::max(1, r.acceleratorConnections));
        args.push_back("--downloader");
        args.push_back(in.acceleratorPath);
        args.push_back("--downloader-args");
        args.push_back("aria2c:-x " + std::to_string(n) + " -s " + std::to_string(n) +
                       " -k 1M --file-allocation=none --optimize-concurrent-downloads=true");
    }

    // Override replaces base+additional; the fetch tool re-splits the joined string.
    std::vector<std::string> ppTokens;
    if (!util::trim(r.ffmpegOverrideArgs).empty()) {
        if (!splitShellArgs(r.ffmpegOverrideArgs, ppTokens, outError)) return false;
    } else {
        std::vector<std::string> extra;
        if (!splitShellArgs(r.ffmpegArgs, ppTokens, outError)) return false;
        if (!splitShellArgs(r.ffmpegAddArgs, extra, outError)) return false;
        ppTokens.insert(ppTokens.end(), extra.begin(), extra.end());
    }
    if (!ppTokens.empty()) {
        std::string joined;
        for (const auto& t : ppTokens) {
            if (!joined.empty()) joined += " ";
            joined += quoteShellArg(t);
        }
        args.push_back("--postprocessor-args");
        args.push_back("ffmpeg:" + joined);
    }

    args.push_back("--");
    args.push_back(r.url);
    outArgs = std::move(args);
    return true;
}

} // namespace ytdle
