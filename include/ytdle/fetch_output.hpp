#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ytdle/models.hpp"

namespace ytdle {

// Prefix of the machine-readable progress template handed to the fetch tool.
constexpr const char* kProgressMarker = "[ytdle-progress]";

// One classified line of fetch-tool output.
struct FetchLine {
    enum class Kind { Progress, Destination, Error, Warning, Other };
    Kind kind{Kind::Other};
    std::optional<uint64_t> bytesDownloaded;
    std::optional<uint64_t> bytesTotal;
    std::optional<double> speedBytesPerSec;
    std::optional<int64_t> etaSeconds;
    // Destination: file path; Error/Warning: message text after the prefix.
    std::string text;
    // Destination lines that name the final file (merge, audio extraction, already downloaded).
    bool finalOutput{false};
};

FetchLine parseFetchLine(const std::string& line);

// "150.23MiB" -> bytes. Accepts B, KiB/MiB/GiB/TiB and KB/MB/GB/TB.
std::optional<double> parseSizeWithUnit(const std::string& text);
// "00:09", "1:02:03" -> seconds.
std::optional<int64_t> parseClock(const std::string& text);

// Digits of a quality selector ("1080p" -> 1080, "192k" -> 192), 0 when none.
int qualityNumber(const std::string& quality);
bool isBestQuality(const std::string& quality);

// yt-dlp -f selector. `relaxed` prefers a single pre-merged mp4 so no merge step is needed.
std::string buildFormatSelector(MediaFormat format, const std::string& quality, bool relaxed);

// POSIX-shell style word splitting (quotes and backslash escapes). Fails on unbalanced quotes.
bool splitShellArgs(const std::string& text, std::vector<std::string>& out, std::string& outError);
std::string quoteShellArg(const std::string& arg);

struct FetchArgsInput {
    std::string fetchTool{"yt-dlp"};
    JobRequest request;
    // Quality for this attempt after degradation.
    std::string quality;
    bool relaxed{false};
    // Resolved accelerator binary; empty routes transfers through the native downloader.
    std::string acceleratorPath;
    std::string ffmpegLocation;
};

bool buildFetchArgs(const FetchArgsInput& in, std::vector<std::string>& outArgs, std::string& outError);

} // namespace ytdle
