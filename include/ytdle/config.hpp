#pragma once

#include <string>
#include <vector>

namespace ytdle {

struct EngineConfig {
    // Concurrent worker slots (1..32).
    int workers{4};
    // pool | sequential
    std::string engine{"pool"};
    // Total attempts per job including the first.
    int maxAttempts{3};
    int stallTimeoutSeconds{120};
    // Leave .part files behind after cancel/skip/failure.
    bool keepPartial{false};
    std::string fetchTool{"yt-dlp"};
    std::string accelerator{"aria2c"};
    int acceleratorConnections{16};
    // Passed to the fetch tool as --ffmpeg-location when set.
    std::string ffmpegLocation;
    // Logging verbosity (debug, info, warn, error)
    std::string logLevel{"info"};
    std::string logPath;
    std::string historyPath;
    // Quality degradation tiers, highest first.
    std::vector<int> qualityLadderVideo{2160, 1440, 1080, 720, 480, 360};
    std::vector<int> qualityLadderAudio{320, 256, 192, 160, 128, 96};
    bool reachabilityCheck{false};
    std::string reachabilityHost{"8.8.8.8"};
    int reachabilityPort{53};
    int reachabilityTimeoutMs{3000};
    int reachabilityIntervalMs{5000};
};

// Load .env then config.json (JSON wins on keys set in both). Either path may be
// empty or missing; a file that exists but does not parse is an error.
bool loadConfig(const std::string& envPath, const std::string& jsonPath, EngineConfig& outCfg,
                std::string& outError);

bool validateConfig(const EngineConfig& cfg, std::string& outError);

// "2160,1440,1080" -> {2160,1440,1080}; tiers must be positive and strictly descending.
bool parseLadder(const std::string& text, std::vector<int>& out, std::string& outError);

#ifdef UNIT_TEST
// Test helpers: parse in-memory content (no validation).
bool parseEnvString(const std::string& contents, EngineConfig& outCfg, std::string& outError);
bool parseJsonString(const std::string& contents, EngineConfig& outCfg, std::string& outError);
#endif

} // namespace ytdle
