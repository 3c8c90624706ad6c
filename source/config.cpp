#include "ytdle/config.hpp"
#include "ytdle/logger.hpp"
#include "mini/json.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ytdle {

static std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static void trim(std::string& s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) i++;
    s = s.substr(i);
}

static bool parseBoolText(const std::string& val) {
    std::string v = toLower(val);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

static bool parseIntText(const std::string& key, const std::string& val, int& out, std::string& outError) {
    if (val.empty()) return true;
    char* end = nullptr;
    long n = std::strtol(val.c_str(), &end, 10);
    if (end == val.c_str() || *end != '\0') {
        outError = "Config key " + key + " expects an integer, got '" + val + "'.";
        return false;
    }
    out = static_cast<int>(n);
    return true;
}

bool parseLadder(const std::string& text, std::vector<int>& out, std::string& outError) {
    std::vector<int> tiers;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        trim(item);
        if (item.empty()) continue;
        char* end = nullptr;
        long n = std::strtol(item.c_str(), &end, 10);
        if (end == item.c_str() || *end != '\0' || n <= 0) {
            outError = "Invalid quality tier '" + item + "'.";
            return false;
        }
        if (!tiers.empty() && n >= tiers.back()) {
            outError = "Quality tiers must be strictly descending: " + text;
            return false;
        }
        tiers.push_back(static_cast<int>(n));
    }
    if (tiers.empty()) {
        outError = "Quality ladder is empty.";
        return false;
    }
    out = std::move(tiers);
    return true;
}

static bool applyEnvContents(const std::string& contents, EngineConfig& outCfg, std::string& outError) {
    std::istringstream in(contents);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == ';') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = toLower(line.substr(0, pos));
        std::string val = line.substr(pos + 1);
        trim(key); trim(val);
        if (!val.empty() && val.front() == '"' && val.back() == '"' && val.size() >= 2) {
            val = val.substr(1, val.size() - 2);
        }
        bool ok = true;
        if (key == "workers") ok = parseIntText(key, val, outCfg.workers, outError);
        else if (key == "engine") outCfg.engine = toLower(val);
        else if (key == "max_attempts") ok = parseIntText(key, val, outCfg.maxAttempts, outError);
        else if (key == "stall_timeout_seconds") ok = parseIntText(key, val, outCfg.stallTimeoutSeconds, outError);
        else if (key == "keep_partial") outCfg.keepPartial = parseBoolText(val);
        else if (key == "fetch_tool") outCfg.fetchTool = val;
        else if (key == "accelerator") outCfg.accelerator = val;
        else if (key == "accelerator_connections") ok = parseIntText(key, val, outCfg.acceleratorConnections, outError);
        else if (key == "ffmpeg_location") outCfg.ffmpegLocation = val;
        else if (key == "log_level") outCfg.logLevel = toLower(val);
        else if (key == "log_path") outCfg.logPath = val;
        else if (key == "history_path") outCfg.historyPath = val;
        else if (key == "quality_ladder_video") ok = parseLadder(val, outCfg.qualityLadderVideo, outError);
        else if (key == "quality_ladder_audio") ok = parseLadder(val, outCfg.qualityLadderAudio, outError);
        else if (key == "reachability_check") outCfg.reachabilityCheck = parseBoolText(val);
        else if (key == "reachability_host") outCfg.reachabilityHost = val;
        else if (key == "reachability_port") ok = parseIntText(key, val, outCfg.reachabilityPort, outError);
        else if (key == "reachability_timeout_ms") ok = parseIntText(key, val, outCfg.reachabilityTimeoutMs, outError);
        else if (key == "reachability_interval_ms") ok = parseIntText(key, val, outCfg.reachabilityIntervalMs, outError);
        else logDebug("Ignoring unknown config key: " + key, "CONFIG");
        if (!ok) return false;
    }
    return true;
}

static bool applyJsonContents(const std::string& content, EngineConfig& outCfg, std::string& outError) {
    mini::Object obj;
    if (!mini::parse(content, obj)) {
        outError = "Invalid config JSON.";
        return false;
    }
    auto getStr = [&](const char* key, std::string& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->second.type == mini::Value::Type::String) {
            out = it->second.str;
        }
    };
    auto getInt = [&](const char* key, int& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->second.type == mini::Value::Type::Number) {
            out = static_cast<int>(it->second.number);
        }
    };
    auto getBool = [&](const char* key, bool& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->second.type == mini::Value::Type::Bool) {
            out = it->second.boolean;
        }
    };
    // Ladders may be given as [2160, 1080] or "2160,1080".
    auto getLadder = [&](const char* key, std::vector<int>& out) -> bool {
        auto it = obj.find(key);
        if (it == obj.end()) return true;
        if (it->second.type == mini::Value::Type::String) {
            return parseLadder(it->second.str, out, outError);
        }
        if (it->second.type != mini::Value::Type::Array) {
            outError = std::string("Config key ") + key + " must be an array or string.";
            return false;
        }
        std::string joined;
        for (const auto& v : it->second.array) {
            if (v.type != mini::Value::Type::Number) {
                outError = std::string("Config key ") + key + " must contain numbers.";
                return false;
            }
            if (!joined.empty()) joined += ",";
            joined += std::to_string(v.number);
        }
        return parseLadder(joined, out, outError);
    };
    getInt("workers", outCfg.workers);
    {
        std::string engine;
        getStr("engine", engine);
        if (!engine.empty()) outCfg.engine = toLower(engine);
    }
    getInt("max_attempts", outCfg.maxAttempts);
    getInt("stall_timeout_seconds", outCfg.stallTimeoutSeconds);
    getBool("keep_partial", outCfg.keepPartial);
    getStr("fetch_tool", outCfg.fetchTool);
    getStr("accelerator", outCfg.accelerator);
    getInt("accelerator_connections", outCfg.acceleratorConnections);
    getStr("ffmpeg_location", outCfg.ffmpegLocation);
    {
        std::string lvl;
        getStr("log_level", lvl);
        if (!lvl.empty()) outCfg.logLevel = toLower(lvl);
    }
    getStr("log_path", outCfg.logPath);
    getStr("history_path", outCfg.historyPath);
    if (!getLadder("quality_ladder_video", outCfg.qualityLadderVideo)) return false;
    if (!getLadder("quality_ladder_audio", outCfg.qualityLadderAudio)) return false;
    getBool("reachability_check", outCfg.reachabilityCheck);
    getStr("reachability_host", outCfg.reachabilityHost);
    getInt("reachability_port", outCfg.reachabilityPort);
    getInt("reachability_timeout_ms", outCfg.reachabilityTimeoutMs);
    getInt("reachability_interval_ms", outCfg.reachabilityIntervalMs);
    return true;
}

static bool readFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) return false;
    out.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return true;
}

bool validateConfig(const EngineConfig& cfg, std::string& outError) {
    if (cfg.workers < 1 || cfg.workers > 32) {
        outError = "workers must be between 1 and 32 (got " + std::to_string(cfg.workers) + ").";
        return false;
    }
    if (cfg.maxAttempts < 1) {
        outError = "max_attempts must be at least 1.";
        return false;
    }
    if (cfg.engine != "pool" && cfg.engine != "sequential") {
        outError = "Unknown engine '" + cfg.engine + "' (expected pool or sequential).";
        return false;
    }
    if (cfg.fetchTool.empty()) {
        outError = "fetch_tool must not be empty.";
        return false;
    }
    if (cfg.stallTimeoutSeconds < 1) {
        outError = "stall_timeout_seconds must be positive.";
        return false;
    }
    if (cfg.acceleratorConnections < 1 || cfg.acceleratorConnections > 16) {
        outError = "accelerator_connections must be between 1 and 16.";
        return false;
    }
    if (cfg.qualityLadderVideo.empty() || cfg.qualityLadderAudio.empty()) {
        outError = "Quality ladders must not be empty.";
        return false;
    }
    if (cfg.reachabilityCheck) {
        if (cfg.reachabilityHost.empty() || cfg.reachabilityPort <= 0 || cfg.reachabilityPort > 65535) {
            outError = "reachability_host/reachability_port are invalid.";
            return false;
        }
        if (cfg.reachabilityTimeoutMs <= 0 || cfg.reachabilityIntervalMs <= 0) {
            outError = "reachability timeouts must be positive.";
            return false;
        }
    }
    return true;
}

bool loadConfig(const std::string& envPath, const std::string& jsonPath, EngineConfig& outCfg,
                std::string& outError) {
    std::string content;
    if (!envPath.empty() && readFile(envPath, content)) {
        if (!applyEnvContents(content, outCfg, outError)) {
            outError = envPath + ": " + outError;
            return false;
        }
        logDebug("Loaded " + envPath, "CONFIG");
    }
    if (!jsonPath.empty() && readFile(jsonPath, content)) {
        if (!applyJsonContents(content, outCfg, outError)) {
            outError = jsonPath + ": " + outError;
            return false;
        }
        logDebug("Loaded " + jsonPath, "CONFIG");
    }
    return validateConfig(outCfg, outError);
}

#ifdef UNIT_TEST
bool parseEnvString(const std::string& contents, EngineConfig& outCfg, std::string& outError) {
    return applyEnvContents(contents, outCfg, outError);
}

bool parseJsonString(const std::string& contents, EngineConfig& outCfg, std::string& outError) {
    return applyJsonContents(contents, outCfg, outError);
}
#endif

} // namespace ytdle
