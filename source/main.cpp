#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "ytdle/config.hpp"
#include "ytdle/console_report.hpp"
#include "ytdle/engine.hpp"
#include "ytdle/fetch_adapter.hpp"
#include "ytdle/filesystem.hpp"
#include "ytdle/history.hpp"
#include "ytdle/logger.hpp"
#include "ytdle/reachability.hpp"
#include "ytdle/util.hpp"
#include "ytdle/version.hpp"

namespace program_options = boost::program_options;
namespace fs = std::filesystem;

namespace {

volatile std::sig_atomic_t gInterrupted = 0;

void onSigint(int) {
    gInterrupted = 1;
}

struct CliOptions {
    std::vector<std::string> urls;
    std::string outputDir;
    std::string format{"mp3"};
    std::string quality;
    bool playlist{false};
    bool restrict{false};
    std::string filenameTemplate{ytdle::kDefaultFilenameTemplate};
    bool noCheckCertificate{false};
    std::string cookies;
    std::string cookiesFromBrowser;
    std::string ffmpegAddArgs;
    std::string ffmpegOverrideArgs;
    bool aria2c{false};
    int workers{0};
    std::string engine;
    std::string configPath;
    std::string historyPath;
    bool verbose{false};
};

// Returns 0 to continue, otherwise the process exit code (help prints and exits 0).
int processCommandLine(int argc, char** argv, CliOptions& out) {
    program_options::options_description desc("ytdle " + std::string(ytdle::appVersion()) + " options");
    try {
        desc.add_options()
            ("help,h", "print this help message and exit")
            ("input,i", program_options::value<std::vector<std::string>>(&out.urls)->multitoken(), "input URL(s)")
            ("output-dir,o", program_options::value<std::string>(&out.outputDir), "output directory (default: current)")
            ("format,f", program_options::value<std::string>(&out.format), "mp3 or mp4 (default: mp3)")
            ("quality,q", program_options::value<std::string>(&out.quality), "quality, e.g. 192k, 1080p, best")
            ("playlist,p", program_options::bool_switch(&out.playlist), "download the whole playlist")
            ("restrict,r", program_options::bool_switch(&out.restrict), "restrict filenames to ASCII")
            ("template,t", program_options::value<std::string>(&out.filenameTemplate), "output filename template")
            ("no-check-certificate", program_options::bool_switch(&out.noCheckCertificate),
             "disable TLS certificate validation")
            ("cookies", program_options::value<std::string>(&out.cookies), "cookies file")
            ("cookies-from-browser", program_options::value<std::string>(&out.cookiesFromBrowser),
             "load cookies from a browser profile")
            ("ffmpeg-add-args", program_options::value<std::string>(&out.ffmpegAddArgs),
             "extra arguments for the ffmpeg post-processor")
            ("ffmpeg-override-args", program_options::value<std::string>(&out.ffmpegOverrideArgs),
             "replace the ffmpeg post-processor arguments")
            ("aria2c", program_options::bool_switch(&out.aria2c), "use the aria2c accelerator when available")
            ("workers,w", program_options::value<int>(&out.workers), "concurrent downloads (1..32)")
            ("engine", program_options::value<std::string>(&out.engine), "pool or sequential")
            ("config", program_options::value<std::string>(&out.configPath),
             "config directory, .env file or config.json")
            ("history", program_options::value<std::string>(&out.historyPath), "history file")
            ("verbose,v", program_options::bool_switch(&out.verbose), "verbose logging");

        program_options::positional_options_description positional;
        positional.add("input", -1);

        program_options::variables_map options;
        program_options::store(
            program_options::command_line_parser(argc, argv).options(desc).positional(positional).run(), options);
        program_options::notify(options);

        if (options.count("help")) {
            std::cout << desc;
            return -1;
        }
    } catch (const std::exception& ex) {
        std::cout << ex.what() << "\n\n" << desc;
        return 1;
    }
    if (out.format != "mp3" && out.format != "mp4") {
        std::cout << "Error: --format must be mp3 or mp4\n";
        return 1;
    }
    return 0;
}

void resolveConfigPaths(const std::string& configPath, std::string& envPath, std::string& jsonPath) {
    if (configPath.empty()) {
        envPath = ".env";
        jsonPath = "config.json";
        return;
    }
    std::error_code ec;
    if (fs::is_directory(configPath, ec)) {
        envPath = (fs::path(configPath) / ".env").string();
        jsonPath = (fs::path(configPath) / "config.json").string();
    } else if (fs::path(configPath).extension() == ".json") {
        jsonPath = configPath;
    } else {
        envPath = configPath;
    }
}

ytdle::JobRequest buildRequest(const CliOptions& cli, const ytdle::EngineConfig& cfg, const std::string& url) {
    ytdle::JobRequest req;
    req.url = url;
    req.format = cli.format == "mp4" ? ytdle::MediaFormat::Video : ytdle::MediaFormat::Audio;
    if (!cli.quality.empty())
        req.quality = cli.quality;
    else
        req.quality = req.format == ytdle::MediaFormat::Audio ? "192k" : "best";
    req.outputDir = cli.outputDir;
    req.filenameTemplate = cli.filenameTemplate;
    req.playlist = cli.playlist;
    req.restrictFilenames = cli.restrict;
    req.checkCertificate = !cli.noCheckCertificate;
    req.cookieFile = cli.cookies;
    req.cookiesFromBrowser = cli.cookiesFromBrowser;
    req.ffmpegAddArgs = cli.ffmpegAddArgs;
    req.ffmpegOverrideArgs = cli.ffmpegOverrideArgs;
    req.useAccelerator = cli.aria2c;
    req.acceleratorConnections = cfg.acceleratorConnections;
    return req;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions cli;
    int rc = processCommandLine(argc, argv, cli);
    if (rc == -1) return 0;
    if (rc != 0) return rc;

    std::string envPath;
    std::string jsonPath;
    resolveConfigPaths(cli.configPath, envPath, jsonPath);
    ytdle::EngineConfig cfg;
    std::string err;
    if (!ytdle::loadConfig(envPath, jsonPath, cfg, err)) {
        std::cout << "Error: " << err << "\n";
        return 1;
    }
    if (cli.workers > 0) cfg.workers = cli.workers;
    if (!cli.engine.empty()) cfg.engine = cli.engine;
    if (!cli.historyPath.empty()) cfg.historyPath = cli.historyPath;
    if (!ytdle::validateConfig(cfg, err)) {
        std::cout << "Error: " << err << "\n";
        return 1;
    }

    ytdle::setLogLevelFromString(cfg.logLevel);
    if (cli.verbose) ytdle::setLogLevel(ytdle::LogLevel::Debug);
    if (!cfg.logPath.empty() && !ytdle::initLogFile(cfg.logPath, err)) {
        std::cout << "Warning: " << err << "\n";
    }

    std::vector<std::string> urls;
    for (const auto& u : cli.urls) {
        std::string t = ytdle::util::trim(u);
        if (!t.empty()) urls.push_back(t);
    }
    if (urls.empty()) {
        std::cout << "Error: No valid URLs provided.\n";
        return 1;
    }
    if (cli.outputDir.empty()) cli.outputDir = fs::current_path().string();
    if (!ytdle::ensureDirectory(cli.outputDir)) {
        std::cout << "Error creating directory " << cli.outputDir << "\n";
        return 1;
    }

    ytdle::HistoryStore history;
    if (!cfg.historyPath.empty() && !history.open(cfg.historyPath, err)) {
        ytdle::logWarn("History disabled: " + err, "HISTORY");
    }

    ytdle::ProcessFetchOptions fetchOpts;
    fetchOpts.fetchTool = cfg.fetchTool;
    fetchOpts.accelerator = cfg.accelerator;
    fetchOpts.ffmpegLocation = cfg.ffmpegLocation;
    fetchOpts.stallTimeoutSeconds = cfg.stallTimeoutSeconds;
    auto adapter = std::make_shared<ytdle::ProcessFetchAdapter>(fetchOpts);
    std::string toolVersion;
    if (adapter->probeVersion(toolVersion, err)) {
        ytdle::logInfo(cfg.fetchTool + " " + toolVersion, "FETCH");
    } else {
        ytdle::logWarn(err, "FETCH");
    }

    std::unique_ptr<ytdle::TcpReachabilityProbe> probe;
    if (cfg.reachabilityCheck) {
        probe = std::make_unique<ytdle::TcpReachabilityProbe>(cfg.reachabilityHost, cfg.reachabilityPort,
                                                               cfg.reachabilityTimeoutMs);
    }

    std::cout << "ytdle " << ytdle::appVersion() << "\n" << std::string(30, '-') << "\n";
    std::cout << "URLs: " << urls.size() << "\n";
    std::cout << "Directory: " << cli.outputDir << "\n";
    std::vector<ytdle::JobSpec> specs;
    ytdle::ConsoleReport report(std::cout);
    for (size_t i = 0; i < urls.size(); ++i) {
        ytdle::JobSpec spec;
        spec.id = "item-" + std::to_string(i + 1);
        spec.request = buildRequest(cli, cfg, urls[i]);
        report.addItem(spec.id, urls[i]);
        specs.push_back(spec);
    }
    std::cout << "Format: " << cli.format << " (" << specs.front().request.quality << ")\n";
    std::cout << "Playlist: " << (cli.playlist ? "yes" : "no") << "\n" << std::string(30, '-') << "\n";

    auto engine = ytdle::makeEngine(cfg, adapter, history.isOpen() ? &history : nullptr, probe.get());
    const std::string batchId = "cli";
    auto sub = engine->subscribe(batchId);
    std::signal(SIGINT, onSigint);
    engine->submit(specs, batchId);

    bool cancelSent = false;
    while (true) {
        if (gInterrupted && !cancelSent) {
            std::cout << "\nCancelled by user.\n";
            engine->cancelAll();
            cancelSent = true;
        }
        auto ev = sub->next(std::chrono::milliseconds(200));
        if (!ev) {
            if (engine->batchSummary(batchId).done() || sub->finished()) break;
            continue;
        }
        report.onEvent(*ev);
    }

    ytdle::BatchSummary summary = engine->batchSummary(batchId);
    engine->shutdown(false);
    history.close();

    std::cout << "\n" << std::string(30, '=') << "\n";
    std::cout << "Batch Complete. Success: " << summary.completed
              << ", Failed: " << (summary.total - summary.completed) << "\n";
    ytdle::closeLogFile();
    return summary.completed == summary.total ? 0 : 1;
}
