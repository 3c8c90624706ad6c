#include "ytdle/fetch_adapter.hpp"
#include "ytdle/fetch_output.hpp"
#include "ytdle/filesystem.hpp"
#include "ytdle/logger.hpp"
#include "ytdle/process.hpp"
#include "ytdle/util.hpp"

#include <algorithm>
#include <chrono>
#include <memory>

namespace ytdle {

bool validateSourceUrl(const std::string& url, std::string& outError) {
    std::string lower = toLowerCopy(util::trim(url));
    size_t schemeLen = 0;
    if (util::startsWith(lower, "http://")) schemeLen = 7;
    else if (util::startsWith(lower, "https://")) schemeLen = 8;
    else {
        outError = "Unsupported URL scheme: " + url;
        return false;
    }
    if (lower.find_first_of(" \t\r\n") != std::string::npos) {
        outError = "URL contains whitespace: " + url;
        return false;
    }
    std::string authority = lower.substr(schemeLen);
    auto end = authority.find_first_of("/?#");
    if (end != std::string::npos) authority.erase(end);
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority.erase(0, at + 1);
    std::string host = authority;
    if (!host.empty() && host.front() == '[') {
        auto close = host.find(']');
        host = close == std::string::npos ? std::string{} : host.substr(1, close - 1);
    } else {
        auto colon = host.find(':');
        if (colon != std::string::npos) host.erase(colon);
    }
    if (host.empty()) {
        outError = "URL has no host: " + url;
        return false;
    }
    return true;
}

ProcessFetchAdapter::ProcessFetchAdapter(ProcessFetchOptions opts) : opts_(std::move(opts)) {}

std::string ProcessFetchAdapter::acceleratorPath() {
    std::lock_guard<std::mutex> lock(accelMutex_);
    if (!accelResolved_) {
        accelPath_ = findExecutable(opts_.accelerator);
        accelResolved_ = true;
        if (accelPath_.empty()) {
            logWarn("Accelerator '" + opts_.accelerator + "' not found; using native transfers", "FETCH");
        } else {
            logInfo("Accelerator: " + accelPath_, "FETCH");
        }
    }
    return accelPath_;
}

bool ProcessFetchAdapter::probeVersion(std::string& outVersion, std::string& outError) {
    ChildProcess child;
    if (!child.start({opts_.fetchTool, "--version"}, outError)) return false;
    std::string line;
    auto st = child.readLine(line, 10000);
    if (st != ChildProcess::ReadStatus::Line) {
        child.terminate(std::chrono::milliseconds(opts_.terminateGraceMs));
        outError = opts_.fetchTool + " --version produced no output";
        return false;
    }
    // Drain so the child never blocks on a full pipe.
    std::string rest;
    while (child.readLine(rest, 1000) == ChildProcess::ReadStatus::Line) {
    }
    int code = child.wait();
    if (code != 0) {
        outError = opts_.fetchTool + " --version exited with code " + std::to_string(code);
        return false;
    }
    outVersion = util::trim(line);
    return true;
}

FetchResult ProcessFetchAdapter::run(const FetchRequest& req, JobControl& control, const ProgressFn& onProgress) {
    const std::string tag = "FETCH";
    const JobRequest& r = req.request;
    std::string err;

    if (!validateSourceUrl(r.url, err)) {
        logWarn(req.jobId + ": " + err, tag);
        return FetchResult::failure(makeError(ErrorCode::InvalidInput, err));
    }
    if (!ensureDirectory(r.outputDir.empty() ? std::string(".") : r.outputDir)) {
        return FetchResult::failure(makeError(ErrorCode::DiskWriteError, "Unable to create output directory " + r.outputDir));
    }

    FetchArgsInput in;
    in.fetchTool = opts_.fetchTool;
    in.request = r;
    in.quality = req.quality.empty() ? r.quality : req.quality;
    in.relaxed = req.relaxed;
    in.ffmpegLocation = opts_.ffmpegLocation;
    if (r.useAccelerator) in.acceleratorPath = acceleratorPath();

    std::vector<std::string> args;
    if (!buildFetchArgs(in, args, err)) {
        return FetchResult::failure(makeError(ErrorCode::InvalidInput, err));
    }

    std::vector<std::string> artifacts;
    std::string finalPath;
    std::string lastDestination;
    std::string lastErrorLine;

    auto withArtifacts = [&](FetchResult res) {
        res.artifacts = artifacts;
        return res;
    };

    auto handleLine = [&](const std::string& line) {
        FetchLine parsed = parseFetchLine(line);
        switch (parsed.kind) {
            case FetchLine::Kind::Progress: {
                FetchProgress p;
                p.bytesDownloaded = parsed.bytesDownloaded;
                p.bytesTotal = parsed.bytesTotal;
                p.speedBytesPerSec = parsed.speedBytesPerSec;
                p.etaSeconds = parsed.etaSeconds;
                if (onProgress) onProgress(p);
                break;
            }
            case FetchLine::Kind::Destination: {
                if (std::find(artifacts.begin(), artifacts.end(), parsed.text) == artifacts.end()) {
                    artifacts.push_back(parsed.text);
                }
                lastDestination = parsed.text;
                if (parsed.finalOutput) finalPath = parsed.text;
                FetchProgress p;
                p.outputPath = parsed.text;
                if (onProgress) onProgress(p);
                logDebug(req.jobId + ": destination " + parsed.text, tag);
                break;
            }
            case FetchLine::Kind::Error:
                lastErrorLine = parsed.text;
                logWarn(req.jobId + ": " + parsed.text, tag);
                break;
            case FetchLine::Kind::Warning:
                logDebug(req.jobId + ": warning " + parsed.text, tag);
                break;
            default:
                if (logLevel() == LogLevel::Debug) logDebug(req.jobId + ": " + util::ellipsize(line, 200), tag);
                break;
        }
    };

    // Cancelled between dequeue and launch: never start the tool.
    if (control.stopRequested()) return FetchResult::aborted();

    auto child = std::make_unique<ChildProcess>();
    if (!child->start(args, err)) {
        logError(req.jobId + ": " + err, tag);
        return FetchResult::failure(makeError(ErrorCode::InternalFault, err));
    }
    logInfo(req.jobId + ": attempt " + std::to_string(req.attempt) + " quality=" + in.quality +
                (in.relaxed ? " (relaxed)" : "") + " url=" + r.url,
            tag);

    const auto poll = std::chrono::milliseconds(opts_.pollIntervalMs);
    const auto grace = std::chrono::milliseconds(opts_.terminateGraceMs);
    const auto stallLimit = std::chrono::seconds(opts_.stallTimeoutSeconds);
    auto lastOutput = std::chrono::steady_clock::now();
    bool suspended = false;
    bool killedForPause = false;

    while (true) {
        Directive d = control.directive();
        if (JobControl::isStopDirective(d)) {
            child->terminate(grace);
            logInfo(req.jobId + ": stopped (" + directiveLabel(d) + ")", tag);
            return withArtifacts(FetchResult::aborted());
        }
        if (d == Directive::Pause) {
            if (!suspended && !killedForPause) {
                if (child->suspend()) {
                    suspended = true;
                    logInfo(req.jobId + ": suspended", tag);
                } else {
                    // Fall back to stop-and-continue from the partial file.
                    child->terminate(grace);
                    killedForPause = true;
                    logWarn(req.jobId + ": suspend failed, process stopped until resume", tag);
                }
            }
            control.waitForChange(Directive::Pause, poll);
            continue;
        }
        if (suspended) {
            child->resume();
            suspended = false;
            lastOutput = std::chrono::steady_clock::now();
            logInfo(req.jobId + ": resumed", tag);
        }
        if (killedForPause) {
            child = std::make_unique<ChildProcess>();
            if (!child->start(args, err)) {
                logError(req.jobId + ": relaunch failed: " + err, tag);
                return withArtifacts(FetchResult::failure(makeError(ErrorCode::InternalFault, err)));
            }
            killedForPause = false;
            lastOutput = std::chrono::steady_clock::now();
            logInfo(req.jobId + ": relaunched with --continue", tag);
        }

        std::string line;
        auto st = child->readLine(line, opts_.pollIntervalMs);
        if (st == ChildProcess::ReadStatus::Line) {
            lastOutput = std::chrono::steady_clock::now();
            handleLine(line);
            continue;
        }
        if (st == ChildProcess::ReadStatus::Timeout) {
            if (std::chrono::steady_clock::now() - lastOutput > stallLimit) {
                child->terminate(grace);
                std::string detail = "stalled: no output for " + std::to_string(opts_.stallTimeoutSeconds) + "s";
                logWarn(req.jobId + ": " + detail, tag);
                // Paused while the stall was detected: report only once resumed.
                while (control.directive() == Directive::Pause) {
                    control.waitForChange(Directive::Pause, poll);
                }
                if (control.stopRequested()) return withArtifacts(FetchResult::aborted());
                return withArtifacts(FetchResult::failure(makeError(ErrorCode::StalledTransfer, detail)));
            }
            continue;
        }
        if (st == ChildProcess::ReadStatus::Error) {
            logWarn(req.jobId + ": output pipe error, stopping tool", tag);
            child->terminate(grace);
        }
        break;
    }

    int code = child->wait();

    // Exited between a pause request and the stop signal: hold the slot until resumed.
    while (control.directive() == Directive::Pause) {
        control.waitForChange(Directive::Pause, poll);
    }
    if (control.stopRequested()) return withArtifacts(FetchResult::aborted());

    if (code == 0) {
        std::string out = finalPath.empty() ? lastDestination : finalPath;
        logInfo(req.jobId + ": finished " + (out.empty() ? std::string("(no output path reported)") : out), tag);
        return withArtifacts(FetchResult::success(out));
    }

    std::string detail = lastErrorLine.empty() ? opts_.fetchTool + " exited with code " + std::to_string(code)
                                               : lastErrorLine;
    ErrorInfo info = classifyError(detail);
    logWarn(req.jobId + ": exit " + std::to_string(code) + " -> " + errorCodeLabel(info.code), tag);
    return withArtifacts(FetchResult::failure(info));
}

void ProcessFetchAdapter::discardPartial(const FetchRequest& req, const FetchResult& result) {
    if (result.artifacts.empty()) return;
    size_t n = removePartialArtifacts(result.artifacts);
    if (n > 0) logInfo(req.jobId + ": removed " + std::to_string(n) + " partial file(s)", "FETCH");
}

} // namespace ytdle
