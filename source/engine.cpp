#include "ytdle/engine.hpp"
#include "ytdle/logger.hpp"
#include "ytdle/sequential_engine.hpp"
#include "ytdle/worker_pool_engine.hpp"

namespace ytdle {

EngineOptions engineOptionsFromConfig(const EngineConfig& cfg) {
    EngineOptions opts;
    opts.workers = cfg.workers;
    opts.keepPartial = cfg.keepPartial;
    opts.maxAttempts = cfg.maxAttempts;
    opts.ladder.videoHeights = cfg.qualityLadderVideo;
    opts.ladder.audioBitrates = cfg.qualityLadderAudio;
    opts.reachabilityInterval = std::chrono::milliseconds(cfg.reachabilityIntervalMs);
    return opts;
}

std::unique_ptr<DownloadEngine> makeEngine(const EngineConfig& cfg, std::shared_ptr<FetchAdapter> adapter,
                                           HistorySink* history, ReachabilityProbe* probe) {
    EngineOptions opts = engineOptionsFromConfig(cfg);
    if (cfg.engine == "sequential") {
        logInfo("Using sequential engine", "ENGINE");
        return std::make_unique<SequentialEngine>(std::move(opts), std::move(adapter), history, probe);
    }
    if (cfg.engine != "pool") logWarn("Unknown engine '" + cfg.engine + "', using pool", "ENGINE");
    return std::make_unique<WorkerPoolEngine>(std::move(opts), std::move(adapter), history, probe);
}

} // namespace ytdle
