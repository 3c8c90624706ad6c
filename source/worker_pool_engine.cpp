#include "ytdle/worker_pool_engine.hpp"
#include "ytdle/logger.hpp"

#include <algorithm>

namespace ytdle {

namespace {
constexpr int kMaxWorkers = 32;
}

WorkerPoolEngine::WorkerPoolEngine(EngineOptions opts, std::shared_ptr<FetchAdapter> adapter, HistorySink* history,
                                   ReachabilityProbe* probe)
    : EngineCore(std::move(opts), std::move(adapter), history, probe) {
    const int n = std::clamp(options().workers, 1, kMaxWorkers);
    workers_.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) workers_.emplace_back(&WorkerPoolEngine::workerLoop, this, i);
    logInfo("Worker pool started with " + std::to_string(n) + " slot(s)", "ENGINE");
}

WorkerPoolEngine::~WorkerPoolEngine() {
    shutdown(true);
}

void WorkerPoolEngine::workerLoop(int index) {
    logDebug("Worker " + std::to_string(index) + " up", "ENGINE");
    while (auto id = queue().dequeue()) processJob(*id);
    logDebug("Worker " + std::to_string(index) + " exiting", "ENGINE");
}

void WorkerPoolEngine::stopWorkers() {
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

} // namespace ytdle
