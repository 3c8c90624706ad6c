#include "ytdle/sequential_engine.hpp"
#include "ytdle/logger.hpp"

namespace ytdle {

SequentialEngine::SequentialEngine(EngineOptions opts, std::shared_ptr<FetchAdapter> adapter, HistorySink* history,
                                   ReachabilityProbe* probe)
    : EngineCore(std::move(opts), std::move(adapter), history, probe) {}

SequentialEngine::~SequentialEngine() {
    shutdown(true);
}

bool SequentialEngine::draining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void SequentialEngine::onJobsQueued() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_ || running_) return;
    // Reap the previous drain thread; it already left the loop.
    if (worker_.joinable()) worker_.join();
    running_ = true;
    worker_ = std::thread(&SequentialEngine::drainLoop, this);
    logDebug("Drain thread started", "ENGINE");
}

void SequentialEngine::drainLoop() {
    while (true) {
        std::optional<std::string> id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = queue().tryDequeue();
            if (!id) {
                running_ = false;
                return;
            }
        }
        processJob(*id);
    }
}

void SequentialEngine::stopWorkers() {
    std::thread t;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        t = std::move(worker_);
    }
    if (t.joinable()) t.join();
}

} // namespace ytdle
