#pragma once

#include <mutex>
#include <thread>

#include "ytdle/engine_core.hpp"

namespace ytdle {

// One job at a time on a drain thread that starts on submit and exits once
// the queue is empty. A finished thread is reaped before the next start.
class SequentialEngine : public EngineCore {
public:
    SequentialEngine(EngineOptions opts, std::shared_ptr<FetchAdapter> adapter, HistorySink* history = nullptr,
                     ReachabilityProbe* probe = nullptr);
    ~SequentialEngine() override;

    bool draining() const;

protected:
    void onJobsQueued() override;
    void stopWorkers() override;

private:
    void drainLoop();

    mutable std::mutex mutex_;
    std::thread worker_;
    bool running_{false};
    bool stopped_{false};
};

} // namespace ytdle
