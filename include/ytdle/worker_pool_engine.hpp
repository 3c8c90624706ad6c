#pragma once

#include <thread>
#include <vector>

#include "ytdle/engine_core.hpp"

namespace ytdle {

// N persistent worker threads blocking on the job queue.
class WorkerPoolEngine : public EngineCore {
public:
    WorkerPoolEngine(EngineOptions opts, std::shared_ptr<FetchAdapter> adapter, HistorySink* history = nullptr,
                     ReachabilityProbe* probe = nullptr);
    ~WorkerPoolEngine() override;

    size_t workerCount() const { return workers_.size(); }

protected:
    void stopWorkers() override;

private:
    void workerLoop(int index);

    std::vector<std::thread> workers_;
};

} // namespace ytdle
