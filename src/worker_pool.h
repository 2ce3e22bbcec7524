#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "job_queue.h"
#include "orchestrator.h"
#include "reaper.h"

namespace kiln {

struct WorkerPoolSettings {
    int worker_count = DEFAULT_WORKER_COUNT;
    std::chrono::milliseconds poll_interval{DEFAULT_QUEUE_POLL_MS};
    std::chrono::seconds reaper_interval{DEFAULT_REAPER_INTERVAL_SECONDS};
};

// Worker threads that lease jobs, hand them to the orchestrator and
// acknowledge or requeue them. An optional reaper runs on its own thread.
class WorkerPool {
public:
    WorkerPool(JobQueue& queue, Orchestrator& orchestrator, Reaper* reaper,
               WorkerPoolSettings settings = {});
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    // Finish in-flight jobs and join every thread
    void stop();

    bool running() const { return running_; }
    size_t processed() const { return processed_; }

private:
    void worker_loop(int index);
    void reaper_loop();

    JobQueue& queue_;
    Orchestrator& orchestrator_;
    Reaper* reaper_;
    WorkerPoolSettings settings_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> processed_{0};
    std::vector<std::thread> workers_;
    std::thread reaper_thread_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
};

} // namespace kiln
