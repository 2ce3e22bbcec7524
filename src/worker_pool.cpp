#include "worker_pool.h"
#include <iostream>
#include <unistd.h>

namespace kiln {

WorkerPool::WorkerPool(JobQueue& queue, Orchestrator& orchestrator, Reaper* reaper,
                       WorkerPoolSettings settings)
    : queue_(queue), orchestrator_(orchestrator), reaper_(reaper), settings_(settings) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (running_.exchange(true)) {
        return;
    }
    for (int i = 0; i < settings_.worker_count; i++) {
        workers_.emplace_back(&WorkerPool::worker_loop, this, i);
    }
    if (reaper_) {
        reaper_thread_ = std::thread(&WorkerPool::reaper_loop, this);
    }
    std::cout << "[Worker] Started " << settings_.worker_count << " workers" << std::endl;
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    stop_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    if (reaper_thread_.joinable()) {
        reaper_thread_.join();
    }
    std::cout << "[Worker] Stopped after " << processed_ << " jobs" << std::endl;
}

void WorkerPool::worker_loop(int index) {
    std::string owner = "worker-" + std::to_string(getpid()) + "-" + std::to_string(index);

    while (running_) {
        std::optional<Lease> lease;
        try {
            lease = queue_.lease(settings_.poll_interval);
        } catch (const std::exception& e) {
            std::cerr << "[Worker] " << owner << " lease failed: " << e.what() << std::endl;
            std::this_thread::sleep_for(settings_.poll_interval);
            continue;
        }
        if (!lease) {
            continue;
        }

        Disposition disposition = orchestrator_.handle(lease->job, owner);
        try {
            if (disposition == Disposition::RETRY) {
                queue_.requeue(*lease);
            } else {
                queue_.ack(*lease);
            }
        } catch (const std::exception& e) {
            // The lease stays in place and the reaper returns it later
            std::cerr << "[Worker] " << owner << " could not settle " << lease->job.describe()
                      << ": " << e.what() << std::endl;
        }
        processed_++;
    }
}

void WorkerPool::reaper_loop() {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    while (running_) {
        lock.unlock();
        try {
            reaper_->sweep();
        } catch (const std::exception& e) {
            std::cerr << "[Reaper] Sweep failed: " << e.what() << std::endl;
        }
        lock.lock();
        stop_cv_.wait_for(lock, settings_.reaper_interval, [this] { return !running_; });
    }
}

} // namespace kiln
