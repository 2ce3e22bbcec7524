#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include "job_queue.h"

namespace kiln {

// Durable job queue spooled to disk, shared by every worker process that
// points at the same directory:
//   ready/   jobs waiting for a worker, consumed in name (= enqueue) order
//   leased/  jobs a worker is processing; mtime marks the lease start
//   dead/    entries that could not be decoded
//
// Leasing is a rename from ready/ to leased/, so exactly one worker wins
// each entry. A worker that dies leaves its entry in leased/ until
// recover_expired() returns it to ready/.
class SpoolJobQueue : public JobQueue {
public:
    explicit SpoolJobQueue(const std::string& root,
                           std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));

    void enqueue(const Job& job) override;
    std::optional<Lease> lease(std::chrono::milliseconds wait) override;
    void ack(const Lease& lease) override;
    void requeue(const Lease& lease) override;
    size_t recover_expired(std::chrono::seconds older_than) override;
    size_t size() const override;

    size_t leased_count() const;
    size_t dead_count() const;

    // Wake every blocked lease() call; they return empty from then on
    void shutdown();

private:
    std::optional<Lease> try_lease();
    std::string next_entry_name();
    void write_entry(const std::filesystem::path& dir, const std::string& name, const Job& job);

    std::filesystem::path root_;
    std::filesystem::path ready_dir_;
    std::filesystem::path leased_dir_;
    std::filesystem::path dead_dir_;
    std::chrono::milliseconds poll_interval_;

    std::mutex mutex_;
    std::condition_variable available_;
    bool shutdown_ = false;
};

} // namespace kiln
