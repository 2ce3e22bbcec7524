#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include "build_manager.h"
#include "execution_manager.h"
#include "jobs.h"
#include "state_store.h"

namespace kiln {

// At most one build per compiler within this process. The state store's
// compare-and-set into `building` covers other processes.
class BuildLockTable {
public:
    struct Entry {
        std::string token;
        std::string owner;
        std::chrono::steady_clock::time_point acquired_at;
    };

    // Returns the lock token, or nullopt if the compiler is already locked
    std::optional<std::string> try_acquire(const std::string& compiler_id, const std::string& owner);

    // No-op unless `token` still owns the lock
    void release(const std::string& compiler_id, const std::string& token);

    bool is_held(const std::string& compiler_id) const;
    std::optional<Entry> entry(const std::string& compiler_id) const;

    // Drop locks held longer than `max_age`. Returns how many were dropped.
    size_t reclaim_expired(std::chrono::steady_clock::duration max_age);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Entry> locks_;
    unsigned long next_token_ = 0;
};

// Submissions this process is executing right now. The reaper leaves
// these alone however old their RUNNING record looks.
class InFlightSubmissions {
public:
    void mark(const std::string& submission_id);
    void clear(const std::string& submission_id);
    bool contains(const std::string& submission_id) const;
    size_t size() const;

    class Guard {
    public:
        Guard(InFlightSubmissions& set, std::string submission_id)
            : set_(set), submission_id_(std::move(submission_id)) {
            set_.mark(submission_id_);
        }
        ~Guard() { set_.clear(submission_id_); }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        InFlightSubmissions& set_;
        std::string submission_id_;
    };

private:
    mutable std::mutex mutex_;
    std::multiset<std::string> ids_;
};

// Counting gate bounding concurrent executions
class ExecutionSlots {
public:
    explicit ExecutionSlots(int capacity);

    void acquire();
    void release();

    int capacity() const { return capacity_; }
    int in_use() const;

    class Guard {
    public:
        explicit Guard(ExecutionSlots& slots) : slots_(slots) { slots_.acquire(); }
        ~Guard() { slots_.release(); }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        ExecutionSlots& slots_;
    };

private:
    const int capacity_;
    int in_use_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable released_;
};

enum class Disposition {
    ACK,        // Done with this job, successfully or not
    RETRY       // Requeue with attempt + 1
};

// Single entry point for queue consumers
class Orchestrator {
public:
    Orchestrator(StateStore& store, BuildManager& builds, ExecutionManager& executions,
                 int max_concurrent_executions, int job_retry_limit);

    Disposition handle(const Job& job, const std::string& owner = "local");

    BuildLockTable& build_locks() { return build_locks_; }
    ExecutionSlots& execution_slots() { return execution_slots_; }
    InFlightSubmissions& in_flight() { return in_flight_; }

private:
    void handle_build(const Job& job, const std::string& owner);
    void handle_execute(const Job& job);
    void handle_cleanup(const Job& job);

    StateStore& store_;
    BuildManager& builds_;
    ExecutionManager& executions_;
    BuildLockTable build_locks_;
    ExecutionSlots execution_slots_;
    InFlightSubmissions in_flight_;
    int job_retry_limit_;
};

} // namespace kiln
