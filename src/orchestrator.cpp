#include "orchestrator.h"
#include <iostream>
#include <stdexcept>

namespace kiln {

// BuildLockTable

std::optional<std::string> BuildLockTable::try_acquire(const std::string& compiler_id,
                                                       const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (locks_.count(compiler_id) > 0) {
        return std::nullopt;
    }
    Entry entry;
    entry.token = owner + "#" + std::to_string(++next_token_);
    entry.owner = owner;
    entry.acquired_at = std::chrono::steady_clock::now();
    locks_[compiler_id] = entry;
    return entry.token;
}

void BuildLockTable::release(const std::string& compiler_id, const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(compiler_id);
    if (it != locks_.end() && it->second.token == token) {
        locks_.erase(it);
    }
}

bool BuildLockTable::is_held(const std::string& compiler_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.count(compiler_id) > 0;
}

std::optional<BuildLockTable::Entry> BuildLockTable::entry(const std::string& compiler_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(compiler_id);
    if (it == locks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t BuildLockTable::reclaim_expired(std::chrono::steady_clock::duration max_age) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cutoff = std::chrono::steady_clock::now() - max_age;
    size_t reclaimed = 0;
    for (auto it = locks_.begin(); it != locks_.end();) {
        if (it->second.acquired_at <= cutoff) {
            std::cerr << "[Orchestrator] Reclaiming expired build lock for " << it->first
                      << " held by " << it->second.owner << std::endl;
            it = locks_.erase(it);
            reclaimed++;
        } else {
            ++it;
        }
    }
    return reclaimed;
}

size_t BuildLockTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.size();
}

// InFlightSubmissions

void InFlightSubmissions::mark(const std::string& submission_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ids_.insert(submission_id);
}

void InFlightSubmissions::clear(const std::string& submission_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ids_.find(submission_id);
    if (it != ids_.end()) {
        ids_.erase(it);
    }
}

bool InFlightSubmissions::contains(const std::string& submission_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.count(submission_id) > 0;
}

size_t InFlightSubmissions::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.size();
}

// ExecutionSlots

ExecutionSlots::ExecutionSlots(int capacity) : capacity_(capacity) {
    if (capacity < 1) {
        throw std::invalid_argument("ExecutionSlots capacity must be >= 1");
    }
}

void ExecutionSlots::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    released_.wait(lock, [this] { return in_use_ < capacity_; });
    in_use_++;
}

void ExecutionSlots::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_use_--;
    }
    released_.notify_one();
}

int ExecutionSlots::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

// Orchestrator

namespace {

class LockHolder {
public:
    LockHolder(BuildLockTable& table, std::string compiler_id, std::string token)
        : table_(table), compiler_id_(std::move(compiler_id)), token_(std::move(token)) {}
    ~LockHolder() { table_.release(compiler_id_, token_); }
    LockHolder(const LockHolder&) = delete;
    LockHolder& operator=(const LockHolder&) = delete;

private:
    BuildLockTable& table_;
    std::string compiler_id_;
    std::string token_;
};

} // namespace

Orchestrator::Orchestrator(StateStore& store, BuildManager& builds, ExecutionManager& executions,
                           int max_concurrent_executions, int job_retry_limit)
    : store_(store),
      builds_(builds),
      executions_(executions),
      execution_slots_(max_concurrent_executions),
      job_retry_limit_(job_retry_limit) {}

Disposition Orchestrator::handle(const Job& job, const std::string& owner) {
    try {
        switch (job.kind) {
            case JobKind::BUILD:
                handle_build(job, owner);
                break;
            case JobKind::EXECUTE:
                handle_execute(job);
                break;
            case JobKind::CLEANUP:
                handle_cleanup(job);
                break;
        }
        return Disposition::ACK;
    } catch (const std::exception& e) {
        if (job.attempt < job_retry_limit_) {
            std::cerr << "[Orchestrator] " << job.describe() << " failed (attempt "
                      << (job.attempt + 1) << "), will retry: " << e.what() << std::endl;
            return Disposition::RETRY;
        }
        std::cerr << "[Orchestrator] Dropping " << job.describe() << " after "
                  << (job.attempt + 1) << " attempts: " << e.what() << std::endl;
        return Disposition::ACK;
    }
}

void Orchestrator::handle_build(const Job& job, const std::string& owner) {
    auto token = build_locks_.try_acquire(job.target, owner);
    if (!token) {
        auto holder = build_locks_.entry(job.target);
        std::cout << "[Orchestrator] Build for " << job.target << " already held by "
                  << (holder ? holder->owner : "another worker") << ", dropping duplicate" << std::endl;
        return;
    }
    LockHolder holder(build_locks_, job.target, *token);

    BuildOutcome outcome = builds_.build(job.target);
    std::cout << "[Orchestrator] " << job.describe() << ": " << to_string(outcome) << std::endl;
}

void Orchestrator::handle_execute(const Job& job) {
    auto submission = store_.get_submission(job.target);
    if (!submission) {
        std::cerr << "[Orchestrator] No submission " << job.target << ", dropping job" << std::endl;
        return;
    }
    if (is_terminal(submission->status)) {
        std::cout << "[Orchestrator] Submission " << job.target << " already "
                  << to_string(submission->status) << ", acknowledging" << std::endl;
        return;
    }

    InFlightSubmissions::Guard running(in_flight_, job.target);
    ExecutionSlots::Guard slot(execution_slots_);
    ExecutionOutcome outcome = executions_.execute(job.target);
    std::cout << "[Orchestrator] " << job.describe() << ": " << to_string(outcome) << std::endl;
}

void Orchestrator::handle_cleanup(const Job& job) {
    builds_.remove_artifact(job.target, job.image_tag);
}

} // namespace kiln
