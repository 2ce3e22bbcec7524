#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include "jobs.h"

namespace kiln {

// A job handed to exactly one worker until it is acked or requeued
struct Lease {
    std::string id;
    Job job;
};

// Durable, at-least-once job channel
class JobQueue {
public:
    virtual ~JobQueue() = default;

    virtual void enqueue(const Job& job) = 0;

    // Blocks up to `wait` for a job
    virtual std::optional<Lease> lease(std::chrono::milliseconds wait) = 0;

    virtual void ack(const Lease& lease) = 0;

    // Return the job to the queue with its attempt counter incremented
    virtual void requeue(const Lease& lease) = 0;

    // Return leases older than `older_than` to the queue (their worker is
    // presumed dead). Returns how many were recovered.
    virtual size_t recover_expired(std::chrono::seconds older_than) = 0;

    virtual size_t size() const = 0;
};

} // namespace kiln
