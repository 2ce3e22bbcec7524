#pragma once

#include <chrono>
#include <cstddef>
#include "constants.h"
#include "job_queue.h"
#include "orchestrator.h"
#include "staging.h"
#include "state_store.h"

namespace kiln {

struct ReaperSettings {
    std::chrono::seconds build_timeout{DEFAULT_BUILD_TIMEOUT_SECONDS};
    std::chrono::seconds orphan_grace{DEFAULT_ORPHAN_GRACE_SECONDS};
    size_t log_max_bytes = MAX_BUILD_LOG_SIZE;
};

struct SweepReport {
    size_t builds_reset = 0;
    size_t submissions_failed = 0;
    size_t leases_recovered = 0;
    size_t locks_reclaimed = 0;

    size_t total() const { return builds_reset + submissions_failed + leases_recovered + locks_reclaimed; }
};

// Reclaims work abandoned by a crashed or killed worker. Submissions in
// `in_flight` belong to this process and are never treated as orphans.
// Other workers' RUNNING records get at least the runtime cleanup ceiling
// past their deadline, whatever orphan_grace says.
class Reaper {
public:
    Reaper(StateStore& store, JobQueue& queue, StagingArea& staging, BuildLockTable& locks,
           const InFlightSubmissions& in_flight, ReaperSettings settings = {});

    SweepReport sweep(Timestamp now = std::chrono::system_clock::now());

private:
    size_t reset_stuck_builds(Timestamp now);
    size_t fail_orphaned_submissions(Timestamp now);

    StateStore& store_;
    JobQueue& queue_;
    StagingArea& staging_;
    BuildLockTable& locks_;
    const InFlightSubmissions& in_flight_;
    ReaperSettings settings_;
};

} // namespace kiln
