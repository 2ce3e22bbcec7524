#include "reaper.h"
#include "build_manager.h"
#include <algorithm>
#include <iostream>

namespace kiln {

namespace {
const char* WORKER_LOST = "execution interrupted: worker lost";
}

Reaper::Reaper(StateStore& store, JobQueue& queue, StagingArea& staging, BuildLockTable& locks,
               const InFlightSubmissions& in_flight, ReaperSettings settings)
    : store_(store),
      queue_(queue),
      staging_(staging),
      locks_(locks),
      in_flight_(in_flight),
      settings_(settings) {}

SweepReport Reaper::sweep(Timestamp now) {
    SweepReport report;
    report.builds_reset = reset_stuck_builds(now);
    report.submissions_failed = fail_orphaned_submissions(now);
    report.leases_recovered = queue_.recover_expired(settings_.build_timeout + settings_.orphan_grace);
    report.locks_reclaimed = locks_.reclaim_expired(settings_.build_timeout + settings_.orphan_grace);

    if (report.total() > 0) {
        std::cout << "[Reaper] Sweep: " << report.builds_reset << " builds reset, "
                  << report.submissions_failed << " submissions failed, "
                  << report.leases_recovered << " leases recovered, "
                  << report.locks_reclaimed << " locks reclaimed" << std::endl;
    }
    return report;
}

size_t Reaper::reset_stuck_builds(Timestamp now) {
    size_t reset = 0;
    auto limit = settings_.build_timeout + settings_.orphan_grace;

    for (const auto& compiler : store_.list_compilers()) {
        if (compiler.build_status != BuildStatus::BUILDING || locks_.is_held(compiler.id)) {
            continue;
        }

        bool changed = store_.update_compiler(compiler.id, [&](Compiler& c) {
            Timestamp started = c.build_started_at.value_or(c.updated_at);
            if (c.build_status != BuildStatus::BUILDING || started + limit > now) {
                return false;
            }
            c.build_status = BuildStatus::PENDING;
            c.build_started_at.reset();
            c.build_logs = BuildManager::append_log(c.build_logs, "Build interrupted; requeued",
                                                    settings_.log_max_bytes);
            return true;
        });
        if (!changed) {
            continue;
        }

        std::cerr << "[Reaper] Compiler " << compiler.id
                  << " was stuck in building; reset to pending" << std::endl;
        queue_.enqueue(Job::build(compiler.id));
        reset++;
    }
    return reset;
}

size_t Reaper::fail_orphaned_submissions(Timestamp now) {
    size_t failed = 0;
    auto grace = std::max(settings_.orphan_grace,
                          std::chrono::seconds(EXECUTION_CLEANUP_CEILING_SECONDS));

    for (const auto& submission : store_.list_submissions()) {
        if (submission.status != SubmissionStatus::RUNNING || !submission.started_at ||
            in_flight_.contains(submission.job_id)) {
            continue;
        }

        int timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
        if (auto compiler = store_.get_compiler(submission.language)) {
            timeout_seconds = compiler->timeout_seconds;
        }
        auto deadline = *submission.started_at + std::chrono::seconds(timeout_seconds) + grace;
        if (deadline > now) {
            continue;
        }

        if (submission.files_directory) {
            staging_.remove(*submission.files_directory);
        }

        bool changed = store_.update_submission(submission.job_id, [&](Submission& s) {
            if (s.status != SubmissionStatus::RUNNING) {
                return false;
            }
            s.status = SubmissionStatus::ERROR;
            s.output_stderr = std::string(WORKER_LOST);
            s.completed_at = now;
            return true;
        });
        if (changed) {
            std::cerr << "[Reaper] Submission " << submission.job_id << ": " << WORKER_LOST << std::endl;
            failed++;
        }
    }
    return failed;
}

} // namespace kiln
