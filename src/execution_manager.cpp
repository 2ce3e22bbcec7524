#include "execution_manager.h"
#include <iostream>
#include <thread>

namespace kiln {

namespace {

std::optional<std::string> non_empty(std::string text) {
    if (text.empty()) return std::nullopt;
    return text;
}

std::string first_line(const std::string& text) {
    return text.substr(0, text.find('\n'));
}

std::string describe_fault(const RunResult& result, const std::string& image_tag) {
    std::string reason;
    switch (result.fault) {
        case RunFault::RUNTIME_UNAVAILABLE: reason = "container runtime unavailable"; break;
        case RunFault::IMAGE_MISSING: reason = "image '" + image_tag + "' is not available"; break;
        case RunFault::MOUNT_FAILED: reason = "failed to mount staged files"; break;
        case RunFault::RUNTIME_ERROR: reason = "container runtime error"; break;
        case RunFault::NONE: break;
    }
    std::string detail = first_line(result.error_message);
    if (!detail.empty()) {
        reason += ": " + detail;
    }
    return reason;
}

ExecutionOutcome outcome_for(SubmissionStatus status) {
    switch (status) {
        case SubmissionStatus::COMPLETED: return ExecutionOutcome::COMPLETED;
        case SubmissionStatus::FAILED: return ExecutionOutcome::FAILED;
        case SubmissionStatus::TIMEOUT: return ExecutionOutcome::TIMEOUT;
        default: return ExecutionOutcome::ERROR;
    }
}

} // namespace

std::string to_string(ExecutionOutcome outcome) {
    switch (outcome) {
        case ExecutionOutcome::COMPLETED: return "completed";
        case ExecutionOutcome::FAILED: return "failed";
        case ExecutionOutcome::TIMEOUT: return "timeout";
        case ExecutionOutcome::ERROR: return "error";
        case ExecutionOutcome::SKIPPED: return "skipped";
        case ExecutionOutcome::NOT_FOUND: return "not found";
    }
    return "unknown";
}

ExecutionManager::ExecutionManager(StateStore& store, ContainerRunner& runner,
                                   StagingArea& staging, ExecutionSettings settings)
    : store_(store), runner_(runner), staging_(staging), settings_(std::move(settings)) {}

std::string ExecutionManager::container_name(const std::string& submission_id) {
    return "kiln-run-" + submission_id;
}

std::optional<std::string> ExecutionManager::check_compiler(const std::optional<Compiler>& compiler,
                                                           const std::string& compiler_id) const {
    if (!compiler) {
        return "compiler '" + compiler_id + "' no longer exists";
    }
    if (!compiler->enabled) {
        return "compiler '" + compiler_id + "' is disabled";
    }
    if (compiler->build_status != BuildStatus::READY || compiler->image_tag.empty()) {
        return "compiler '" + compiler_id + "' is not ready (build status: " +
               to_string(compiler->build_status) + ")";
    }
    return std::nullopt;
}

ExecutionOutcome ExecutionManager::execute(const std::string& submission_id) {
    auto submission = store_.get_submission(submission_id);
    if (!submission) {
        std::cerr << "[ExecManager] Submission not found: " << submission_id << std::endl;
        return ExecutionOutcome::NOT_FOUND;
    }
    if (submission->status != SubmissionStatus::PENDING) {
        std::cout << "[ExecManager] Submission " << submission_id << " is already "
                  << to_string(submission->status) << ", skipping" << std::endl;
        return ExecutionOutcome::SKIPPED;
    }

    auto compiler = store_.get_compiler(submission->language);
    if (auto reason = check_compiler(compiler, submission->language)) {
        return reject(*submission, *reason);
    }

    bool claimed = store_.update_submission(submission_id, [](Submission& s) {
        if (s.status != SubmissionStatus::PENDING) {
            return false;
        }
        s.status = SubmissionStatus::RUNNING;
        s.started_at = std::chrono::system_clock::now();
        return true;
    });
    if (!claimed) {
        std::cout << "[ExecManager] Submission " << submission_id
                  << " was claimed elsewhere, skipping" << std::endl;
        return ExecutionOutcome::SKIPPED;
    }

    std::cout << "[ExecManager] Running " << submission_id << " on " << compiler->id
              << " (" << compiler->image_tag << ")" << std::endl;

    // From here on the staged files are ours; the handle deletes them on
    // any path that does not release them explicitly
    StagedFiles staged;
    RunSpec spec;
    spec.container_name = container_name(submission_id);
    spec.image_tag = compiler->image_tag;
    spec.command = compiler->run_command;
    spec.policy.memory_limit = compiler->memory_limit;
    spec.policy.cpu_limit = compiler->cpu_limit;
    spec.policy.timeout = std::chrono::seconds(compiler->timeout_seconds);
    spec.stdin_payload = submission->code;
    spec.output_limit_bytes = settings_.output_max_bytes;

    if (submission->files_directory) {
        try {
            staged = staging_.acquire(*submission->files_directory);
        } catch (const std::runtime_error& e) {
            staging_.remove(*submission->files_directory);
            return finish(submission_id, SubmissionStatus::ERROR, std::nullopt,
                          std::string("Cannot mount uploaded files: ") + e.what());
        }
        spec.mounts.push_back({staged.path().string(), settings_.files_mount_path, true});
    }

    RunResult result;
    try {
        result = run_with_retry(spec);
    } catch (const std::exception& e) {
        result = RunResult{};
        result.fault = RunFault::RUNTIME_ERROR;
        result.error_message = e.what();
    }
    runner_.terminate(spec.container_name);
    staged.release();

    if (result.infrastructure_failed()) {
        return finish(submission_id, SubmissionStatus::ERROR, non_empty(result.stdout_output),
                      describe_fault(result, spec.image_tag));
    }
    if (result.timed_out) {
        return finish(submission_id, SubmissionStatus::TIMEOUT, non_empty(result.stdout_output),
                      "Execution timed out after " + std::to_string(compiler->timeout_seconds) +
                      " seconds.");
    }

    std::string stderr_output = result.stderr_output;
    if (result.exit_code == DOCKER_OOM_KILL_EXIT && stderr_output.empty()) {
        stderr_output = "Process was killed (exit code 137), likely out of memory.";
    }
    SubmissionStatus status = result.exit_code == 0 ? SubmissionStatus::COMPLETED
                                                    : SubmissionStatus::FAILED;
    return finish(submission_id, status, non_empty(result.stdout_output), non_empty(stderr_output));
}

RunResult ExecutionManager::run_with_retry(const RunSpec& spec) {
    RunResult result;
    for (int attempt = 0; ; attempt++) {
        result = runner_.run(spec);
        if (!result.transient() || attempt >= settings_.infra_retry_limit) {
            return result;
        }
        std::cerr << "[ExecManager] Runtime unavailable for " << spec.container_name
                  << " (attempt " << (attempt + 1) << "), retrying: "
                  << first_line(result.error_message) << std::endl;
        runner_.terminate(spec.container_name);
        std::this_thread::sleep_for(settings_.infra_retry_backoff);
    }
}

ExecutionOutcome ExecutionManager::reject(const Submission& submission, const std::string& reason) {
    std::cerr << "[ExecManager] Rejecting " << submission.job_id << ": " << reason << std::endl;
    if (submission.files_directory) {
        staging_.remove(*submission.files_directory);
    }

    bool settled = store_.update_submission(submission.job_id, [&](Submission& s) {
        if (s.status != SubmissionStatus::PENDING) {
            return false;
        }
        s.status = SubmissionStatus::ERROR;
        s.output_stderr = reason;
        s.completed_at = std::chrono::system_clock::now();
        return true;
    });
    return settled ? ExecutionOutcome::ERROR : ExecutionOutcome::SKIPPED;
}

ExecutionOutcome ExecutionManager::finish(const std::string& submission_id, SubmissionStatus status,
                                          std::optional<std::string> stdout_output,
                                          std::optional<std::string> stderr_output) {
    bool settled = store_.update_submission(submission_id, [&](Submission& s) {
        if (s.status != SubmissionStatus::RUNNING) {
            return false;
        }
        s.status = status;
        s.output_stdout = stdout_output;
        s.output_stderr = stderr_output;
        s.completed_at = std::chrono::system_clock::now();
        return true;
    });

    if (!settled) {
        std::cerr << "[ExecManager] Submission " << submission_id
                  << " was settled by someone else; dropping " << to_string(status) << std::endl;
        return ExecutionOutcome::SKIPPED;
    }
    std::cout << "[ExecManager] Submission " << submission_id << " finished: "
              << to_string(status) << std::endl;
    return outcome_for(status);
}

} // namespace kiln
