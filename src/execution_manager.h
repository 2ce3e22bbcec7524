#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "constants.h"
#include "runtime.h"
#include "staging.h"
#include "state_store.h"

namespace kiln {

enum class ExecutionOutcome {
    COMPLETED,
    FAILED,
    TIMEOUT,
    ERROR,
    SKIPPED,        // Already running or settled
    NOT_FOUND
};

std::string to_string(ExecutionOutcome outcome);

struct ExecutionSettings {
    std::string files_mount_path = DEFAULT_FILES_MOUNT_PATH;
    size_t output_max_bytes = MAX_OUTPUT_SIZE;
    int infra_retry_limit = DEFAULT_INFRA_RETRY_LIMIT;
    std::chrono::milliseconds infra_retry_backoff{INFRA_RETRY_BACKOFF_MS};
};

// Drives the submission state machine:
//   PENDING -> RUNNING -> COMPLETED|FAILED|TIMEOUT|ERROR
//   PENDING -> ERROR                 (compiler missing, disabled or not ready)
// Staged files are deleted on every path, before the terminal status is
// written.
class ExecutionManager {
public:
    ExecutionManager(StateStore& store, ContainerRunner& runner, StagingArea& staging,
                     ExecutionSettings settings = {});

    ExecutionOutcome execute(const std::string& submission_id);

    static std::string container_name(const std::string& submission_id);

private:
    // Why the submission cannot run, or nullopt when the compiler is usable
    std::optional<std::string> check_compiler(const std::optional<Compiler>& compiler,
                                              const std::string& compiler_id) const;

    RunResult run_with_retry(const RunSpec& spec);
    ExecutionOutcome reject(const Submission& submission, const std::string& reason);
    ExecutionOutcome finish(const std::string& submission_id, SubmissionStatus status,
                            std::optional<std::string> stdout_output,
                            std::optional<std::string> stderr_output);

    StateStore& store_;
    ContainerRunner& runner_;
    StagingArea& staging_;
    ExecutionSettings settings_;
};

} // namespace kiln
