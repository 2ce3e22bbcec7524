#pragma once

#include <cstddef>  // for size_t

namespace kiln {

// Output and log limits
constexpr size_t MAX_OUTPUT_SIZE = 1 * 1024 * 1024;              // 1MB per stream
constexpr size_t MAX_BUILD_LOG_SIZE = 64 * 1024;                  // Tail kept in build_logs
constexpr size_t MAX_BUILD_ERROR_SIZE = 2 * 1024;                 // build_error summary
constexpr size_t BUILD_ERROR_TAIL_LINES = 20;
constexpr size_t MAX_JOB_FILES_SIZE = 100 * 1024 * 1024;          // 100MB staged per submission

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 10;                       // Compiler default
constexpr int DEFAULT_BUILD_TIMEOUT_SECONDS = 600;                // 10 minute build ceiling
constexpr int DEFAULT_ORPHAN_GRACE_SECONDS = 60;
constexpr int EXECUTION_CLEANUP_CEILING_SECONDS = 190;            // Three 60s `docker rm -f` plus drain
constexpr int DEFAULT_REAPER_INTERVAL_SECONDS = 30;
constexpr int DEFAULT_QUEUE_POLL_MS = 500;
constexpr int INFRA_RETRY_BACKOFF_MS = 500;

// Concurrency
constexpr int DEFAULT_WORKER_COUNT = 4;
constexpr int DEFAULT_MAX_CONCURRENT_EXECUTIONS = 4;
constexpr int DEFAULT_INFRA_RETRY_LIMIT = 2;                      // Extra attempts after the first
constexpr int DEFAULT_JOB_RETRY_LIMIT = 3;

// Container policy
constexpr int DEFAULT_PIDS_LIMIT = 64;
constexpr const char* DEFAULT_SCRATCH_SIZE = "64m";
constexpr const char* DEFAULT_FILES_MOUNT_PATH = "/sandbox/files";
constexpr const char* SANDBOX_WORKDIR = "/sandbox";
constexpr const char* DEFAULT_IMAGE_PREFIX = "kiln";

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                         // Read buffer size

// Docker CLI exit codes that mean the runtime, not the program, failed
constexpr int DOCKER_DAEMON_ERROR_EXIT = 125;
constexpr int DOCKER_OOM_KILL_EXIT = 137;

} // namespace kiln
