#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include "constants.h"

namespace kiln {

// Daemon configuration. Defaults come from constants.h; a JSON file and
// then command-line flags may override them.
struct Config {
    std::string state_dir = "/var/lib/kiln/state";
    std::string queue_dir = "/var/lib/kiln/queue";
    std::string staging_root = "/var/lib/kiln/staging";

    int worker_count = DEFAULT_WORKER_COUNT;
    int max_concurrent_executions = DEFAULT_MAX_CONCURRENT_EXECUTIONS;

    int build_timeout_seconds = DEFAULT_BUILD_TIMEOUT_SECONDS;
    size_t build_log_max_bytes = MAX_BUILD_LOG_SIZE;
    size_t build_error_max_bytes = MAX_BUILD_ERROR_SIZE;
    size_t output_max_bytes = MAX_OUTPUT_SIZE;

    int infra_retry_limit = DEFAULT_INFRA_RETRY_LIMIT;
    int job_retry_limit = DEFAULT_JOB_RETRY_LIMIT;

    int reaper_interval_seconds = DEFAULT_REAPER_INTERVAL_SECONDS;
    int orphan_grace_seconds = DEFAULT_ORPHAN_GRACE_SECONDS;
    int queue_poll_interval_ms = DEFAULT_QUEUE_POLL_MS;

    // Container runtime
    std::string docker_binary = "docker";
    std::string oci_runtime;                 // e.g. "runsc"; empty = daemon default
    std::string image_prefix = DEFAULT_IMAGE_PREFIX;
    std::string files_mount_path = DEFAULT_FILES_MOUNT_PATH;
    std::string scratch_size = DEFAULT_SCRATCH_SIZE;
    int pids_limit = DEFAULT_PIDS_LIMIT;

    std::chrono::seconds build_timeout() const { return std::chrono::seconds(build_timeout_seconds); }
    std::chrono::seconds orphan_grace() const { return std::chrono::seconds(orphan_grace_seconds); }

    // Throws ConfigError on out-of-range values
    void validate() const;

    // Parse a JSON object of overrides on top of defaults.
    // Unknown keys and wrongly typed values throw ConfigError.
    static Config from_json_string(const std::string& text);
    static Config load(const std::string& path);
};

} // namespace kiln
