#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

using Timestamp = std::chrono::system_clock::time_point;

enum class BuildStatus {
    PENDING,
    BUILDING,
    READY,
    FAILED
};

enum class SubmissionStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    TIMEOUT,
    ERROR
};

// "pending", "building", "ready", "failed"
std::string to_string(BuildStatus status);
BuildStatus build_status_from_string(const std::string& value);

// "PENDING", "RUNNING", "COMPLETED", "FAILED", "TIMEOUT", "ERROR"
std::string to_string(SubmissionStatus status);
SubmissionStatus submission_status_from_string(const std::string& value);

bool is_terminal(SubmissionStatus status);

// A user-defined runtime environment
struct Compiler {
    std::string id;
    std::string name;
    std::optional<std::string> version;

    // Build inputs
    std::string dockerfile_content;
    std::vector<std::string> run_command;

    // Resource policy, evaluated once per execution
    std::string memory_limit = "512m";
    std::string cpu_limit = "1";
    int timeout_seconds = 10;

    bool enabled = true;

    // Build state, owned by the build manager
    BuildStatus build_status = BuildStatus::PENDING;
    std::optional<std::string> build_error;
    std::string build_logs;
    std::string image_tag;                       // Last promoted artifact
    std::optional<Timestamp> built_at;
    std::optional<Timestamp> build_started_at;

    Timestamp created_at{};
    Timestamp updated_at{};
};

struct UploadedFile {
    std::string filename;
    size_t size = 0;
    std::string mime_type;
};

// A single request to execute code under a compiler
struct Submission {
    std::string job_id;
    std::string code;
    std::string language;                        // Compiler id
    SubmissionStatus status = SubmissionStatus::PENDING;

    std::optional<std::string> output_stdout;
    std::optional<std::string> output_stderr;

    std::vector<UploadedFile> uploaded_files;
    std::optional<std::string> files_directory;

    Timestamp created_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
};

} // namespace kiln
