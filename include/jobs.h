#pragma once

#include <string>

namespace kiln {

enum class JobKind {
    BUILD,      // Build the image for a compiler
    EXECUTE,    // Run a submission
    CLEANUP     // Remove the artifact of a deleted compiler
};

std::string to_string(JobKind kind);
JobKind job_kind_from_string(const std::string& value);

// Queue payload. Results travel back only through persisted state.
struct Job {
    JobKind kind = JobKind::BUILD;
    std::string target;          // Compiler id or submission job id
    std::string image_tag;       // CLEANUP only
    int attempt = 0;

    static Job build(const std::string& compiler_id);
    static Job execute(const std::string& submission_id);
    static Job cleanup(const std::string& compiler_id, const std::string& image_tag);

    std::string describe() const;
};

} // namespace kiln
