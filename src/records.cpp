#include "records.h"
#include "jobs.h"
#include <stdexcept>

namespace kiln {

std::string to_string(BuildStatus status) {
    switch (status) {
        case BuildStatus::PENDING: return "pending";
        case BuildStatus::BUILDING: return "building";
        case BuildStatus::READY: return "ready";
        case BuildStatus::FAILED: return "failed";
    }
    return "pending";
}

BuildStatus build_status_from_string(const std::string& value) {
    if (value == "pending") return BuildStatus::PENDING;
    if (value == "building") return BuildStatus::BUILDING;
    if (value == "ready") return BuildStatus::READY;
    if (value == "failed") return BuildStatus::FAILED;
    throw std::invalid_argument("Unknown build status: " + value);
}

std::string to_string(SubmissionStatus status) {
    switch (status) {
        case SubmissionStatus::PENDING: return "PENDING";
        case SubmissionStatus::RUNNING: return "RUNNING";
        case SubmissionStatus::COMPLETED: return "COMPLETED";
        case SubmissionStatus::FAILED: return "FAILED";
        case SubmissionStatus::TIMEOUT: return "TIMEOUT";
        case SubmissionStatus::ERROR: return "ERROR";
    }
    return "PENDING";
}

SubmissionStatus submission_status_from_string(const std::string& value) {
    if (value == "PENDING") return SubmissionStatus::PENDING;
    if (value == "RUNNING") return SubmissionStatus::RUNNING;
    if (value == "COMPLETED") return SubmissionStatus::COMPLETED;
    if (value == "FAILED") return SubmissionStatus::FAILED;
    if (value == "TIMEOUT") return SubmissionStatus::TIMEOUT;
    if (value == "ERROR") return SubmissionStatus::ERROR;
    throw std::invalid_argument("Unknown submission status: " + value);
}

bool is_terminal(SubmissionStatus status) {
    return status == SubmissionStatus::COMPLETED ||
           status == SubmissionStatus::FAILED ||
           status == SubmissionStatus::TIMEOUT ||
           status == SubmissionStatus::ERROR;
}

std::string to_string(JobKind kind) {
    switch (kind) {
        case JobKind::BUILD: return "build";
        case JobKind::EXECUTE: return "execute";
        case JobKind::CLEANUP: return "cleanup";
    }
    return "build";
}

JobKind job_kind_from_string(const std::string& value) {
    if (value == "build") return JobKind::BUILD;
    if (value == "execute") return JobKind::EXECUTE;
    if (value == "cleanup") return JobKind::CLEANUP;
    throw std::invalid_argument("Unknown job kind: " + value);
}

Job Job::build(const std::string& compiler_id) {
    Job job;
    job.kind = JobKind::BUILD;
    job.target = compiler_id;
    return job;
}

Job Job::execute(const std::string& submission_id) {
    Job job;
    job.kind = JobKind::EXECUTE;
    job.target = submission_id;
    return job;
}

Job Job::cleanup(const std::string& compiler_id, const std::string& image_tag) {
    Job job;
    job.kind = JobKind::CLEANUP;
    job.target = compiler_id;
    job.image_tag = image_tag;
    return job;
}

std::string Job::describe() const {
    std::string text = to_string(kind) + "(" + target;
    if (!image_tag.empty()) {
        text += ", " + image_tag;
    }
    text += ")";
    if (attempt > 0) {
        text += " attempt " + std::to_string(attempt + 1);
    }
    return text;
}

} // namespace kiln
