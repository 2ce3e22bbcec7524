#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace kiln {

// Receives one line of builder output at a time, in order
using LineSink = std::function<void(const std::string& line)>;

struct BuildRequest {
    std::string dockerfile_content;
    std::string tag;
    std::chrono::seconds timeout{600};
};

struct BuildResult {
    bool ok = false;
    int exit_code = 0;
    bool timed_out = false;
    std::string error_message;      // Builder could not run at all
    std::string output_tail;        // Last lines of combined output
};

// Produces and manages container images in the artifact store
class ImageBuilder {
public:
    virtual ~ImageBuilder() = default;

    virtual BuildResult build(const BuildRequest& request, const LineSink& on_line) = 0;
    virtual bool exists(const std::string& tag) = 0;
    virtual bool tag(const std::string& source, const std::string& target) = 0;
    virtual bool remove(const std::string& tag) = 0;
};

struct Mount {
    std::string host_path;
    std::string container_path;
    bool read_only = true;
};

struct ResourcePolicy {
    std::string memory_limit = "512m";
    std::string cpu_limit = "1";
    std::chrono::seconds timeout{10};
};

struct RunSpec {
    std::string container_name;
    std::string image_tag;
    std::vector<std::string> command;
    ResourcePolicy policy;
    std::vector<Mount> mounts;
    std::string stdin_payload;      // Code is delivered here, never on disk
    size_t output_limit_bytes = 1024 * 1024;
};

// Why the runtime, rather than the user's program, failed
enum class RunFault {
    NONE,
    RUNTIME_UNAVAILABLE,    // Transient: daemon unreachable, spawn failed
    IMAGE_MISSING,
    MOUNT_FAILED,
    RUNTIME_ERROR
};

struct RunResult {
    int exit_code = 0;
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;
    RunFault fault = RunFault::NONE;
    std::string error_message;
    std::chrono::milliseconds wall_time{0};

    bool infrastructure_failed() const { return fault != RunFault::NONE; }
    bool transient() const { return fault == RunFault::RUNTIME_UNAVAILABLE; }
};

// Runs one isolated, network-disabled container to completion or deadline
class ContainerRunner {
public:
    virtual ~ContainerRunner() = default;

    virtual RunResult run(const RunSpec& spec) = 0;

    // Force-remove a container by name. Returns false if nothing was removed.
    virtual bool terminate(const std::string& container_name) = 0;
};

} // namespace kiln
