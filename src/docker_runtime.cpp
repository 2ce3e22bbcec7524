#include "docker_runtime.h"
#include "file_utils.h"
#include <cstdlib>
#include <cstring>
#include <deque>
#include <filesystem>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

namespace kiln {

namespace {

constexpr size_t OUTPUT_TAIL_LINES = 40;

// Build context directory removed when the build returns
class TempContext {
public:
    TempContext() {
        std::string pattern = (fs::temp_directory_path() / "kiln-build-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (!mkdtemp(buffer.data())) {
            throw std::runtime_error(std::string("Failed to create build context: ") +
                                     std::strerror(errno));
        }
        path_ = buffer.data();
    }

    ~TempContext() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempContext(const TempContext&) = delete;
    TempContext& operator=(const TempContext&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

SubprocessResult run_quiet(const std::vector<std::string>& argv) {
    SubprocessOptions options;
    options.argv = argv;
    options.timeout = std::chrono::seconds(60);
    options.output_limit = 64 * 1024;
    return Subprocess::run(options);
}

} // namespace

// DockerImageBuilder

DockerImageBuilder::DockerImageBuilder(DockerOptions options)
    : options_(std::move(options)) {}

BuildResult DockerImageBuilder::build(const BuildRequest& request, const LineSink& on_line) {
    BuildResult result;

    std::unique_ptr<TempContext> context;
    try {
        context = std::make_unique<TempContext>();
        FileUtils::write_file_atomic(context->path() / "Dockerfile", request.dockerfile_content);
    } catch (const std::exception& e) {
        result.error_message = e.what();
        return result;
    }

    std::deque<std::string> tail;
    SubprocessOptions options;
    options.argv = {options_.binary, "build", "--progress=plain",
                    "-t", request.tag, context->path().string()};
    options.timeout = request.timeout;
    options.output_limit = 0;  // Everything goes through on_line
    options.on_line = [&](const std::string& line) {
        tail.push_back(line);
        if (tail.size() > OUTPUT_TAIL_LINES) {
            tail.pop_front();
        }
        if (on_line) {
            on_line(line);
        }
    };

    std::cout << "[Docker] Building " << request.tag << std::endl;
    SubprocessResult proc = Subprocess::run(options);

    for (const auto& line : tail) {
        result.output_tail += line + "\n";
    }
    result.exit_code = proc.exit_code;
    result.timed_out = proc.timed_out;

    if (!proc.started()) {
        result.error_message = proc.error_message;
    } else if (proc.timed_out) {
        result.error_message = "Build exceeded " + std::to_string(request.timeout.count()) + " seconds";
    } else if (proc.exit_code != 0) {
        result.error_message = "docker build exited with code " + std::to_string(proc.exit_code);
    } else {
        result.ok = true;
    }
    return result;
}

bool DockerImageBuilder::exists(const std::string& tag) {
    auto result = run_quiet({options_.binary, "image", "inspect", "--format", "{{.Id}}", tag});
    return result.started() && result.exit_code == 0;
}

bool DockerImageBuilder::tag(const std::string& source, const std::string& target) {
    auto result = run_quiet({options_.binary, "tag", source, target});
    if (!result.started() || result.exit_code != 0) {
        std::cerr << "[Docker] Failed to tag " << source << " as " << target << ": "
                  << (result.started() ? result.stderr_output : result.error_message) << std::endl;
        return false;
    }
    return true;
}

bool DockerImageBuilder::remove(const std::string& tag) {
    auto result = run_quiet({options_.binary, "rmi", tag});
    return result.started() && result.exit_code == 0;
}

// DockerContainerRunner

DockerContainerRunner::DockerContainerRunner(DockerOptions options)
    : options_(std::move(options)) {}

std::vector<std::string> DockerContainerRunner::build_run_args(const RunSpec& spec) const {
    std::vector<std::string> args = {
        options_.binary, "run",
        "--name", spec.container_name,
        "--rm", "-i",
        "--network=none",
        "--memory", spec.policy.memory_limit,
        "--memory-swap", spec.policy.memory_limit,
        "--cpus", spec.policy.cpu_limit,
        "--read-only",
        "--tmpfs", "/tmp:rw,size=" + options_.scratch_size + ",noexec",
        "--pids-limit", std::to_string(options_.pids_limit),
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "-w", SANDBOX_WORKDIR,
    };
    if (!options_.oci_runtime.empty()) {
        args.push_back("--runtime=" + options_.oci_runtime);
    }
    for (const auto& mount : spec.mounts) {
        args.push_back("-v");
        args.push_back(mount.host_path + ":" + mount.container_path +
                       (mount.read_only ? ":ro" : ""));
    }
    args.push_back(spec.image_tag);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

RunFault DockerContainerRunner::classify(const SubprocessResult& result) {
    if (!result.started()) {
        return RunFault::RUNTIME_UNAVAILABLE;
    }
    if (result.timed_out) {
        return RunFault::NONE;
    }

    const std::string& err = result.stderr_output;
    if (contains(err, "Cannot connect to the Docker daemon") ||
        contains(err, "error during connect")) {
        return RunFault::RUNTIME_UNAVAILABLE;
    }
    if (result.exit_code != DOCKER_DAEMON_ERROR_EXIT) {
        return RunFault::NONE;  // The program's own exit status
    }
    if (contains(err, "Unable to find image") || contains(err, "No such image") ||
        contains(err, "pull access denied")) {
        return RunFault::IMAGE_MISSING;
    }
    if (contains(err, "invalid mount") || contains(err, "bind source path does not exist") ||
        contains(err, "error while creating mount source path")) {
        return RunFault::MOUNT_FAILED;
    }
    return RunFault::RUNTIME_ERROR;
}

RunResult DockerContainerRunner::run(const RunSpec& spec) {
    SubprocessOptions options;
    options.argv = build_run_args(spec);
    options.stdin_data = spec.stdin_payload;
    options.timeout = spec.policy.timeout;
    options.output_limit = spec.output_limit_bytes;

    // Killing the CLI client does not stop the container; remove it by name
    std::string name = spec.container_name;
    options.on_timeout = [this, name] {
        std::cout << "[Docker] Deadline reached, removing " << name << std::endl;
        terminate(name);
    };

    SubprocessResult proc = Subprocess::run(options);

    RunResult result;
    result.exit_code = proc.exit_code;
    result.stdout_output = std::move(proc.stdout_output);
    result.stderr_output = std::move(proc.stderr_output);
    result.timed_out = proc.timed_out;
    result.wall_time = proc.wall_time;
    result.fault = classify(proc);

    if (!proc.started()) {
        result.error_message = proc.error_message;
    } else if (result.fault != RunFault::NONE) {
        result.error_message = result.stderr_output;
    }
    if (proc.stdout_truncated) {
        result.stdout_output += "\n[output truncated]";
    }
    if (proc.stderr_truncated) {
        result.stderr_output += "\n[output truncated]";
    }

    // --rm normally handles this; a killed client can leave it behind
    if (result.timed_out || result.fault != RunFault::NONE) {
        terminate(name);
    }
    return result;
}

bool DockerContainerRunner::terminate(const std::string& container_name) {
    auto result = run_quiet({options_.binary, "rm", "-f", container_name});
    return result.started() && result.exit_code == 0;
}

} // namespace kiln
