#pragma once

#include <string>
#include <vector>
#include "runtime.h"
#include "subprocess.h"

namespace kiln {

struct DockerOptions {
    std::string binary = "docker";
    std::string oci_runtime;                // Passed as --runtime when set
    std::string scratch_size = DEFAULT_SCRATCH_SIZE;
    int pids_limit = DEFAULT_PIDS_LIMIT;
};

// Builds and manages images through the docker CLI
class DockerImageBuilder : public ImageBuilder {
public:
    explicit DockerImageBuilder(DockerOptions options = {});

    BuildResult build(const BuildRequest& request, const LineSink& on_line) override;
    bool exists(const std::string& tag) override;
    bool tag(const std::string& source, const std::string& target) override;
    bool remove(const std::string& tag) override;

private:
    DockerOptions options_;
};

// Runs submissions with `docker run`. Code arrives on stdin; staged files
// arrive as read-only bind mounts.
class DockerContainerRunner : public ContainerRunner {
public:
    explicit DockerContainerRunner(DockerOptions options = {});

    RunResult run(const RunSpec& spec) override;
    bool terminate(const std::string& container_name) override;

    // The full argv for `spec`, exposed for tests
    std::vector<std::string> build_run_args(const RunSpec& spec) const;

    // Map a finished docker CLI invocation to the runtime fault, if any
    static RunFault classify(const SubprocessResult& result);

private:
    DockerOptions options_;
};

} // namespace kiln
