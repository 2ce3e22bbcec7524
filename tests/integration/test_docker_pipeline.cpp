#include <gtest/gtest.h>
#include "build_manager.h"
#include "docker_runtime.h"
#include "execution_manager.h"
#include "file_state_store.h"
#include "staging.h"
#include "subprocess.h"
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace kiln {
namespace {

// Runs against a real docker daemon. Skipped where none is reachable.
class DockerPipelineTest : public ::testing::Test {
protected:
    static bool docker_available() {
        SubprocessOptions options;
        options.argv = {"docker", "info", "--format", "{{.ServerVersion}}"};
        options.timeout = std::chrono::seconds(10);
        auto result = Subprocess::run(options);
        return result.started() && result.exit_code == 0;
    }

    void SetUp() override {
        if (!docker_available()) {
            GTEST_SKIP() << "docker daemon not available";
        }
        base = fs::temp_directory_path() / ("kiln_docker_test_" + std::to_string(::getpid()));
        fs::remove_all(base);
        store = std::make_unique<FileStateStore>((base / "state").string());
        staging = std::make_unique<StagingArea>((base / "staging").string());

        BuildSettings build_settings;
        build_settings.image_prefix = "kiln-test";
        build_settings.build_timeout = std::chrono::seconds(300);
        builds = std::make_unique<BuildManager>(*store, builder, build_settings);
        executions = std::make_unique<ExecutionManager>(*store, runner, *staging);
    }

    void TearDown() override {
        if (!store) {
            return;
        }
        for (const auto& compiler : store->list_compilers()) {
            if (!compiler.image_tag.empty()) {
                builder.remove(compiler.image_tag);
            }
        }
        executions.reset();
        builds.reset();
        staging.reset();
        store.reset();
        fs::remove_all(base);
    }

    void register_python(int timeout_seconds) {
        Compiler compiler;
        compiler.id = "python-3.11";
        compiler.name = "Python 3.11";
        compiler.version = "3.11";
        compiler.dockerfile_content = "FROM python:3.11-slim\n";
        compiler.run_command = {"python", "-"};
        compiler.timeout_seconds = timeout_seconds;
        store->put_compiler(compiler);
    }

    void submit(const std::string& job_id, const std::string& code) {
        Submission submission;
        submission.job_id = job_id;
        submission.code = code;
        submission.language = "python-3.11";
        store->put_submission(submission);
    }

    fs::path base;
    DockerImageBuilder builder;
    DockerContainerRunner runner;
    std::unique_ptr<FileStateStore> store;
    std::unique_ptr<StagingArea> staging;
    std::unique_ptr<BuildManager> builds;
    std::unique_ptr<ExecutionManager> executions;
};

TEST_F(DockerPipelineTest, PythonHelloWorld) {
    // Given: A python compiler built from its Dockerfile
    register_python(10);
    ASSERT_NE(builds->build("python-3.11"), BuildOutcome::FAILED)
        << store->get_compiler("python-3.11")->build_error.value_or("");
    ASSERT_EQ(store->get_compiler("python-3.11")->build_status, BuildStatus::READY);

    // When: Running print('hi')
    submit("job-hello", "print('hi')");
    EXPECT_EQ(executions->execute("job-hello"), ExecutionOutcome::COMPLETED);

    // Then: Exactly "hi\n" on stdout and nothing on stderr
    auto submission = store->get_submission("job-hello");
    EXPECT_EQ(submission->output_stdout, std::optional<std::string>("hi\n"));
    EXPECT_FALSE(submission->output_stderr.has_value());
}

TEST_F(DockerPipelineTest, NetworkIsDisabled) {
    register_python(10);
    ASSERT_NE(builds->build("python-3.11"), BuildOutcome::FAILED);

    submit("job-net", "import socket\nsocket.create_connection(('1.1.1.1', 53), timeout=2)");
    EXPECT_EQ(executions->execute("job-net"), ExecutionOutcome::FAILED);
}

TEST_F(DockerPipelineTest, UploadedFilesReadableThenRemoved) {
    register_python(10);
    ASSERT_NE(builds->build("python-3.11"), BuildOutcome::FAILED);

    submit("job-files", "print(open('/sandbox/files/data.csv').read(), end='')");
    staging->stage_file("job-files", "data.csv", "a,b\n1,2\n");
    fs::path dir = staging->root() / "job-files";
    store->update_submission("job-files", [&](Submission& s) {
        s.files_directory = dir.string();
        return true;
    });

    EXPECT_EQ(executions->execute("job-files"), ExecutionOutcome::COMPLETED);
    EXPECT_EQ(store->get_submission("job-files")->output_stdout, std::optional<std::string>("a,b\n1,2\n"));
    EXPECT_FALSE(fs::exists(dir));
}

TEST_F(DockerPipelineTest, SleepPastDeadlineTimesOut) {
    // Given: A ten second policy and a program sleeping for thirty
    register_python(10);
    ASSERT_NE(builds->build("python-3.11"), BuildOutcome::FAILED);
    submit("job-sleep", "import time\nprint('start', flush=True)\ntime.sleep(30)");

    // When: Executing
    auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(executions->execute("job-sleep"), ExecutionOutcome::TIMEOUT);

    // Then: Cut off near ten seconds, well before thirty
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(25));
    auto submission = store->get_submission("job-sleep");
    EXPECT_EQ(submission->status, SubmissionStatus::TIMEOUT);
    EXPECT_EQ(submission->output_stderr,
              std::optional<std::string>("Execution timed out after 10 seconds."));
}

TEST_F(DockerPipelineTest, BadBaseImageFailsBuild) {
    Compiler compiler;
    compiler.id = "broken";
    compiler.name = "Broken";
    compiler.dockerfile_content = "FROM kiln-nonexistent-base-image:does-not-exist\n";
    compiler.run_command = {"true"};
    store->put_compiler(compiler);

    EXPECT_EQ(builds->build("broken"), BuildOutcome::FAILED);

    auto after = store->get_compiler("broken");
    EXPECT_EQ(after->build_status, BuildStatus::FAILED);
    ASSERT_TRUE(after->build_error.has_value());
    EXPECT_FALSE(after->build_error->empty());
    EXPECT_TRUE(after->image_tag.empty());
}

} // namespace
} // namespace kiln
