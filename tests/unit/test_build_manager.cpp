#include <gtest/gtest.h>
#include "build_manager.h"
#include "fakes.h"
#include "file_state_store.h"
#include "image_tag.h"
#include <filesystem>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace kiln {
namespace {

class BuildManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / ("kiln_build_test_" + std::to_string(::getpid()));
        fs::remove_all(root);
        store = std::make_unique<FileStateStore>(root.string());
        manager = std::make_unique<BuildManager>(*store, builder);
    }

    void TearDown() override {
        manager.reset();
        store.reset();
        fs::remove_all(root);
    }

    Compiler add_compiler(const std::string& id, const std::string& dockerfile = "FROM python:3.11-slim\n") {
        Compiler compiler;
        compiler.id = id;
        compiler.name = id;
        compiler.dockerfile_content = dockerfile;
        compiler.run_command = {"python", "-"};
        store->put_compiler(compiler);
        return compiler;
    }

    std::string expected_tag(const Compiler& compiler) {
        return ImageDefinition::from_compiler(compiler).image_tag("kiln");
    }

    Compiler load(const std::string& id) {
        auto compiler = store->get_compiler(id);
        EXPECT_TRUE(compiler.has_value());
        return compiler.value_or(Compiler{});
    }

    fs::path root;
    std::unique_ptr<FileStateStore> store;
    fakes::FakeImageBuilder builder;
    std::unique_ptr<BuildManager> manager;
};

// ============================================================================
// Successful Builds
// ============================================================================

TEST_F(BuildManagerTest, Build_SuccessPromotesTagAndMarksReady) {
    // Given: A pending compiler
    Compiler compiler = add_compiler("python-3.11");
    builder.output_lines = {"Step 1/1 : FROM python:3.11-slim", "Successfully built"};

    // When: Building it
    BuildOutcome outcome = manager->build("python-3.11");

    // Then: Ready with the deterministic tag, staging tag cleaned up
    EXPECT_EQ(outcome, BuildOutcome::BUILT);
    Compiler after = load("python-3.11");
    EXPECT_EQ(after.build_status, BuildStatus::READY);
    EXPECT_EQ(after.image_tag, expected_tag(compiler));
    EXPECT_FALSE(after.build_error.has_value());
    EXPECT_TRUE(after.built_at.has_value());
    EXPECT_FALSE(after.build_started_at.has_value());

    EXPECT_TRUE(builder.exists(after.image_tag));
    EXPECT_NE(builder.last_request().tag, after.image_tag) << "Builds go to a staging tag first";
    EXPECT_FALSE(builder.exists(builder.last_request().tag)) << "Staging tag removed after promotion";
    EXPECT_EQ(builder.last_request().dockerfile_content, "FROM python:3.11-slim\n");
}

TEST_F(BuildManagerTest, Build_StreamsOutputIntoLogs) {
    add_compiler("python-3.11");
    builder.output_lines = {"Step 1/2 : FROM python:3.11-slim", "Step 2/2 : RUN pip install numpy"};

    manager->build("python-3.11");

    std::string logs = load("python-3.11").build_logs;
    EXPECT_EQ(logs.rfind("Building image for compiler 'python-3.11'", 0), 0u) << logs;
    EXPECT_NE(logs.find("RUN pip install numpy"), std::string::npos) << logs;
    EXPECT_NE(logs.find("Build complete"), std::string::npos) << logs;
}

TEST_F(BuildManagerTest, Build_ReusesExistingArtifact) {
    // Given: The image for this exact definition is already present
    Compiler compiler = add_compiler("python-3.11");
    builder.add_image(expected_tag(compiler));

    // When: Building
    BuildOutcome outcome = manager->build("python-3.11");

    // Then: No builder invocation, compiler is ready on the same tag
    EXPECT_EQ(outcome, BuildOutcome::REUSED);
    EXPECT_EQ(builder.build_count.load(), 0);
    EXPECT_EQ(load("python-3.11").build_status, BuildStatus::READY);
    EXPECT_EQ(load("python-3.11").image_tag, expected_tag(compiler));
}

TEST_F(BuildManagerTest, Build_EditedDefinitionGetsNewTagAndRemovesOld) {
    // Given: A compiler built once
    add_compiler("python-3.11");
    manager->build("python-3.11");
    std::string old_tag = load("python-3.11").image_tag;

    // When: Its Dockerfile changes and it is rebuilt
    store->update_compiler("python-3.11", [](Compiler& c) {
        c.dockerfile_content = "FROM python:3.12-slim\n";
        c.build_status = BuildStatus::PENDING;
        return true;
    });
    EXPECT_EQ(manager->build("python-3.11"), BuildOutcome::BUILT);

    // Then: A different tag, the superseded image is gone
    std::string new_tag = load("python-3.11").image_tag;
    EXPECT_NE(new_tag, old_tag);
    EXPECT_TRUE(builder.exists(new_tag));
    EXPECT_FALSE(builder.exists(old_tag));
}

// ============================================================================
// Failed Builds
// ============================================================================

TEST_F(BuildManagerTest, Build_FailureRecordsErrorAndKeepsPreviousTag) {
    // Given: A compiler that was ready once
    add_compiler("python-3.11");
    manager->build("python-3.11");
    std::string good_tag = load("python-3.11").image_tag;

    // When: A rebuild of an edited definition fails
    store->update_compiler("python-3.11", [](Compiler& c) {
        c.dockerfile_content = "FROM nonexistent-base-image:latest\n";
        c.build_status = BuildStatus::PENDING;
        return true;
    });
    builder.next_result = fakes::FakeImageBuilder::failure(
        "docker build exited with code 1",
        "pull access denied for nonexistent-base-image\n");
    BuildOutcome outcome = manager->build("python-3.11");

    // Then: Failed with a useful error, last good artifact still recorded
    EXPECT_EQ(outcome, BuildOutcome::FAILED);
    Compiler after = load("python-3.11");
    EXPECT_EQ(after.build_status, BuildStatus::FAILED);
    ASSERT_TRUE(after.build_error.has_value());
    EXPECT_NE(after.build_error->find("exited with code 1"), std::string::npos);
    EXPECT_NE(after.build_error->find("pull access denied"), std::string::npos);
    EXPECT_EQ(after.image_tag, good_tag);
    EXPECT_TRUE(builder.exists(good_tag));
    EXPECT_FALSE(after.build_started_at.has_value());
}

TEST_F(BuildManagerTest, Build_RetryAfterFailureClearsError) {
    add_compiler("python-3.11");
    builder.next_result = fakes::FakeImageBuilder::failure("network hiccup", "");
    ASSERT_EQ(manager->build("python-3.11"), BuildOutcome::FAILED);

    builder.next_result = fakes::FakeImageBuilder::success();
    EXPECT_EQ(manager->build("python-3.11"), BuildOutcome::BUILT);

    Compiler after = load("python-3.11");
    EXPECT_EQ(after.build_status, BuildStatus::READY);
    EXPECT_FALSE(after.build_error.has_value()) << "A new build starts with a clean error";
}

TEST_F(BuildManagerTest, Build_BuilderExceptionBecomesFailure) {
    add_compiler("python-3.11");
    builder.throw_on_build = true;

    EXPECT_EQ(manager->build("python-3.11"), BuildOutcome::FAILED);
    Compiler after = load("python-3.11");
    EXPECT_EQ(after.build_status, BuildStatus::FAILED) << "Never left in building";
    ASSERT_TRUE(after.build_error.has_value());
    EXPECT_NE(after.build_error->find("builder crashed"), std::string::npos);
}

TEST_F(BuildManagerTest, Build_PromotionFailureIsFailure) {
    add_compiler("python-3.11");
    builder.fail_tag = true;

    EXPECT_EQ(manager->build("python-3.11"), BuildOutcome::FAILED);
    EXPECT_EQ(load("python-3.11").build_status, BuildStatus::FAILED);
    EXPECT_TRUE(load("python-3.11").image_tag.empty());
}

TEST_F(BuildManagerTest, Build_MissingCompiler) {
    EXPECT_EQ(manager->build("ghost"), BuildOutcome::NOT_FOUND);
    EXPECT_EQ(builder.build_count.load(), 0);
}

// ============================================================================
// Duplicate Deliveries
// ============================================================================

TEST_F(BuildManagerTest, Build_ConcurrentDuplicatesBuildOnce) {
    // Given: A slow build and the same job delivered to many workers
    add_compiler("python-3.11");
    builder.build_delay = 200ms;

    std::vector<BuildOutcome> outcomes(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < outcomes.size(); i++) {
        threads.emplace_back([&, i] { outcomes[i] = manager->build("python-3.11"); });
    }
    for (auto& t : threads) t.join();

    // Then: Exactly one builder invocation, the rest skipped
    EXPECT_EQ(builder.build_count.load(), 1);
    int built = 0;
    for (auto outcome : outcomes) {
        if (outcome == BuildOutcome::BUILT) built++;
        else EXPECT_EQ(outcome, BuildOutcome::SKIPPED);
    }
    EXPECT_EQ(built, 1);
    EXPECT_EQ(load("python-3.11").build_status, BuildStatus::READY);
}

TEST_F(BuildManagerTest, Build_SkipsWhileAnotherBuildHoldsTheCompiler) {
    add_compiler("python-3.11");
    store->update_compiler("python-3.11", [](Compiler& c) {
        c.build_status = BuildStatus::BUILDING;
        return true;
    });

    EXPECT_EQ(manager->build("python-3.11"), BuildOutcome::SKIPPED);
    EXPECT_EQ(builder.build_count.load(), 0);
}

TEST_F(BuildManagerTest, Build_RedeliveredJobForReadyCompilerIsNoOp) {
    // Given: A compiler that finished building, its image still present
    add_compiler("python-3.11");
    builder.output_lines = {"Step 1/1 : FROM python:3.11-slim", "Successfully built"};
    ASSERT_EQ(manager->build("python-3.11"), BuildOutcome::BUILT);
    Compiler before = load("python-3.11");
    int builds_before = builder.build_count.load();

    // When: The same build job is delivered again
    BuildOutcome outcome = manager->build("python-3.11");

    // Then: Nothing is rebuilt and the record is untouched
    EXPECT_EQ(outcome, BuildOutcome::SKIPPED);
    EXPECT_EQ(builder.build_count.load(), builds_before);
    Compiler after = load("python-3.11");
    EXPECT_EQ(after.build_status, BuildStatus::READY);
    EXPECT_EQ(after.build_logs, before.build_logs) << "Logs of the finished build are kept";
    EXPECT_EQ(after.image_tag, before.image_tag);
    EXPECT_EQ(after.built_at, before.built_at);
    EXPECT_FALSE(after.build_started_at.has_value());
}

TEST_F(BuildManagerTest, Build_StaleJobLeavesReadyCompilerAlone) {
    // Given: A ready compiler whose image has since vanished from the cache
    add_compiler("python-3.11");
    ASSERT_EQ(manager->build("python-3.11"), BuildOutcome::BUILT);
    std::string tag = load("python-3.11").image_tag;
    builder.remove(tag);
    bool saw_building = false;
    builder.on_build = [&](const BuildRequest&) {
        saw_building = load("python-3.11").build_status == BuildStatus::BUILDING;
    };

    // When: A stale build job arrives
    EXPECT_EQ(manager->build("python-3.11"), BuildOutcome::SKIPPED);

    // Then: Executions keep seeing READY; only an explicit reset rebuilds
    EXPECT_FALSE(saw_building);
    EXPECT_EQ(load("python-3.11").build_status, BuildStatus::READY);

    store->update_compiler("python-3.11", [](Compiler& c) {
        c.build_status = BuildStatus::PENDING;
        return true;
    });
    EXPECT_EQ(manager->build("python-3.11"), BuildOutcome::BUILT);
    EXPECT_TRUE(builder.exists(tag));
}

TEST_F(BuildManagerTest, Build_CompilerRemovedDuringBuildDiscardsArtifact) {
    // Given: A compiler deleted while its build runs
    add_compiler("python-3.11");
    builder.on_build = [&](const BuildRequest&) { store->remove_compiler("python-3.11"); };

    // When: The build finishes
    BuildOutcome outcome = manager->build("python-3.11");

    // Then: Nothing is promoted into a record that no longer exists
    EXPECT_EQ(outcome, BuildOutcome::SKIPPED);
    EXPECT_FALSE(store->get_compiler("python-3.11").has_value());
    for (const auto& image : builder.images()) {
        EXPECT_EQ(image.rfind("kiln-python-3.11", 0), std::string::npos) << "Leaked " << image;
    }
}

// ============================================================================
// Log and Error Bounds
// ============================================================================

TEST_F(BuildManagerTest, AppendLog_StaysWithinBoundAndMarksTruncation) {
    std::string logs;
    for (int i = 0; i < 500; i++) {
        logs = BuildManager::append_log(logs, "line " + std::to_string(i) + " of build output", 1024);
    }

    EXPECT_LE(logs.size(), 1024u);
    EXPECT_EQ(logs.rfind("[... earlier build output truncated ...]\n", 0), 0u);
    EXPECT_NE(logs.find("line 499 of build output\n"), std::string::npos) << "Newest line kept";
    EXPECT_EQ(logs.find("line 0 of"), std::string::npos) << "Oldest line dropped";
}

TEST_F(BuildManagerTest, AppendLog_UnderBoundKeepsEverything) {
    std::string logs = BuildManager::append_log("", "one", 1024);
    logs = BuildManager::append_log(logs, "two", 1024);
    EXPECT_EQ(logs, "one\ntwo\n");
}

TEST_F(BuildManagerTest, Build_LogsBoundedBySettings) {
    BuildSettings settings;
    settings.log_max_bytes = 2048;
    manager = std::make_unique<BuildManager>(*store, builder, settings);
    add_compiler("python-3.11");
    for (int i = 0; i < 300; i++) {
        builder.output_lines.push_back("#" + std::to_string(i) + " downloading layer sha256:abcdef");
    }

    manager->build("python-3.11");

    Compiler after = load("python-3.11");
    EXPECT_LE(after.build_logs.size(), 2048u);
    EXPECT_NE(after.build_logs.find("Build complete"), std::string::npos);
}

TEST_F(BuildManagerTest, SummarizeError_KeepsLastLinesWithinBound) {
    std::string tail;
    for (int i = 0; i < 50; i++) {
        tail += "output " + std::to_string(i) + "\n";
    }

    std::string summary = BuildManager::summarize_error("docker build exited with code 1", tail, 4096);
    EXPECT_EQ(summary.rfind("docker build exited with code 1", 0), 0u);
    EXPECT_NE(summary.find("output 49"), std::string::npos);
    EXPECT_EQ(summary.find("output 29\n"), std::string::npos) << "Only the last lines are kept";

    std::string bounded = BuildManager::summarize_error("x", tail, 64);
    EXPECT_EQ(bounded.size(), 64u);
    EXPECT_EQ(bounded.rfind("...", 0), 0u);

    EXPECT_EQ(BuildManager::summarize_error("", "", 64), "Build failed");
}

// ============================================================================
// Artifact Removal
// ============================================================================

TEST_F(BuildManagerTest, RemoveArtifact_SkipsTagStillInUse) {
    // Given: Two compilers sharing one artifact
    add_compiler("a");
    manager->build("a");
    std::string tag = load("a").image_tag;
    add_compiler("b");
    store->update_compiler("b", [&](Compiler& c) {
        c.image_tag = tag;
        return true;
    });

    // When: One is retired
    store->remove_compiler("a");

    // Then: The shared artifact survives
    EXPECT_FALSE(manager->remove_artifact("a", tag));
    EXPECT_TRUE(builder.exists(tag));

    store->remove_compiler("b");
    EXPECT_TRUE(manager->remove_artifact("b", tag));
    EXPECT_FALSE(builder.exists(tag));
}

TEST_F(BuildManagerTest, RemoveArtifact_EmptyOrMissingTag) {
    EXPECT_FALSE(manager->remove_artifact("a", ""));
    EXPECT_FALSE(manager->remove_artifact("a", "kiln-a:0000000000000000"));
}

} // namespace
} // namespace kiln
