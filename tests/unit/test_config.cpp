#include <gtest/gtest.h>
#include "config.h"
#include "errors.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace kiln {
namespace {

TEST(ConfigTest, Defaults_AreValid) {
    Config config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.worker_count, DEFAULT_WORKER_COUNT);
    EXPECT_EQ(config.build_log_max_bytes, MAX_BUILD_LOG_SIZE);
    EXPECT_EQ(config.files_mount_path, "/sandbox/files");
    EXPECT_EQ(config.build_timeout(), std::chrono::seconds(600));
}

TEST(ConfigTest, FromJson_OverridesOnlyGivenKeys) {
    // Given: A partial configuration
    Config config = Config::from_json_string(R"({
        "worker_count": 8,
        "oci_runtime": "runsc",
        "build_log_max_bytes": 4096
    })");

    // Then: Given keys change, the rest keep defaults
    EXPECT_EQ(config.worker_count, 8);
    EXPECT_EQ(config.oci_runtime, "runsc");
    EXPECT_EQ(config.build_log_max_bytes, 4096u);
    EXPECT_EQ(config.max_concurrent_executions, DEFAULT_MAX_CONCURRENT_EXECUTIONS);
    EXPECT_EQ(config.docker_binary, "docker");
}

TEST(ConfigTest, FromJson_UnknownKeyRejected) {
    try {
        Config::from_json_string(R"({"worker_cuont": 2})");
        FAIL() << "Typo in key should be rejected";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("worker_cuont"), std::string::npos);
    }
}

TEST(ConfigTest, FromJson_WrongTypeRejected) {
    try {
        Config::from_json_string(R"({"worker_count": "eight"})");
        FAIL() << "String for integer key should be rejected";
    } catch (const ConfigError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("'worker_count'"), std::string::npos) << message;
        EXPECT_EQ(message.find("Config: Config:"), std::string::npos) << "Prefix should appear once";
    }
}

TEST(ConfigTest, FromJson_OutOfRangeRejected) {
    EXPECT_THROW(Config::from_json_string(R"({"worker_count": 0})"), ConfigError);
    EXPECT_THROW(Config::from_json_string(R"({"build_log_max_bytes": 0})"), ConfigError);
    EXPECT_THROW(Config::from_json_string(R"({"files_mount_path": "relative/path"})"), ConfigError);
    EXPECT_NO_THROW(Config::from_json_string(R"({"infra_retry_limit": 0})"))
        << "Zero retries is a valid choice";
}

TEST(ConfigTest, FromJson_MalformedRejected) {
    EXPECT_THROW(Config::from_json_string("{"), ConfigError);
    EXPECT_THROW(Config::from_json_string("[1, 2]"), ConfigError);
}

TEST(ConfigTest, Load_ReadsFileAndReportsMissing) {
    auto path = std::filesystem::temp_directory_path() /
                ("kiln_config_test_" + std::to_string(::getpid()) + ".json");
    std::ofstream(path) << R"({"state_dir": "/tmp/kiln-state", "reaper_interval_seconds": 5})";

    Config config = Config::load(path.string());
    EXPECT_EQ(config.state_dir, "/tmp/kiln-state");
    EXPECT_EQ(config.reaper_interval_seconds, 5);

    std::filesystem::remove(path);
    EXPECT_THROW(Config::load(path.string()), ConfigError);
}

} // namespace
} // namespace kiln
