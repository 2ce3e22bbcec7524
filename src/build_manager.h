#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include "constants.h"
#include "runtime.h"
#include "state_store.h"

namespace kiln {

enum class BuildOutcome {
    BUILT,          // New image built and promoted
    REUSED,         // Artifact for this definition already existed
    FAILED,
    SKIPPED,        // Another build holds the compiler
    NOT_FOUND
};

std::string to_string(BuildOutcome outcome);

struct BuildSettings {
    std::string image_prefix = DEFAULT_IMAGE_PREFIX;
    std::chrono::seconds build_timeout{DEFAULT_BUILD_TIMEOUT_SECONDS};
    size_t log_max_bytes = MAX_BUILD_LOG_SIZE;
    size_t error_max_bytes = MAX_BUILD_ERROR_SIZE;
};

// Drives the compiler build state machine:
//   pending|failed -> building -> ready|failed
// The transition into building is a compare-and-set on the state store,
// so duplicate deliveries (in any process) build at most once at a time.
class BuildManager {
public:
    BuildManager(StateStore& store, ImageBuilder& builder, BuildSettings settings = {});

    BuildOutcome build(const std::string& compiler_id);

    // Remove an artifact left behind by a deleted or rebuilt compiler.
    // Kept if some compiler record still promotes the same tag.
    bool remove_artifact(const std::string& compiler_id, const std::string& image_tag);

    // Append one line to bounded build logs. Once over `max_bytes` the
    // oldest lines are dropped and a truncation marker leads the text.
    static std::string append_log(const std::string& logs, const std::string& line, size_t max_bytes);

    // Short failure summary: the error plus the last lines of output
    static std::string summarize_error(const std::string& message, const std::string& output_tail,
                                       size_t max_bytes);

private:
    void log_line(const std::string& compiler_id, const std::string& line);
    BuildOutcome finish_ready(const Compiler& before, const std::string& tag, BuildOutcome outcome);
    BuildOutcome finish_failed(const std::string& compiler_id, const std::string& error);

    StateStore& store_;
    ImageBuilder& builder_;
    BuildSettings settings_;
    std::atomic<unsigned long> staging_counter_{0};
};

} // namespace kiln
