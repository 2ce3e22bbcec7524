#include "build_manager.h"
#include "errors.h"
#include "image_tag.h"
#include <iostream>
#include <optional>
#include <sstream>
#include <vector>

namespace kiln {

namespace {

const std::string TRUNCATION_MARKER = "[... earlier build output truncated ...]\n";

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

std::string to_string(BuildOutcome outcome) {
    switch (outcome) {
        case BuildOutcome::BUILT: return "built";
        case BuildOutcome::REUSED: return "reused";
        case BuildOutcome::FAILED: return "failed";
        case BuildOutcome::SKIPPED: return "skipped";
        case BuildOutcome::NOT_FOUND: return "not found";
    }
    return "unknown";
}

BuildManager::BuildManager(StateStore& store, ImageBuilder& builder, BuildSettings settings)
    : store_(store), builder_(builder), settings_(std::move(settings)) {}

std::string BuildManager::append_log(const std::string& logs, const std::string& line,
                                     size_t max_bytes) {
    std::string body = logs;
    bool truncated = body.compare(0, TRUNCATION_MARKER.size(), TRUNCATION_MARKER) == 0;
    if (truncated) {
        body.erase(0, TRUNCATION_MARKER.size());
    }
    body += line;
    body += '\n';

    if (!truncated && body.size() <= max_bytes) {
        return body;
    }

    size_t budget = max_bytes > TRUNCATION_MARKER.size() ? max_bytes - TRUNCATION_MARKER.size() : 0;
    if (body.size() > budget) {
        size_t cut = body.size() - budget;
        // Drop whole lines where possible
        size_t newline = body.find('\n', cut);
        if (newline != std::string::npos && newline + 1 < body.size()) {
            cut = newline + 1;
        }
        body.erase(0, cut);
    }
    return TRUNCATION_MARKER + body;
}

std::string BuildManager::summarize_error(const std::string& message, const std::string& output_tail,
                                          size_t max_bytes) {
    std::string summary = message.empty() ? "Build failed" : message;

    auto lines = split_lines(output_tail);
    size_t first = lines.size() > BUILD_ERROR_TAIL_LINES ? lines.size() - BUILD_ERROR_TAIL_LINES : 0;
    for (size_t i = first; i < lines.size(); i++) {
        summary += "\n" + lines[i];
    }

    if (summary.size() > max_bytes && max_bytes > 3) {
        summary = "..." + summary.substr(summary.size() - (max_bytes - 3));
    }
    return summary;
}

void BuildManager::log_line(const std::string& compiler_id, const std::string& line) {
    // Failing to persist progress must not abort the build itself
    try {
        store_.update_compiler(compiler_id, [&](Compiler& compiler) {
            if (compiler.build_status != BuildStatus::BUILDING) {
                return false;
            }
            compiler.build_logs = append_log(compiler.build_logs, line, settings_.log_max_bytes);
            return true;
        });
    } catch (const StoreError& e) {
        std::cerr << "[BuildManager] Could not persist build log for " << compiler_id
                  << ": " << e.what() << std::endl;
    }
}

BuildOutcome BuildManager::build(const std::string& compiler_id) {
    Compiler snapshot;
    auto started_at = std::chrono::system_clock::now();

    // Only pending|failed -> building. A job for a ready compiler is a
    // redelivered duplicate; rebuilds reset the record to pending first.
    std::optional<BuildStatus> seen;
    bool claimed = store_.update_compiler(compiler_id, [&](Compiler& compiler) {
        seen = compiler.build_status;
        if (compiler.build_status == BuildStatus::BUILDING ||
            compiler.build_status == BuildStatus::READY) {
            return false;
        }
        compiler.build_status = BuildStatus::BUILDING;
        compiler.build_error.reset();
        compiler.build_logs = "Building image for compiler '" + compiler_id + "'\n";
        compiler.build_started_at = started_at;
        snapshot = compiler;
        return true;
    });

    if (!claimed) {
        if (!seen) {
            std::cerr << "[BuildManager] Compiler not found: " << compiler_id << std::endl;
            return BuildOutcome::NOT_FOUND;
        }
        if (*seen == BuildStatus::READY) {
            std::cout << "[BuildManager] Compiler " << compiler_id
                      << " is already ready, dropping stale build job" << std::endl;
            return BuildOutcome::SKIPPED;
        }
        std::cout << "[BuildManager] Build already in progress for " << compiler_id
                  << ", skipping" << std::endl;
        return BuildOutcome::SKIPPED;
    }

    std::cout << "[BuildManager] Building compiler: " << compiler_id << std::endl;

    try {
        ImageDefinition definition = ImageDefinition::from_compiler(snapshot);
        std::string tag = definition.image_tag(settings_.image_prefix);

        if (builder_.exists(tag)) {
            std::cout << "[BuildManager] Reusing cached image " << tag << std::endl;
            log_line(compiler_id, "Reusing cached image " + tag);
            return finish_ready(snapshot, tag, BuildOutcome::REUSED);
        }

        std::string staging = definition.staging_tag(settings_.image_prefix, ++staging_counter_);
        log_line(compiler_id, "Building " + tag);

        BuildRequest request;
        request.dockerfile_content = snapshot.dockerfile_content;
        request.tag = staging;
        request.timeout = settings_.build_timeout;

        BuildResult result = builder_.build(request, [&](const std::string& line) {
            log_line(compiler_id, line);
        });

        if (!result.ok) {
            builder_.remove(staging);
            return finish_failed(compiler_id,
                                 summarize_error(result.error_message, result.output_tail,
                                                 settings_.error_max_bytes));
        }

        // Promote: the final tag only ever points at a finished image
        if (!builder_.tag(staging, tag)) {
            builder_.remove(staging);
            return finish_failed(compiler_id, "Failed to promote image " + staging + " to " + tag);
        }
        builder_.remove(staging);
        return finish_ready(snapshot, tag, BuildOutcome::BUILT);
    } catch (const std::exception& e) {
        return finish_failed(compiler_id, std::string("Build error: ") + e.what());
    }
}

BuildOutcome BuildManager::finish_ready(const Compiler& before, const std::string& tag,
                                        BuildOutcome outcome) {
    auto now = std::chrono::system_clock::now();
    bool committed = store_.update_compiler(before.id, [&](Compiler& compiler) {
        if (compiler.build_status != BuildStatus::BUILDING) {
            return false;
        }
        compiler.build_status = BuildStatus::READY;
        compiler.build_error.reset();
        compiler.image_tag = tag;
        compiler.built_at = now;
        compiler.build_started_at.reset();
        compiler.build_logs = append_log(compiler.build_logs, "Build complete: " + tag,
                                         settings_.log_max_bytes);
        return true;
    });

    if (!committed) {
        std::cerr << "[BuildManager] Compiler " << before.id
                  << " changed during build; discarding " << tag << std::endl;
        remove_artifact(before.id, tag);
        return BuildOutcome::SKIPPED;
    }

    std::cout << "[BuildManager] Compiler " << before.id << " ready: " << tag << std::endl;

    if (!before.image_tag.empty() && before.image_tag != tag) {
        remove_artifact(before.id, before.image_tag);
    }
    return outcome;
}

BuildOutcome BuildManager::finish_failed(const std::string& compiler_id, const std::string& error) {
    std::cerr << "[BuildManager] Build failed for " << compiler_id << ": "
              << error.substr(0, error.find('\n')) << std::endl;

    store_.update_compiler(compiler_id, [&](Compiler& compiler) {
        if (compiler.build_status != BuildStatus::BUILDING) {
            return false;
        }
        // image_tag keeps pointing at the last good artifact
        compiler.build_status = BuildStatus::FAILED;
        compiler.build_error = error;
        compiler.build_started_at.reset();
        compiler.build_logs = append_log(compiler.build_logs, "Build failed", settings_.log_max_bytes);
        return true;
    });
    return BuildOutcome::FAILED;
}

bool BuildManager::remove_artifact(const std::string& compiler_id, const std::string& image_tag) {
    if (image_tag.empty()) {
        return false;
    }
    for (const auto& compiler : store_.list_compilers()) {
        if (compiler.image_tag == image_tag) {
            std::cout << "[BuildManager] Keeping " << image_tag << ", still used by "
                      << compiler.id << std::endl;
            return false;
        }
    }

    if (!builder_.remove(image_tag)) {
        std::cerr << "[BuildManager] Could not remove image " << image_tag
                  << " (compiler " << compiler_id << ")" << std::endl;
        return false;
    }
    std::cout << "[BuildManager] Removed image " << image_tag << std::endl;
    return true;
}

} // namespace kiln
