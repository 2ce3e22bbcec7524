#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "constants.h"
#include "runtime.h"

namespace kiln {

struct SubprocessOptions {
    std::vector<std::string> argv;
    std::string stdin_data;                              // Written, then stdin is closed
    std::optional<std::chrono::milliseconds> timeout;    // Wall clock
    size_t output_limit = MAX_OUTPUT_SIZE;               // Per stream; excess is drained

    // Receives complete lines from stdout and stderr, interleaved as read
    LineSink on_line;

    // Runs once when the deadline passes, before the process group is killed
    std::function<void()> on_timeout;
};

struct SubprocessResult {
    int exit_code = -1;             // Negative signal number if killed
    std::string stdout_output;
    std::string stderr_output;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    bool timed_out = false;
    std::string error_message;      // Set when the program could not be started
    std::chrono::milliseconds wall_time{0};

    bool started() const { return error_message.empty(); }
};

// fork/exec with piped stdio and a hard deadline
class Subprocess {
public:
    static SubprocessResult run(const SubprocessOptions& options);
};

} // namespace kiln
