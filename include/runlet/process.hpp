#pragma once

#include "config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace runlet::process {

    struct process_spec {
        std::vector<std::string> argv{};
        std::filesystem::path cwd{};
        // nullopt: the child's stdin is /dev/null
        std::optional<std::string> stdin_text{};
        int timeout_ms{default_timeout_ms};
        int kill_grace_ms{2'000};
    };

    /*
     * Raw result of one child process.
     *
     * - spawn_error is set when the child could not be created or talked to
     *   (missing binary, bad cwd, pipe/fork failure); every other field is then empty.
     * - exit_code is set only for a normal exit; a child terminated by a signal
     *   (including the timeout kill) carries term_signal instead.
     * - timed_out is informational and only used for logging.
     */
    struct process_outcome {
        std::optional<int> exit_code{};
        std::optional<int> term_signal{};
        std::string stdout_text{};
        std::string stderr_text{};
        std::optional<std::string> spawn_error{};
        bool timed_out{false};
    };

    // Blocks the calling thread until the child reaches a terminal state. Never throws
    // for child-side failures; those are reported through process_outcome.
    process_outcome run_process(const process_spec& spec);

}  // namespace runlet::process
