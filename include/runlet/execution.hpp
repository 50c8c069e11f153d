#pragma once

#include "classifier.hpp"
#include "config.hpp"
#include "process.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace runlet {

    struct execution_request {
        std::string code{};
        int timeout_ms{default_timeout_ms};
        runtime_kind runtime{runtime_kind::node};
    };

    /*
     * Uniform outcome of one execution, whatever runtime or strategy produced it.
     *
     * - success == (exit_code == 0); a signal-terminated child has no exit_code.
     * - error_message is set only when the child could not be spawned or talked to;
     *   stdout/stderr are empty in that case.
     * - execution_time_ms is measured from the moment the request was accepted.
     */
    struct execution_result {
        bool success{false};
        std::string stdout_text{};
        std::string stderr_text{};
        int64_t execution_time_ms{0};
        std::optional<int> exit_code{};
        std::optional<std::string> error_message{};
    };

    using execution_clock = std::chrono::steady_clock;

    // Result envelope: folds a raw process outcome into an execution_result.
    execution_result build_execution_result(
            process::process_outcome outcome, execution_clock::time_point started_at);

    // Same shape for failures that happen before any child exists.
    execution_result build_failure_result(std::string message, execution_clock::time_point started_at);

    // Primary runtime; module sources go through stdin, commonjs sources through a temp file.
    execution_result execute_node(const execution_request& request, const startup_config& cfg);

    // Alternate runtime; always stdin with every permission granted.
    execution_result execute_deno(const execution_request& request, const startup_config& cfg);

    // Dispatches on request.runtime.
    execution_result execute(const execution_request& request, const startup_config& cfg);

}  // namespace runlet
