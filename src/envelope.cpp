#include "runlet/execution.hpp"

#include <algorithm>

namespace runlet {

    namespace detail {

        static int64_t elapsed_ms(execution_clock::time_point started_at) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(execution_clock::now() - started_at);
            return std::max<int64_t>(elapsed.count(), 0);
        }

    }  // namespace detail

    execution_result build_execution_result(
            process::process_outcome outcome, execution_clock::time_point started_at) {
        if (outcome.spawn_error) {
            return build_failure_result(std::move(*outcome.spawn_error), started_at);
        }

        execution_result result{};
        result.exit_code = outcome.exit_code;
        result.success = outcome.exit_code.has_value() && *outcome.exit_code == 0;
        result.stdout_text = std::move(outcome.stdout_text);
        result.stderr_text = std::move(outcome.stderr_text);
        result.execution_time_ms = detail::elapsed_ms(started_at);
        return result;
    }

    execution_result build_failure_result(std::string message, execution_clock::time_point started_at) {
        execution_result result{};
        result.success = false;
        result.error_message = std::move(message);
        result.execution_time_ms = detail::elapsed_ms(started_at);
        return result;
    }

}  // namespace runlet
