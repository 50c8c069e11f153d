#include "utils.hpp"

namespace runlet::test {

    TEST_CASE("006: zero exit is a success", "[006][envelope]") {
        process::process_outcome outcome{};
        outcome.exit_code = 0;
        outcome.stdout_text = "2\n";

        auto result = build_execution_result(std::move(outcome), execution_clock::now());

        CHECK(result.success);
        CHECK(result.exit_code == 0);
        CHECK(result.stdout_text == "2\n");
        CHECK(result.stderr_text.empty());
        CHECK_FALSE(result.error_message);
        CHECK(result.execution_time_ms >= 0);
    }

    TEST_CASE("006: non-zero exit keeps both streams", "[006][envelope]") {
        process::process_outcome outcome{};
        outcome.exit_code = 1;
        outcome.stdout_text = "partial\n";
        outcome.stderr_text = "ReferenceError: x is not defined\n";

        auto result = build_execution_result(std::move(outcome), execution_clock::now());

        CHECK_FALSE(result.success);
        CHECK(result.exit_code == 1);
        CHECK(result.stdout_text == "partial\n");
        CHECK(result.stderr_text == "ReferenceError: x is not defined\n");
        CHECK_FALSE(result.error_message);
    }

    TEST_CASE("006: signal termination has no exit code", "[006][envelope]") {
        process::process_outcome outcome{};
        outcome.term_signal = SIGKILL;
        outcome.timed_out = true;
        outcome.stdout_text = "tick\n";

        auto result = build_execution_result(std::move(outcome), execution_clock::now());

        CHECK_FALSE(result.success);
        CHECK_FALSE(result.exit_code);
        CHECK(result.stdout_text == "tick\n");
        CHECK_FALSE(result.error_message);
    }

    TEST_CASE("006: spawn failure carries the message and empty streams", "[006][envelope]") {
        process::process_outcome outcome{};
        outcome.spawn_error = "spawn node failed: No such file or directory";
        outcome.stdout_text = "stale";

        auto result = build_execution_result(std::move(outcome), execution_clock::now());

        CHECK_FALSE(result.success);
        CHECK_FALSE(result.exit_code);
        CHECK(result.stdout_text.empty());
        CHECK(result.stderr_text.empty());
        CHECK(result.error_message == "spawn node failed: No such file or directory");
    }

    TEST_CASE("006: elapsed time is measured from the start point", "[006][envelope]") {
        auto started_at = execution_clock::now() - std::chrono::milliseconds{250};

        auto result = build_failure_result("failed to stage source file: disk full", started_at);

        CHECK_FALSE(result.success);
        CHECK(result.execution_time_ms >= 250);
        CHECK(result.error_message == "failed to stage source file: disk full");
    }

}  // namespace runlet::test
