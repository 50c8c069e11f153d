#include "runlet/execution.hpp"

#include "runlet/format.hpp"
#include "runlet/temp_artifact.hpp"

#include <exception>
#include <string>
#include <vector>

using namespace runlet::literals;

namespace runlet {

    namespace detail {

        static constexpr auto node_module_flag = "--input-type=module"sv;
        static constexpr auto commonjs_artifact_prefix = "node-exec-"sv;
        static constexpr auto commonjs_artifact_extension = ".cjs"sv;

        static process::process_spec base_spec(const execution_request& request, const startup_config& cfg) {
            process::process_spec spec{};
            spec.cwd = cfg.working_dir;
            spec.timeout_ms = request.timeout_ms;
            spec.kill_grace_ms = cfg.kill_grace_ms;
            return spec;
        }

        static execution_result run_node_stdin(
                const execution_request& request, const startup_config& cfg, execution_clock::time_point started_at) {
            auto spec = base_spec(request, cfg);
            spec.argv = {cfg.node_path, std::string{node_module_flag}};
            spec.stdin_text = request.code;
            return build_execution_result(process::run_process(spec), started_at);
        }

        static execution_result run_node_file(
                const execution_request& request, const startup_config& cfg, execution_clock::time_point started_at) {
            std::optional<temp_artifact> artifact{};
            try {
                artifact.emplace(temp_artifact::create(
                        cfg.temp_dir(), commonjs_artifact_prefix, commonjs_artifact_extension, request.code));
            } catch (const std::exception& e) {
                return build_failure_result("failed to stage source file: {}"_format(e.what()), started_at);
            }

            auto spec = base_spec(request, cfg);
            spec.argv = {cfg.node_path, artifact->path().string()};
            auto result = build_execution_result(process::run_process(spec), started_at);
            artifact.reset();
            return result;
        }

    }  // namespace detail

    execution_result execute_node(const execution_request& request, const startup_config& cfg) {
        auto started_at = execution_clock::now();
        auto kind = classify_source(request.code);
        debug_log("node execution strategy: ", to_string(kind));

        if (kind == source_kind::commonjs) {
            return detail::run_node_file(request, cfg, started_at);
        }
        return detail::run_node_stdin(request, cfg, started_at);
    }

    execution_result execute_deno(const execution_request& request, const startup_config& cfg) {
        auto started_at = execution_clock::now();

        auto spec = detail::base_spec(request, cfg);
        spec.argv = {cfg.deno_path, "run", "--allow-all", "-"};
        spec.stdin_text = request.code;
        return build_execution_result(process::run_process(spec), started_at);
    }

    execution_result execute(const execution_request& request, const startup_config& cfg) {
        switch (request.runtime) {
            case runtime_kind::node:
                return execute_node(request, cfg);
            case runtime_kind::deno:
                return execute_deno(request, cfg);
        }
        return execute_node(request, cfg);
    }

}  // namespace runlet
