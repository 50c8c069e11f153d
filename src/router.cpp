#include "runlet/router.hpp"

#include "runlet/format.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <chrono>
#include <climits>
#include <cmath>
#include <exception>
#include <iostream>

using namespace runlet::literals;
namespace fs = std::filesystem;

namespace runlet {

    namespace detail {

        struct execute_args {
            std::optional<std::string> code{};
            std::optional<double> timeout{};
            struct glaze {
                using T = execute_args;
                static constexpr auto value = glz::object(&T::code, &T::timeout);
            };
        };

        struct search_args {
            std::optional<std::string> query{};
            std::optional<std::string> folders{};
            std::optional<std::string> extensions{};
            std::optional<std::string> ignores{};
            std::optional<double> topK{};
            struct glaze {
                using T = search_args;
                static constexpr auto value =
                        glz::object(&T::query, &T::folders, &T::extensions, &T::ignores, "topK", &T::topK);
            };
        };

        struct tool_alias {
            std::string_view name;
            tool_kind kind;
        };

        static constexpr tool_alias tool_aliases[] = {
                {"executenodejs"sv, tool_kind::execute_node},
                {"execute"sv, tool_kind::execute_node},
                {"mcp_mcp_repl_execute"sv, tool_kind::execute_node},
                {"executedeno"sv, tool_kind::execute_deno},
                {"mcp_mcp_repl_executedeno"sv, tool_kind::execute_deno},
                {"searchcode"sv, tool_kind::search_code},
                {"mcp_mcp_repl_searchcode"sv, tool_kind::search_code},
        };

        static constexpr auto error_prefix = "ERROR: "sv;

        template <typename T>
        static T parse_arguments(std::string_view raw, tool_kind kind) {
            T args{};
            auto body = utils::trim_view(raw);
            if (body.empty() || body == "null"sv) {
                return args;
            }
            std::string buffer{body};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(args, buffer);
            if (ec) {
                throw std::invalid_argument(
                        "Invalid arguments for {} tool: {}"_format(to_string(kind), glz::format_error(ec, buffer)));
            }
            return args;
        }

        static int resolve_timeout(const std::optional<double>& requested, int fallback) {
            if (!requested || !std::isfinite(*requested) || *requested < 1.0) {
                return fallback;
            }
            return static_cast<int>(std::min(*requested, static_cast<double>(INT_MAX)));
        }

        static std::vector<std::string> resolve_list(
                const std::optional<std::string>& csv, const std::vector<std::string>& fallback) {
            if (!csv) {
                return fallback;
            }
            auto items = utils::split_csv(*csv);
            return items.empty() ? fallback : items;
        }

        static std::string error_text(std::string_view message) { return "{}{}"_format(error_prefix, message); }

        static int64_t elapsed_since(std::chrono::steady_clock::time_point start) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
                    .count();
        }

    }  // namespace detail

    unknown_tool::unknown_tool(std::string name) :
            std::runtime_error{"Unknown tool: {}"_format(name)}, name{std::move(name)} {}

    std::optional<tool_kind> resolve_tool(std::string_view name) {
        for (const auto& alias : detail::tool_aliases) {
            if (alias.name == name) {
                return alias.kind;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> render_execution(const execution_result& result, runtime_kind runtime) {
        std::vector<std::string> segments{};
        if (!result.stdout_text.empty()) {
            segments.emplace_back(utils::trim_view(result.stdout_text));
        }
        if (!result.stderr_text.empty()) {
            segments.push_back(detail::error_text(utils::trim_view(result.stderr_text)));
        }
        if (!result.success && result.error_message) {
            segments.push_back(detail::error_text(*result.error_message));
        }

        auto label = runtime == runtime_kind::deno ? "Deno execution"sv : "Execution"sv;
        segments.push_back("{} completed in {}ms with exit code {}"_format(
                label, result.execution_time_ms, result.exit_code.value_or(0)));
        return segments;
    }

    std::vector<std::string> render_search(
            std::string_view query,
            const std::vector<fs::path>& folders,
            const std::vector<std::string>& extensions,
            const std::vector<std::string>& ignores,
            const std::vector<search::search_hit>& hits,
            int64_t elapsed_ms) {
        std::vector<std::string> folder_names{};
        for (const auto& folder : folders) {
            folder_names.push_back(folder.string());
        }

        std::vector<std::string> segments{};
        segments.push_back("Code search for \"{}\"\nSearched in: {}\nIncluded extensions: {}\nIgnored patterns: {}"_format(
                query,
                utils::join_with_separator(folder_names, ", "sv),
                utils::join_with_separator(extensions, ", "sv),
                utils::join_with_separator(ignores, ", "sv)));

        if (hits.empty()) {
            segments.emplace_back("No results found.");
        }
        else {
            segments.push_back("Found {} result(s):"_format(hits.size()));
        }

        for (const auto& hit : hits) {
            std::vector<std::string> details{};
            const auto& structure = hit.structure;

            if (!structure.parameters.empty()) {
                std::vector<std::string> params{};
                for (const auto& param : structure.parameters) {
                    params.push_back(param.type ? "{}: {}"_format(param.name, *param.type) : param.name);
                }
                details.push_back("Parameters: {}"_format(utils::join_with_separator(params, ", "sv)));
            }
            if (structure.return_type) {
                details.push_back("Return type: {}"_format(*structure.return_type));
            }
            if (structure.parent_class) {
                details.push_back("Parent class: {}"_format(*structure.parent_class));
            }
            if (structure.inherits_from) {
                details.push_back("Extends: {}"_format(*structure.inherits_from));
            }
            if (hit.doc) {
                details.push_back("Doc: {}"_format(*hit.doc));
            }
            if (!structure.calls.empty()) {
                details.push_back("Calls: {}"_format(utils::join_with_separator(structure.calls, ", "sv)));
            }
            details.push_back("Lines: {}"_format(hit.lines));
            if (hit.code) {
                details.push_back("Code snippet: {}"_format(*hit.code));
            }

            segments.push_back("[{}] {}:{}-{} - {} {}\n{}"_format(
                    hit.score,
                    hit.file,
                    hit.start_line,
                    hit.end_line,
                    hit.kind,
                    hit.qualified_name,
                    utils::join_with_separator(details, "\n"sv)));
        }

        segments.push_back("Search completed in {}ms"_format(elapsed_ms));
        return segments;
    }

    tool_response tool_router::route(std::string_view tool_name, std::string_view raw_arguments) const {
        try {
            return dispatch(tool_name, raw_arguments);
        } catch (const std::exception& e) {
            if (!cfg.quiet) {
                std::cerr << "runlet: tool {} failed: {}\n"_format(tool_name, e.what());
            }
            return tool_response{.segments = {detail::error_text(e.what())}, .is_error = true};
        }
    }

    tool_response tool_router::dispatch(std::string_view tool_name, std::string_view raw_arguments) const {
        auto kind = resolve_tool(tool_name);
        if (!kind) {
            throw unknown_tool{std::string{tool_name}};
        }
        if (*kind == tool_kind::search_code) {
            return run_search(raw_arguments);
        }
        return run_execution(*kind, raw_arguments);
    }

    tool_response tool_router::run_execution(tool_kind kind, std::string_view raw_arguments) const {
        auto args = detail::parse_arguments<detail::execute_args>(raw_arguments, kind);
        auto runtime = kind == tool_kind::execute_deno ? runtime_kind::deno : runtime_kind::node;

        if (!args.code || args.code->empty()) {
            throw missing_argument{
                    runtime == runtime_kind::deno ? "Missing code argument for Deno execute tool"
                                                  : "Missing code argument for execute tool"};
        }

        execution_request request{
                .code = std::move(*args.code),
                .timeout_ms = detail::resolve_timeout(args.timeout, cfg.default_timeout_ms),
                .runtime = runtime,
        };
        auto result = execute(request, cfg);

        if (cfg.verbose) {
            std::cerr << "runlet: {} finished in {}ms (exit {}, success {})\n"_format(
                    runtime,
                    result.execution_time_ms,
                    result.exit_code ? std::to_string(*result.exit_code) : std::string{"none"},
                    result.success);
        }
        return tool_response{.segments = render_execution(result, runtime), .is_error = false};
    }

    tool_response tool_router::run_search(std::string_view raw_arguments) const {
        auto args = detail::parse_arguments<detail::search_args>(raw_arguments, tool_kind::search_code);
        if (!args.query || args.query->empty()) {
            throw missing_argument{"Missing query argument for code search tool"};
        }

        auto started_at = std::chrono::steady_clock::now();

        std::vector<fs::path> folders{};
        if (args.folders) {
            for (const auto& folder : utils::split_csv(*args.folders)) {
                fs::path p{folder};
                folders.push_back((p.is_absolute() ? p : cfg.working_dir / p).lexically_normal());
            }
        }
        if (folders.empty()) {
            folders.push_back(cfg.working_dir);
        }

        auto extensions = detail::resolve_list(args.extensions, cfg.search_extensions);
        for (auto& ext : extensions) {
            if (ext.starts_with('.')) {
                ext.erase(0U, 1U);
            }
        }
        auto ignores = detail::resolve_list(args.ignores, cfg.search_ignores);

        size_t top_k = cfg.search_top_k;
        if (args.topK && std::isfinite(*args.topK) && *args.topK >= 1.0) {
            top_k = static_cast<size_t>(std::min(*args.topK, 1000.0));
        }

        std::vector<search::search_hit> hits{};
        try {
            index.sync(folders, extensions, ignores);
            hits = index.query(*args.query, top_k);
        } catch (const std::exception& e) {
            return tool_response{.segments = {detail::error_text(e.what())}, .is_error = true};
        }

        return tool_response{
                .segments = render_search(
                        *args.query, folders, extensions, ignores, hits, detail::elapsed_since(started_at)),
                .is_error = false};
    }

}  // namespace runlet
