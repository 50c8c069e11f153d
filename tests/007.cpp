#include "utils.hpp"

namespace runlet::test {
    using namespace std::string_view_literals;
    using namespace runlet::literals;

    namespace detail {
        struct recording_index final : search::code_index {
            std::vector<fs::path> folders{};
            std::vector<std::string> extensions{};
            std::vector<std::string> ignores{};
            std::string query_text{};
            size_t top_k{};
            std::vector<search::search_hit> hits{};
            bool fail{false};

            void sync(const std::vector<fs::path>& f,
                      const std::vector<std::string>& e,
                      const std::vector<std::string>& i) override {
                if (fail) {
                    throw std::runtime_error("search folder is not a directory: /missing");
                }
                folders = f;
                extensions = e;
                ignores = i;
            }

            std::vector<search::search_hit> query(std::string_view text, size_t k) override {
                query_text = std::string{text};
                top_k = k;
                return hits;
            }
        };

        static search::search_hit sample_hit() {
            search::search_hit hit{};
            hit.score = 0.875;
            hit.file = "/work/src/shape.js";
            hit.start_line = 12U;
            hit.end_line = 15U;
            hit.kind = "method";
            hit.qualified_name = "Shape.area";
            hit.structure.parameters = {{.name = "scale", .type = "number"}, {.name = "unit", .type = std::nullopt}};
            hit.structure.return_type = "number";
            hit.structure.parent_class = "Shape";
            hit.structure.calls = {"computeArea"};
            hit.doc = "Area in square units.";
            hit.lines = 4U;
            hit.code = "area(scale, unit) {";
            return hit;
        }
    }  // namespace detail

    TEST_CASE("007: tool names and aliases resolve", "[007][router]") {
        CHECK(resolve_tool("executenodejs"sv) == tool_kind::execute_node);
        CHECK(resolve_tool("execute"sv) == tool_kind::execute_node);
        CHECK(resolve_tool("mcp_mcp_repl_execute"sv) == tool_kind::execute_node);
        CHECK(resolve_tool("executedeno"sv) == tool_kind::execute_deno);
        CHECK(resolve_tool("mcp_mcp_repl_executedeno"sv) == tool_kind::execute_deno);
        CHECK(resolve_tool("searchcode"sv) == tool_kind::search_code);
        CHECK(resolve_tool("mcp_mcp_repl_searchcode"sv) == tool_kind::search_code);
        CHECK_FALSE(resolve_tool("executepython"sv));
        CHECK_FALSE(resolve_tool("ExecuteNodeJS"sv));
    }

    TEST_CASE("007: execution renders output, errors and a summary", "[007][router]") {
        execution_result ok{.success = true, .stdout_text = "2\n", .execution_time_ms = 41, .exit_code = 0};
        CHECK(render_execution(ok, runtime_kind::node) ==
              std::vector<std::string>{"2", "Execution completed in 41ms with exit code 0"});

        execution_result failed{
                .success = false, .stdout_text = "", .stderr_text = "  boom\n", .execution_time_ms = 7, .exit_code = 1};
        CHECK(render_execution(failed, runtime_kind::deno) ==
              std::vector<std::string>{"ERROR: boom", "Deno execution completed in 7ms with exit code 1"});

        execution_result killed{.success = false, .stdout_text = "tick\n", .execution_time_ms = 300};
        CHECK(render_execution(killed, runtime_kind::node).back() == "Execution completed in 300ms with exit code 0");

        execution_result spawn{.success = false, .execution_time_ms = 1, .error_message = "spawn node failed: nope"};
        CHECK(render_execution(spawn, runtime_kind::node) ==
              std::vector<std::string>{"ERROR: spawn node failed: nope", "Execution completed in 1ms with exit code 0"});
    }

    TEST_CASE("007: missing arguments are reported as errors", "[007][router]") {
        detail::temp_dir temp{"runlet_router_missing"};
        auto cfg = detail::test_config(temp.path);
        detail::recording_index index{};
        tool_router router{cfg, index};

        auto no_code = router.route("executenodejs"sv, R"({})"sv);
        CHECK(no_code.is_error);
        CHECK(no_code.segments == std::vector<std::string>{"ERROR: Missing code argument for execute tool"});

        auto empty_code = router.route("executedeno"sv, R"({"code":""})"sv);
        CHECK(empty_code.segments == std::vector<std::string>{"ERROR: Missing code argument for Deno execute tool"});

        auto no_args = router.route("searchcode"sv, ""sv);
        CHECK(no_args.segments == std::vector<std::string>{"ERROR: Missing query argument for code search tool"});

        auto null_args = router.route("execute"sv, "null"sv);
        CHECK(null_args.segments == std::vector<std::string>{"ERROR: Missing code argument for execute tool"});
    }

    TEST_CASE("007: unknown tools and malformed arguments are errors", "[007][router]") {
        detail::temp_dir temp{"runlet_router_unknown"};
        auto cfg = detail::test_config(temp.path);
        detail::recording_index index{};
        tool_router router{cfg, index};

        auto unknown = router.route("executepython"sv, R"({"code":"print(1)"})"sv);
        CHECK(unknown.is_error);
        CHECK(unknown.segments == std::vector<std::string>{"ERROR: Unknown tool: executepython"});

        auto malformed = router.route("executenodejs"sv, R"({"code": 42})"sv);
        CHECK(malformed.is_error);
        REQUIRE(malformed.segments.size() == 1U);
        CHECK(malformed.segments.front().starts_with("ERROR: Invalid arguments for executenodejs tool"));
    }

    TEST_CASE("007: execution goes through the configured runtime", "[007][router]") {
        detail::temp_dir temp{"runlet_router_exec"};
        auto cfg = detail::test_config(temp.path);
        cfg.node_path = detail::write_echo_runtime(temp.path, "fake-node").string();
        cfg.deno_path = detail::write_echo_runtime(temp.path, "fake-deno").string();
        detail::recording_index index{};
        tool_router router{cfg, index};

        auto node = router.route("executenodejs"sv, R"({"code":"console.log(1+1)","timeout":5000})"sv);
        CHECK_FALSE(node.is_error);
        REQUIRE(node.segments.size() == 2U);
        CHECK(detail::contains(node.segments[0], "arg=--input-type=module"));
        CHECK(detail::contains(node.segments[0], "console.log(1+1)"));
        CHECK(node.segments[1].starts_with("Execution completed in "));
        CHECK(node.segments[1].ends_with("ms with exit code 0"));

        auto deno = router.route("mcp_mcp_repl_executedeno"sv, R"({"code":"console.log(Deno.pid)","timeout":-5})"sv);
        CHECK_FALSE(deno.is_error);
        REQUIRE(deno.segments.size() == 2U);
        CHECK(detail::contains(deno.segments[0], "arg=--allow-all"));
        CHECK(deno.segments[1].starts_with("Deno execution completed in "));
    }

    TEST_CASE("007: runtime failures are results, not tool errors", "[007][router]") {
        detail::temp_dir temp{"runlet_router_spawn"};
        auto cfg = detail::test_config(temp.path);
        cfg.node_path = (temp.path / "missing-node").string();
        detail::recording_index index{};
        tool_router router{cfg, index};

        auto response = router.route("executenodejs"sv, R"({"code":"console.log(1)"})"sv);

        CHECK_FALSE(response.is_error);
        REQUIRE(response.segments.size() == 2U);
        CHECK(response.segments[0].starts_with("ERROR: spawn "));
        CHECK(response.segments[1].ends_with("with exit code 0"));
    }

    TEST_CASE("007: verbose runs log the runtime by name", "[007][router]") {
        detail::temp_dir temp{"runlet_router_verbose"};
        auto cfg = detail::test_config(temp.path);
        cfg.quiet = false;
        cfg.verbose = true;
        cfg.deno_path = detail::write_echo_runtime(temp.path, "fake-deno").string();
        detail::recording_index index{};
        tool_router router{cfg, index};

        std::ostringstream log{};
        auto* saved = std::cerr.rdbuf(log.rdbuf());
        auto response = router.route("executedeno"sv, R"({"code":"console.log(1)"})"sv);
        std::cerr.rdbuf(saved);

        CHECK_FALSE(response.is_error);
        CHECK(detail::contains(log.str(), "runlet: deno finished in "));
        CHECK(detail::contains(log.str(), "(exit 0, success true)"));
    }

    TEST_CASE("007: search applies defaults from the startup config", "[007][router][search]") {
        detail::temp_dir temp{"runlet_router_search_defaults"};
        auto cfg = detail::test_config(temp.path);
        detail::recording_index index{};
        tool_router router{cfg, index};

        auto response = router.route("searchcode"sv, R"({"query":"shape area"})"sv);

        CHECK_FALSE(response.is_error);
        CHECK(index.folders == std::vector<std::filesystem::path>{temp.path});
        CHECK(index.extensions == std::vector<std::string>{"js", "ts"});
        CHECK(index.ignores == std::vector<std::string>{"node_modules"});
        CHECK(index.query_text == "shape area");
        CHECK(index.top_k == 8U);

        REQUIRE(response.segments.size() == 3U);
        CHECK(response.segments[0] ==
              "Code search for \"shape area\"\nSearched in: {}\nIncluded extensions: js, ts\nIgnored patterns: node_modules"_format(
                      temp.path.string()));
        CHECK(response.segments[1] == "No results found.");
        CHECK(response.segments[2].starts_with("Search completed in "));
    }

    TEST_CASE("007: search arguments override the defaults", "[007][router][search]") {
        detail::temp_dir temp{"runlet_router_search_args"};
        auto cfg = detail::test_config(temp.path);
        detail::recording_index index{};
        tool_router router{cfg, index};

        auto response = router.route(
                "mcp_mcp_repl_searchcode"sv,
                R"({"query":"q","folders":"src, /abs/lib","extensions":".mjs,ts","ignores":"dist,build","topK":3})"sv);

        CHECK_FALSE(response.is_error);
        CHECK(index.folders == std::vector<std::filesystem::path>{temp.path / "src", "/abs/lib"});
        CHECK(index.extensions == std::vector<std::string>{"mjs", "ts"});
        CHECK(index.ignores == std::vector<std::string>{"dist", "build"});
        CHECK(index.top_k == 3U);

        router.route("searchcode"sv, R"({"query":"q","topK":0,"extensions":" , "})"sv);
        CHECK(index.top_k == 8U);
        CHECK(index.extensions == std::vector<std::string>{"js", "ts"});
    }

    TEST_CASE("007: search hits render with their structure", "[007][router][search]") {
        detail::temp_dir temp{"runlet_router_search_hits"};
        auto cfg = detail::test_config(temp.path);
        detail::recording_index index{};
        index.hits = {detail::sample_hit()};
        tool_router router{cfg, index};

        auto response = router.route("searchcode"sv, R"({"query":"area"})"sv);

        REQUIRE(response.segments.size() == 4U);
        CHECK(response.segments[1] == "Found 1 result(s):");
        CHECK(response.segments[2] ==
              "[0.875] /work/src/shape.js:12-15 - method Shape.area\n"
              "Parameters: scale: number, unit\n"
              "Return type: number\n"
              "Parent class: Shape\n"
              "Doc: Area in square units.\n"
              "Calls: computeArea\n"
              "Lines: 4\n"
              "Code snippet: area(scale, unit) {");
    }

    TEST_CASE("007: index failures become a single error segment", "[007][router][search]") {
        detail::temp_dir temp{"runlet_router_search_fail"};
        auto cfg = detail::test_config(temp.path);
        detail::recording_index index{};
        index.fail = true;
        tool_router router{cfg, index};

        auto response = router.route("searchcode"sv, R"({"query":"area","folders":"/missing"})"sv);

        CHECK(response.is_error);
        CHECK(response.segments == std::vector<std::string>{"ERROR: search folder is not a directory: /missing"});
    }

}  // namespace runlet::test
