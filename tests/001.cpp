#include "utils.hpp"

namespace runlet::test {
    using namespace std::string_view_literals;
    using namespace runlet::literals;

    TEST_CASE("001: startup config defaults", "[001][config]") {
        startup_config cfg{};

        CHECK(cfg.node_path == "node");
        CHECK(cfg.deno_path == "deno");
        CHECK(cfg.default_timeout_ms == 120'000);
        CHECK(cfg.kill_grace_ms == 2'000);
        CHECK(cfg.search_extensions == std::vector<std::string>{"js", "ts"});
        CHECK(cfg.search_ignores == std::vector<std::string>{"node_modules"});
        CHECK(cfg.search_top_k == 8U);
        CHECK(cfg.index_on_startup);
        CHECK(cfg.working_dir == std::filesystem::current_path());
        CHECK(cfg.temp_dir() == cfg.working_dir / "temp");
    }

    TEST_CASE("001: enum string conversion", "[001][config]") {
        CHECK(to_string(runtime_kind::node) == "node"sv);
        CHECK(to_string(runtime_kind::deno) == "deno"sv);
        CHECK(to_string(source_kind::module) == "module"sv);
        CHECK(to_string(source_kind::commonjs) == "commonjs"sv);

        CHECK("{}/{}"_format(runtime_kind::deno, source_kind::commonjs) == "deno/commonjs");
    }

    TEST_CASE("001: trim and csv splitting", "[001][utils]") {
        CHECK(utils::trim_view("  a b \n"sv) == "a b"sv);
        CHECK(utils::trim_view(" \t\r\n"sv).empty());

        CHECK(utils::split_csv("src, lib ,,test"sv) == std::vector<std::string>{"src", "lib", "test"});
        CHECK(utils::split_csv(" , "sv).empty());
        CHECK(utils::split_csv(""sv).empty());

        CHECK(utils::join_with_separator({"a", "b", "c"}, ", "sv) == "a, b, c");
        CHECK(utils::join_with_separator({}, ", "sv).empty());
    }

}  // namespace runlet::test
