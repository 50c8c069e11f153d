#pragma once

#include "utils.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace runlet {

    using namespace std::string_view_literals;

    /*
     * Runlet Startup Config Options
     *
     * Workspace
     * - working_dir: Root every child runs in; default search folder; parent of the scratch dir.
     * - temp_dir_name: Scratch subdirectory of working_dir holding transient source files.
     *
     * Runtimes
     * - node_path: Primary runtime executable (resolved through PATH when not absolute).
     * - deno_path: Alternate runtime executable.
     * - default_timeout_ms: Wall-time budget when a call omits `timeout`.
     * - kill_grace_ms: Delay between SIGTERM and SIGKILL once a budget expires.
     *
     * Code search
     * - search_extensions: Extensions indexed when a call omits `extensions`.
     * - search_ignores: Path components skipped when a call omits `ignores`.
     * - search_top_k: Result count when a call omits `topK`.
     * - index_on_startup: Index working_dir once in the background at startup.
     *
     * Output
     * - quiet/verbose: Coarse verbosity knobs for stderr logs.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */

    enum class runtime_kind { node, deno };

    inline constexpr std::string_view to_string(runtime_kind kind) {
        switch (kind) {
            case runtime_kind::node:
                return "node"sv;
            case runtime_kind::deno:
                return "deno"sv;
        }
        return "node"sv;
    }

    inline constexpr int default_timeout_ms = 120'000;
    inline constexpr std::size_t default_top_k = 8U;

    struct startup_config {
        std::filesystem::path working_dir{std::filesystem::current_path()};
        std::string temp_dir_name{"temp"};

        std::string node_path{"node"};
        std::string deno_path{"deno"};
        int default_timeout_ms{runlet::default_timeout_ms};
        int kill_grace_ms{2'000};

        std::vector<std::string> search_extensions{"js", "ts"};
        std::vector<std::string> search_ignores{"node_modules"};
        std::size_t search_top_k{runlet::default_top_k};
        bool index_on_startup{true};

        bool quiet{false};
        bool verbose{false};

        bool print_config{false};

        std::filesystem::path temp_dir() const { return working_dir / temp_dir_name; }
    };

}  // namespace runlet
