#include "runlet/cli.hpp"

#include "runlet/format.hpp"
#include "runlet/mcp.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

using namespace runlet::literals;

namespace runlet::cli {

    namespace detail {

        namespace fs = std::filesystem;

        static void print_config(const startup_config& cfg, std::ostream& os) {
            os << "working_dir=" << cfg.working_dir.string() << '\n';
            os << "temp_dir=" << cfg.temp_dir().string() << '\n';
            os << "node=" << cfg.node_path << '\n';
            os << "deno=" << cfg.deno_path << '\n';
            os << "timeout_ms=" << cfg.default_timeout_ms << '\n';
            os << "kill_grace_ms=" << cfg.kill_grace_ms << '\n';
            os << "search_extensions=" << utils::join_with_separator(cfg.search_extensions, ","sv) << '\n';
            os << "search_ignores=" << utils::join_with_separator(cfg.search_ignores, ","sv) << '\n';
            os << "search_top_k=" << cfg.search_top_k << '\n';
            os << "index_on_startup=" << (cfg.index_on_startup ? "true" : "false") << '\n';
        }

        static std::optional<fs::path> resolve_working_dir(const std::string& arg) {
            std::error_code ec{};
            auto dir = fs::weakly_canonical(fs::absolute(arg, ec), ec);
            if (ec || !fs::is_directory(dir, ec)) {
                return std::nullopt;
            }
            return dir;
        }

    }  // namespace detail

    // the only non-zero host exit code
    static constexpr int startup_failure = 1;

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"runlet-server: run JavaScript/TypeScript snippets for MCP clients over stdio"};

        bool show_version = false;
        bool no_index = false;
        std::string working_dir_arg{};
        int timeout_arg{cfg.default_timeout_ms};
        int kill_grace_arg{cfg.kill_grace_ms};

        app.add_option("working-directory", working_dir_arg, "Root for child processes and code search");
        app.add_flag("-v,--version", show_version, "Print version and exit");
        app.add_option("--node", cfg.node_path, "node executable path");
        app.add_option("--deno", cfg.deno_path, "deno executable path");
        app.add_option("--timeout", timeout_arg, "Default execution timeout in milliseconds");
        app.add_option("--kill-grace", kill_grace_arg, "Milliseconds between SIGTERM and SIGKILL on timeout");
        app.add_flag("--no-index", no_index, "Skip indexing the working directory at startup");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::Success& e) {
            return std::optional<int>{app.exit(e)};
        } catch (const CLI::ParseError& e) {
            (void)app.exit(e);
            return std::optional<int>{startup_failure};
        }

        if (show_version) {
            std::cout << "{} {}\n"_format(mcp::server_name, mcp::server_version);
            return std::optional<int>{0};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{startup_failure};
        }
        if (timeout_arg < 1) {
            std::cerr << "invalid --timeout value: " << timeout_arg << " (expected a positive millisecond count)\n";
            return std::optional<int>{startup_failure};
        }
        if (kill_grace_arg < 0) {
            std::cerr << "invalid --kill-grace value: " << kill_grace_arg << " (expected >= 0)\n";
            return std::optional<int>{startup_failure};
        }
        if (cfg.node_path.empty() || cfg.deno_path.empty()) {
            std::cerr << "runtime paths must be non-empty\n";
            return std::optional<int>{startup_failure};
        }

        if (!working_dir_arg.empty()) {
            auto dir = detail::resolve_working_dir(working_dir_arg);
            if (!dir) {
                std::cerr << "invalid working directory: " << working_dir_arg << '\n';
                return std::optional<int>{startup_failure};
            }
            cfg.working_dir = std::move(*dir);
        }

        cfg.default_timeout_ms = timeout_arg;
        cfg.kill_grace_ms = kill_grace_arg;
        cfg.index_on_startup = !no_index;

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace runlet::cli
