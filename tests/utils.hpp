#pragma once

#include "runlet/classifier.hpp"
#include "runlet/cli.hpp"
#include "runlet/config.hpp"
#include "runlet/execution.hpp"
#include "runlet/format.hpp"
#include "runlet/mcp.hpp"
#include "runlet/process.hpp"
#include "runlet/router.hpp"
#include "runlet/search.hpp"
#include "runlet/temp_artifact.hpp"
#include "runlet/utils.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <optional>
#include <ranges>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace runlet::test::detail {
    namespace fs = std::filesystem;
    using namespace runlet::literals;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
    }

    inline std::string read_file(const fs::path& p) {
        std::ifstream in{p};
        std::ostringstream buf{};
        buf << in.rdbuf();
        return buf.str();
    }

    // shell script stand-in for a runtime binary
    inline fs::path write_script(const fs::path& dir, std::string_view name, std::string_view body) {
        auto p = dir / name;
        write_file(p, "#!/bin/sh\n{}"_format(body));
        fs::permissions(p, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec, fs::perm_options::replace);
        return p;
    }

    // Echoes its argv one per line, then the program it was given: stdin for `-` or a
    // leading flag, else the file named by the last argument.
    inline constexpr auto echo_runtime_script = R"sh(echo "argc=$#"
for a in "$@"; do echo "arg=$a"; done
last=""
for a in "$@"; do last="$a"; done
case "$last" in
  -*) cat ;;
  *) cat "$last" ;;
esac
)sh";

    inline fs::path write_echo_runtime(const fs::path& dir, std::string_view name) {
        return write_script(dir, name, echo_runtime_script);
    }

    inline std::vector<std::string> lines_with_prefix(std::string_view text, std::string_view prefix) {
        std::vector<std::string> out{};
        for (auto piece : text | std::views::split('\n')) {
            std::string_view line{piece.begin(), piece.end()};
            if (line.starts_with(prefix)) {
                out.emplace_back(line.substr(prefix.size()));
            }
        }
        return out;
    }

    inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

    inline std::optional<fs::path> find_in_path(std::string_view program) {
        const char* path_env = std::getenv("PATH");
        if (path_env == nullptr) {
            return std::nullopt;
        }
        for (auto dir : std::string_view{path_env} | std::views::split(':')) {
            fs::path candidate = fs::path{std::string_view{dir.begin(), dir.end()}} / program;
            if (::access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
        }
        return std::nullopt;
    }

    inline startup_config test_config(const fs::path& root) {
        startup_config cfg{};
        cfg.working_dir = root;
        cfg.quiet = true;
        cfg.index_on_startup = false;
        return cfg;
    }
}  // namespace runlet::test::detail
