#pragma once

#include "config.hpp"
#include "search.hpp"

#include <iosfwd>

namespace runlet::mcp {

    inline constexpr auto protocol_version = "2024-11-05"sv;
    inline constexpr auto server_name = "runlet"sv;
    inline constexpr auto server_version = "1.0.0"sv;

    // Serves line-delimited JSON-RPC from `in` to `out` until EOF, then waits for
    // in-flight tool calls. Returns the process exit code.
    int serve(const startup_config& cfg, search::code_index& index, std::istream& in, std::ostream& out);

    // stdio server with the bundled lexical index, indexing working_dir in the background
    int run_mcp_server(const startup_config& cfg);

}  // namespace runlet::mcp
