#pragma once

#include "config.hpp"

#include <optional>

namespace runlet::cli {

    // Fills `cfg` from argv. Returns an exit code when the process should stop here
    // (--help, --version, --print-config or a usage error), nullopt to keep going.
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

}  // namespace runlet::cli
