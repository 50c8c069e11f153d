#include "runlet/cli.hpp"
#include "runlet/mcp.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        runlet::startup_config cfg{};
        if (auto cli_result = runlet::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        if (cfg.verbose) {
            std::cerr << "runlet: serving " << cfg.working_dir.string() << " over stdio\n";
        }
        return runlet::mcp::run_mcp_server(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
