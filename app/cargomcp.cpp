#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        cargomcp::startup_config cfg{};
        if (auto cli_result = cargomcp::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return cargomcp::mcp::run_mcp_server(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
