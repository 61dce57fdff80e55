#include "asmcmp.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        asmcmp::startup_config cfg{};
        asmcmp::cli::command_request command{};
        if (auto cli_result = asmcmp::cli::parse_cli(argc, argv, cfg, command)) {
            return *cli_result;
        }

        asmcmp::system_process_runner runner{};
        return asmcmp::cli::run_command(cfg, command, runner, std::cout, std::cerr);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
