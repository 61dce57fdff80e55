#pragma once

#include "config.hpp"
#include "extraction.hpp"
#include "process.hpp"
#include "target.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace asmcmp::cli {

    enum class command_kind : uint8_t {
        list,
        single,
        all,
        custom,
    };

    struct command_request {
        command_kind kind{command_kind::list};
        std::string function{};
        std::vector<target_alias> targets{};
    };

    // Returns an exit code when the process should stop without running a command
    // (usage error, --version, --print-config).
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg, command_request& command);

    int run_command(
            const startup_config& cfg,
            const command_request& command,
            process_runner& runner,
            std::ostream& out,
            std::ostream& err);

    void print_commands(std::ostream& os);
    void print_config(const startup_config& cfg, std::ostream& os);

    // Applies a JSON config file on top of cfg; throws std::runtime_error naming the file on failure.
    void load_config_file(const std::filesystem::path& path, startup_config& cfg);

    std::string render_json_report(const compare_summary& summary);

}  // namespace asmcmp::cli
