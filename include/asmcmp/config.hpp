#pragma once

#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace asmcmp {

    using namespace std::string_view_literals;

    /*
     * asmcmp Startup Config Options
     *
     * Toolchain
     * - cargo_path: cargo executable used to run `cargo asm`; defaults to the one found at build time.
     * - manifest_path: Optional Cargo.toml forwarded as --manifest-path.
     * - timeout_ms: Per-invocation wall-time bound; 0 waits until the tool exits.
     *
     * Output
     * - output: Result shape ("table" for framed text blocks, "json" for records).
     * - policy: Multi-target failure handling (fail-fast or keep going).
     * - quiet: Drop the tool's stderr chatter when an extraction succeeds.
     * - verbose: Echo every executed command line to stderr.
     *
     * Sources
     * - config_file: JSON file loaded before command-line overrides are applied.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */

    // cargo found at configure time, or plain "cargo" to search PATH
    inline constexpr auto cargo_executable_path = std::string_view{ASMCMP_CARGO_EXECUTABLE_PATH};

    enum class output_mode : uint8_t { table, json };
    enum class failure_policy : uint8_t { fail_fast, best_effort };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr std::string_view to_string(failure_policy policy) {
        switch (policy) {
            case failure_policy::fail_fast:
                return "fail-fast"sv;
            case failure_policy::best_effort:
                return "best-effort"sv;
        }
        return "fail-fast"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_failure_policy(std::string_view text, failure_policy& out) {
        if (utils::str_case_eq(text, "fail-fast"sv) || utils::str_case_eq(text, "fail_fast"sv)) {
            out = failure_policy::fail_fast;
            return true;
        }
        if (utils::str_case_eq(text, "best-effort"sv) || utils::str_case_eq(text, "best_effort"sv) ||
            utils::str_case_eq(text, "keep-going"sv)) {
            out = failure_policy::best_effort;
            return true;
        }
        return false;
    }

    struct startup_config {
        std::filesystem::path cargo_path{cargo_executable_path};
        std::optional<std::filesystem::path> manifest_path{};
        int timeout_ms{0};

        output_mode output{output_mode::table};
        failure_policy policy{failure_policy::fail_fast};
        bool quiet{false};
        bool verbose{false};

        std::optional<std::filesystem::path> config_file{};

        bool print_config{false};
    };

}  // namespace asmcmp
