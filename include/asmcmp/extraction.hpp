#pragma once

#include "config.hpp"
#include "process.hpp"
#include "target.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace asmcmp {

    enum class extraction_status : uint8_t {
        ok,
        tool_failed,
        spawn_failed,
        timed_out,
    };

    inline constexpr std::string_view to_string(extraction_status status) {
        switch (status) {
            case extraction_status::ok:
                return "ok"sv;
            case extraction_status::tool_failed:
                return "tool_failed"sv;
            case extraction_status::spawn_failed:
                return "spawn_failed"sv;
            case extraction_status::timed_out:
                return "timed_out"sv;
        }
        return "tool_failed"sv;
    }

    struct extraction_options {
        std::filesystem::path cargo_path{"cargo"};
        std::optional<std::filesystem::path> manifest_path{};
        std::optional<std::chrono::milliseconds> timeout{};
        bool verbose{false};
    };

    extraction_options make_extraction_options(const startup_config& cfg);

    struct extraction_result {
        extraction_request request{};
        extraction_status status{extraction_status::tool_failed};
        bool success{false};
        int exit_code{-1};
        std::vector<std::string> command{};
        std::string output_text{};
        std::string diagnostics_text{};

        // stdout on success, the tool's diagnostics otherwise
        std::string_view payload() const { return success ? output_text : diagnostics_text; }
    };

    namespace arg_tokens {
        inline constexpr auto asm_subcommand = "asm"sv;
        inline constexpr auto lib_scope = "--lib"sv;
        inline constexpr auto full_name = "--full-name"sv;
        inline constexpr auto simplify = "--simplify"sv;
        inline constexpr auto target_prefix = "--target="sv;
        inline constexpr auto manifest_path = "--manifest-path"sv;
    }  // namespace arg_tokens

    std::vector<std::string> build_command(const extraction_options& options, const extraction_request& request);

    // Exactly one process per call; failures are reported through the result and never retried.
    // With options.verbose the command line is echoed to `err` before the tool runs.
    extraction_result run_extraction(
            process_runner& runner,
            const extraction_options& options,
            const extraction_request& request,
            std::ostream& err);

    inline constexpr char separator_char = '-';
    inline constexpr std::size_t separator_width = 50U;

    std::string make_separator();
    std::string make_banner(const extraction_request& request);

    struct compare_options {
        failure_policy policy{failure_policy::fail_fast};
        output_mode output{output_mode::table};
        bool quiet{false};
    };

    struct compare_summary {
        std::vector<extraction_result> results{};
        std::size_t requested{};
        std::size_t separators{};

        bool success() const;
        std::size_t skipped() const { return requested - results.size(); }
    };

    /*
     * Runs one extraction per target in the given order.
     *
     * Table output frames every block as
     *
     *     assembly for <triple> of '<function>'\n
     *     <tool stdout>
     *     \n
     *
     * with make_separator() between consecutive blocks only. A failed extraction gets no trailing
     * blank line. The tool's stderr is forwarded to `err` unchanged. Under failure_policy::fail_fast
     * the first failed extraction ends the run; later targets are counted in
     * compare_summary::skipped(). JSON output writes no blocks or diagnostics; the caller
     * serializes the summary.
     */
    compare_summary run_compare(
            process_runner& runner,
            const extraction_options& options,
            const compare_options& compare,
            std::string_view function,
            std::span<const target_alias> targets,
            std::ostream& out,
            std::ostream& err);

}  // namespace asmcmp
