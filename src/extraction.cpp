#include "asmcmp/extraction.hpp"

#include "asmcmp/format.hpp"

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace asmcmp::literals;

namespace asmcmp {

    namespace detail {

        static extraction_status classify(const process_output& output) {
            if (!output.spawned) {
                return extraction_status::spawn_failed;
            }
            if (output.timed_out) {
                return extraction_status::timed_out;
            }
            if (output.exit_code != 0) {
                return extraction_status::tool_failed;
            }
            return extraction_status::ok;
        }

        static void emit_block(
                const extraction_result& result, const compare_options& compare, std::ostream& out, std::ostream& err) {
            out << result.output_text;
            if (result.success) {
                out << '\n';
            }
            out.flush();

            if (result.success && compare.quiet) {
                return;
            }
            err << result.diagnostics_text;
            if (!result.success && result.status == extraction_status::tool_failed) {
                err << "error: {} exited with status {} for {}\n"_format(
                        result.command.front(), result.exit_code, result.request.triple());
            }
            err.flush();
        }

    }  // namespace detail

    extraction_options make_extraction_options(const startup_config& cfg) {
        extraction_options options{};
        options.cargo_path = cfg.cargo_path;
        options.manifest_path = cfg.manifest_path;
        if (cfg.timeout_ms > 0) {
            options.timeout = std::chrono::milliseconds{cfg.timeout_ms};
        }
        options.verbose = cfg.verbose;
        return options;
    }

    std::vector<std::string> build_command(const extraction_options& options, const extraction_request& request) {
        std::vector<std::string> cmd{};
        cmd.reserve(9U);
        cmd.push_back(options.cargo_path.string());
        cmd.emplace_back(arg_tokens::asm_subcommand);
        cmd.emplace_back(arg_tokens::lib_scope);
        cmd.push_back(request.function);
        cmd.emplace_back(arg_tokens::full_name);
        cmd.emplace_back(arg_tokens::simplify);
        cmd.push_back("{}{}"_format(arg_tokens::target_prefix, request.triple()));
        if (options.manifest_path) {
            cmd.emplace_back(arg_tokens::manifest_path);
            cmd.push_back(options.manifest_path->string());
        }
        return cmd;
    }

    extraction_result run_extraction(
            process_runner& runner,
            const extraction_options& options,
            const extraction_request& request,
            std::ostream& err) {
        if (request.function.empty()) {
            throw std::invalid_argument{"function identifier must be non-empty"};
        }

        extraction_result result{};
        result.request = request;
        result.command = build_command(options, request);

        if (options.verbose) {
            err << "+ " << utils::join_with_separator(result.command, " "sv) << '\n';
            err.flush();
        }

        auto output = runner.run(result.command, options.timeout);

        result.status = detail::classify(output);
        result.success = (result.status == extraction_status::ok);
        result.exit_code = output.exit_code;
        result.output_text = std::move(output.stdout_text);
        result.diagnostics_text = std::move(output.stderr_text);
        return result;
    }

    std::string make_separator() {
        std::string separator(separator_width, separator_char);
        separator.push_back('\n');
        return separator;
    }

    std::string make_banner(const extraction_request& request) {
        return "assembly for {} of '{}'\n"_format(request.triple(), request.function);
    }

    bool compare_summary::success() const {
        if (results.size() != requested) {
            return false;
        }
        return std::ranges::all_of(results, [](const extraction_result& r) { return r.success; });
    }

    compare_summary run_compare(
            process_runner& runner,
            const extraction_options& options,
            const compare_options& compare,
            std::string_view function,
            std::span<const target_alias> targets,
            std::ostream& out,
            std::ostream& err) {
        compare_summary summary{};
        summary.requested = targets.size();
        summary.results.reserve(targets.size());

        bool framed = (compare.output == output_mode::table);

        for (auto target : targets) {
            extraction_request request{.function = std::string{function}, .target = target};

            if (framed) {
                if (!summary.results.empty()) {
                    out << make_separator();
                    ++summary.separators;
                }
                out << make_banner(request);
                out.flush();
            }

            auto result = run_extraction(runner, options, request, err);
            debug_log("extraction ", to_triple(target), ": ", to_string(result.status));

            if (framed) {
                detail::emit_block(result, compare, out, err);
            }

            bool failed = !result.success;
            summary.results.push_back(std::move(result));

            if (failed && compare.policy == failure_policy::fail_fast) {
                break;
            }
        }

        return summary;
    }

}  // namespace asmcmp
