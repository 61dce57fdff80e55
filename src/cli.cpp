#include "asmcmp/cli.hpp"

#include "asmcmp/format.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace asmcmp::literals;

namespace asmcmp::cli { namespace detail {

    using namespace std::string_view_literals;
    namespace fs = std::filesystem;

    struct persisted_config {
        int schema_version{1};
        std::string cargo{};
        std::optional<std::string> manifest_path{};
        std::string output{};
        bool keep_going{false};
        int timeout_ms{0};
    };

    struct extraction_record {
        std::string target{};
        std::string triple{};
        std::string function{};
        bool success{false};
        std::string status{};
        int exit_code{-1};
        std::vector<std::string> command{};
        std::string text{};
        std::string diagnostics{};
    };

}}  // namespace asmcmp::cli::detail

namespace glz {

    template <>
    struct meta<asmcmp::cli::detail::persisted_config> {
        using T = asmcmp::cli::detail::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "cargo",
                       &T::cargo,
                       "manifest_path",
                       &T::manifest_path,
                       "output",
                       &T::output,
                       "keep_going",
                       &T::keep_going,
                       "timeout_ms",
                       &T::timeout_ms);
    };

    template <>
    struct meta<asmcmp::cli::detail::extraction_record> {
        using T = asmcmp::cli::detail::extraction_record;
        static constexpr auto value =
                object("target",
                       &T::target,
                       "triple",
                       &T::triple,
                       "function",
                       &T::function,
                       "success",
                       &T::success,
                       "status",
                       &T::status,
                       "exit_code",
                       &T::exit_code,
                       "command",
                       &T::command,
                       "text",
                       &T::text,
                       "diagnostics",
                       &T::diagnostics);
    };

}  // namespace glz

namespace asmcmp::cli {

    namespace detail {

        static constexpr auto default_value = "<default>"sv;
        static constexpr auto version_string = "asmcmp 0.1.0"sv;
        static constexpr int usage_error = 2;

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open " + path.string());
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

        static void validate_supported_schema_version(int schema_version, const fs::path& path) {
            constexpr int supported_schema_version = 1;
            if (schema_version > supported_schema_version) {
                throw std::runtime_error(
                        "unsupported schema_version in {}: {} > {}"_format(
                                path.string(), schema_version, supported_schema_version));
            }
        }

        static std::optional<std::string> normalize_optional(std::string_view value) {
            auto trimmed = utils::trim_view(value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return std::string(trimmed);
        }

        static std::string usage_for(command_kind kind) {
            switch (kind) {
                case command_kind::list:
                    return "list";
                case command_kind::single:
                    return "<function>";
                case command_kind::all:
                    return "<function>";
                case command_kind::custom:
                    return "<function> <alias>...";
            }
            return {};
        }

    }  // namespace detail

    void print_commands(std::ostream& os) {
        auto arm = to_triple(target_alias::arm64);
        auto x86 = to_triple(target_alias::x86_64);

        os << "available commands:\n";
        os << "    {:<34} # emits assembly code for both {} and {} targets for a function\n"_format(
                "asm-all " + detail::usage_for(command_kind::all), arm, x86);
        os << "    {:<34} # emits assembly code for target {} for a function [alias: arm]\n"_format(
                "asm-arm64 " + detail::usage_for(command_kind::single), arm);
        os << "    {:<34} # emits assembly code for target {} for a function [alias: x86]\n"_format(
                "asm-x86-64 " + detail::usage_for(command_kind::single), x86);
        os << "    {:<34} # emits assembly code for each listed target, in order\n"_format(
                "asm " + detail::usage_for(command_kind::custom));
        os << "    {:<34} # lists all commands\n"_format(detail::usage_for(command_kind::list));
        os << "target aliases:\n";
        for (auto alias : all_target_aliases) {
            os << "    {:<10} {}\n"_format(to_string(alias), to_triple(alias));
        }
    }

    void print_config(const startup_config& cfg, std::ostream& os) {
        os << "cargo=" << cfg.cargo_path.string() << '\n';
        os << "manifest_path="
           << (cfg.manifest_path ? cfg.manifest_path->string() : std::string{detail::default_value}) << '\n';
        os << "output=" << to_string(cfg.output) << '\n';
        os << "policy=" << to_string(cfg.policy) << '\n';
        os << "timeout_ms=" << cfg.timeout_ms << '\n';
        os << "config=" << (cfg.config_file ? cfg.config_file->string() : std::string{detail::default_value})
           << '\n';
    }

    void load_config_file(const std::filesystem::path& path, startup_config& cfg) {
        detail::persisted_config data{};
        auto json = detail::read_text_file(path);
        auto ec = glz::read_json(data, json);
        if (ec) {
            throw std::runtime_error("failed to parse json file {}"_format(path.string()));
        }
        detail::validate_supported_schema_version(data.schema_version, path);

        if (!data.cargo.empty()) {
            cfg.cargo_path = data.cargo;
        }
        if (data.manifest_path) {
            cfg.manifest_path = detail::normalize_optional(*data.manifest_path);
        }
        if (!data.output.empty() && !try_parse_output_mode(data.output, cfg.output)) {
            throw std::runtime_error(
                    "invalid output in {}: {} (expected table|json)"_format(path.string(), data.output));
        }
        if (data.keep_going) {
            cfg.policy = failure_policy::best_effort;
        }
        if (data.timeout_ms < 0) {
            throw std::runtime_error("invalid timeout_ms in {}: {}"_format(path.string(), data.timeout_ms));
        }
        cfg.timeout_ms = data.timeout_ms;
        cfg.config_file = path;
    }

    std::string render_json_report(const compare_summary& summary) {
        std::vector<detail::extraction_record> records{};
        records.reserve(summary.results.size());
        for (const auto& result : summary.results) {
            records.push_back(
                    detail::extraction_record{
                            .target = std::string{to_string(result.request.target)},
                            .triple = std::string{result.request.triple()},
                            .function = result.request.function,
                            .success = result.success,
                            .status = std::string{to_string(result.status)},
                            .exit_code = result.exit_code,
                            .command = result.command,
                            .text = result.output_text,
                            .diagnostics = result.diagnostics_text});
        }

        std::string json{};
        auto ec = glz::write_json(records, json);
        if (ec) {
            throw std::runtime_error("failed to serialize extraction results");
        }
        return json;
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg, command_request& command) {
        CLI::App app{"asmcmp: compare the assembly of a function across targets"};
        app.fallthrough();
        app.require_subcommand(0, 1);

        bool show_version = false;
        bool keep_going = false;
        std::string cargo_arg{cfg.cargo_path.string()};
        std::string manifest_arg{};
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string policy_arg{std::string{to_string(cfg.policy)}};
        std::string config_arg{};
        int timeout_arg{cfg.timeout_ms};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--cargo", cargo_arg, "cargo executable path")->envname("ASMCMP_CARGO");
        app.add_option("--manifest-path", manifest_arg, "Cargo.toml of the crate to inspect");
        app.add_option("--output", output_arg, "Output mode: table|json");
        app.add_option("--timeout-ms", timeout_arg, "Per-invocation timeout in milliseconds, 0 for none");
        app.add_option("--config", config_arg, "JSON config file");
        app.add_option("--on-failure", policy_arg, "Multi-target failure policy: fail-fast|best-effort");
        app.add_flag("--keep-going", keep_going, "Same as --on-failure=best-effort");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress tool diagnostics for successful extractions");
        app.add_flag("--verbose", cfg.verbose, "Echo executed commands to stderr");

        std::string function_arg{};
        std::vector<std::string> alias_args{};

        auto* arm_cmd = app.add_subcommand(
                "asm-arm64",
                "Emit assembly for {} of a function"_format(to_triple(target_alias::arm64)));
        arm_cmd->alias("arm");
        arm_cmd->add_option("function", function_arg, "Function to inspect")->required();

        auto* x86_cmd = app.add_subcommand(
                "asm-x86-64",
                "Emit assembly for {} of a function"_format(to_triple(target_alias::x86_64)));
        x86_cmd->alias("x86");
        x86_cmd->add_option("function", function_arg, "Function to inspect")->required();

        auto* all_cmd = app.add_subcommand("asm-all", "Emit assembly for arm64, then x86-64, of a function");
        all_cmd->add_option("function", function_arg, "Function to inspect")->required();

        auto* custom_cmd = app.add_subcommand("asm", "Emit assembly of a function for each listed target, in order");
        custom_cmd->add_option("function", function_arg, "Function to inspect")->required();
        custom_cmd->add_option("targets", alias_args, "Target aliases: {}"_format(accepted_aliases()))->required();

        app.add_subcommand("list", "List available commands");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{detail::usage_error};
        }

        if (auto config_path = detail::normalize_optional(config_arg)) {
            load_config_file(*config_path, cfg);
        }

        if (app.get_option("--cargo")->count() > 0U) {
            cfg.cargo_path = cargo_arg;
        }
        if (app.get_option("--manifest-path")->count() > 0U) {
            cfg.manifest_path = detail::normalize_optional(manifest_arg);
        }
        if (app.get_option("--output")->count() > 0U && !try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{detail::usage_error};
        }
        if (app.get_option("--timeout-ms")->count() > 0U) {
            if (timeout_arg < 0) {
                std::cerr << "invalid --timeout-ms value: " << timeout_arg << " (expected >= 0)\n";
                return std::optional<int>{detail::usage_error};
            }
            cfg.timeout_ms = timeout_arg;
        }
        if (app.get_option("--on-failure")->count() > 0U && !try_parse_failure_policy(policy_arg, cfg.policy)) {
            std::cerr << "invalid --on-failure value: " << policy_arg << " (expected fail-fast|best-effort)\n";
            return std::optional<int>{detail::usage_error};
        }
        if (keep_going) {
            cfg.policy = failure_policy::best_effort;
        }

        if (show_version) {
            std::cout << detail::version_string << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        command = command_request{};
        if (arm_cmd->parsed()) {
            command.kind = command_kind::single;
            command.targets = {target_alias::arm64};
        }
        else if (x86_cmd->parsed()) {
            command.kind = command_kind::single;
            command.targets = {target_alias::x86_64};
        }
        else if (all_cmd->parsed()) {
            command.kind = command_kind::all;
            command.targets = {target_alias::arm64, target_alias::x86_64};
        }
        else if (custom_cmd->parsed()) {
            command.kind = command_kind::custom;
            try {
                command.targets = resolve_targets(alias_args);
            } catch (const unknown_alias_error& e) {
                std::cerr << e.what() << '\n';
                return std::optional<int>{detail::usage_error};
            }
        }
        else {
            command.kind = command_kind::list;
            return std::nullopt;
        }

        if (utils::trim_view(function_arg).empty()) {
            std::cerr << "function identifier must be non-empty\n";
            return std::optional<int>{detail::usage_error};
        }
        command.function = std::move(function_arg);

        return std::nullopt;
    }

    int run_command(
            const startup_config& cfg,
            const command_request& command,
            process_runner& runner,
            std::ostream& out,
            std::ostream& err) {
        if (command.kind == command_kind::list) {
            print_commands(out);
            return 0;
        }

        auto options = make_extraction_options(cfg);
        compare_options compare{.policy = cfg.policy, .output = cfg.output, .quiet = cfg.quiet};

        auto summary = run_compare(runner, options, compare, command.function, command.targets, out, err);

        if (cfg.output == output_mode::json) {
            out << render_json_report(summary) << '\n';
        }
        if (summary.skipped() > 0U) {
            err << "skipped {} target(s) after a failed extraction (--keep-going runs all)\n"_format(
                    summary.skipped());
        }
        out.flush();

        return summary.success() ? 0 : 1;
    }

}  // namespace asmcmp::cli
