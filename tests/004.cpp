#include "utils.hpp"

namespace asmcmp::test {
    using namespace std::string_view_literals;

    namespace detail {
        struct compare_capture {
            compare_summary summary{};
            std::string out{};
            std::string err{};
        };

        compare_capture compare(
                scripted_process_runner& runner,
                std::string_view function,
                std::vector<target_alias> targets,
                compare_options options = {}) {
            std::ostringstream out{};
            std::ostringstream err{};
            compare_capture capture{};
            capture.summary = run_compare(runner, extraction_options{}, options, function, targets, out, err);
            capture.out = out.str();
            capture.err = err.str();
            return capture;
        }

        const auto arm_then_x86 = std::vector{target_alias::arm64, target_alias::x86_64};
    }  // namespace detail

    TEST_CASE("004: separator is fifty identical characters and a newline", "[004][compare]") {
        auto separator = make_separator();
        REQUIRE(separator.size() == 51U);
        CHECK(separator.back() == '\n');
        CHECK(std::ranges::all_of(separator.substr(0, 50), [](char c) { return c == '-'; }));
        CHECK(separator == std::string(50, '-') + "\n");
    }

    TEST_CASE("004: banner names the triple and the function", "[004][compare]") {
        auto banner = make_banner(resolve_request("arm"sv, "simple_add_ten"));
        CHECK(banner == "assembly for aarch64-unknown-linux-musl of 'simple_add_ten'\n");
    }

    TEST_CASE("004: asm-all output is the two single-target outputs joined by one separator", "[004][compare]") {
        std::string function{"relaxed_atomic_fetch_or"};

        detail::scripted_process_runner arm_runner{};
        arm_runner.replies = {detail::succeeded("A\n")};
        auto arm_only = detail::compare(arm_runner, function, {target_alias::arm64});

        detail::scripted_process_runner x86_runner{};
        x86_runner.replies = {detail::succeeded("B\n")};
        auto x86_only = detail::compare(x86_runner, function, {target_alias::x86_64});

        detail::scripted_process_runner all_runner{};
        all_runner.replies = {detail::succeeded("A\n"), detail::succeeded("B\n")};
        auto all = detail::compare(all_runner, function, detail::arm_then_x86);

        CHECK(arm_only.out ==
              "assembly for aarch64-unknown-linux-musl of 'relaxed_atomic_fetch_or'\n"
              "A\n"
              "\n");
        CHECK(all.out == arm_only.out + make_separator() + x86_only.out);
        CHECK(all.summary.success());
        CHECK(all.summary.separators == 1U);
        CHECK(arm_only.summary.separators == 0U);

        auto a = all.out.find("A\n");
        auto sep = all.out.find(std::string(50, '-') + "\n");
        auto b = all.out.find("B\n");
        REQUIRE(a != std::string::npos);
        REQUIRE(sep != std::string::npos);
        REQUIRE(b != std::string::npos);
        CHECK(a < sep);
        CHECK(sep < b);

        REQUIRE(all_runner.spawn_count() == 2U);
        CHECK(detail::has_exact_arg(all_runner.calls[0], "--target=aarch64-unknown-linux-musl"));
        CHECK(detail::has_exact_arg(all_runner.calls[1], "--target=x86_64-unknown-linux-musl"));
    }

    TEST_CASE("004: separators only sit between blocks", "[004][compare]") {
        detail::scripted_process_runner runner{};
        runner.replies = {
                detail::succeeded(std::string(500, '-') + "\n"), detail::succeeded("x\n"), detail::succeeded("y\n")};
        auto targets = std::vector{target_alias::arm64, target_alias::x86_64, target_alias::arm64};
        auto run = detail::compare(runner, "a_function_with_a_particularly_long_name_to_frame", targets);

        CHECK(run.summary.separators == targets.size() - 1U);
        CHECK(run.out.starts_with("assembly for "));
        CHECK(run.out.ends_with("y\n\n"));
        CHECK_FALSE(run.out.ends_with(make_separator()));
        CHECK(detail::count_occurrences(run.out, "\n" + make_separator() + "assembly for ") == 2U);
    }

    TEST_CASE("004: target order follows the caller", "[004][compare]") {
        detail::scripted_process_runner runner{};
        runner.replies = {detail::succeeded("first\n"), detail::succeeded("second\n")};
        auto run = detail::compare(runner, "simple_store", {target_alias::x86_64, target_alias::arm64});

        REQUIRE(run.summary.results.size() == 2U);
        CHECK(run.summary.results[0].request.target == target_alias::x86_64);
        CHECK(run.summary.results[1].request.target == target_alias::arm64);
        CHECK(run.out.find("x86_64-unknown-linux-musl") < run.out.find("aarch64-unknown-linux-musl"));
    }

    TEST_CASE("004: fail-fast stops after the first failed target", "[004][compare]") {
        detail::scripted_process_runner runner{};
        runner.replies = {detail::failed(101, "error: symbol not found\n"), detail::succeeded("B\n")};
        auto run = detail::compare(runner, "missing_fn", detail::arm_then_x86);

        CHECK(runner.spawn_count() == 1U);
        CHECK_FALSE(run.summary.success());
        CHECK(run.summary.results.size() == 1U);
        CHECK(run.summary.skipped() == 1U);
        CHECK(run.summary.separators == 0U);
        CHECK(run.out.find(std::string(50, '-')) == std::string::npos);
        CHECK(run.err.starts_with("error: symbol not found\n"));
        CHECK(run.err.find("exited with status 101") != std::string::npos);
    }

    TEST_CASE("004: a failed block ends without the trailing blank line", "[004][compare]") {
        detail::scripted_process_runner runner{};
        runner.replies = {detail::failed(101, "error: symbol not found\n"), detail::succeeded("B\n")};
        auto run = detail::compare(
                runner, "missing_fn", detail::arm_then_x86, compare_options{.policy = failure_policy::best_effort});

        CHECK(run.out ==
              "assembly for aarch64-unknown-linux-musl of 'missing_fn'\n" + make_separator() +
                      "assembly for x86_64-unknown-linux-musl of 'missing_fn'\n"
                      "B\n"
                      "\n");
        CHECK(run.summary.separators == 1U);
    }

    TEST_CASE("004: verbose echoes each command line to the error stream", "[004][compare]") {
        detail::scripted_process_runner runner{};
        runner.replies = {detail::succeeded("A\n"), detail::succeeded("B\n")};

        extraction_options options{};
        options.verbose = true;
        std::ostringstream out{};
        std::ostringstream err{};
        auto summary = run_compare(runner, options, compare_options{}, "f", detail::arm_then_x86, out, err);

        CHECK(summary.success());
        auto text = err.str();
        auto arm = text.find("+ cargo asm --lib f --full-name --simplify --target=aarch64-unknown-linux-musl\n");
        auto x86 = text.find("+ cargo asm --lib f --full-name --simplify --target=x86_64-unknown-linux-musl\n");
        REQUIRE(arm != std::string::npos);
        REQUIRE(x86 != std::string::npos);
        CHECK(arm < x86);
        CHECK(out.str().find("+ cargo") == std::string::npos);

        detail::scripted_process_runner quiet_runner{};
        quiet_runner.replies = {detail::succeeded("A\n")};
        std::ostringstream quiet_err{};
        (void)run_extraction(quiet_runner, extraction_options{}, resolve_request("arm"sv, "f"), quiet_err);
        CHECK(quiet_err.str().empty());
    }

    TEST_CASE("004: best-effort runs every target and reports each failure", "[004][compare]") {
        detail::scripted_process_runner runner{};
        runner.replies = {detail::failed(101, "arm failure\n"), detail::failed(101, "x86 failure\n")};
        auto run = detail::compare(
                runner, "missing_fn", detail::arm_then_x86, compare_options{.policy = failure_policy::best_effort});

        CHECK(runner.spawn_count() == 2U);
        CHECK_FALSE(run.summary.success());
        CHECK(run.summary.skipped() == 0U);
        CHECK(run.summary.separators == 1U);
        CHECK(run.err.find("arm failure\n") < run.err.find("x86 failure\n"));
    }

    TEST_CASE("004: best-effort still succeeds when every target does", "[004][compare]") {
        detail::scripted_process_runner runner{};
        runner.replies = {detail::succeeded("A\n"), detail::succeeded("B\n")};
        auto run = detail::compare(
                runner, "simple_load", detail::arm_then_x86, compare_options{.policy = failure_policy::best_effort});
        CHECK(run.summary.success());
    }

    TEST_CASE("004: quiet drops tool chatter only for successful extractions", "[004][compare]") {
        detail::scripted_process_runner runner{};
        runner.replies = {
                detail::succeeded("A\n", "   Compiling chapter_7_asm\n"),
                detail::failed(101, "error: ambiguous symbol\n")};
        auto run = detail::compare(
                runner,
                "simple_load",
                detail::arm_then_x86,
                compare_options{.policy = failure_policy::best_effort, .quiet = true});

        CHECK(run.err.find("Compiling") == std::string::npos);
        CHECK(run.err.find("error: ambiguous symbol\n") != std::string::npos);
    }

    TEST_CASE("004: json mode leaves the streams untouched", "[004][compare]") {
        detail::scripted_process_runner runner{};
        runner.replies = {detail::succeeded("A\n", "noise\n"), detail::succeeded("B\n")};
        auto run = detail::compare(
                runner, "simple_load", detail::arm_then_x86, compare_options{.output = output_mode::json});

        CHECK(run.out.empty());
        CHECK(run.err.empty());
        CHECK(run.summary.separators == 0U);
        REQUIRE(run.summary.results.size() == 2U);
        CHECK(run.summary.results[1].output_text == "B\n");
    }
}  // namespace asmcmp::test
