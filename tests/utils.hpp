#pragma once

#include "asmcmp.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <sys/types.h>
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace asmcmp::test::detail {
    namespace fs = std::filesystem;

    // Replays canned process outputs in call order and records every argument vector it receives.
    struct scripted_process_runner final : process_runner {
        std::vector<process_output> replies{};
        std::vector<std::vector<std::string>> calls{};
        std::vector<std::optional<std::chrono::milliseconds>> timeouts{};

        process_output run(
                const std::vector<std::string>& args, std::optional<std::chrono::milliseconds> timeout) override {
            calls.push_back(args);
            timeouts.push_back(timeout);
            if (calls.size() <= replies.size()) {
                return replies[calls.size() - 1U];
            }
            return process_output{.spawned = true, .exit_code = 0};
        }

        std::size_t spawn_count() const { return calls.size(); }
    };

    inline process_output succeeded(std::string out, std::string err = {}) {
        return process_output{
                .spawned = true, .exit_code = 0, .stdout_text = std::move(out), .stderr_text = std::move(err)};
    }

    inline process_output failed(int exit_code, std::string err) {
        return process_output{.spawned = true, .exit_code = exit_code, .stderr_text = std::move(err)};
    }

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }

        write_text_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    inline bool has_exact_arg(const std::vector<std::string>& args, std::string_view token) {
        return std::find(args.begin(), args.end(), token) != args.end();
    }

    inline std::size_t count_occurrences(std::string_view text, std::string_view needle) {
        std::size_t count = 0U;
        for (auto pos = text.find(needle); pos != std::string_view::npos; pos = text.find(needle, pos + 1U)) {
            ++count;
        }
        return count;
    }
}  // namespace asmcmp::test::detail
