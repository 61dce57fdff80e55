#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace asmcmp {

    struct process_output {
        // false when the program could not be executed at all (missing, not executable)
        bool spawned{false};
        bool timed_out{false};
        int exit_code{-1};
        std::string stdout_text{};
        std::string stderr_text{};
    };

    // Raised when the operating system refuses to set up a child (pipe/fork failure).
    class tool_invocation_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    class process_runner {
      public:
        virtual ~process_runner() = default;

        // Runs args[0] with args[1..] and blocks until it exits or the timeout expires.
        virtual process_output run(
                const std::vector<std::string>& args, std::optional<std::chrono::milliseconds> timeout) = 0;
    };

    class system_process_runner final : public process_runner {
      public:
        process_output run(
                const std::vector<std::string>& args, std::optional<std::chrono::milliseconds> timeout) override;
    };

}  // namespace asmcmp
