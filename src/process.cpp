#include "asmcmp/process.hpp"

#include "asmcmp/format.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace asmcmp::literals;
using namespace std::string_view_literals;

namespace asmcmp {

    namespace detail {

        class fd_guard {
          public:
            fd_guard() = default;
            explicit fd_guard(int fd) : fd_value(fd) {}

            fd_guard(const fd_guard&) = delete;
            fd_guard& operator=(const fd_guard&) = delete;

            fd_guard(fd_guard&& other) noexcept : fd_value(std::exchange(other.fd_value, -1)) {}
            fd_guard& operator=(fd_guard&& other) noexcept {
                if (this != &other) {
                    reset(std::exchange(other.fd_value, -1));
                }
                return *this;
            }

            ~fd_guard() { reset(); }

            int get() const { return fd_value; }

            void reset(int fd = -1) {
                if (fd_value >= 0) {
                    ::close(fd_value);
                }
                fd_value = fd;
            }

          private:
            int fd_value{-1};
        };

        struct pipe_pair {
            fd_guard read_end{};
            fd_guard write_end{};
        };

        // close-on-exec on both ends; dup2 onto stdio clears the flag on the child's copy
        static pipe_pair make_pipe() {
            int fds[2]{};
            if (::pipe2(fds, O_CLOEXEC) != 0) {
                throw tool_invocation_error{"pipe() failed: {}"_format(std::strerror(errno))};
            }
            pipe_pair pair{};
            pair.read_end.reset(fds[0]);
            pair.write_end.reset(fds[1]);
            return pair;
        }

        // Only async-signal-safe calls between fork and exec.
        [[noreturn]] static void exec_child(char* const* argv, int stdout_fd, int stderr_fd, int status_fd) {
            auto devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }
            if (::dup2(stdout_fd, STDOUT_FILENO) < 0 || ::dup2(stderr_fd, STDERR_FILENO) < 0) {
                int err = errno;
                (void)!::write(status_fd, &err, sizeof(err));
                _exit(127);
            }

            ::execvp(argv[0], argv);

            int err = errno;
            (void)!::write(status_fd, &err, sizeof(err));
            _exit(127);
        }

        // Reads the errno the child reports when exec fails; the pipe is close-on-exec so a
        // successful exec yields EOF.
        static std::optional<int> read_exec_errno(int fd) {
            int err = 0;
            for (;;) {
                auto n = ::read(fd, &err, sizeof(err));
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n == static_cast<ssize_t>(sizeof(err))) {
                    return err;
                }
                return std::nullopt;
            }
        }

        static int decode_wait_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

        static int wait_for(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    throw tool_invocation_error{"waitpid failed: {}"_format(std::strerror(errno))};
                }
            }
            return status;
        }

        // Reaps the child once its pipes are closed, still honoring the deadline; nullopt means it
        // was still running when the deadline passed.
        static std::optional<int> wait_until(pid_t pid, std::chrono::steady_clock::time_point deadline) {
            constexpr auto poll_interval = std::chrono::milliseconds{10};
            int status = 0;
            for (;;) {
                auto ret = ::waitpid(pid, &status, WNOHANG);
                if (ret == pid) {
                    return status;
                }
                if (ret < 0 && errno != EINTR) {
                    throw tool_invocation_error{"waitpid failed: {}"_format(std::strerror(errno))};
                }
                auto now = std::chrono::steady_clock::now();
                if (now >= deadline) {
                    return std::nullopt;
                }
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
                std::this_thread::sleep_for(std::min(poll_interval, remaining));
            }
        }

    }  // namespace detail

    process_output system_process_runner::run(
            const std::vector<std::string>& args, std::optional<std::chrono::milliseconds> timeout) {
        if (args.empty()) {
            throw tool_invocation_error{"cannot run an empty command"};
        }

        auto stdout_pipe = detail::make_pipe();
        auto stderr_pipe = detail::make_pipe();
        auto status_pipe = detail::make_pipe();

        std::vector<char*> argv{};
        argv.reserve(args.size() + 1U);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        debug_log("spawning: ", utils::join_with_separator(args, " "sv));

        auto pid = ::fork();
        if (pid < 0) {
            throw tool_invocation_error{"fork failed: {}"_format(std::strerror(errno))};
        }

        if (pid == 0) {
            detail::exec_child(
                    argv.data(), stdout_pipe.write_end.get(), stderr_pipe.write_end.get(), status_pipe.write_end.get());
        }

        // parent
        stdout_pipe.write_end.reset();
        stderr_pipe.write_end.reset();
        status_pipe.write_end.reset();

        process_output output{};

        if (auto exec_errno = detail::read_exec_errno(status_pipe.read_end.get())) {
            (void)detail::wait_for(pid);
            output.spawned = false;
            output.exit_code = 127;
            output.stderr_text = "failed to execute {}: {}\n"_format(args.front(), std::strerror(*exec_errno));
            return output;
        }
        output.spawned = true;

        pollfd fds[2]{};
        fds[0] = {.fd = stdout_pipe.read_end.get(), .events = POLLIN, .revents = 0};
        fds[1] = {.fd = stderr_pipe.read_end.get(), .events = POLLIN, .revents = 0};
        int fds_open = 2;

        auto deadline = timeout ? std::optional{std::chrono::steady_clock::now() + *timeout} : std::nullopt;

        char chunk[4096];
        while (fds_open > 0) {
            int wait_ms = -1;
            if (deadline) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                         *deadline - std::chrono::steady_clock::now())
                                         .count();
                if (remaining <= 0) {
                    output.timed_out = true;
                    break;
                }
                wait_ms = static_cast<int>(remaining);
            }

            int ret = ::poll(fds, 2, wait_ms);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                ::kill(pid, SIGKILL);
                (void)detail::wait_for(pid);
                throw tool_invocation_error{"poll failed: {}"_format(std::strerror(errno))};
            }
            if (ret == 0) {
                output.timed_out = true;
                break;
            }

            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (i == 0 ? output.stdout_text : output.stderr_text).append(chunk, static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR) {
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }
        }

        std::optional<int> status{};
        if (!output.timed_out && deadline) {
            status = detail::wait_until(pid, *deadline);
            output.timed_out = !status.has_value();
        }

        if (output.timed_out) {
            ::kill(pid, SIGKILL);
        }

        if (!status) {
            status = detail::wait_for(pid);
        }
        output.exit_code = detail::decode_wait_status(*status);

        if (output.timed_out) {
            output.stderr_text += "{} timed out after {} ms\n"_format(args.front(), timeout->count());
        }

        debug_log("exited: ", args.front(), " status=", output.exit_code);
        return output;
    }

}  // namespace asmcmp
