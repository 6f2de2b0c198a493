#include "lvb/io_utils.hpp"

#include <fcntl.h>     // for open, O_WRONLY
#include <poll.h>      // for poll, pollfd
#include <signal.h>    // for kill, SIGKILL
#include <sys/wait.h>  // for waitpid
#include <unistd.h>    // for execvpe, fork, pipe, environ

#include <cerrno>   // for errno, EINTR
#include <cstdint>  // for int32_t
#include <cstdlib>  // for getenv

#include <algorithm>  // for transform
#include <array>      // for array
#include <iterator>   // for back_inserter
#include <optional>   // for optional
#include <thread>     // for sleep_for

#include <rapidjson/error/en.h>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// exit status used by the child when execvp fails
static constexpr std::int32_t EXEC_FAILED_STATUS = 127;

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Drain the pipe until EOF or the deadline.
auto read_until_eof(int fd, std::string& output, std::chrono::steady_clock::time_point deadline) noexcept -> bool {
    std::array<char, 4096> buffer{};
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
        const auto ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return true;
        }
        if (ready == 0) {
            continue;
        }

        const auto bytes_read = ::read(fd, buffer.data(), buffer.size());
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        if (bytes_read <= 0) {
            return true;
        }
        output.append(buffer.data(), static_cast<std::size_t>(bytes_read));
    }
}

// Child environment, the child must not allocate after fork.
auto make_child_env(bool c_locale) noexcept -> std::vector<std::string> {
    std::vector<std::string> env{};
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string_view var{*entry};
        if (c_locale && var.starts_with("LC_ALL="sv)) {
            continue;
        }
        env.emplace_back(var);
    }
    if (c_locale) {
        env.emplace_back("LC_ALL=C");
    }
    return env;
}

auto make_c_array(std::vector<std::string>& strings) noexcept -> std::vector<char*> {
    std::vector<char*> result;
    std::transform(strings.begin(), strings.end(), std::back_inserter(result),
        [](std::string& str) -> char* { return str.data(); });
    result.push_back(nullptr);
    return result;
}

// Reap the child, giving up at the deadline.
auto wait_child_until(pid_t pid, std::chrono::steady_clock::time_point deadline) noexcept -> std::optional<std::int32_t> {
    using namespace std::chrono_literals;
    std::int32_t status{};
    while (true) {
        const auto reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            return status;
        }
        if (reaped < 0 && errno != EINTR) {
            return status;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(5ms);
    }
}

auto wait_child(pid_t pid) noexcept -> std::int32_t {
    std::int32_t status{};
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            break;
        }
    }
    return status;
}

}  // namespace

namespace lvb::utils {

auto command_error_to_string(CommandError error) noexcept -> std::string_view {
    switch (error) {
    case CommandError::NotFound:
        return "not found"sv;
    case CommandError::SpawnFailed:
        return "spawn failed"sv;
    case CommandError::NonZeroExit:
        return "non-zero exit status"sv;
    case CommandError::Signaled:
        return "terminated by signal"sv;
    case CommandError::TimedOut:
        return "timed out"sv;
    case CommandError::MalformedOutput:
        return "malformed output"sv;
    }
    return "unknown"sv;
}

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto run_text(const std::vector<std::string>& argv, const RunOptions& options) noexcept
    -> std::expected<std::string, CommandError> {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;

    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[run_text] cmd := {}", argv);
    }
    if (argv.empty()) {
        return std::unexpected(CommandError::SpawnFailed);
    }

    std::array<int, 2> pipe_fds{-1, -1};
    if (::pipe2(pipe_fds.data(), O_CLOEXEC) != 0) {
        spdlog::error("[run_text] pipe failed for '{}'", argv.front());
        return std::unexpected(CommandError::SpawnFailed);
    }

    // argv and env must outlive the child until execvpe
    auto argv_copy = argv;
    auto env       = make_child_env(options.c_locale);
    auto args      = make_c_array(argv_copy);
    auto envp      = make_c_array(env);

    const auto pid = ::fork();
    if (pid < 0) {
        spdlog::error("[run_text] fork failed for '{}'", argv.front());
        close_fd(pipe_fds[0]);
        close_fd(pipe_fds[1]);
        return std::unexpected(CommandError::SpawnFailed);
    }
    if (pid == 0) {
        ::dup2(pipe_fds[1], STDOUT_FILENO);
        const int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDERR_FILENO);
            ::dup2(devnull, STDIN_FILENO);
        }
        ::execvpe(args[0], args.data(), envp.data());
        ::_exit(EXEC_FAILED_STATUS);
    }

    close_fd(pipe_fds[1]);

    std::string output{};
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    const bool finished = read_until_eof(pipe_fds[0], output, deadline);
    close_fd(pipe_fds[0]);

    // the child may close stdout and keep running
    const auto child_status = finished ? wait_child_until(pid, deadline) : std::nullopt;
    if (!child_status) {
        ::kill(pid, SIGKILL);
        wait_child(pid);
        spdlog::warn("[run_text] '{}' timed out after {}ms", argv.front(), options.timeout.count());
        return std::unexpected(CommandError::TimedOut);
    }

    const auto status = *child_status;
    if (WIFSIGNALED(status)) {
        spdlog::debug("[run_text] '{}' terminated by signal {}", argv.front(), WTERMSIG(status));
        return std::unexpected(CommandError::Signaled);
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == EXEC_FAILED_STATUS) {
        spdlog::debug("[run_text] '{}' not found", argv.front());
        return std::unexpected(CommandError::NotFound);
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        spdlog::debug("[run_text] '{}' exited with status {}", argv.front(), WEXITSTATUS(status));
        return std::unexpected(CommandError::NonZeroExit);
    }
    return output;
}

auto parse_json(std::string_view json_text) noexcept -> std::expected<rapidjson::Document, CommandError> {
    rapidjson::Document document;
    document.Parse(json_text.data(), json_text.size());
    if (document.HasParseError()) {
        spdlog::debug("Failed to parse json output: {}", rapidjson::GetParseError_En(document.GetParseError()));
        return std::unexpected(CommandError::MalformedOutput);
    }
    return document;
}

auto run_structured(const std::vector<std::string>& argv, const RunOptions& options) noexcept
    -> std::expected<rapidjson::Document, CommandError> {
    auto output = utils::run_text(argv, options);
    if (!output) {
        return std::unexpected(output.error());
    }
    return utils::parse_json(*output);
}

}  // namespace lvb::utils
