#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include <chrono>       // for milliseconds
#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <rapidjson/document.h>

namespace lvb::utils {

/// @brief Reasons an external command produced no usable output.
enum class CommandError : std::uint8_t {
    /// The binary could not be found/executed.
    NotFound,
    /// fork/pipe failed.
    SpawnFailed,
    /// The command exited with a non-zero status.
    NonZeroExit,
    /// The command was terminated by a signal.
    Signaled,
    /// The command did not finish within the timeout and was killed.
    TimedOut,
    /// The output could not be parsed as JSON.
    MalformedOutput,
};

/// @brief Options for spawning an external command.
struct RunOptions final {
    /// Upper bound for the run time, the child is killed afterwards.
    std::chrono::milliseconds timeout{std::chrono::seconds(10)};
    /// Force the C locale in the child, so that the reports are not translated.
    bool c_locale{true};
};

/// @brief Convert command error to string representation
auto command_error_to_string(CommandError error) noexcept -> std::string_view;

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

/// @brief Spawns the command (no shell) and captures its stdout.
/// @param argv The program followed by its arguments.
/// @param options Timeout and locale settings.
/// @return Captured stdout on zero exit status, CommandError otherwise.
auto run_text(const std::vector<std::string>& argv, const RunOptions& options = {}) noexcept
    -> std::expected<std::string, CommandError>;

/// @brief Spawns the command and parses its stdout as JSON document.
/// @param argv The program followed by its arguments.
/// @param options Timeout and locale settings.
/// @return Parsed document, CommandError otherwise.
auto run_structured(const std::vector<std::string>& argv, const RunOptions& options = {}) noexcept
    -> std::expected<rapidjson::Document, CommandError>;

/// @brief Parses JSON text into a document.
/// @return Parsed document, or CommandError::MalformedOutput.
auto parse_json(std::string_view json_text) noexcept -> std::expected<rapidjson::Document, CommandError>;

}  // namespace lvb::utils

#endif  // IO_UTILS_HPP
