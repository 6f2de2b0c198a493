#ifndef BROWSER_CONFIG_HPP
#define BROWSER_CONFIG_HPP

#include <cstdint>      // for int32_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view

namespace browser {

/// Default location of the configuration file.
inline constexpr std::string_view DEFAULT_CONFIG_PATH = "/etc/lvm-browser.json";

/// Environment variable which overrides the configuration file location.
inline constexpr const char* CONFIG_PATH_ENV = "LVB_CONFIG";

/// Runtime configuration of the browser.
struct BrowserConfig {
    /// Upper bound for every external command.
    std::int32_t command_timeout_ms{10000};
    std::string log_file{"/tmp/lvm-browser.log"};
    /// spdlog level name (trace, debug, info, warning, error, critical, off).
    std::string log_level{"info"};
    /// List every PV when the selected device is not a PV.
    bool show_all_pvs_when_unassigned{true};
};

/// Parses browser configuration from JSON string content.
/// @param json_content The JSON configuration content.
/// @return BrowserConfig on success, or error string on failure.
[[nodiscard]] auto parse_browser_config(std::string_view json_content) noexcept
    -> std::expected<BrowserConfig, std::string>;

/// Reads and parses the configuration file.
/// @param config_path The file to read.
/// @return BrowserConfig on success, or error string if the file is unreadable or invalid.
[[nodiscard]] auto load_browser_config(std::string_view config_path) noexcept
    -> std::expected<BrowserConfig, std::string>;

/// Returns default BrowserConfig.
[[nodiscard]] auto get_default_config() noexcept -> BrowserConfig;

}  // namespace browser

#endif  // BROWSER_CONFIG_HPP
