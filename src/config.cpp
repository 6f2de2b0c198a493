#include "config.hpp"
#include "definitions.hpp"  // for error_inter, warning_inter

// import lvb
#include "lvb/io_utils.hpp"

#include <filesystem>    // for exists
#include <memory>        // for unique_ptr, make_unique, operator==
#include <string>        // for string
#include <system_error>  // for error_code
#include <utility>       // for move

static std::unique_ptr<Config> s_config = nullptr;

namespace fs = std::filesystem;

namespace {

// Explicit path from the environment, then the system-wide file.
auto find_config_path() noexcept -> std::string {
    const auto& env_path = lvb::utils::safe_getenv(browser::CONFIG_PATH_ENV);
    if (!env_path.empty()) {
        return std::string{env_path};
    }
    std::error_code err{};
    if (fs::exists(browser::DEFAULT_CONFIG_PATH, err)) {
        return std::string{browser::DEFAULT_CONFIG_PATH};
    }
    return {};
}

}  // namespace

bool Config::initialize() noexcept {
    if (s_config != nullptr) {
        error_inter("You should only initialize it once!\n");
        return false;
    }
    s_config = std::make_unique<Config>();
    if (s_config) {
        s_config->m_data = browser::get_default_config();

        const auto& config_path = find_config_path();
        if (!config_path.empty()) {
            auto config = browser::load_browser_config(config_path);
            if (config) {
                s_config->m_data = std::move(*config);
            } else {
                warning_inter("Invalid configuration, using defaults: {}\n", config.error());
            }
        }
    }

    return s_config.get();
}

auto Config::instance() -> Config* {
    return s_config.get();
}
