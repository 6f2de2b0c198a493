#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "browser_config.hpp"

#include <chrono>  // for milliseconds

class Config final {
 public:
    using value_type      = browser::BrowserConfig;
    using reference       = value_type&;
    using const_reference = const value_type&;

    Config() noexcept          = default;
    virtual ~Config() noexcept = default;

    static bool initialize() noexcept;
    static Config* instance();

    /* clang-format off */

    // Element access.
    auto data() noexcept -> reference
    { return m_data; }
    auto data() const noexcept -> const_reference
    { return m_data; }

    /* clang-format on */

    auto command_timeout() const noexcept -> std::chrono::milliseconds
    { return std::chrono::milliseconds{m_data.command_timeout_ms}; }

 private:
    value_type m_data{};
};

#endif  // CONFIG_HPP
