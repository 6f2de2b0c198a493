#include "browser_config.hpp"

// import lvb
#include "lvb/file_utils.hpp"

#include <expected>     // for expected, unexpected
#include <string_view>  // for string_view

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/common.h>

using namespace std::string_view_literals;

namespace {

auto is_valid_log_level(std::string_view level) noexcept -> bool {
    // from_str maps every unknown name to off
    return level == "off"sv || spdlog::level::from_str(std::string{level}) != spdlog::level::off;
}

}  // namespace

namespace browser {

auto get_default_config() noexcept -> BrowserConfig {
    return BrowserConfig{};
}

auto parse_browser_config(std::string_view json_content) noexcept
    -> std::expected<BrowserConfig, std::string> {
    if (json_content.empty()) {
        return get_default_config();
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    auto config = get_default_config();

    if (doc.HasMember("command_timeout_ms")) {
        if (!doc["command_timeout_ms"].IsInt() || doc["command_timeout_ms"].GetInt() <= 0) {
            return std::unexpected("'command_timeout_ms' must be a positive integer");
        }
        config.command_timeout_ms = doc["command_timeout_ms"].GetInt();
    }

    if (doc.HasMember("log_file")) {
        if (!doc["log_file"].IsString() || doc["log_file"].GetStringLength() == 0) {
            return std::unexpected("'log_file' must be a non-empty string");
        }
        config.log_file = doc["log_file"].GetString();
    }

    if (doc.HasMember("log_level")) {
        if (!doc["log_level"].IsString()) {
            return std::unexpected("'log_level' must be a string");
        }
        const std::string_view log_level{doc["log_level"].GetString(), doc["log_level"].GetStringLength()};
        if (!is_valid_log_level(log_level)) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid log level '{}'"), log_level));
        }
        config.log_level = std::string{log_level};
    }

    if (doc.HasMember("show_all_pvs_when_unassigned")) {
        if (!doc["show_all_pvs_when_unassigned"].IsBool()) {
            return std::unexpected("'show_all_pvs_when_unassigned' must be a boolean");
        }
        config.show_all_pvs_when_unassigned = doc["show_all_pvs_when_unassigned"].GetBool();
    }

    return config;
}

auto load_browser_config(std::string_view config_path) noexcept
    -> std::expected<BrowserConfig, std::string> {
    const auto& content = lvb::file_utils::read_whole_file(config_path);
    if (!content) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to read '{}'"), config_path));
    }
    auto config = parse_browser_config(*content);
    if (!config) {
        return std::unexpected(fmt::format(FMT_COMPILE("{}: {}"), config_path, config.error()));
    }
    return config;
}

}  // namespace browser
