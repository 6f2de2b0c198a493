#include "config.hpp"       // for Config
#include "definitions.hpp"  // for error_inter
#include "tui.hpp"          // for init

// import lvb
#include "lvb/io_utils.hpp"
#include "lvb/logger.hpp"
#include "lvb/snapshot.hpp"

#include <chrono>  // for seconds
#include <string>  // for string

#include <spdlog/async.h>                  // for create_async
#include <spdlog/common.h>                 // for level
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt
#include <spdlog/spdlog.h>                 // for set_default_logger, set_level

int main() {
    // Initialize default config.
    if (!Config::initialize()) {
        return 1;
    }
    const auto& config = Config::instance()->data();

    // Initialize logger.
    try {
        auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("lvb_logger", config.log_file);
        lvb::logger::set_logger(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        warning_inter("Failed to open log file '{}': {}\n", config.log_file, ex.what());
        lvb::logger::set_logger(lvb::logger::make_null_logger("lvb_logger"));
    }
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::flush_every(std::chrono::seconds(5));

    info_inter("Reading storage topology...\n");
    const auto& snapshot = lvb::load_snapshot(lvb::utils::RunOptions{.timeout = Config::instance()->command_timeout()});
    if (snapshot.devices.empty()) {
        error_inter("No block devices found or permission denied.\n");
        spdlog::error("lsblk reported no block devices");
        spdlog::shutdown();
        return 1;
    }

    tui::init(snapshot);

    spdlog::shutdown();
}
