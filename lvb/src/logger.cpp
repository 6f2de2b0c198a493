#include "lvb/logger.hpp"

#include <utility>  // for move

#include <spdlog/sinks/null_sink.h>

namespace lvb::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    spdlog::set_default_logger(std::move(default_logger));
}

auto make_null_logger(const char* name) noexcept -> std::shared_ptr<spdlog::logger> {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

}  // namespace lvb::logger
