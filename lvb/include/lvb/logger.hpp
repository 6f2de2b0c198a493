#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>  // for shared_ptr

#include <spdlog/spdlog.h>

namespace lvb::logger {

// Set library default logger
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

// Logger which drops every message, used while no sink is configured
auto make_null_logger(const char* name) noexcept -> std::shared_ptr<spdlog::logger>;

}  // namespace lvb::logger

#endif  // LOGGER_HPP
