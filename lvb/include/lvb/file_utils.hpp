#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace lvb::file_utils {

/// @brief Reads the whole file into memory.
/// @return file content, std::nullopt if the file cannot be opened or read
auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string>;

}  // namespace lvb::file_utils

#endif  // FILE_UTILS_HPP
