#include "lvb/file_utils.hpp"

#include <cerrno>   // for errno
#include <cstdio>   // for fopen, fread, fclose, ferror
#include <cstring>  // for strerror

#include <array>   // for array
#include <memory>  // for unique_ptr

#include <spdlog/spdlog.h>

namespace lvb::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string> {
    const std::string path{filepath};

    // Use std::fopen because it's faster than std::ifstream
    std::unique_ptr<std::FILE, decltype(&std::fclose)> file{std::fopen(path.c_str(), "rb"), &std::fclose};
    if (!file) {
        spdlog::debug("[READWHOLEFILE] '{}' open failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }

    std::string buf{};
    std::array<char, 4096> chunk{};
    while (true) {
        const auto read = std::fread(chunk.data(), sizeof(char), chunk.size(), file.get());
        buf.append(chunk.data(), read);
        if (read < chunk.size()) {
            break;
        }
    }
    if (std::ferror(file.get()) != 0) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }
    return buf;
}

}  // namespace lvb::file_utils
