#ifndef FS_USAGE_HPP
#define FS_USAGE_HPP

#include <cstdint>      // for uint64_t
#include <expected>     // for expected
#include <map>          // for map
#include <string>       // for string
#include <string_view>  // for string_view

#include "lvb/io_utils.hpp"

namespace lvb::fs {

/// @brief Usage of a mounted filesystem.
struct FsUsage final {
    /// Mount target, may contain spaces.
    std::string mount_point;
    std::uint64_t size_bytes{};
    std::uint64_t used_bytes{};
    std::uint64_t avail_bytes{};
    /// Use% column without the percent sign.
    std::string use_percent;
};

/// Usage keyed by source device (e.g. /dev/sda1, /dev/mapper/vg0-root).
using FsUsageMap = std::map<std::string, FsUsage>;

/// @brief Parses `df --output=source,size,used,avail,pcent,target` output in 1K blocks.
/// Header row is skipped, as well as rows with less than 6 fields.
/// @param df_output The text from df.
/// @return usage keyed by source
auto parse_df_output(std::string_view df_output) noexcept -> FsUsageMap;

/// @brief Executes df and returns its raw report.
auto read_df_report(const utils::RunOptions& options = {}) noexcept -> std::expected<std::string, utils::CommandError>;

}  // namespace lvb::fs

#endif  // FS_USAGE_HPP
