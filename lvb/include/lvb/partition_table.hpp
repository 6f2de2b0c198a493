#ifndef PARTITION_TABLE_HPP
#define PARTITION_TABLE_HPP

#include <expected>     // for expected
#include <map>          // for map
#include <string>       // for string
#include <string_view>  // for string_view

#include "lvb/io_utils.hpp"

namespace lvb::disk {

/// @brief Partition row of a legacy (dos) partition table, as reported by fdisk.
struct MbrPartitionInfo final {
    /// Id column (e.g. 83, 8e).
    std::string fdisk_id_info;
    /// Type column (e.g. "Linux LVM").
    std::string fdisk_type_info;
};

/// @brief Per-disk information reported by fdisk.
struct MbrDiskInfo final {
    std::string disk_model;
    /// Disklabel type (dos, gpt, ...).
    std::string disklabel_type;
    /// Keyed by partition path.
    std::map<std::string, MbrPartitionInfo> partitions;
};

/// @brief Partition row reported by parted.
struct GptPartitionInfo final {
    std::string gpt_disk_flags_type;
    std::string gpt_fs_info;
    std::string gpt_df_flags_info;
};

/// @brief Per-disk information reported by parted.
struct GptDiskInfo final {
    std::string gpt_model_info;
    /// Partition table type (gpt, msdos, loop, ...).
    std::string gpt_part_table_type;
    /// Keyed by partition path.
    std::map<std::string, GptPartitionInfo> partitions;
};

using MbrDiskMap = std::map<std::string, MbrDiskInfo>;
using GptDiskMap = std::map<std::string, GptDiskInfo>;

/// @brief Shortens vendor strings for display
/// e.g "VBOX HARDDISK" -> "VBOX HDD".
auto clean_device_info(std::string_view text) noexcept -> std::string;

/// @brief Parses `fdisk -l` output.
/// @param fdisk_output The text from fdisk.
/// @return disks keyed by disk path, empty on unrecognized input
auto parse_fdisk_output(std::string_view fdisk_output) noexcept -> MbrDiskMap;

/// @brief Parses `parted -l` output.
/// @param parted_output The text from parted.
/// @return disks keyed by disk path, empty on unrecognized input
auto parse_parted_output(std::string_view parted_output) noexcept -> GptDiskMap;

/// @brief Executes fdisk and returns its raw report.
auto read_fdisk_report(const utils::RunOptions& options = {}) noexcept -> std::expected<std::string, utils::CommandError>;

/// @brief Executes parted and returns its raw report.
auto read_parted_report(const utils::RunOptions& options = {}) noexcept -> std::expected<std::string, utils::CommandError>;

}  // namespace lvb::disk

#endif  // PARTITION_TABLE_HPP
