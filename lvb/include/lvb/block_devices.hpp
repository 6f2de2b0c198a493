#ifndef BLOCK_DEVICES_HPP
#define BLOCK_DEVICES_HPP

#include "lvb/fs_usage.hpp"
#include "lvb/io_utils.hpp"
#include "lvb/partition_table.hpp"

#include <cstdint>        // for uint64_t, uint8_t
#include <expected>       // for expected
#include <optional>       // for optional
#include <string>         // for string
#include <string_view>    // for string_view
#include <unordered_set>  // for unordered_set
#include <vector>         // for vector

namespace lvb::disk {

/// @brief Kind of block device.
enum class DeviceKind : std::uint8_t {
    Disk,
    Partition,
    Lvm,
    Other
};

/// @brief Convert lsblk type string (disk, part, lvm, ...) to device kind
auto device_kind_from_string(std::string_view type_str) noexcept -> DeviceKind;

/// @brief Raw block device node as reported by lsblk, including nested children.
struct BlockDeviceNode {
    /// Device name (e.g., sda1, vg0-root).
    std::string name;
    /// Device path (e.g., /dev/sda1).
    std::optional<std::string> path;
    /// Device type (e.g., part, lvm, disk).
    std::string type;
    /// Size of the device in bytes.
    std::optional<std::uint64_t> size;
    /// Nested devices (partitions of a disk, LVs on a partition, ...).
    std::vector<BlockDeviceNode> children;
};

/// @brief Partition-table metadata attached to a device.
/// Disk-level fields are filled for disks, partition-level fields for partitions.
struct PartitionTableInfo final {
    // disk level
    std::optional<std::string> disk_model;
    std::optional<std::string> disklabel_type;
    std::optional<std::string> gpt_model_info;
    std::optional<std::string> gpt_part_table_type;

    // partition level
    std::optional<std::string> fdisk_id_info;
    std::optional<std::string> fdisk_type_info;
    std::optional<std::string> gpt_disk_flags_type;
    std::optional<std::string> gpt_fs_info;
    std::optional<std::string> gpt_df_flags_info;
};

/// @brief One row of the flattened device list.
struct DeviceRecord {
    /// Unique key, falls back to name when lsblk reports no path.
    std::string path;
    std::string name;
    /// Raw lsblk type.
    std::string type;
    DeviceKind kind{DeviceKind::Other};
    std::uint64_t size_bytes{};
    /// Mount and capacity information, std::nullopt if not mounted.
    std::optional<fs::FsUsage> usage;
    /// std::nullopt if the device path did not match any known disk.
    std::optional<PartitionTableInfo> table_info;

    [[nodiscard]] auto mount_point_str() const noexcept -> std::string;
    [[nodiscard]] auto used_str() const noexcept -> std::string;
    [[nodiscard]] auto avail_str() const noexcept -> std::string;
};

/// @brief Parses the JSON output of `lsblk -J` into the device tree.
/// @param json_output The JSON string from lsblk.
/// @return root nodes, or error message on malformed input
auto parse_lsblk_tree(std::string_view json_output) noexcept -> std::expected<std::vector<BlockDeviceNode>, std::string>;

/// @brief Returns the identity key of the node: path or name.
auto device_identity(const BlockDeviceNode& node) noexcept -> std::string_view;

/// @brief Finds the disk the device belongs to, by the longest disk path prefix.
/// @param device_path The device path.
/// @param mbr_info Disks reported by fdisk.
/// @param gpt_info Disks reported by parted.
/// @return matched disk path, std::nullopt otherwise
auto find_owning_disk(std::string_view device_path, const MbrDiskMap& mbr_info, const GptDiskMap& gpt_info) noexcept
    -> std::optional<std::string>;

/// @brief Builds partition-table information for the device.
/// @return std::nullopt if device is not under /dev/ or not on a known disk
auto lookup_partition_table_info(std::string_view device_path, const MbrDiskMap& mbr_info, const GptDiskMap& gpt_info) noexcept
    -> std::optional<PartitionTableInfo>;

/// @brief Flattens one node and its children into out, depth-first pre-order.
/// @param node The node to flatten.
/// @param usage_map Filesystem usage keyed by source device.
/// @param mbr_info Disks reported by fdisk.
/// @param gpt_info Disks reported by parted.
/// @param seen Identity keys already added.
/// @param out The resulting list.
void flatten_node(const BlockDeviceNode& node, const fs::FsUsageMap& usage_map, const MbrDiskMap& mbr_info,
    const GptDiskMap& gpt_info, std::unordered_set<std::string>& seen, std::vector<DeviceRecord>& out) noexcept;

/// @brief Flattens the device forest into a deduplicated list, first occurrence wins.
auto flatten_block_devices(const std::vector<BlockDeviceNode>& roots, const fs::FsUsageMap& usage_map,
    const MbrDiskMap& mbr_info, const GptDiskMap& gpt_info) noexcept -> std::vector<DeviceRecord>;

/// @brief Short partition classification for table display.
/// @return "Disk", "Pri", "Extd", "Logi" or "---"
auto classify_partition(const DeviceRecord& device) noexcept -> std::string_view;

/// @brief Finds a device by its path.
/// @param devices A vector of DeviceRecord objects.
/// @param device_path A string view containing the path of the device to find.
/// @return pointer to the record if found, nullptr otherwise.
auto find_device_by_path(const std::vector<DeviceRecord>& devices, std::string_view device_path) noexcept -> const DeviceRecord*;

/// @brief Executes lsblk command and returns its raw JSON report.
auto read_lsblk_report(const utils::RunOptions& options = {}) noexcept -> std::expected<std::string, utils::CommandError>;

}  // namespace lvb::disk

#endif  // BLOCK_DEVICES_HPP
