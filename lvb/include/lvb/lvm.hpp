#ifndef LVM_HPP
#define LVM_HPP

#include "lvb/io_utils.hpp"

#include <cstdint>        // for uint64_t
#include <expected>       // for expected
#include <optional>       // for optional
#include <string>         // for string
#include <string_view>    // for string_view
#include <unordered_map>  // for unordered_map
#include <vector>         // for vector

namespace lvb::lvm {

/// @brief Row of the pvs report.
struct PhysicalVolume final {
    /// Device path, joins with DeviceRecord::path.
    std::string pv_name;
    std::optional<std::uint64_t> size_bytes;
    std::optional<std::uint64_t> free_bytes;
    /// Owning volume group, empty for orphan PVs.
    std::string vg_name;
    /// Metadata format (e.g. lvm2).
    std::string format;
};

/// @brief Row of the vgs report.
struct VolumeGroup final {
    std::string vg_name;
    std::optional<std::uint64_t> size_bytes;
    std::optional<std::uint64_t> free_bytes;
    std::optional<std::uint64_t> pv_count;
    std::optional<std::uint64_t> lv_count;
    /// Attribute string (e.g. wz--n-).
    std::string attributes;
    std::optional<std::uint64_t> extent_size_bytes;
};

/// @brief Segment row of the lvs report.
/// An LV with several segments is reported once per segment.
struct LogicalVolume final {
    std::string vg_name;
    std::string lv_name;
    std::optional<std::uint64_t> size_bytes;
    std::optional<std::uint64_t> segment_extent_count;
    std::optional<std::uint64_t> segment_start_extent;
    /// e.g. "/dev/sda1(0),/dev/sdb1(20)"
    std::string device_placement;
};

/// @brief Physical devices of a segment with their start extents.
struct DevicePlacement final {
    /// Device names without the "(start)" suffix, tokens without it as is.
    std::vector<std::string> devices;
    /// Start extent text of every token that had one, in device order.
    std::vector<std::string> start_extents;
};

/// @brief Lookup tables of one LVM snapshot.
struct LvmTables final {
    std::unordered_map<std::string, PhysicalVolume> pv_by_path;
    /// PV names in first-seen report order.
    std::vector<std::string> pv_order;
    std::unordered_map<std::string, VolumeGroup> vg_by_name;
    /// VG names in first-seen report order.
    std::vector<std::string> vg_order;
    /// All segment rows of a VG, in report order.
    std::unordered_map<std::string, std::vector<LogicalVolume>> lv_rows_by_vg;

    [[nodiscard]] auto find_pv(std::string_view pv_name) const noexcept -> const PhysicalVolume*;
    [[nodiscard]] auto find_vg(std::string_view vg_name) const noexcept -> const VolumeGroup*;
    [[nodiscard]] auto lv_rows(std::string_view vg_name) const noexcept -> const std::vector<LogicalVolume>&;
};

/// @brief Parses `pvs --reportformat json` output.
/// @return rows, or error message on malformed input
auto parse_pvs_report(std::string_view json_output) noexcept -> std::expected<std::vector<PhysicalVolume>, std::string>;

/// @brief Parses `vgs --reportformat json` output.
/// @return rows, or error message on malformed input
auto parse_vgs_report(std::string_view json_output) noexcept -> std::expected<std::vector<VolumeGroup>, std::string>;

/// @brief Parses `lvs --reportformat json` output.
/// @return rows, or error message on malformed input
auto parse_lvs_report(std::string_view json_output) noexcept -> std::expected<std::vector<LogicalVolume>, std::string>;

/// @brief Builds the lookup tables, later duplicates overwrite earlier ones.
auto build_lvm_tables(std::vector<PhysicalVolume> pvs, std::vector<VolumeGroup> vgs, std::vector<LogicalVolume> lvs) noexcept -> LvmTables;

/// @brief Parses the devices field of a segment
/// e.g "/dev/sda1(10), /dev/sdb2(20)" -> {"/dev/sda1", "/dev/sdb2"}, {"10", "20"}
auto parse_device_placement(std::string_view placement) noexcept -> DevicePlacement;

/// @brief Executes pvs and returns its raw JSON report.
auto read_pvs_report(const utils::RunOptions& options = {}) noexcept -> std::expected<std::string, utils::CommandError>;

/// @brief Executes vgs and returns its raw JSON report.
auto read_vgs_report(const utils::RunOptions& options = {}) noexcept -> std::expected<std::string, utils::CommandError>;

/// @brief Executes lvs and returns its raw JSON report.
auto read_lvs_report(const utils::RunOptions& options = {}) noexcept -> std::expected<std::string, utils::CommandError>;

}  // namespace lvb::lvm

#endif  // LVM_HPP
