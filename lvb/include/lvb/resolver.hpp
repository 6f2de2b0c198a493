#ifndef RESOLVER_HPP
#define RESOLVER_HPP

#include "lvb/block_devices.hpp"
#include "lvb/lvm.hpp"
#include "lvb/snapshot.hpp"

#include <cstddef>      // for size_t
#include <cstdint>      // for uint64_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lvb::resolver {

/// @brief PV row as shown next to its volume group.
struct PvSummary final {
    std::string pv_name;
    /// Empty for orphan PVs.
    std::string vg_name;
    std::optional<std::uint64_t> size_bytes;
    std::optional<std::uint64_t> free_bytes;
    /// Number of LV segment rows placed on this PV.
    std::size_t lv_segment_count{};
};

/// @brief Volume group header of the resolution.
struct VgSummary final {
    std::string vg_name;
    /// False when the PV points to a VG which vgs did not report.
    bool known{};
    std::optional<std::uint64_t> size_bytes;
    std::optional<std::uint64_t> free_bytes;
    std::optional<std::uint64_t> extent_size_bytes;
    std::optional<std::uint64_t> pv_count;
    std::optional<std::uint64_t> lv_count;
    std::string attributes;
    /// Distinct LV names in encounter order.
    std::vector<std::string> lv_names;

    [[nodiscard]] auto attributes_str() const noexcept -> std::string;
    /// @return LV names joined by ", ", or "none"
    [[nodiscard]] auto lv_names_str() const noexcept -> std::string;
};

/// @brief One extent segment of a logical volume.
struct SegmentView final {
    std::optional<std::uint64_t> start_extent;
    std::optional<std::uint64_t> end_extent;
    std::optional<std::uint64_t> extent_count;
    /// VG extent size multiplied by the extent count.
    std::optional<std::uint64_t> size_bytes;
    lvm::DevicePlacement placement;

    [[nodiscard]] auto start_str() const noexcept -> std::string;
    [[nodiscard]] auto end_str() const noexcept -> std::string;
    [[nodiscard]] auto count_str() const noexcept -> std::string;
    [[nodiscard]] auto size_str() const noexcept -> std::string;
    /// @return placement devices joined by ", "
    [[nodiscard]] auto devices_str() const noexcept -> std::string;
    /// @return start extents on every device joined by ", "
    [[nodiscard]] auto start_extents_str() const noexcept -> std::string;
};

/// @brief Logical volume with its segments and backing block device.
struct LvView final {
    std::string lv_name;
    std::optional<std::uint64_t> size_bytes;
    /// Backing device in the snapshot, nullptr when none matched.
    const disk::DeviceRecord* device{};
    /// Sorted by start extent.
    std::vector<SegmentView> segments;

    [[nodiscard]] auto capacity_str() const noexcept -> std::string;
    [[nodiscard]] auto mount_point_str() const noexcept -> std::string;
    [[nodiscard]] auto used_str() const noexcept -> std::string;
    [[nodiscard]] auto avail_str() const noexcept -> std::string;
};

/// @brief Everything known about the LVM role of one device.
/// Points into the snapshot, must not outlive it.
struct Resolution final {
    std::string path;
    /// std::nullopt if the device is not a PV.
    std::optional<lvm::PhysicalVolume> pv;
    std::optional<VgSummary> vg;
    /// PVs of the same VG, in report order.
    std::vector<PvSummary> vg_pvs;
    /// LVs of the VG in encounter order.
    std::vector<LvView> lvs;
    /// Set when the device has no LVM role.
    std::string message;
};

/// @brief VG and LV names encoded in a device-mapper or /dev/<vg>/<lv> path.
struct LvPathParts final {
    std::string vg_name;
    std::string lv_name;
};

/// @brief Logical volume view of a selected device of kind lvm.
struct LvDeviceView final {
    const disk::DeviceRecord* device{};
    /// std::nullopt if the path does not follow either naming convention.
    std::optional<LvPathParts> names;
    /// Set when lvs knows the LV.
    std::optional<LvView> lv;
};

/// @brief Resolves the LVM role of the device.
/// @param path The selected device path.
/// @param snapshot The snapshot to resolve against.
/// @return resolution, missing pieces degrade to "N/A" fields
auto resolve(std::string_view path, const StorageSnapshot& snapshot) noexcept -> Resolution;

/// @brief Candidate device paths of the LV, in lookup order.
/// /dev/<vg>/<lv>, /dev/mapper/<vg>-<lv>, then the device-mapper escaped form.
auto lv_device_candidates(std::string_view vg_name, std::string_view lv_name) noexcept -> std::vector<std::string>;

/// @brief Finds the block device which backs the LV.
/// Exact candidates are tried first, then the first device path containing /<vg>/<lv> or /<vg>-<lv>.
auto find_lv_device(std::string_view vg_name, std::string_view lv_name, const std::vector<disk::DeviceRecord>& devices) noexcept
    -> const disk::DeviceRecord*;

/// @brief Splits /dev/mapper/<vg>-<lv> (doubled hyphens are unescaped) or /dev/<vg>/<lv>.
auto parse_lv_path(std::string_view path) noexcept -> std::optional<LvPathParts>;

/// @brief Builds the LV view of a device of kind lvm.
auto resolve_lv_device(const disk::DeviceRecord& device, const StorageSnapshot& snapshot) noexcept -> LvDeviceView;

/// @brief Every PV of the snapshot, in report order.
auto list_all_pvs(const StorageSnapshot& snapshot) noexcept -> std::vector<PvSummary>;

}  // namespace lvb::resolver

#endif  // RESOLVER_HPP
