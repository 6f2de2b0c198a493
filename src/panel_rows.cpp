#include "panel_rows.hpp"

// import lvb
#include "lvb/size_format.hpp"
#include "lvb/string_utils.hpp"

#include <algorithm>  // for min

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

static constexpr auto NO_VALUE = "---"sv;

static constexpr std::size_t CELL_WIDTH         = 6;
static constexpr std::size_t DEVICE_NAME_WIDTH  = 13;
static constexpr std::size_t PV_NAME_WIDTH      = 15;
static constexpr std::size_t SEGMENT_PVS_WIDTH  = 20;

auto value_or_dashes(const std::optional<std::string>& value) noexcept -> std::string {
    if (!value || value->empty()) {
        return std::string{NO_VALUE};
    }
    return *value;
}

auto is_known(const std::optional<std::string>& value) noexcept -> bool {
    return value && !value->empty() && *value != lvb::NOT_AVAILABLE;
}

}  // namespace

namespace tui::rows {

auto shorten_cell(std::string_view cell) noexcept -> std::string {
    if (cell.size() <= CELL_WIDTH) {
        return std::string{cell};
    }
    return fmt::format(FMT_COMPILE("{}."), cell.substr(0, CELL_WIDTH - 1));
}

auto block_device_columns(const lvb::disk::DeviceRecord& device, const std::vector<std::string>& sibling_names) noexcept -> BlockDeviceColumns {
    BlockDeviceColumns columns{
        .name  = lvb::utils::truncate_identifier(device.name, DEVICE_NAME_WIDTH, sibling_names),
        .size  = lvb::format_size(device.size_bytes),
        .type  = device.type,
        .part  = std::string{lvb::disk::classify_partition(device)},
        .table = std::string{NO_VALUE},
        .fs    = std::string{NO_VALUE},
        .flags = std::string{NO_VALUE},
    };

    if (device.table_info) {
        const auto& info = *device.table_info;
        columns.table    = value_or_dashes(info.fdisk_type_info);
        if (is_known(info.gpt_part_table_type)) {
            columns.table = *info.gpt_part_table_type;
        } else if (device.kind == lvb::disk::DeviceKind::Disk && is_known(info.disklabel_type)) {
            columns.table = *info.disklabel_type;
        }
        columns.fs    = value_or_dashes(info.gpt_fs_info);
        columns.flags = value_or_dashes(info.gpt_df_flags_info);
    }

    // extended partition is a container, flags belong to its logical partitions
    if (columns.part == "Extd"sv) {
        columns.flags = std::string{NO_VALUE};
    }

    columns.part  = shorten_cell(columns.part);
    columns.table = shorten_cell(columns.table);
    columns.fs    = shorten_cell(columns.fs);
    columns.flags = shorten_cell(columns.flags);
    columns.type  = shorten_cell(columns.type);
    if (columns.flags == "lvm"sv) {
        columns.flags = "LVM";
    }
    return columns;
}

auto block_device_header() noexcept -> std::string {
    return block_device_row(BlockDeviceColumns{
        .name  = "Device",
        .size  = "Size",
        .type  = "Type",
        .part  = "Part",
        .table = "Table",
        .fs    = "FSinf",
        .flags = "Flags",
    });
}

auto block_device_row(const BlockDeviceColumns& columns) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{:<15} {:<12} {:<8} {:<8} {:<8} {:<8} {:<8}"),
        columns.name, columns.size, columns.type, columns.part, columns.table, columns.fs, columns.flags);
}

auto pv_header(bool vg_column) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{:<15} {:>10} {:>8} {}"), "Block dev", "Size", vg_column ? "VG" : "LV #", "Free");
}

auto pv_row(const lvb::resolver::PvSummary& pv, const std::vector<std::string>& sibling_names) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{:<15} {:>10} {:>8} {}"),
        lvb::utils::truncate_identifier(pv.pv_name, PV_NAME_WIDTH, sibling_names), lvb::format_size(pv.size_bytes),
        pv.lv_segment_count, lvb::format_size(pv.free_bytes));
}

auto all_pv_row(const lvb::resolver::PvSummary& pv, const std::vector<std::string>& sibling_names) noexcept -> std::string {
    const auto& vg_name = pv.vg_name.empty() ? std::string{lvb::NOT_AVAILABLE} : pv.vg_name;
    return fmt::format(FMT_COMPILE("{:<15} {:>10} {:>8} {}"),
        lvb::utils::truncate_identifier(pv.pv_name, PV_NAME_WIDTH, sibling_names), lvb::format_size(pv.size_bytes),
        vg_name, lvb::format_size(pv.free_bytes));
}

auto segment_header() noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{:<10} {:<10} {:>10} {:>10} {:<20} {}"),
        "LE Start", "LE End", "PE Count", "PE Size", "PVs", "PE Start");
}

auto segment_row(const lvb::resolver::SegmentView& segment, const std::vector<std::string>& sibling_paths) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{:<10} {:<10} {:>10} {:>10} {:<20} {}"),
        segment.start_str(), segment.end_str(), segment.count_str(), segment.size_str(),
        lvb::utils::truncate_identifier(segment.devices_str(), SEGMENT_PVS_WIDTH, sibling_paths), segment.start_extents_str());
}

auto visible_range(std::size_t selected, std::size_t count, std::size_t visible) noexcept -> VisibleRange {
    const auto last_page_begin = count > visible ? count - visible : 0;
    const auto begin           = std::min(selected, last_page_begin);
    return VisibleRange{.begin = begin, .end = std::min(begin + visible, count)};
}

}  // namespace tui::rows
