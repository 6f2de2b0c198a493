#ifndef PANEL_ROWS_HPP
#define PANEL_ROWS_HPP

// import lvb
#include "lvb/block_devices.hpp"
#include "lvb/resolver.hpp"

#include <cstddef>      // for size_t
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace tui::rows {

/// Display columns of the block device table.
struct BlockDeviceColumns {
    std::string name;
    std::string size;
    std::string type;
    std::string part;
    std::string table;
    std::string fs;
    std::string flags;
};

/// Rows [begin, end) of a scrolled list.
struct VisibleRange {
    std::size_t begin{};
    std::size_t end{};
};

/// Shortens a short table cell, "primary" -> "prima."
auto shorten_cell(std::string_view cell) noexcept -> std::string;

auto block_device_columns(const lvb::disk::DeviceRecord& device, const std::vector<std::string>& sibling_names) noexcept -> BlockDeviceColumns;
auto block_device_header() noexcept -> std::string;
auto block_device_row(const BlockDeviceColumns& columns) noexcept -> std::string;

/// @param vg_column Show the VG name instead of the LV count.
auto pv_header(bool vg_column) noexcept -> std::string;
/// PV of the selected VG, with the number of LV segments placed on it.
auto pv_row(const lvb::resolver::PvSummary& pv, const std::vector<std::string>& sibling_names) noexcept -> std::string;
/// PV of the full listing, with its VG name.
auto all_pv_row(const lvb::resolver::PvSummary& pv, const std::vector<std::string>& sibling_names) noexcept -> std::string;

auto segment_header() noexcept -> std::string;
/// @param sibling_paths Device paths the PV column must stay distinguishable from.
auto segment_row(const lvb::resolver::SegmentView& segment, const std::vector<std::string>& sibling_paths) noexcept -> std::string;

/// Keeps the selected row visible, the list scrolls once the selection passes the last full page.
auto visible_range(std::size_t selected, std::size_t count, std::size_t visible) noexcept -> VisibleRange;

}  // namespace tui::rows

#endif  // PANEL_ROWS_HPP
