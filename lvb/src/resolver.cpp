#include "lvb/resolver.hpp"
#include "lvb/size_format.hpp"
#include "lvb/string_utils.hpp"

#include <algorithm>  // for copy_if, count_if, find, find_if, stable_sort
#include <iterator>   // for back_inserter, prev
#include <ranges>     // for ranges::*
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

static constexpr auto DEV_PREFIX        = "/dev/"sv;
static constexpr auto DEV_MAPPER_PREFIX = "/dev/mapper/"sv;

using lvb::lvm::LogicalVolume;
using lvb::resolver::LvView;
using lvb::resolver::PvSummary;
using lvb::resolver::SegmentView;

auto optional_to_string(const std::optional<std::uint64_t>& value) noexcept -> std::string {
    return value ? std::to_string(*value) : std::string{lvb::NOT_AVAILABLE};
}

auto join_or_na(const std::vector<std::string>& items) noexcept -> std::string {
    if (items.empty()) {
        return std::string{lvb::NOT_AVAILABLE};
    }
    return lvb::utils::join(items, ", "sv);
}

/// device-mapper doubles every hyphen inside VG and LV names
auto dm_escape(std::string_view name) noexcept -> std::string {
    return lvb::utils::replace_all(std::string{name}, "-"sv, "--"sv);
}

auto dm_unescape(std::string_view name) noexcept -> std::string {
    return lvb::utils::replace_all(std::string{name}, "--"sv, "-"sv);
}

/// Number of placement tokens, over the given rows, which name the PV.
auto count_pv_segments(std::string_view pv_name, const std::vector<LogicalVolume>& rows) noexcept -> std::size_t {
    std::size_t count{};
    for (const auto& row : rows) {
        const auto& placement = lvb::lvm::parse_device_placement(row.device_placement);
        count += static_cast<std::size_t>(std::ranges::count_if(placement.devices, [pv_name](auto&& device) { return device == pv_name; }));
    }
    return count;
}

auto make_pv_summary(const lvb::lvm::PhysicalVolume& pv, std::size_t lv_segment_count) noexcept -> PvSummary {
    return PvSummary{
        .pv_name          = pv.pv_name,
        .vg_name          = pv.vg_name,
        .size_bytes       = pv.size_bytes,
        .free_bytes       = pv.free_bytes,
        .lv_segment_count = lv_segment_count,
    };
}

auto make_segment_view(const LogicalVolume& row, const std::optional<std::uint64_t>& extent_size) noexcept -> SegmentView {
    SegmentView segment{
        .start_extent = row.segment_start_extent,
        .end_extent   = std::nullopt,
        .extent_count = row.segment_extent_count,
        .size_bytes   = std::nullopt,
        .placement    = lvb::lvm::parse_device_placement(row.device_placement),
    };

    // fallback to the start on the first device
    if (!segment.start_extent && !segment.placement.start_extents.empty()) {
        segment.start_extent = lvb::parse_uint(segment.placement.start_extents.front());
    }
    if (segment.start_extent && segment.extent_count && *segment.extent_count > 0) {
        segment.end_extent = *segment.start_extent + *segment.extent_count - 1;
    }
    if (extent_size && segment.extent_count) {
        segment.size_bytes = *extent_size * *segment.extent_count;
    }
    return segment;
}

/// Groups segment rows by LV name, in first encounter order.
auto group_lv_rows(const std::vector<LogicalVolume>& rows, const std::optional<std::uint64_t>& extent_size,
    std::string_view vg_name, const std::vector<lvb::disk::DeviceRecord>& devices) noexcept -> std::vector<LvView> {
    std::vector<LvView> lvs{};
    for (const auto& row : rows) {
        auto lv_it = std::ranges::find_if(lvs, [&row](auto&& lv) { return lv.lv_name == row.lv_name; });
        if (lv_it == lvs.end()) {
            lvs.emplace_back(LvView{
                .lv_name    = row.lv_name,
                .size_bytes = row.size_bytes,
                .device     = lvb::resolver::find_lv_device(vg_name, row.lv_name, devices),
                .segments   = {},
            });
            lv_it = std::prev(lvs.end());
        }
        lv_it->segments.emplace_back(make_segment_view(row, extent_size));
    }

    // rows without a start extent stay after the numbered ones
    for (auto& lv : lvs) {
        std::ranges::stable_sort(lv.segments, [](auto&& lhs, auto&& rhs) {
            return lhs.start_extent && (!rhs.start_extent || *lhs.start_extent < *rhs.start_extent);
        });
    }
    return lvs;
}

}  // namespace

namespace lvb::resolver {

auto VgSummary::attributes_str() const noexcept -> std::string {
    return attributes.empty() ? std::string{NOT_AVAILABLE} : attributes;
}

auto VgSummary::lv_names_str() const noexcept -> std::string {
    return lv_names.empty() ? std::string{"none"} : utils::join(lv_names, ", "sv);
}

auto SegmentView::start_str() const noexcept -> std::string {
    return optional_to_string(start_extent);
}

auto SegmentView::end_str() const noexcept -> std::string {
    return optional_to_string(end_extent);
}

auto SegmentView::count_str() const noexcept -> std::string {
    return optional_to_string(extent_count);
}

auto SegmentView::size_str() const noexcept -> std::string {
    return format_size(size_bytes);
}

auto SegmentView::devices_str() const noexcept -> std::string {
    return join_or_na(placement.devices);
}

auto SegmentView::start_extents_str() const noexcept -> std::string {
    return join_or_na(placement.start_extents);
}

auto LvView::capacity_str() const noexcept -> std::string {
    return format_size(size_bytes);
}

auto LvView::mount_point_str() const noexcept -> std::string {
    return device ? device->mount_point_str() : std::string{NOT_AVAILABLE};
}

auto LvView::used_str() const noexcept -> std::string {
    return device ? device->used_str() : std::string{NOT_AVAILABLE};
}

auto LvView::avail_str() const noexcept -> std::string {
    return device ? device->avail_str() : std::string{NOT_AVAILABLE};
}

auto lv_device_candidates(std::string_view vg_name, std::string_view lv_name) noexcept -> std::vector<std::string> {
    std::vector<std::string> candidates{
        fmt::format(FMT_COMPILE("/dev/{}/{}"), vg_name, lv_name),
        fmt::format(FMT_COMPILE("/dev/mapper/{}-{}"), vg_name, lv_name),
    };
    auto escaped = fmt::format(FMT_COMPILE("/dev/mapper/{}-{}"), dm_escape(vg_name), dm_escape(lv_name));
    if (std::ranges::find(candidates, escaped) == candidates.end()) {
        candidates.emplace_back(std::move(escaped));
    }
    return candidates;
}

auto find_lv_device(std::string_view vg_name, std::string_view lv_name, const std::vector<disk::DeviceRecord>& devices) noexcept
    -> const disk::DeviceRecord* {
    if (vg_name.empty() || lv_name.empty()) {
        return nullptr;
    }
    for (const auto& candidate : lv_device_candidates(vg_name, lv_name)) {
        if (const auto* device = disk::find_device_by_path(devices, candidate)) {
            return device;
        }
    }

    const auto& slash_infix  = fmt::format(FMT_COMPILE("/{}/{}"), vg_name, lv_name);
    const auto& hyphen_infix = fmt::format(FMT_COMPILE("/{}-{}"), vg_name, lv_name);
    auto it = std::ranges::find_if(devices, [&](auto&& device) {
        return device.path.contains(slash_infix) || device.path.contains(hyphen_infix);
    });
    if (it != devices.end()) {
        spdlog::debug("lv {}/{} matched {} by infix", vg_name, lv_name, it->path);
        return &*it;
    }
    return nullptr;
}

auto parse_lv_path(std::string_view path) noexcept -> std::optional<LvPathParts> {
    if (path.starts_with(DEV_MAPPER_PREFIX)) {
        const auto dm_name = path.substr(DEV_MAPPER_PREFIX.size());

        // first hyphen which is not doubled separates VG and LV
        std::size_t pos{};
        while (pos < dm_name.size()) {
            if (dm_name[pos] != '-') {
                ++pos;
            } else if (pos + 1 < dm_name.size() && dm_name[pos + 1] == '-') {
                pos += 2;
            } else {
                break;
            }
        }
        if (pos == 0 || pos + 1 >= dm_name.size()) {
            return std::nullopt;
        }
        return LvPathParts{
            .vg_name = dm_unescape(dm_name.substr(0, pos)),
            .lv_name = dm_unescape(dm_name.substr(pos + 1)),
        };
    }

    if (path.starts_with(DEV_PREFIX)) {
        const auto rest      = path.substr(DEV_PREFIX.size());
        const auto slash_pos = rest.find('/');
        if (slash_pos == std::string_view::npos || slash_pos == 0 || slash_pos + 1 >= rest.size()) {
            return std::nullopt;
        }
        return LvPathParts{
            .vg_name = std::string{rest.substr(0, slash_pos)},
            .lv_name = std::string{rest.substr(slash_pos + 1)},
        };
    }
    return std::nullopt;
}

auto resolve(std::string_view path, const StorageSnapshot& snapshot) noexcept -> Resolution {
    Resolution resolution{.path = std::string{path}};
    const auto& tables = snapshot.lvm;

    const auto* pv = tables.find_pv(path);
    if (pv == nullptr) {
        resolution.message = fmt::format(FMT_COMPILE("No LVM info for {}"), path);
        return resolution;
    }
    resolution.pv = *pv;

    const auto& vg_name = pv->vg_name;
    const auto& lv_rows = tables.lv_rows(vg_name);

    VgSummary vg_summary{.vg_name = vg_name};
    if (const auto* vg = tables.find_vg(vg_name)) {
        vg_summary.known             = true;
        vg_summary.size_bytes        = vg->size_bytes;
        vg_summary.free_bytes        = vg->free_bytes;
        vg_summary.extent_size_bytes = vg->extent_size_bytes;
        vg_summary.pv_count          = vg->pv_count;
        vg_summary.lv_count          = vg->lv_count;
        vg_summary.attributes        = vg->attributes;
    } else {
        spdlog::debug("pv {} references unknown vg '{}'", path, vg_name);
    }

    // PV records do not link siblings, scan for the VG membership
    for (const auto& pv_name : tables.pv_order) {
        const auto* sibling = tables.find_pv(pv_name);
        if (sibling != nullptr && sibling->vg_name == vg_name) {
            resolution.vg_pvs.emplace_back(make_pv_summary(*sibling, count_pv_segments(pv_name, lv_rows)));
        }
    }

    resolution.lvs = group_lv_rows(lv_rows, vg_summary.extent_size_bytes, vg_name, snapshot.devices);
    for (const auto& lv : resolution.lvs) {
        vg_summary.lv_names.push_back(lv.lv_name);
    }
    resolution.vg = std::move(vg_summary);
    return resolution;
}

auto resolve_lv_device(const disk::DeviceRecord& device, const StorageSnapshot& snapshot) noexcept -> LvDeviceView {
    LvDeviceView view{.device = &device, .names = parse_lv_path(device.path), .lv = std::nullopt};
    if (!view.names) {
        return view;
    }

    const auto& vg_name = view.names->vg_name;
    const auto& lv_name = view.names->lv_name;
    const auto* vg      = snapshot.lvm.find_vg(vg_name);
    const auto& rows    = snapshot.lvm.lv_rows(vg_name);

    std::vector<LogicalVolume> lv_rows{};
    std::ranges::copy_if(rows, std::back_inserter(lv_rows), [&lv_name](auto&& row) { return row.lv_name == lv_name; });
    if (lv_rows.empty()) {
        return view;
    }

    const auto& extent_size = vg != nullptr ? vg->extent_size_bytes : std::nullopt;
    auto lvs                = group_lv_rows(lv_rows, extent_size, vg_name, snapshot.devices);
    view.lv                 = std::move(lvs.front());
    view.lv->device         = &device;
    return view;
}

auto list_all_pvs(const StorageSnapshot& snapshot) noexcept -> std::vector<PvSummary> {
    const auto& tables = snapshot.lvm;

    std::vector<PvSummary> pvs{};
    pvs.reserve(tables.pv_order.size());
    for (const auto& pv_name : tables.pv_order) {
        const auto* pv = tables.find_pv(pv_name);
        if (pv == nullptr) {
            continue;
        }
        pvs.emplace_back(make_pv_summary(*pv, count_pv_segments(pv_name, tables.lv_rows(pv->vg_name))));
    }
    return pvs;
}

}  // namespace lvb::resolver
