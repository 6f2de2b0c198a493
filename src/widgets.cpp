#include "widgets.hpp"
#include "panel_rows.hpp"

// import lvb
#include "lvb/size_format.hpp"
#include "lvb/string_utils.hpp"

#include <array>      // for array
#include <utility>    // for move, pair

#include <fmt/compile.h>
#include <fmt/format.h>

#include <ftxui/dom/elements.hpp>  // for operator|, Element
#include <ftxui/dom/node.hpp>      // for Render

using namespace ftxui;
using namespace std::string_view_literals;

namespace {

static constexpr auto TOO_SMALL_MESSAGE = "Terminal too small. Please resize to at least 80x10."sv;

// Free text line, cut to the panel width.
Element line(std::string_view str, std::size_t width) noexcept {
    return text(lvb::utils::truncate_text(str, width));
}

Element empty_line() noexcept {
    return text("");
}

Element selectable_line(std::string_view str, std::size_t width, bool selected) noexcept {
    auto element = line(str, width);
    return selected ? element | inverted : element;
}

}  // namespace

namespace tui::detail {

SiblingNames make_sibling_names(const lvb::StorageSnapshot& snapshot) noexcept {
    SiblingNames siblings{};
    for (const auto& device : snapshot.devices) {
        siblings.device_names.push_back(device.name);
        siblings.device_paths.push_back(device.path);
    }
    siblings.pv_names = snapshot.lvm.pv_order;
    siblings.vg_names = snapshot.lvm.vg_order;
    return siblings;
}

Element panel_widget(std::string_view title, bool active, Elements lines) noexcept {
    auto title_element = text(std::string{title});
    if (active) {
        title_element = title_element | bold;
    }
    return window(std::move(title_element), vbox(std::move(lines)) | frame);
}

Element too_small_widget() noexcept {
    return text(std::string{TOO_SMALL_MESSAGE});
}

Element volume_group_panel(const lvb::resolver::Resolution& resolution, const SiblingNames& siblings, const PanelLayout& layout) noexcept {
    const auto& vg     = *resolution.vg;
    const auto& width  = layout.width;
    const auto& header = fmt::format(FMT_COMPILE(" Volume Group - {} ({}) "),
        lvb::utils::truncate_identifier(vg.vg_name, width > 20 ? width - 20 : width, siblings.vg_names), lvb::format_size(vg.size_bytes));

    Elements lines{
        line(fmt::format(FMT_COMPILE("VG Format:     {}"), vg.attributes_str()), width),
        line(fmt::format(FMT_COMPILE("VG seg size:   {}"), lvb::format_size(vg.extent_size_bytes)), width),
        line(fmt::format(FMT_COMPILE("Logical Vols:  {}"), vg.lv_names_str()), width),
        line(fmt::format(FMT_COMPILE("Free space:    {}"), lvb::format_size(vg.free_bytes)), width),
        empty_line(),
        text("[ Discovered LVols.. ]") | bold,
        empty_line(),
    };

    const auto indent_width = width > 2 ? width - 2 : width;
    for (const auto& lv : resolution.lvs) {
        lines.push_back(line(fmt::format(FMT_COMPILE("Logical Volume: {}"), lv.lv_name), width) | bold);
        lines.push_back(line(fmt::format(FMT_COMPILE("  Mounted: {}"), lv.mount_point_str()), width));
        lines.push_back(line(fmt::format(FMT_COMPILE("  Capacity: {}"), lv.capacity_str()), width));
        lines.push_back(line(fmt::format(FMT_COMPILE("  Used: {}"), lv.used_str()), width));
        lines.push_back(line(fmt::format(FMT_COMPILE("  Available: {}"), lv.avail_str()), width));
        lines.push_back(empty_line());
        lines.push_back(hbox({text("  "), line(tui::rows::segment_header(), indent_width) | underlined}));
        for (const auto& segment : lv.segments) {
            lines.push_back(hbox({text("  "), line(tui::rows::segment_row(segment, siblings.device_paths), indent_width)}));
        }
        lines.push_back(empty_line());
    }

    return panel_widget(header, layout.active, std::move(lines));
}

Element logical_volume_panel(const lvb::resolver::LvDeviceView& view, const SiblingNames& siblings, const PanelLayout& layout) noexcept {
    const auto& device = *view.device;
    const auto& width  = layout.width;

    const auto vg_name = view.names ? view.names->vg_name : std::string{"Unknown"};
    const auto lv_name = view.names ? view.names->lv_name : std::string{"Unknown"};

    Elements lines{
        line(fmt::format(FMT_COMPILE("Device: {}"), device.path), width),
        line(fmt::format(FMT_COMPILE("VG Name: {}"), vg_name), width),
        line(fmt::format(FMT_COMPILE("LV Name: {}"), lv_name), width),
        line(fmt::format(FMT_COMPILE("Size: {}"), lvb::format_size(device.size_bytes)), width),
        empty_line(),
        line(fmt::format(FMT_COMPILE("Mounted: {}"), device.mount_point_str()), width),
        line(fmt::format(FMT_COMPILE("Used: {}"), device.used_str()), width),
        line(fmt::format(FMT_COMPILE("Available: {}"), device.avail_str()), width),
    };

    if (view.lv && !view.lv->segments.empty()) {
        lines.push_back(empty_line());
        lines.push_back(line(tui::rows::segment_header(), width) | underlined);
        for (const auto& segment : view.lv->segments) {
            lines.push_back(line(tui::rows::segment_row(segment, siblings.device_paths), width));
        }
    }

    return panel_widget(" Logical Volume Information ", layout.active, std::move(lines));
}

Element device_panel(const lvb::disk::DeviceRecord* device, const lvb::resolver::Resolution& resolution, const PanelLayout& layout) noexcept {
    const auto& width = layout.width;

    Elements lines{line(resolution.message, width), empty_line()};
    if (device != nullptr) {
        lines.push_back(line(fmt::format(FMT_COMPILE("Type: {}"), device->type), width));
        lines.push_back(line(fmt::format(FMT_COMPILE("Size: {}"), lvb::format_size(device->size_bytes)), width));
        lines.push_back(line(fmt::format(FMT_COMPILE("Mounted: {}"), device->mount_point_str()), width));
        lines.push_back(line(fmt::format(FMT_COMPILE("Used: {}"), device->used_str()), width));
        lines.push_back(line(fmt::format(FMT_COMPILE("Available: {}"), device->avail_str()), width));
    }
    return panel_widget(" Device ", layout.active, std::move(lines));
}

Element vg_pvs_panel(const std::vector<lvb::resolver::PvSummary>& pvs, std::size_t selected, const SiblingNames& siblings, const PanelLayout& layout) noexcept {
    Elements lines{line(tui::rows::pv_header(false), layout.width) | underlined};
    if (pvs.empty()) {
        lines.push_back(text("[ waiting... ]"));
    }

    const auto& range = tui::rows::visible_range(selected, pvs.size(), layout.visible_rows);
    for (auto i = range.begin; i < range.end; ++i) {
        lines.push_back(selectable_line(tui::rows::pv_row(pvs[i], siblings.pv_names), layout.width, layout.active && i == selected));
    }
    return panel_widget(" Physical Volumes (PV) ", layout.active, std::move(lines));
}

Element all_pvs_panel(const std::vector<lvb::resolver::PvSummary>& pvs, const SiblingNames& siblings, const PanelLayout& layout) noexcept {
    Elements lines{line(tui::rows::pv_header(true), layout.width) | underlined};

    const auto& range = tui::rows::visible_range(0, pvs.size(), layout.visible_rows);
    for (auto i = range.begin; i < range.end; ++i) {
        lines.push_back(line(tui::rows::all_pv_row(pvs[i], siblings.pv_names), layout.width));
    }
    return panel_widget(" Physical Volumes (PV) ", layout.active, std::move(lines));
}

Element block_devices_panel(const std::vector<lvb::disk::DeviceRecord>& devices, std::size_t selected, const SiblingNames& siblings, const PanelLayout& layout) noexcept {
    if (devices.empty()) {
        return panel_widget(" System Block Devices ", layout.active, {text("No block devices available")});
    }

    Elements lines{line(tui::rows::block_device_header(), layout.width) | underlined};

    const auto& range = tui::rows::visible_range(selected, devices.size(), layout.visible_rows);
    for (auto i = range.begin; i < range.end; ++i) {
        const auto& columns = tui::rows::block_device_columns(devices[i], siblings.device_names);
        lines.push_back(selectable_line(tui::rows::block_device_row(columns), layout.width, layout.active && i == selected));
    }
    return panel_widget(" System Block Devices ", layout.active, std::move(lines));
}

std::string unavailable_sources_line(const lvb::SourceStates& states) noexcept {
    const std::array sources{
        std::pair{"lsblk"sv, states.lsblk},
        std::pair{"fdisk"sv, states.fdisk},
        std::pair{"parted"sv, states.parted},
        std::pair{"df"sv, states.df},
        std::pair{"pvs"sv, states.pvs},
        std::pair{"vgs"sv, states.vgs},
        std::pair{"lvs"sv, states.lvs},
    };

    std::vector<std::string> unavailable{};
    for (const auto& [name, state] : sources) {
        if (state == lvb::SourceState::Unavailable) {
            unavailable.emplace_back(name);
        }
    }
    if (unavailable.empty()) {
        return {};
    }
    return fmt::format(FMT_COMPILE("Unavailable: {}"), lvb::utils::join(unavailable, ", "sv));
}

}  // namespace tui::detail
