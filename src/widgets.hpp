#ifndef WIDGETS_HPP
#define WIDGETS_HPP

// import lvb
#include "lvb/resolver.hpp"
#include "lvb/snapshot.hpp"

#include <cstddef>      // for size_t
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <ftxui/dom/elements.hpp>  // for Element, Elements

namespace tui {
namespace detail {
    /// Identifier lists used to keep shortened names unambiguous.
    struct SiblingNames {
        std::vector<std::string> device_names;
        std::vector<std::string> device_paths;
        std::vector<std::string> pv_names;
        std::vector<std::string> vg_names;
    };

    /// Geometry and focus of one panel.
    struct PanelLayout {
        /// Inner width available for text.
        std::size_t width{};
        /// Rows available for list entries.
        std::size_t visible_rows{};
        bool active{};
    };

    auto make_sibling_names(const lvb::StorageSnapshot& snapshot) noexcept -> SiblingNames;

    auto panel_widget(std::string_view title, bool active, ftxui::Elements lines) noexcept -> ftxui::Element;
    auto too_small_widget() noexcept -> ftxui::Element;

    auto volume_group_panel(const lvb::resolver::Resolution& resolution, const SiblingNames& siblings, const PanelLayout& layout) noexcept -> ftxui::Element;
    auto logical_volume_panel(const lvb::resolver::LvDeviceView& view, const SiblingNames& siblings, const PanelLayout& layout) noexcept -> ftxui::Element;
    auto device_panel(const lvb::disk::DeviceRecord* device, const lvb::resolver::Resolution& resolution, const PanelLayout& layout) noexcept -> ftxui::Element;

    auto vg_pvs_panel(const std::vector<lvb::resolver::PvSummary>& pvs, std::size_t selected, const SiblingNames& siblings, const PanelLayout& layout) noexcept -> ftxui::Element;
    auto all_pvs_panel(const std::vector<lvb::resolver::PvSummary>& pvs, const SiblingNames& siblings, const PanelLayout& layout) noexcept -> ftxui::Element;
    auto block_devices_panel(const std::vector<lvb::disk::DeviceRecord>& devices, std::size_t selected, const SiblingNames& siblings, const PanelLayout& layout) noexcept -> ftxui::Element;

    /// One line listing the sources which could not be read, empty if all were.
    auto unavailable_sources_line(const lvb::SourceStates& states) noexcept -> std::string;
}  // namespace detail
}  // namespace tui

#endif  // WIDGETS_HPP
