#include "tui.hpp"
#include "config.hpp"
#include "view_state.hpp"
#include "widgets.hpp"

// import lvb
#include "lvb/resolver.hpp"

#include <cstddef>  // for size_t
#include <limits>   // for numeric_limits
#include <string>   // for string
#include <vector>   // for vector

#include <spdlog/spdlog.h>

/* clang-format off */
#include <ftxui/component/component.hpp>           // for Renderer, CatchEvent
#include <ftxui/component/event.hpp>               // for Event
#include <ftxui/component/screen_interactive.hpp>  // for Component, ScreenI...
#include <ftxui/dom/elements.hpp>                  // for operator|, size
#include <ftxui/screen/terminal.hpp>               // for Size
/* clang-format on */

using namespace ftxui;
using namespace std::string_view_literals;

namespace {

static constexpr int MIN_WIDTH  = 80;
static constexpr int MIN_HEIGHT = 10;

// borders, header row and footer
static constexpr int PANEL_CHROME_ROWS = 3;
static constexpr int PANEL_CHROME_COLS = 4;

static constexpr auto KEYS_HELP = "Tab: switch panel  j/k: move  q/Esc: quit"sv;

auto key_from_event(const Event& event) noexcept -> tui::Key {
    if (event == Event::Tab) {
        return tui::Key::NextPanel;
    } else if (event == Event::ArrowUp || event == Event::Character('k')) {
        return tui::Key::Up;
    } else if (event == Event::ArrowDown || event == Event::Character('j')) {
        return tui::Key::Down;
    } else if (event == Event::Character('q') || event == Event::Escape) {
        return tui::Key::Quit;
    }
    return tui::Key::Other;
}

auto to_rows(int value) noexcept -> std::size_t {
    return value > 0 ? static_cast<std::size_t>(value) : 0;
}

/// Snapshot with the resolution of the current device.
/// Resolution happens once per selected device, not on every redraw.
class BrowserModel final {
 public:
    explicit BrowserModel(const lvb::StorageSnapshot& snapshot) noexcept
      : m_snapshot(snapshot), m_siblings(tui::detail::make_sibling_names(snapshot)), m_all_pvs(lvb::resolver::list_all_pvs(snapshot)) { }

    auto snapshot() const noexcept -> const lvb::StorageSnapshot& { return m_snapshot; }
    auto siblings() const noexcept -> const tui::detail::SiblingNames& { return m_siblings; }
    auto all_pvs() const noexcept -> const std::vector<lvb::resolver::PvSummary>& { return m_all_pvs; }

    auto device(std::size_t index) const noexcept -> const lvb::disk::DeviceRecord* {
        return index < m_snapshot.devices.size() ? &m_snapshot.devices[index] : nullptr;
    }

    auto resolution(std::size_t index) noexcept -> const lvb::resolver::Resolution& {
        if (index != m_resolved_index) {
            const auto* current = device(index);
            m_resolution        = lvb::resolver::resolve(current != nullptr ? std::string_view{current->path} : ""sv, m_snapshot);
            m_resolved_index    = index;
            spdlog::debug("resolved '{}': {}", m_resolution.path, m_resolution.pv ? m_resolution.pv->vg_name : m_resolution.message);
        }
        return m_resolution;
    }

    auto counts(std::size_t index) noexcept -> tui::ListCounts {
        return tui::ListCounts{.devices = m_snapshot.devices.size(), .vg_pvs = resolution(index).vg_pvs.size()};
    }

 private:
    const lvb::StorageSnapshot& m_snapshot;
    tui::detail::SiblingNames m_siblings;
    std::vector<lvb::resolver::PvSummary> m_all_pvs;
    std::size_t m_resolved_index{std::numeric_limits<std::size_t>::max()};
    lvb::resolver::Resolution m_resolution;
};

Element render_browser(BrowserModel& model, const tui::ViewState& state, const browser::BrowserConfig& config) noexcept {
    const auto& dimensions = Terminal::Size();
    if (dimensions.dimx < MIN_WIDTH || dimensions.dimy < MIN_HEIGHT) {
        return tui::detail::too_small_widget();
    }

    // footer takes the last row
    const int content_height = dimensions.dimy - 1;
    const int vg_width       = dimensions.dimx / 2;
    const int pv_width       = dimensions.dimx - vg_width;
    const int pv_height      = content_height / 2;
    const int block_height   = content_height - pv_height;

    const auto* device      = model.device(state.current_device);
    const auto& resolution  = model.resolution(state.current_device);
    const auto& snapshot    = model.snapshot();
    const auto& siblings    = model.siblings();

    const tui::detail::PanelLayout main_layout{
        .width        = to_rows(vg_width - PANEL_CHROME_COLS),
        .visible_rows = to_rows(content_height - PANEL_CHROME_ROWS),
        .active       = state.active_panel == tui::Panel::Main,
    };
    const tui::detail::PanelLayout pv_layout{
        .width        = to_rows(pv_width - PANEL_CHROME_COLS),
        .visible_rows = to_rows(pv_height - PANEL_CHROME_ROWS),
        .active       = state.active_panel == tui::Panel::PhysicalVolumes,
    };
    const tui::detail::PanelLayout block_layout{
        .width        = to_rows(pv_width - PANEL_CHROME_COLS),
        .visible_rows = to_rows(block_height - PANEL_CHROME_ROWS),
        .active       = state.active_panel == tui::Panel::BlockDevices,
    };

    Element main_panel;
    if (device != nullptr && device->kind == lvb::disk::DeviceKind::Lvm) {
        main_panel = tui::detail::logical_volume_panel(lvb::resolver::resolve_lv_device(*device, snapshot), siblings, main_layout);
    } else if (resolution.vg) {
        main_panel = tui::detail::volume_group_panel(resolution, siblings, main_layout);
    } else {
        main_panel = tui::detail::device_panel(device, resolution, main_layout);
    }

    Element pv_panel;
    if (resolution.pv || !config.show_all_pvs_when_unassigned) {
        pv_panel = tui::detail::vg_pvs_panel(resolution.vg_pvs, state.pv_selected, siblings, pv_layout);
    } else {
        pv_panel = tui::detail::all_pvs_panel(model.all_pvs(), siblings, pv_layout);
    }

    auto block_panel = tui::detail::block_devices_panel(snapshot.devices, state.block_dev_selected, siblings, block_layout);

    const auto& unavailable = tui::detail::unavailable_sources_line(snapshot.sources);
    auto footer             = hbox({
        text(std::string{KEYS_HELP}) | dim,
        filler(),
        text(unavailable) | color(Color::Yellow),
    });

    return vbox({
        hbox({
            main_panel | size(WIDTH, EQUAL, vg_width),
            vbox({
                pv_panel | size(HEIGHT, EQUAL, pv_height),
                block_panel | size(HEIGHT, EQUAL, block_height),
            }) | flex,
        }) | size(HEIGHT, EQUAL, content_height),
        footer,
    });
}

}  // namespace

namespace tui {

void init(const lvb::StorageSnapshot& snapshot) noexcept {
    const auto& config = Config::instance()->data();

    auto screen = ScreenInteractive::Fullscreen();
    BrowserModel model{snapshot};
    ViewState state{};

    auto renderer = Renderer([&] {
        return render_browser(model, state, config);
    });

    auto browser = CatchEvent(renderer, [&](const Event& event) {
        const auto key = key_from_event(event);
        if (key == Key::Other) {
            return false;
        }
        state = reduce(state, key, model.counts(state.current_device));
        if (state.quit) {
            screen.ExitLoopClosure()();
        }
        return true;
    });

    screen.Loop(browser);
}

}  // namespace tui
