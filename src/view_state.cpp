#include "view_state.hpp"

namespace {

auto move_up(std::size_t selected) noexcept -> std::size_t {
    return selected > 0 ? selected - 1 : selected;
}

auto move_down(std::size_t selected, std::size_t count) noexcept -> std::size_t {
    return selected + 1 < count ? selected + 1 : selected;
}

}  // namespace

namespace tui {

auto next_panel(Panel panel) noexcept -> Panel {
    switch (panel) {
    case Panel::Main:
        return Panel::PhysicalVolumes;
    case Panel::PhysicalVolumes:
        return Panel::BlockDevices;
    case Panel::BlockDevices:
    default:
        return Panel::Main;
    }
}

auto reduce(const ViewState& state, Key key, const ListCounts& counts) noexcept -> ViewState {
    auto next = state;

    switch (key) {
    case Key::Quit:
        next.quit = true;
        return next;
    case Key::NextPanel:
        next.active_panel = next_panel(state.active_panel);
        if (next.active_panel == Panel::BlockDevices) {
            next.block_dev_selected = state.current_device;
        }
        return next;
    case Key::Other:
        return next;
    case Key::Up:
    case Key::Down:
        break;
    }

    const bool up = (key == Key::Up);
    switch (state.active_panel) {
    case Panel::Main:
        next.current_device = up ? move_up(state.current_device) : move_down(state.current_device, counts.devices);
        break;
    case Panel::PhysicalVolumes:
        next.pv_selected = up ? move_up(state.pv_selected) : move_down(state.pv_selected, counts.vg_pvs);
        break;
    case Panel::BlockDevices:
        next.block_dev_selected = up ? move_up(state.block_dev_selected) : move_down(state.block_dev_selected, counts.devices);
        next.current_device     = next.block_dev_selected;
        break;
    }

    // PV selection belongs to the VG of the previous device
    if (next.current_device != state.current_device) {
        next.pv_selected = 0;
    }
    return next;
}

}  // namespace tui
