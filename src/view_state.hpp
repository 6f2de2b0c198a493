#ifndef VIEW_STATE_HPP
#define VIEW_STATE_HPP

#include <cstddef>  // for size_t
#include <cstdint>  // for uint8_t

namespace tui {

/// Panel which receives the navigation keys.
enum class Panel : std::uint8_t {
    Main,
    PhysicalVolumes,
    BlockDevices
};

/// Input of the reducer, decoded from the terminal events.
enum class Key : std::uint8_t {
    NextPanel,
    Up,
    Down,
    Quit,
    Other
};

/// Selection state of the browser, independent from the snapshot.
struct ViewState {
    Panel active_panel{Panel::Main};
    /// Device shown in the main panel.
    std::size_t current_device{};
    std::size_t pv_selected{};
    std::size_t block_dev_selected{};
    bool quit{};
};

/// Number of entries of the lists the selections move in.
struct ListCounts {
    std::size_t devices{};
    /// PVs of the VG of the current device, 0 if it is not a PV.
    std::size_t vg_pvs{};
};

/// Applies one key to the state.
/// Selections never leave [0, count), moving past either end is a no-op.
/// The block device list starts at the current device when it gets focus,
/// moving through it also changes the current device.
[[nodiscard]] auto reduce(const ViewState& state, Key key, const ListCounts& counts) noexcept -> ViewState;

/// Returns the next panel in Tab order.
[[nodiscard]] auto next_panel(Panel panel) noexcept -> Panel;

}  // namespace tui

#endif  // VIEW_STATE_HPP
