#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "view_state.hpp"

using tui::Key;
using tui::ListCounts;
using tui::Panel;
using tui::ViewState;

TEST_CASE("panel cycling")
{
    SECTION("tab order")
    {
        REQUIRE_EQ(tui::next_panel(Panel::Main), Panel::PhysicalVolumes);
        REQUIRE_EQ(tui::next_panel(Panel::PhysicalVolumes), Panel::BlockDevices);
        REQUIRE_EQ(tui::next_panel(Panel::BlockDevices), Panel::Main);
    }
    SECTION("block device list starts at the current device")
    {
        ViewState state{.active_panel = Panel::PhysicalVolumes, .current_device = 4, .pv_selected = 1, .block_dev_selected = 0, .quit = false};
        const auto next = tui::reduce(state, Key::NextPanel, ListCounts{.devices = 8, .vg_pvs = 2});
        REQUIRE_EQ(next.active_panel, Panel::BlockDevices);
        REQUIRE_EQ(next.block_dev_selected, 4);
        REQUIRE_EQ(next.pv_selected, 1);
    }
    SECTION("quit and unknown keys")
    {
        const ViewState state{};
        REQUIRE(tui::reduce(state, Key::Quit, {}).quit);

        const auto next = tui::reduce(state, Key::Other, {});
        REQUIRE(!next.quit);
        REQUIRE_EQ(next.active_panel, Panel::Main);
        REQUIRE_EQ(next.current_device, 0);
    }
}

TEST_CASE("selection movement")
{
    const ListCounts counts{.devices = 3, .vg_pvs = 2};

    SECTION("main panel moves the current device within bounds")
    {
        ViewState state{};
        state = tui::reduce(state, Key::Up, counts);
        REQUIRE_EQ(state.current_device, 0);

        state = tui::reduce(state, Key::Down, counts);
        state = tui::reduce(state, Key::Down, counts);
        REQUIRE_EQ(state.current_device, 2);

        state = tui::reduce(state, Key::Down, counts);
        REQUIRE_EQ(state.current_device, 2);
    }
    SECTION("pv selection is bounded by the vg pvs")
    {
        ViewState state{.active_panel = Panel::PhysicalVolumes};
        state = tui::reduce(state, Key::Down, counts);
        REQUIRE_EQ(state.pv_selected, 1);
        state = tui::reduce(state, Key::Down, counts);
        REQUIRE_EQ(state.pv_selected, 1);
        REQUIRE_EQ(state.current_device, 0);

        state = tui::reduce(state, Key::Up, counts);
        state = tui::reduce(state, Key::Up, counts);
        REQUIRE_EQ(state.pv_selected, 0);
    }
    SECTION("pv selection stays at zero without pvs")
    {
        ViewState state{.active_panel = Panel::PhysicalVolumes};
        state = tui::reduce(state, Key::Down, ListCounts{.devices = 3, .vg_pvs = 0});
        REQUIRE_EQ(state.pv_selected, 0);
    }
    SECTION("block device panel drives the current device")
    {
        ViewState state{.active_panel = Panel::BlockDevices, .current_device = 1, .pv_selected = 1, .block_dev_selected = 1, .quit = false};
        state = tui::reduce(state, Key::Down, counts);
        REQUIRE_EQ(state.block_dev_selected, 2);
        REQUIRE_EQ(state.current_device, 2);
        REQUIRE_EQ(state.pv_selected, 0);
    }
    SECTION("pv selection resets when the device changes")
    {
        ViewState state{.active_panel = Panel::Main, .current_device = 0, .pv_selected = 1, .block_dev_selected = 0, .quit = false};
        state = tui::reduce(state, Key::Down, counts);
        REQUIRE_EQ(state.current_device, 1);
        REQUIRE_EQ(state.pv_selected, 0);
    }
    SECTION("no devices")
    {
        ViewState state{};
        state = tui::reduce(state, Key::Down, ListCounts{});
        REQUIRE_EQ(state.current_device, 0);
    }
}
