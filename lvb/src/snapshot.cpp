#include "lvb/snapshot.hpp"
#include "lvb/fs_usage.hpp"
#include "lvb/partition_table.hpp"

#include <utility>  // for move

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using lvb::SourceState;

template <typename T>
auto state_of(const T& table) noexcept -> SourceState {
    return table.empty() ? SourceState::Empty : SourceState::Loaded;
}

void log_unavailable(std::string_view source, lvb::utils::CommandError error) noexcept {
    spdlog::warn("{} is unavailable: {}", source, lvb::utils::command_error_to_string(error));
}

/// Parses raw text with the given parser.
/// Returns parsed table and its state, empty table if the tool has failed.
template <typename Parser>
auto parse_text_source(std::string_view source, const lvb::RawOutput& raw, Parser&& parser, SourceState& state) noexcept {
    using Table = decltype(parser(std::string_view{}));
    if (!raw) {
        log_unavailable(source, raw.error());
        state = SourceState::Unavailable;
        return Table{};
    }
    auto table = parser(std::string_view{*raw});
    state      = state_of(table);
    return table;
}

/// Same as parse_text_source, for parsers which may reject their input.
template <typename Parser>
auto parse_report_source(std::string_view source, const lvb::RawOutput& raw, Parser&& parser, SourceState& state) noexcept {
    using Table = typename decltype(parser(std::string_view{}))::value_type;
    if (!raw) {
        log_unavailable(source, raw.error());
        state = SourceState::Unavailable;
        return Table{};
    }
    auto table = parser(std::string_view{*raw});
    if (!table) {
        spdlog::error("{} report is malformed: {}", source, table.error());
        state = SourceState::Unavailable;
        return Table{};
    }
    state = state_of(*table);
    return std::move(*table);
}

}  // namespace

namespace lvb {

auto source_state_to_string(SourceState state) noexcept -> std::string_view {
    switch (state) {
    case SourceState::Loaded:
        return "loaded"sv;
    case SourceState::Empty:
        return "empty"sv;
    case SourceState::Unavailable:
    default:
        return "unavailable"sv;
    }
}

auto build_snapshot(const RawSources& raw_sources) noexcept -> StorageSnapshot {
    StorageSnapshot snapshot{};
    auto& states = snapshot.sources;

    const auto& mbr_info   = parse_text_source("fdisk"sv, raw_sources.fdisk, disk::parse_fdisk_output, states.fdisk);
    const auto& gpt_info   = parse_text_source("parted"sv, raw_sources.parted, disk::parse_parted_output, states.parted);
    const auto& usage_map  = parse_text_source("df"sv, raw_sources.df, fs::parse_df_output, states.df);
    const auto& root_nodes = parse_report_source("lsblk"sv, raw_sources.lsblk, disk::parse_lsblk_tree, states.lsblk);

    snapshot.devices = disk::flatten_block_devices(root_nodes, usage_map, mbr_info, gpt_info);

    auto pvs = parse_report_source("pvs"sv, raw_sources.pvs, lvm::parse_pvs_report, states.pvs);
    auto vgs = parse_report_source("vgs"sv, raw_sources.vgs, lvm::parse_vgs_report, states.vgs);
    auto lvs = parse_report_source("lvs"sv, raw_sources.lvs, lvm::parse_lvs_report, states.lvs);

    snapshot.lvm = lvm::build_lvm_tables(std::move(pvs), std::move(vgs), std::move(lvs));

    spdlog::info("snapshot: {} devices (lsblk {}, fdisk {}, parted {}, df {}, pvs {}, vgs {}, lvs {})",
        snapshot.devices.size(), source_state_to_string(states.lsblk), source_state_to_string(states.fdisk),
        source_state_to_string(states.parted), source_state_to_string(states.df), source_state_to_string(states.pvs),
        source_state_to_string(states.vgs), source_state_to_string(states.lvs));
    return snapshot;
}

auto load_snapshot(const utils::RunOptions& options) noexcept -> StorageSnapshot {
    const RawSources raw_sources{
        .lsblk  = disk::read_lsblk_report(options),
        .fdisk  = disk::read_fdisk_report(options),
        .parted = disk::read_parted_report(options),
        .df     = fs::read_df_report(options),
        .pvs    = lvm::read_pvs_report(options),
        .vgs    = lvm::read_vgs_report(options),
        .lvs    = lvm::read_lvs_report(options),
    };
    return build_snapshot(raw_sources);
}

}  // namespace lvb
