#ifndef SNAPSHOT_HPP
#define SNAPSHOT_HPP

#include "lvb/block_devices.hpp"
#include "lvb/io_utils.hpp"
#include "lvb/lvm.hpp"

#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lvb {

/// @brief Outcome of reading one external source.
enum class SourceState : std::uint8_t {
    /// Tool ran and reported at least one row.
    Loaded,
    /// Tool ran, but reported nothing.
    Empty,
    /// Tool is missing, failed, timed out or produced malformed output.
    Unavailable,
};

/// @brief Convert source state to string representation
auto source_state_to_string(SourceState state) noexcept -> std::string_view;

/// @brief State of every source of the snapshot.
struct SourceStates final {
    SourceState lsblk{SourceState::Unavailable};
    SourceState fdisk{SourceState::Unavailable};
    SourceState parted{SourceState::Unavailable};
    SourceState df{SourceState::Unavailable};
    SourceState pvs{SourceState::Unavailable};
    SourceState vgs{SourceState::Unavailable};
    SourceState lvs{SourceState::Unavailable};
};

/// Raw output of a tool, or the reason there is none.
using RawOutput = std::expected<std::string, utils::CommandError>;

/// @brief Raw outputs of every external tool.
struct RawSources final {
    RawOutput lsblk;
    RawOutput fdisk;
    RawOutput parted;
    RawOutput df;
    RawOutput pvs;
    RawOutput vgs;
    RawOutput lvs;
};

/// @brief Immutable storage topology, loaded once per run.
struct StorageSnapshot final {
    /// Flattened, deduplicated block devices in lsblk pre-order.
    std::vector<disk::DeviceRecord> devices;
    lvm::LvmTables lvm;
    SourceStates sources;
};

/// @brief Builds the snapshot out of raw tool outputs.
/// Sources which fail to parse are treated as unavailable, their tables stay empty.
auto build_snapshot(const RawSources& raw_sources) noexcept -> StorageSnapshot;

/// @brief Runs every tool in turn and builds the snapshot.
/// @param options Timeout used for each of the commands.
auto load_snapshot(const utils::RunOptions& options = {}) noexcept -> StorageSnapshot;

}  // namespace lvb

#endif  // SNAPSHOT_HPP
