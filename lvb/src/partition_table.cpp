#include "lvb/partition_table.hpp"
#include "lvb/size_format.hpp"
#include "lvb/string_utils.hpp"

#include <algorithm>  // for all_of
#include <cctype>     // for isdigit
#include <optional>   // for optional
#include <utility>    // for exchange, move
#include <vector>     // for vector

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

#include <ctre.hpp>

using namespace std::string_view_literals;

namespace {

/// Minimal amount of fields in dos partition row: Device Start End Sectors Size Id Type
static constexpr std::size_t MBR_ROW_MIN_FIELDS = 7;
/// Minimal amount of fields in parted partition row: Number Start End Size
static constexpr std::size_t GPT_ROW_MIN_FIELDS = 4;

/// Extracts disk path out of the "Disk /dev/sda: 20 GiB, ..." header line
auto parse_disk_header(std::string_view line) noexcept -> std::optional<std::string> {
    if (!line.starts_with("Disk /"sv)) {
        return std::nullopt;
    }
    if (auto match = ctre::search<"Disk (/[^:]+):">(line)) {
        return std::string{match.get<1>().to_view()};
    }
    return std::nullopt;
}

auto value_after(std::string_view line, std::string_view key) noexcept -> std::string_view {
    const auto pos = line.find(key);
    if (pos == std::string_view::npos) {
        return {};
    }
    return lvb::utils::trim(line.substr(pos + key.size()));
}

auto is_table_header(std::string_view line, std::string_view first_column) noexcept -> bool {
    return line.contains(first_column) && line.contains("Start"sv) && line.contains("End"sv);
}

auto is_number(std::string_view token) noexcept -> bool {
    return !token.empty() && std::ranges::all_of(token, [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; });
}

auto join_tokens(const std::vector<std::string_view>& tokens, std::size_t from) noexcept -> std::string {
    std::string res{};
    for (std::size_t i = from; i < tokens.size(); ++i) {
        if (!res.empty()) {
            res += ' ';
        }
        res += tokens[i];
    }
    return res;
}

/// Kernel naming: partitions of disks ending with a digit get a "p" separator
/// e.g /dev/nvme0n1 -> /dev/nvme0n1p1, /dev/sda -> /dev/sda1
auto make_partition_path(std::string_view disk, std::string_view number) noexcept -> std::string {
    if (!disk.empty() && std::isdigit(static_cast<unsigned char>(disk.back())) != 0) {
        return fmt::format(FMT_COMPILE("{}p{}"), disk, number);
    }
    return fmt::format(FMT_COMPILE("{}{}"), disk, number);
}

}  // namespace

namespace lvb::disk {

auto clean_device_info(std::string_view text) noexcept -> std::string {
    auto res = utils::replace_all(std::string{text}, "HARDDISK"sv, "HDD"sv);
    res      = utils::replace_all(std::move(res), "(iscsi)"sv, ""sv);
    res      = utils::replace_all(std::move(res), "Linux device-mapper (linear) (dm)"sv, "LINUX Dev-map"sv);
    return res;
}

auto parse_fdisk_output(std::string_view fdisk_output) noexcept -> MbrDiskMap {
    MbrDiskMap disks{};

    MbrDiskInfo* current_disk{};
    std::string current_disk_path{};
    bool in_partition_table{false};

    for (auto&& raw_line : utils::make_split_view(fdisk_output)) {
        const auto line = utils::trim(raw_line);
        if (line.empty()) {
            continue;
        }

        if (auto disk_path = parse_disk_header(line)) {
            current_disk_path  = std::move(*disk_path);
            current_disk       = &disks[current_disk_path];
            *current_disk      = MbrDiskInfo{};
            in_partition_table = false;
            continue;
        }
        if (current_disk == nullptr) {
            continue;
        }

        if (line.contains("Disk model:"sv)) {
            current_disk->disk_model = clean_device_info(value_after(line, "Disk model:"sv));
        } else if (line.contains("Disklabel type:"sv)) {
            current_disk->disklabel_type = std::string{value_after(line, "Disklabel type:"sv)};
        } else if (is_table_header(line, "Device"sv)) {
            in_partition_table = true;
        } else if (in_partition_table && !line.starts_with("Disk "sv)) {
            auto tokens = utils::split_whitespace(line);
            if (tokens.size() < 2 || !tokens[0].starts_with(current_disk_path)) {
                continue;
            }
            // boot indicator column is only filled for bootable partitions
            if (tokens[1] == "*"sv) {
                tokens.erase(tokens.begin() + 1);
            }
            if (current_disk->disklabel_type != "dos"sv || tokens.size() < MBR_ROW_MIN_FIELDS) {
                continue;
            }
            current_disk->partitions[std::string{tokens[0]}] = MbrPartitionInfo{
                .fdisk_id_info   = std::string{tokens[5]},
                .fdisk_type_info = join_tokens(tokens, 6),
            };
        }
    }

    spdlog::debug("fdisk: parsed {} disks", disks.size());
    return disks;
}

auto parse_parted_output(std::string_view parted_output) noexcept -> GptDiskMap {
    GptDiskMap disks{};

    GptDiskInfo* current_disk{};
    std::string current_disk_path{};
    std::string pending_model{};
    bool in_partition_table{false};

    for (auto&& raw_line : utils::make_split_view(parted_output)) {
        const auto line = utils::trim(raw_line);
        if (line.empty()) {
            continue;
        }

        // parted prints the model line right before the disk header
        if (line.starts_with("Model:"sv)) {
            pending_model = clean_device_info(value_after(line, "Model:"sv));
            continue;
        }
        if (auto disk_path = parse_disk_header(line)) {
            current_disk_path            = std::move(*disk_path);
            current_disk                 = &disks[current_disk_path];
            *current_disk                = GptDiskInfo{};
            current_disk->gpt_model_info = std::exchange(pending_model, {});
            in_partition_table           = false;
            continue;
        }
        if (current_disk == nullptr) {
            continue;
        }

        if (line.contains("Partition Table:"sv)) {
            current_disk->gpt_part_table_type = std::string{value_after(line, "Partition Table:"sv)};
        } else if (is_table_header(line, "Number"sv)) {
            in_partition_table = true;
        } else if (in_partition_table) {
            const auto tokens = utils::split_whitespace(line);
            if (tokens.size() < GPT_ROW_MIN_FIELDS || !is_number(tokens[0])) {
                continue;
            }
            const auto part_path = make_partition_path(current_disk_path, tokens[0]);

            current_disk->partitions[part_path] = GptPartitionInfo{
                .gpt_disk_flags_type = tokens.size() > 4 ? std::string{tokens[4]} : std::string{lvb::NOT_AVAILABLE},
                .gpt_fs_info         = clean_device_info(tokens[tokens.size() - 2]),
                .gpt_df_flags_info   = clean_device_info(tokens.back()),
            };
        }
    }

    spdlog::debug("parted: parsed {} disks", disks.size());
    return disks;
}

auto read_fdisk_report(const utils::RunOptions& options) noexcept -> std::expected<std::string, utils::CommandError> {
    return utils::run_text({"fdisk", "-l"}, options);
}

auto read_parted_report(const utils::RunOptions& options) noexcept -> std::expected<std::string, utils::CommandError> {
    return utils::run_text({"parted", "-l"}, options);
}

}  // namespace lvb::disk
