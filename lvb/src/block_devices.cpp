#include "lvb/block_devices.hpp"
#include "lvb/size_format.hpp"

#include <algorithm>  // for find_if, transform
#include <cctype>     // for tolower
#include <ranges>     // for ranges::*
#include <utility>    // for move

#include <rapidjson/document.h>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

static constexpr auto DEV_PATH_PREFIX = "/dev/"sv;

namespace {

using BlockDeviceNode = lvb::disk::BlockDeviceNode;

auto get_size_from_json(const rapidjson::Value& value) noexcept -> std::optional<std::uint64_t> {
    if (value.IsUint64()) {
        return value.GetUint64();
    }
    // older lsblk versions report numbers as strings
    if (value.IsString()) {
        return lvb::parse_uint(std::string_view{value.GetString(), value.GetStringLength()});
    }
    return std::nullopt;
}

/// Constructs a BlockDeviceNode from a RapidJSON object, recursing into children.
auto get_blockdevice_from_json(const rapidjson::Value& doc) -> BlockDeviceNode {
    auto device = BlockDeviceNode{};
    if (doc.HasMember("name") && doc["name"].IsString()) {
        device.name = doc["name"].GetString();
    }
    if (doc.HasMember("path") && doc["path"].IsString()) {
        device.path = doc["path"].GetString();
    }
    if (doc.HasMember("type") && doc["type"].IsString()) {
        device.type = doc["type"].GetString();
    }
    if (doc.HasMember("size")) {
        device.size = get_size_from_json(doc["size"]);
    }

    if (doc.HasMember("children") && doc["children"].IsArray()) {
        for (const auto& child_json : doc["children"].GetArray()) {
            if (child_json.IsObject()) {
                device.children.emplace_back(get_blockdevice_from_json(child_json));
            }
        }
    }
    return device;
}

auto to_lower(std::string_view str) noexcept -> std::string {
    std::string res{str};
    std::ranges::transform(res, res.begin(), [](char ch) { return static_cast<char>(std::tolower(static_cast<unsigned char>(ch))); });
    return res;
}

}  // namespace

namespace lvb::disk {

auto device_kind_from_string(std::string_view type_str) noexcept -> DeviceKind {
    if (type_str == "disk"sv) {
        return DeviceKind::Disk;
    } else if (type_str == "part"sv) {
        return DeviceKind::Partition;
    } else if (type_str == "lvm"sv) {
        return DeviceKind::Lvm;
    }
    return DeviceKind::Other;
}

auto DeviceRecord::mount_point_str() const noexcept -> std::string {
    return usage ? usage->mount_point : std::string{NOT_AVAILABLE};
}

auto DeviceRecord::used_str() const noexcept -> std::string {
    return usage ? format_size(usage->used_bytes) : std::string{NOT_AVAILABLE};
}

auto DeviceRecord::avail_str() const noexcept -> std::string {
    return usage ? format_size(usage->avail_bytes) : std::string{NOT_AVAILABLE};
}

auto parse_lsblk_tree(std::string_view json_output) noexcept -> std::expected<std::vector<BlockDeviceNode>, std::string> {
    auto parsed = utils::parse_json(json_output);
    if (!parsed) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to parse lsblk output: {}"), utils::command_error_to_string(parsed.error())));
    }
    const auto& document = *parsed;
    if (!document.IsObject()) {
        return std::unexpected("lsblk output root must be an object");
    }

    // Extract data from JSON
    std::vector<BlockDeviceNode> block_devices{};
    if (document.HasMember("blockdevices") && document["blockdevices"].IsArray()) {
        for (const auto& device_json : document["blockdevices"].GetArray()) {
            if (device_json.IsObject()) {
                block_devices.emplace_back(get_blockdevice_from_json(device_json));
            }
        }
    }
    return block_devices;
}

auto device_identity(const BlockDeviceNode& node) noexcept -> std::string_view {
    if (node.path && !node.path->empty()) {
        return *node.path;
    }
    return node.name;
}

auto find_owning_disk(std::string_view device_path, const MbrDiskMap& mbr_info, const GptDiskMap& gpt_info) noexcept
    -> std::optional<std::string> {
    std::optional<std::string> best_match{};
    auto consider = [&](const std::string& disk_path) {
        if (!device_path.starts_with(disk_path)) {
            return;
        }
        if (!best_match || disk_path.size() > best_match->size()) {
            best_match = disk_path;
        }
    };

    for (const auto& disk_path : mbr_info | std::views::keys) {
        consider(disk_path);
    }
    for (const auto& disk_path : gpt_info | std::views::keys) {
        consider(disk_path);
    }
    return best_match;
}

auto lookup_partition_table_info(std::string_view device_path, const MbrDiskMap& mbr_info, const GptDiskMap& gpt_info) noexcept
    -> std::optional<PartitionTableInfo> {
    if (!device_path.starts_with(DEV_PATH_PREFIX)) {
        return std::nullopt;
    }
    const auto& disk_path = find_owning_disk(device_path, mbr_info, gpt_info);
    if (!disk_path) {
        return std::nullopt;
    }

    PartitionTableInfo info{};
    const auto mbr_disk = mbr_info.find(*disk_path);
    const auto gpt_disk = gpt_info.find(*disk_path);

    if (device_path == *disk_path) {
        if (mbr_disk != mbr_info.end()) {
            info.disk_model     = mbr_disk->second.disk_model;
            info.disklabel_type = mbr_disk->second.disklabel_type;
        }
        if (gpt_disk != gpt_info.end()) {
            info.gpt_model_info      = gpt_disk->second.gpt_model_info;
            info.gpt_part_table_type = gpt_disk->second.gpt_part_table_type;
        }
        return info;
    }

    const std::string device_path_str{device_path};
    if (mbr_disk != mbr_info.end()) {
        if (auto it = mbr_disk->second.partitions.find(device_path_str); it != mbr_disk->second.partitions.end()) {
            info.fdisk_id_info   = it->second.fdisk_id_info;
            info.fdisk_type_info = it->second.fdisk_type_info;
        }
    }
    if (gpt_disk != gpt_info.end()) {
        if (auto it = gpt_disk->second.partitions.find(device_path_str); it != gpt_disk->second.partitions.end()) {
            info.gpt_disk_flags_type = it->second.gpt_disk_flags_type;
            info.gpt_fs_info         = it->second.gpt_fs_info;
            info.gpt_df_flags_info   = it->second.gpt_df_flags_info;
        }
    }
    return info;
}

void flatten_node(const BlockDeviceNode& node, const fs::FsUsageMap& usage_map, const MbrDiskMap& mbr_info,
    const GptDiskMap& gpt_info, std::unordered_set<std::string>& seen, std::vector<DeviceRecord>& out) noexcept {
    const auto identity = device_identity(node);
    if (!identity.empty() && !seen.contains(std::string{identity})) {
        seen.emplace(identity);

        DeviceRecord record{
            .path       = std::string{identity},
            .name       = node.name,
            .type       = node.type,
            .kind       = device_kind_from_string(node.type),
            .size_bytes = node.size.value_or(0),
            .usage      = std::nullopt,
            .table_info = lookup_partition_table_info(identity, mbr_info, gpt_info),
        };
        if (auto it = usage_map.find(record.path); it != usage_map.end()) {
            record.usage = it->second;
        }
        out.emplace_back(std::move(record));
    }

    // children are visited even for duplicates, they may carry unseen devices
    for (const auto& child : node.children) {
        flatten_node(child, usage_map, mbr_info, gpt_info, seen, out);
    }
}

auto flatten_block_devices(const std::vector<BlockDeviceNode>& roots, const fs::FsUsageMap& usage_map,
    const MbrDiskMap& mbr_info, const GptDiskMap& gpt_info) noexcept -> std::vector<DeviceRecord> {
    std::unordered_set<std::string> seen{};
    std::vector<DeviceRecord> devices{};
    for (const auto& root : roots) {
        flatten_node(root, usage_map, mbr_info, gpt_info, seen, devices);
    }
    spdlog::debug("flattened {} block devices", devices.size());
    return devices;
}

auto classify_partition(const DeviceRecord& device) noexcept -> std::string_view {
    if (device.kind == DeviceKind::Disk) {
        return "Disk"sv;
    }
    if (device.kind != DeviceKind::Partition) {
        return "---"sv;
    }
    if (!device.table_info) {
        return "Pri"sv;
    }

    const auto& info     = *device.table_info;
    const auto& id_info  = to_lower(info.fdisk_id_info.value_or(""));
    const auto& mbr_type = to_lower(info.fdisk_type_info.value_or(""));
    const auto& gpt_type = to_lower(info.gpt_disk_flags_type.value_or(""));

    if (id_info.contains("primary"sv) || gpt_type.contains("primary"sv)) {
        return "Pri"sv;
    } else if (id_info.contains("extended"sv) || gpt_type.contains("extended"sv)
        || mbr_type.contains("extended"sv) || mbr_type.contains("ext'd"sv)) {
        return "Extd"sv;
    } else if (id_info.contains("logical"sv) || gpt_type.contains("logical"sv)) {
        return "Logi"sv;
    }
    return "Pri"sv;
}

auto find_device_by_path(const std::vector<DeviceRecord>& devices, std::string_view device_path) noexcept -> const DeviceRecord* {
    auto it = std::ranges::find_if(devices, [device_path](auto&& dev) {
        return dev.path == device_path;
    });
    if (it != std::ranges::end(devices)) {
        return &*it;
    }
    return nullptr;
}

auto read_lsblk_report(const utils::RunOptions& options) noexcept -> std::expected<std::string, utils::CommandError> {
    return utils::run_text({"lsblk", "-b", "-O", "-J"}, options);
}

}  // namespace lvb::disk
