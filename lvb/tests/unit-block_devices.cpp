#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "lvb/block_devices.hpp"
#include "lvb/logger.hpp"

#include <string_view>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

static constexpr auto LSBLK_OUTPUT = R"({
   "blockdevices": [
      {
         "name": "sda", "path": "/dev/sda", "type": "disk", "size": 21474836480,
         "children": [
            {"name": "sda1", "path": "/dev/sda1", "type": "part", "size": 536870912},
            {"name": "sda2", "path": "/dev/sda2", "type": "part", "size": 20936916992,
               "children": [
                  {"name": "vg0-root", "path": "/dev/mapper/vg0-root", "type": "lvm", "size": 10737418240}
               ]
            }
         ]
      },
      {
         "name": "sdb", "path": "/dev/sdb", "type": "disk", "size": "10737418240",
         "children": [
            {"name": "sdb1", "path": "/dev/sdb1", "type": "part", "size": "10736369664",
               "children": [
                  {"name": "vg0-root", "path": "/dev/mapper/vg0-root", "type": "lvm", "size": 10737418240}
               ]
            }
         ]
      },
      {"name": "sr0", "type": "rom", "size": null}
   ]
})"sv;

auto make_mbr_info() -> lvb::disk::MbrDiskMap {
    lvb::disk::MbrDiskMap mbr_info{};
    auto& sda          = mbr_info["/dev/sda"];
    sda.disk_model     = "QEMU HDD";
    sda.disklabel_type = "dos";
    sda.partitions["/dev/sda1"] = {.fdisk_id_info = "83", .fdisk_type_info = "Linux"};
    sda.partitions["/dev/sda2"] = {.fdisk_id_info = "5", .fdisk_type_info = "Extended"};
    return mbr_info;
}

auto make_gpt_info() -> lvb::disk::GptDiskMap {
    lvb::disk::GptDiskMap gpt_info{};
    auto& sda                   = gpt_info["/dev/sda"];
    sda.gpt_model_info          = "ATA QEMU HDD (scsi)";
    sda.gpt_part_table_type     = "msdos";
    sda.partitions["/dev/sda1"] = {.gpt_disk_flags_type = "primary", .gpt_fs_info = "ext4", .gpt_df_flags_info = "boot"};
    return gpt_info;
}

}  // namespace

TEST_CASE("lsblk parser test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    lvb::logger::set_logger(logger);

    SECTION("tree with numeric and string sizes")
    {
        const auto& roots = lvb::disk::parse_lsblk_tree(LSBLK_OUTPUT);
        REQUIRE(roots.has_value());
        REQUIRE_EQ(roots->size(), 3);

        const auto& sda = (*roots)[0];
        REQUIRE_EQ(sda.name, "sda");
        REQUIRE_EQ(sda.path, "/dev/sda");
        REQUIRE_EQ(sda.type, "disk");
        REQUIRE_EQ(sda.size, 21474836480ULL);
        REQUIRE_EQ(sda.children.size(), 2);
        REQUIRE_EQ(sda.children[1].children.size(), 1);

        const auto& sdb = (*roots)[1];
        REQUIRE_EQ(sdb.size, 10737418240ULL);
        REQUIRE_EQ(sdb.children[0].size, 10736369664ULL);

        const auto& sr0 = (*roots)[2];
        REQUIRE(!sr0.path.has_value());
        REQUIRE(!sr0.size.has_value());
        REQUIRE_EQ(lvb::disk::device_identity(sr0), "sr0");
    }
    SECTION("malformed input")
    {
        REQUIRE(!lvb::disk::parse_lsblk_tree("{\"blockdevices\": ["sv).has_value());
        REQUIRE(!lvb::disk::parse_lsblk_tree("[]"sv).has_value());
    }
    SECTION("missing blockdevices array")
    {
        const auto& roots = lvb::disk::parse_lsblk_tree("{}"sv);
        REQUIRE(roots.has_value());
        REQUIRE(roots->empty());
    }
}

TEST_CASE("device flattening test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    lvb::logger::set_logger(logger);

    const auto& roots = lvb::disk::parse_lsblk_tree(LSBLK_OUTPUT);
    REQUIRE(roots.has_value());

    SECTION("depth first order without duplicates")
    {
        const auto& devices = lvb::disk::flatten_block_devices(*roots, {}, {}, {});
        REQUIRE_EQ(devices.size(), 7);
        REQUIRE_EQ(devices[0].path, "/dev/sda");
        REQUIRE_EQ(devices[1].path, "/dev/sda1");
        REQUIRE_EQ(devices[2].path, "/dev/sda2");
        REQUIRE_EQ(devices[3].path, "/dev/mapper/vg0-root");
        REQUIRE_EQ(devices[4].path, "/dev/sdb");
        REQUIRE_EQ(devices[5].path, "/dev/sdb1");
        REQUIRE_EQ(devices[6].path, "sr0");

        REQUIRE_EQ(devices[3].kind, lvb::disk::DeviceKind::Lvm);
        REQUIRE_EQ(devices[6].kind, lvb::disk::DeviceKind::Other);
        REQUIRE_EQ(devices[6].size_bytes, 0);
    }
    SECTION("flattening is idempotent")
    {
        const auto& first  = lvb::disk::flatten_block_devices(*roots, {}, {}, {});
        const auto& second = lvb::disk::flatten_block_devices(*roots, {}, {}, {});
        REQUIRE_EQ(first.size(), second.size());
        for (std::size_t i = 0; i < first.size(); ++i) {
            REQUIRE_EQ(first[i].path, second[i].path);
        }
    }
    SECTION("usage is attached by path")
    {
        lvb::fs::FsUsageMap usage_map{};
        usage_map["/dev/mapper/vg0-root"] = lvb::fs::FsUsage{
            .mount_point = "/",
            .size_bytes  = 10240,
            .used_bytes  = 4096,
            .avail_bytes = 6144,
            .use_percent = "40",
        };

        const auto& devices = lvb::disk::flatten_block_devices(*roots, usage_map, {}, {});
        const auto* root    = lvb::disk::find_device_by_path(devices, "/dev/mapper/vg0-root"sv);
        REQUIRE(root != nullptr);
        REQUIRE(root->usage.has_value());
        REQUIRE_EQ(root->mount_point_str(), "/");
        REQUIRE_EQ(root->used_str(), "  4.00 KiB");
        REQUIRE_EQ(root->avail_str(), "  6.00 KiB");

        const auto* sda1 = lvb::disk::find_device_by_path(devices, "/dev/sda1"sv);
        REQUIRE(sda1 != nullptr);
        REQUIRE_EQ(sda1->mount_point_str(), "N/A");
        REQUIRE_EQ(sda1->used_str(), "N/A");
        REQUIRE_EQ(sda1->avail_str(), "N/A");
    }
    SECTION("find device by path")
    {
        const auto& devices = lvb::disk::flatten_block_devices(*roots, {}, {}, {});
        REQUIRE(lvb::disk::find_device_by_path(devices, "/dev/sdb1"sv) != nullptr);
        REQUIRE(lvb::disk::find_device_by_path(devices, "/dev/sdz"sv) == nullptr);
    }
}

TEST_CASE("partition table enrichment test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    lvb::logger::set_logger(logger);

    const auto& mbr_info = make_mbr_info();
    const auto& gpt_info = make_gpt_info();

    SECTION("owning disk")
    {
        lvb::disk::MbrDiskMap nested{};
        nested["/dev/md1"];
        nested["/dev/md12"];
        REQUIRE_EQ(lvb::disk::find_owning_disk("/dev/md12p1"sv, nested, {}), "/dev/md12");
        REQUIRE_EQ(lvb::disk::find_owning_disk("/dev/sda2"sv, mbr_info, gpt_info), "/dev/sda");
        REQUIRE(!lvb::disk::find_owning_disk("/dev/sdb1"sv, mbr_info, gpt_info).has_value());
    }
    SECTION("disk level fields")
    {
        const auto& info = lvb::disk::lookup_partition_table_info("/dev/sda"sv, mbr_info, gpt_info);
        REQUIRE(info.has_value());
        REQUIRE_EQ(info->disk_model, "QEMU HDD");
        REQUIRE_EQ(info->disklabel_type, "dos");
        REQUIRE_EQ(info->gpt_model_info, "ATA QEMU HDD (scsi)");
        REQUIRE_EQ(info->gpt_part_table_type, "msdos");
        REQUIRE(!info->fdisk_id_info.has_value());
    }
    SECTION("partition level fields")
    {
        const auto& info = lvb::disk::lookup_partition_table_info("/dev/sda1"sv, mbr_info, gpt_info);
        REQUIRE(info.has_value());
        REQUIRE_EQ(info->fdisk_id_info, "83");
        REQUIRE_EQ(info->fdisk_type_info, "Linux");
        REQUIRE_EQ(info->gpt_disk_flags_type, "primary");
        REQUIRE_EQ(info->gpt_fs_info, "ext4");
        REQUIRE_EQ(info->gpt_df_flags_info, "boot");
        REQUIRE(!info->disk_model.has_value());
    }
    SECTION("devices outside of /dev or unknown disks")
    {
        REQUIRE(!lvb::disk::lookup_partition_table_info("sr0"sv, mbr_info, gpt_info).has_value());
        REQUIRE(!lvb::disk::lookup_partition_table_info("/dev/sdb1"sv, mbr_info, gpt_info).has_value());
    }
    SECTION("classification")
    {
        const auto& roots = lvb::disk::parse_lsblk_tree(LSBLK_OUTPUT);
        REQUIRE(roots.has_value());
        const auto& devices = lvb::disk::flatten_block_devices(*roots, {}, mbr_info, gpt_info);

        REQUIRE_EQ(lvb::disk::classify_partition(*lvb::disk::find_device_by_path(devices, "/dev/sda"sv)), "Disk");
        REQUIRE_EQ(lvb::disk::classify_partition(*lvb::disk::find_device_by_path(devices, "/dev/sda1"sv)), "Pri");
        REQUIRE_EQ(lvb::disk::classify_partition(*lvb::disk::find_device_by_path(devices, "/dev/sda2"sv)), "Extd");
        REQUIRE_EQ(lvb::disk::classify_partition(*lvb::disk::find_device_by_path(devices, "/dev/sdb1"sv)), "Pri");
        REQUIRE_EQ(lvb::disk::classify_partition(*lvb::disk::find_device_by_path(devices, "/dev/mapper/vg0-root"sv)), "---");
    }
    SECTION("logical partitions")
    {
        lvb::disk::DeviceRecord record{
            .path       = "/dev/sda5",
            .name       = "sda5",
            .type       = "part",
            .kind       = lvb::disk::DeviceKind::Partition,
            .size_bytes = 1024,
            .usage      = std::nullopt,
            .table_info = lvb::disk::PartitionTableInfo{.gpt_disk_flags_type = "logical"},
        };
        REQUIRE_EQ(lvb::disk::classify_partition(record), "Logi");
    }
}
