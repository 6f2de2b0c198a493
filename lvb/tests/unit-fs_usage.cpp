#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "lvb/fs_usage.hpp"
#include "lvb/logger.hpp"

#include <string_view>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

static constexpr auto DF_OUTPUT = R"(Filesystem            1K-blocks    Used Available Use% Mounted on
/dev/mapper/vg0-root   10218772 4206092   5472008  44% /
tmpfs                   8134320       0   8134320   0% /dev/shm
/dev/sda1                523248    5972    517276   2% /boot
/dev/sdb1              20511312 1048576  18398160   6% /mnt/backup disk
)"sv;

}  // namespace

TEST_CASE("df parser test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    lvb::logger::set_logger(logger);

    SECTION("rows keyed by source")
    {
        const auto& usage = lvb::fs::parse_df_output(DF_OUTPUT);
        REQUIRE_EQ(usage.size(), 4);
        REQUIRE(usage.contains("/dev/mapper/vg0-root"));
        REQUIRE(usage.contains("tmpfs"));
        REQUIRE(usage.contains("/dev/sda1"));
        REQUIRE(usage.contains("/dev/sdb1"));
        REQUIRE(!usage.contains("Filesystem"));
    }
    SECTION("blocks are converted to bytes")
    {
        const auto& usage = lvb::fs::parse_df_output(DF_OUTPUT);
        const auto& root  = usage.at("/dev/mapper/vg0-root");
        REQUIRE_EQ(root.mount_point, "/");
        REQUIRE_EQ(root.size_bytes, 10218772ULL * 1024);
        REQUIRE_EQ(root.used_bytes, 4206092ULL * 1024);
        REQUIRE_EQ(root.avail_bytes, 5472008ULL * 1024);
        REQUIRE_EQ(root.use_percent, "44");
    }
    SECTION("mount point with spaces")
    {
        const auto& usage = lvb::fs::parse_df_output(DF_OUTPUT);
        REQUIRE_EQ(usage.at("/dev/sdb1").mount_point, "/mnt/backup disk");
    }
    SECTION("short and malformed rows are skipped")
    {
        static constexpr auto input = R"(Filesystem 1K-blocks Used Available Use% Mounted on
/dev/sdc1 100 50
/dev/sdd1 abc 1 2 3% /mnt/d
/dev/sde1 100 50 50 50% /mnt/e
)"sv;
        const auto& usage = lvb::fs::parse_df_output(input);
        REQUIRE_EQ(usage.size(), 1);
        REQUIRE(usage.contains("/dev/sde1"));
    }
    SECTION("later rows overwrite earlier ones")
    {
        static constexpr auto input = R"(Filesystem 1K-blocks Used Available Use% Mounted on
/dev/sda1 100 50 50 50% /boot
/dev/sda1 100 50 50 50% /mnt/boot
)"sv;
        const auto& usage = lvb::fs::parse_df_output(input);
        REQUIRE_EQ(usage.size(), 1);
        REQUIRE_EQ(usage.at("/dev/sda1").mount_point, "/mnt/boot");
    }
    SECTION("empty input and header only")
    {
        REQUIRE(lvb::fs::parse_df_output(""sv).empty());
        REQUIRE(lvb::fs::parse_df_output("Filesystem 1K-blocks Used Available Use% Mounted on\n"sv).empty());
    }
}
