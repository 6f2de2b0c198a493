#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "lvb/string_utils.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

namespace {

template <typename Range>
auto collect(Range&& range) -> std::vector<std::string_view> {
  std::vector<std::string_view> tokens{};
  for (auto&& token : range) {
    tokens.emplace_back(token);
  }
  return tokens;
}

}  // namespace

TEST_CASE("Split test")
{
  SECTION("empty string view")
  {
    static constexpr auto input = ""sv;
    const auto tokens = collect(lvb::utils::make_split_view(input, ','));
    REQUIRE_EQ(tokens.size(), 0);
  }
  SECTION("single delim string view")
  {
    static constexpr auto input = ","sv;
    const auto tokens = collect(lvb::utils::make_split_view(input, ','));
    REQUIRE_EQ(tokens.size(), 0);
  }
  SECTION("placement list")
  {
    static constexpr auto input = "/dev/sda1(0),/dev/sdb1(20)"sv;
    const auto tokens = collect(lvb::utils::make_split_view(input, ','));
    REQUIRE_EQ(input.data(), tokens[0].data());
    REQUIRE_EQ(tokens.size(), 2);
    REQUIRE_EQ(tokens[0], "/dev/sda1(0)");
    REQUIRE_EQ(tokens[1], "/dev/sdb1(20)");
  }
  SECTION("empty lines are skipped")
  {
    const std::string input = "Disk /dev/sda: 20 GiB\n\n\nDisk model: QEMU HARDDISK\n";
    const auto lines = collect(lvb::utils::make_split_view(input));
    REQUIRE_EQ(lines.size(), 2);
    REQUIRE_EQ(lines[0], "Disk /dev/sda: 20 GiB");
    REQUIRE_EQ(lines[1], "Disk model: QEMU HARDDISK");
  }
}

TEST_CASE("split whitespace test")
{
  SECTION("columns separated by runs of blanks")
  {
    const auto tokens = lvb::utils::split_whitespace("/dev/sda1  *     2048 1050623 1048576  512M 83 Linux"sv);
    REQUIRE_EQ(tokens.size(), 8);
    REQUIRE_EQ(tokens[0], "/dev/sda1"sv);
    REQUIRE_EQ(tokens[1], "*"sv);
    REQUIRE_EQ(tokens[7], "Linux"sv);
  }
  SECTION("tabs and surrounding blanks")
  {
    const auto tokens = lvb::utils::split_whitespace("\t a\tb  "sv);
    REQUIRE_EQ(tokens.size(), 2);
    REQUIRE_EQ(tokens[0], "a"sv);
    REQUIRE_EQ(tokens[1], "b"sv);
  }
  SECTION("blank string")
  {
    REQUIRE(lvb::utils::split_whitespace("   "sv).empty());
  }
}

TEST_CASE("join test")
{
  SECTION("empty vector")
  {
    const std::vector<std::string> input{};
    const auto joined_str = lvb::utils::join(input, ","sv);
    REQUIRE_EQ(joined_str.empty(), true);
  }
  SECTION("single element")
  {
    const std::vector<std::string> input{"vg0"};
    REQUIRE_EQ(lvb::utils::join(input, ", "sv), "vg0");
  }
  SECTION("short vector")
  {
    const std::vector<std::string> input{"1", "22", "333"};
    const auto joined_str = lvb::utils::join(input, ","sv);
    REQUIRE_EQ(joined_str.size(), 8);
    REQUIRE_EQ(joined_str, "1,22,333");
  }
  SECTION("default delimiter is newline")
  {
    const std::vector<std::string> input{"a", "b"};
    REQUIRE_EQ(lvb::utils::join(input), "a\nb");
  }
}

TEST_CASE("trim test")
{
  SECTION("empty string view")
  {
    static constexpr auto input = ""sv;
    const auto trimmed_str = lvb::utils::trim(input);
    REQUIRE_EQ(trimmed_str.size(), 0);
  }
  SECTION("only chars to trim")
  {
    static constexpr auto input = "\n\t \t\v\f"sv;
    const auto trimmed_str = lvb::utils::trim(input);
    REQUIRE_EQ(trimmed_str.size(), 0);
    REQUIRE_EQ(trimmed_str, ""sv);
  }
  SECTION("short string view")
  {
    static constexpr auto input = "\n\t 2\t\v\f"sv;
    const auto trimmed_str = lvb::utils::trim(input);
    REQUIRE_EQ(trimmed_str.size(), 1);
    REQUIRE_EQ(trimmed_str, "2"sv);
  }
  SECTION("without any trim chars")
  {
    static constexpr auto input = "/dev/mapper/vg0-root"sv;
    REQUIRE_EQ(lvb::utils::trim(input), input);
  }
}

TEST_CASE("replace_all test")
{
  REQUIRE_EQ(lvb::utils::replace_all("data-1", "-"sv, "--"sv), "data--1");
  REQUIRE_EQ(lvb::utils::replace_all("vg--x", "--"sv, "-"sv), "vg-x");
  REQUIRE_EQ(lvb::utils::replace_all("QEMU HARDDISK", "HARDDISK"sv, "HDD"sv), "QEMU HDD");
  REQUIRE_EQ(lvb::utils::replace_all("unchanged", ""sv, "x"sv), "unchanged");
}

TEST_CASE("truncate_text test")
{
  SECTION("fits")
  {
    REQUIRE_EQ(lvb::utils::truncate_text("hello"sv, 5), "hello");
    REQUIRE_EQ(lvb::utils::truncate_text(""sv, 0), "");
  }
  SECTION("shortened with ellipsis")
  {
    const auto result = lvb::utils::truncate_text("hello world"sv, 8);
    REQUIRE_EQ(result, "hello...");
    REQUIRE_EQ(result.size(), 8);
  }
  SECTION("width smaller than the ellipsis")
  {
    REQUIRE_EQ(lvb::utils::truncate_text("hello"sv, 2), "he");
    REQUIRE_EQ(lvb::utils::truncate_text("hello"sv, 0), "");
  }
}

TEST_CASE("truncate_identifier test")
{
  SECTION("fits")
  {
    const std::vector<std::string> siblings{"/dev/sda1", "/dev/sda2"};
    REQUIRE_EQ(lvb::utils::truncate_identifier("/dev/sda1"sv, 20, siblings), "/dev/sda1");
  }
  SECTION("unique prefix is kept")
  {
    const std::vector<std::string> siblings{"/dev/mapper/vg0-root", "/dev/nvme0n1p1"};
    REQUIRE_EQ(lvb::utils::truncate_identifier("/dev/mapper/vg0-root"sv, 10, siblings), "/dev/ma...");
  }
  SECTION("falls back to the tail when prefixes collide")
  {
    const std::vector<std::string> siblings{"/dev/mapper/vg0-root", "/dev/mapper/vg0-swap"};
    const auto root = lvb::utils::truncate_identifier("/dev/mapper/vg0-root"sv, 10, siblings);
    const auto swap = lvb::utils::truncate_identifier("/dev/mapper/vg0-swap"sv, 10, siblings);
    REQUIRE_EQ(root, "...g0-root");
    REQUIRE_EQ(swap, "...g0-swap");
    REQUIRE(root != swap);
  }
  SECTION("kept intact when every shortening is ambiguous")
  {
    const std::vector<std::string> siblings{"abcdef-1-xyz", "abcdef-2-xyz"};
    REQUIRE_EQ(lvb::utils::truncate_identifier("abcdef-1-xyz"sv, 7, siblings), "abcdef-1-xyz");
  }
  SECTION("never equal to another sibling")
  {
    const std::vector<std::string> siblings{"abcdefgh", "abc..."};
    REQUIRE_EQ(lvb::utils::truncate_identifier("abcdefgh"sv, 6, siblings), "...fgh");
  }
  SECTION("width smaller than the ellipsis")
  {
    const std::vector<std::string> siblings{};
    REQUIRE_EQ(lvb::utils::truncate_identifier("/dev/sda"sv, 3, siblings), "/dev/sda");
  }
}
