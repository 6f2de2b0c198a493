#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "lvb/size_format.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

using namespace std::string_view_literals;

TEST_CASE("format_size test")
{
  SECTION("bytes")
  {
    REQUIRE_EQ(lvb::format_size(std::uint64_t{0}), "  0.00 B");
    REQUIRE_EQ(lvb::format_size(std::uint64_t{1}), "  1.00 B");
    REQUIRE_EQ(lvb::format_size(std::uint64_t{1023}), "1023.00 B");
  }
  SECTION("binary units")
  {
    REQUIRE_EQ(lvb::format_size(std::uint64_t{1024}), "  1.00 KiB");
    REQUIRE_EQ(lvb::format_size(std::uint64_t{1536}), "  1.50 KiB");
    REQUIRE_EQ(lvb::format_size(std::uint64_t{12 * 1024}), " 12.00 KiB");
    REQUIRE_EQ(lvb::format_size(std::uint64_t{536870912}), "512.00 MiB");
    REQUIRE_EQ(lvb::format_size(std::uint64_t{1073741824}), "  1.00 GiB");
  }
  SECTION("tebibytes are never scaled further")
  {
    static constexpr std::uint64_t TiB = 1024ULL * 1024 * 1024 * 1024;
    REQUIRE_EQ(lvb::format_size(TiB), "  1.00 TiB");
    REQUIRE_EQ(lvb::format_size(TiB * 1024), "1024.00 TiB");
  }
  SECTION("absent value")
  {
    REQUIRE_EQ(lvb::format_size(std::optional<std::uint64_t>{}), "N/A");
    REQUIRE_EQ(lvb::format_size(std::optional<std::uint64_t>{4194304}), "  4.00 MiB");
  }
  SECTION("numeric text")
  {
    REQUIRE_EQ(lvb::format_size("536870912"sv), "512.00 MiB");
    REQUIRE_EQ(lvb::format_size(" 4194304 "sv), "  4.00 MiB");
    REQUIRE_EQ(lvb::format_size("1.5"sv), "  1.50 B");
  }
  SECTION("non-numeric text")
  {
    REQUIRE_EQ(lvb::format_size("abc"sv), "N/A");
    REQUIRE_EQ(lvb::format_size(""sv), "N/A");
    REQUIRE_EQ(lvb::format_size("-1"sv), "N/A");
    REQUIRE_EQ(lvb::format_size("12abc"sv), "N/A");
  }
}

TEST_CASE("parse_uint test")
{
  SECTION("plain numbers")
  {
    REQUIRE_EQ(lvb::parse_uint("4194304"sv), std::optional<std::uint64_t>{4194304});
    REQUIRE_EQ(lvb::parse_uint(" 12 "sv), std::optional<std::uint64_t>{12});
    REQUIRE_EQ(lvb::parse_uint("0"sv), std::optional<std::uint64_t>{0});
    REQUIRE_EQ(lvb::parse_uint("9999999999"sv), std::optional<std::uint64_t>{9999999999ULL});
  }
  SECTION("fraction is truncated")
  {
    REQUIRE_EQ(lvb::parse_uint("128.00"sv), std::optional<std::uint64_t>{128});
    REQUIRE_EQ(lvb::parse_uint("7."sv), std::optional<std::uint64_t>{7});
  }
  SECTION("invalid")
  {
    REQUIRE_FALSE(lvb::parse_uint(""sv).has_value());
    REQUIRE_FALSE(lvb::parse_uint("-123"sv).has_value());
    REQUIRE_FALSE(lvb::parse_uint("123abc"sv).has_value());
    REQUIRE_FALSE(lvb::parse_uint(".5"sv).has_value());
    REQUIRE_FALSE(lvb::parse_uint("1.2x"sv).has_value());
    REQUIRE_FALSE(lvb::parse_uint("N/A"sv).has_value());
  }
}
