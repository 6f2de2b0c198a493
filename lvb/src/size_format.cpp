#include "lvb/size_format.hpp"
#include "lvb/string_utils.hpp"

#include <array>         // for array
#include <charconv>      // for from_chars
#include <cmath>         // for isfinite
#include <system_error>  // for errc

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

static constexpr std::array SIZE_UNITS{"B"sv, "KiB"sv, "MiB"sv, "GiB"sv, "TiB"sv};

auto format_scaled(double size) noexcept -> std::string {
    std::size_t unit_idx{};
    while (size >= 1024.0 && unit_idx + 1 < SIZE_UNITS.size()) {
        size /= 1024.0;
        ++unit_idx;
    }
    // number is right aligned, so values up to 999.99 line up on the decimal point
    return fmt::format(FMT_COMPILE("{:6.2f} {}"), size, SIZE_UNITS[unit_idx]);
}

}  // namespace

namespace lvb {

auto format_size(std::uint64_t bytes) noexcept -> std::string {
    return format_scaled(static_cast<double>(bytes));
}

auto format_size(std::optional<std::uint64_t> bytes) noexcept -> std::string {
    if (!bytes) {
        return std::string{NOT_AVAILABLE};
    }
    return format_size(*bytes);
}

auto format_size(std::string_view bytes_text) noexcept -> std::string {
    const auto trimmed = utils::trim(bytes_text);
    if (trimmed.empty()) {
        return std::string{NOT_AVAILABLE};
    }

    double size{};
    const auto* const end = trimmed.data() + trimmed.size();
    const auto [ptr, ec]  = std::from_chars(trimmed.data(), end, size);
    if (ec != std::errc{} || ptr != end || !std::isfinite(size) || size < 0.0) {
        return std::string{NOT_AVAILABLE};
    }
    return format_scaled(size);
}

auto parse_uint(std::string_view text) noexcept -> std::optional<std::uint64_t> {
    auto trimmed = utils::trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    // lvm may report values like "128.00" depending on the units option
    if (const auto dot_pos = trimmed.find('.'); dot_pos != std::string_view::npos) {
        const auto fraction = trimmed.substr(dot_pos + 1);
        if (!fraction.empty() && fraction.find_first_not_of("0123456789"sv) != std::string_view::npos) {
            return std::nullopt;
        }
        trimmed = trimmed.substr(0, dot_pos);
        if (trimmed.empty()) {
            return std::nullopt;
        }
    }

    std::uint64_t result{};
    const auto* const end = trimmed.data() + trimmed.size();
    const auto [ptr, ec]  = std::from_chars(trimmed.data(), end, result);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return result;
}

}  // namespace lvb
