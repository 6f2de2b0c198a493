#ifndef SIZE_FORMAT_HPP
#define SIZE_FORMAT_HPP

#include <cstdint>      // for uint64_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace lvb {

/// Placeholder shown for every value that is not available.
inline constexpr std::string_view NOT_AVAILABLE = "N/A";

/// @brief Formats a size in bytes to human-readable string
/// e.g "  1.00 B", " 12.00 KiB", "512.00 MiB". TiB is the largest unit.
/// @param bytes Size in bytes
/// @return Human-readable size string
auto format_size(std::uint64_t bytes) noexcept -> std::string;

/// @brief Formats an optional size, "N/A" when absent.
auto format_size(std::optional<std::uint64_t> bytes) noexcept -> std::string;

/// @brief Formats a size given as text, "N/A" for anything non-numeric.
auto format_size(std::string_view bytes_text) noexcept -> std::string;

/// @brief Parses non-negative integer text (e.g "4194304", " 12 ", "128.00").
/// Fractional part is truncated.
/// @return parsed number or std::nullopt
auto parse_uint(std::string_view text) noexcept -> std::optional<std::uint64_t>;

}  // namespace lvb

#endif  // SIZE_FORMAT_HPP
