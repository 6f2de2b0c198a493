#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <cstddef>      // for size_t
#include <ranges>       // for ranges::*
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lvb::utils {

/// @brief Join a vector of strings into a single string using a delimiter.
/// @param lines The lines to join.
/// @param delim The delimiter to join the lines.
/// @return The joined lines as a single string.
auto join(const std::vector<std::string>& lines, std::string_view delim = "\n") noexcept -> std::string;

/// @brief Split a string on any run of blanks (space, tab).
/// @param str The string to split.
/// @return A vector of string views of every non-empty token.
auto split_whitespace(std::string_view str) noexcept -> std::vector<std::string_view>;

/// @brief Remove leading and trailing whitespace.
auto trim(std::string_view str) noexcept -> std::string_view;

/// @brief Replace every occurrence of a substring.
/// @param str The string to modify.
/// @param from The substring to look for, must not be empty.
/// @param to The replacement text.
/// @return The resulting string.
auto replace_all(std::string str, std::string_view from, std::string_view to) noexcept -> std::string;

/// @brief Shorten free text to fit into a fixed width.
/// @param str The text to shorten.
/// @param width The maximum number of characters.
/// @return The text itself when it fits, otherwise a prefix ending with "...".
/// When width is too small to hold the ellipsis, the text is cut to width.
auto truncate_text(std::string_view str, std::size_t width) noexcept -> std::string;

/// @brief Shorten an identifier (device path, VG/LV name) without making it ambiguous.
/// Keeps the head first ("/dev/mapper/v..."), then the tail ("...vg0-root").
/// A shortening is rejected when another sibling would be displayed the same way.
/// @param id The identifier to shorten.
/// @param width The maximum number of characters.
/// @param siblings Every identifier displayed next to it, may include id itself.
/// @return The shortened identifier, or id intact when no unambiguous shortening fits.
auto truncate_identifier(std::string_view id, std::size_t width, const std::vector<std::string>& siblings) noexcept -> std::string;

/// @brief Make a split view from a string into multiple lines based on a delimiter.
/// @param str The string to split.
/// @param delim The delimiter to split the string.
/// @return A range view representing the split lines.
constexpr auto make_split_view(std::string_view str, char delim = '\n') noexcept {
    constexpr auto functor = [](auto&& rng) {
        return std::string_view(&*rng.begin(), static_cast<size_t>(std::ranges::distance(rng)));
    };
    constexpr auto second = [](auto&& rng) { return rng != ""; };

    return str
        | std::ranges::views::split(delim)
        | std::ranges::views::filter([](auto&& rng) { return !std::ranges::empty(rng); })
        | std::ranges::views::transform(functor)
        | std::ranges::views::filter(second);
}

}  // namespace lvb::utils

#endif  // STRING_UTILS_HPP
