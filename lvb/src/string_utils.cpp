#include "lvb/string_utils.hpp"

#include <algorithm>  // for none_of
#include <ranges>     // for ranges::to, views::join_with

using namespace std::string_view_literals;

namespace {

static constexpr auto WHITESPACE_CHARS = " \t\r\n\v\f"sv;
static constexpr auto ELLIPSIS         = "..."sv;

}  // namespace

namespace lvb::utils {

auto join(const std::vector<std::string>& lines, std::string_view delim) noexcept -> std::string {
    return lines | std::ranges::views::join_with(delim) | std::ranges::to<std::string>();
}

auto split_whitespace(std::string_view str) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens{};
    std::size_t pos{};
    while (pos < str.size()) {
        const auto start = str.find_first_not_of(" \t"sv, pos);
        if (start == std::string_view::npos) {
            break;
        }
        auto end = str.find_first_of(" \t"sv, start);
        if (end == std::string_view::npos) {
            end = str.size();
        }
        tokens.emplace_back(str.substr(start, end - start));
        pos = end;
    }
    return tokens;
}

auto trim(std::string_view str) noexcept -> std::string_view {
    const auto first = str.find_first_not_of(WHITESPACE_CHARS);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(WHITESPACE_CHARS);
    return str.substr(first, last - first + 1);
}

auto replace_all(std::string str, std::string_view from, std::string_view to) noexcept -> std::string {
    if (from.empty()) {
        return str;
    }
    std::size_t pos{};
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.size(), to);
        pos += to.size();
    }
    return str;
}

auto truncate_text(std::string_view str, std::size_t width) noexcept -> std::string {
    if (str.size() <= width) {
        return std::string{str};
    }
    if (width <= ELLIPSIS.size()) {
        return std::string{str.substr(0, width)};
    }
    std::string res{str.substr(0, width - ELLIPSIS.size())};
    res += ELLIPSIS;
    return res;
}

auto truncate_identifier(std::string_view id, std::size_t width, const std::vector<std::string>& siblings) noexcept -> std::string {
    if (id.size() <= width || width <= ELLIPSIS.size()) {
        return std::string{id};
    }

    const auto keep_head = [width](std::string_view str) { return truncate_text(str, width); };
    const auto keep_tail = [width](std::string_view str) -> std::string {
        if (str.size() <= width) {
            return std::string{str};
        }
        std::string res{ELLIPSIS};
        res += str.substr(str.size() - (width - ELLIPSIS.size()));
        return res;
    };

    const auto is_unambiguous = [&](auto&& shorten) {
        const auto candidate = shorten(id);
        return std::ranges::none_of(siblings, [&](auto&& sibling) {
            return sibling != id && (sibling == candidate || shorten(sibling) == candidate);
        });
    };

    if (is_unambiguous(keep_head)) {
        return keep_head(id);
    }
    if (is_unambiguous(keep_tail)) {
        return keep_tail(id);
    }
    return std::string{id};
}

}  // namespace lvb::utils
