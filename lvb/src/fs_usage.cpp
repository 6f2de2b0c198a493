#include "lvb/fs_usage.hpp"
#include "lvb/size_format.hpp"
#include "lvb/string_utils.hpp"

#include <ranges>   // for ranges::*
#include <utility>  // for move
#include <vector>   // for vector

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

static constexpr std::size_t DF_MIN_FIELDS = 6;
static constexpr std::uint64_t DF_BLOCK_SIZE = 1024;

}  // namespace

namespace lvb::fs {

auto parse_df_output(std::string_view df_output) noexcept -> FsUsageMap {
    FsUsageMap usage_map{};

    // first line is the header
    for (auto&& line : utils::make_split_view(df_output) | std::ranges::views::drop(1)) {
        const auto tokens = utils::split_whitespace(line);
        if (tokens.size() < DF_MIN_FIELDS) {
            continue;
        }

        const auto size_blocks  = lvb::parse_uint(tokens[1]);
        const auto used_blocks  = lvb::parse_uint(tokens[2]);
        const auto avail_blocks = lvb::parse_uint(tokens[3]);
        if (!size_blocks || !used_blocks || !avail_blocks) {
            spdlog::debug("df: skipping malformed row '{}'", line);
            continue;
        }

        std::string mount_point{};
        for (auto&& token : tokens | std::ranges::views::drop(5)) {
            if (!mount_point.empty()) {
                mount_point += ' ';
            }
            mount_point += token;
        }

        auto use_percent = std::string{tokens[4]};
        if (use_percent.ends_with('%')) {
            use_percent.pop_back();
        }

        usage_map.insert_or_assign(std::string{tokens[0]},
            FsUsage{
                .mount_point = std::move(mount_point),
                .size_bytes  = *size_blocks * DF_BLOCK_SIZE,
                .used_bytes  = *used_blocks * DF_BLOCK_SIZE,
                .avail_bytes = *avail_blocks * DF_BLOCK_SIZE,
                .use_percent = std::move(use_percent),
            });
    }

    return usage_map;
}

auto read_df_report(const utils::RunOptions& options) noexcept -> std::expected<std::string, utils::CommandError> {
    return utils::run_text({"df", "--block-size=1K", "--output=source,size,used,avail,pcent,target"}, options);
}

}  // namespace lvb::fs
