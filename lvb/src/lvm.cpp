#include "lvb/lvm.hpp"
#include "lvb/size_format.hpp"
#include "lvb/string_utils.hpp"

#include <utility>  // for move

#include <rapidjson/document.h>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// every report is requested in bytes without unit suffix
static constexpr auto PVS_COLUMNS = "pv_name,pv_size,pv_free,vg_name,pv_fmt"sv;
static constexpr auto VGS_COLUMNS = "vg_name,vg_size,vg_free,pv_count,lv_count,vg_attr,vg_extent_size"sv;
static constexpr auto LVS_COLUMNS = "vg_name,lv_name,lv_size,seg_size_pe,seg_start_pe,devices"sv;

auto get_string(const rapidjson::Value& obj, const char* key) noexcept -> std::string {
    if (obj.HasMember(key) && obj[key].IsString()) {
        return std::string{obj[key].GetString(), obj[key].GetStringLength()};
    }
    return {};
}

auto get_uint(const rapidjson::Value& obj, const char* key) noexcept -> std::optional<std::uint64_t> {
    if (!obj.HasMember(key)) {
        return std::nullopt;
    }
    const auto& value = obj[key];
    if (value.IsUint64()) {
        return value.GetUint64();
    }
    if (value.IsString()) {
        return lvb::parse_uint(std::string_view{value.GetString(), value.GetStringLength()});
    }
    return std::nullopt;
}

/// Walks {"report": [{"<kind>": [ ... ]}]} and calls the functor for every row object.
template <typename F>
auto for_each_report_row(std::string_view json_output, const char* kind, F&& functor) noexcept -> std::expected<void, std::string> {
    auto parsed = lvb::utils::parse_json(json_output);
    if (!parsed) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to parse {} report: {}"), kind, lvb::utils::command_error_to_string(parsed.error())));
    }
    const auto& document = *parsed;
    if (!document.IsObject() || !document.HasMember("report") || !document["report"].IsArray()) {
        return std::unexpected(fmt::format(FMT_COMPILE("{} report has no 'report' array"), kind));
    }

    for (const auto& report : document["report"].GetArray()) {
        if (!report.IsObject() || !report.HasMember(kind) || !report[kind].IsArray()) {
            continue;
        }
        for (const auto& row : report[kind].GetArray()) {
            if (row.IsObject()) {
                functor(row);
            }
        }
    }
    return {};
}

auto make_report_command(std::string_view tool, std::string_view columns) noexcept -> std::vector<std::string> {
    return {std::string{tool}, "--reportformat", "json", "--units", "b", "--nosuffix", "-o", std::string{columns}};
}

}  // namespace

namespace lvb::lvm {

auto LvmTables::find_pv(std::string_view pv_name) const noexcept -> const PhysicalVolume* {
    auto it = pv_by_path.find(std::string{pv_name});
    return it != pv_by_path.end() ? &it->second : nullptr;
}

auto LvmTables::find_vg(std::string_view vg_name) const noexcept -> const VolumeGroup* {
    auto it = vg_by_name.find(std::string{vg_name});
    return it != vg_by_name.end() ? &it->second : nullptr;
}

auto LvmTables::lv_rows(std::string_view vg_name) const noexcept -> const std::vector<LogicalVolume>& {
    static const std::vector<LogicalVolume> empty_rows{};
    auto it = lv_rows_by_vg.find(std::string{vg_name});
    return it != lv_rows_by_vg.end() ? it->second : empty_rows;
}

auto parse_pvs_report(std::string_view json_output) noexcept -> std::expected<std::vector<PhysicalVolume>, std::string> {
    std::vector<PhysicalVolume> pvs{};
    auto status = for_each_report_row(json_output, "pv", [&](const rapidjson::Value& row) {
        pvs.emplace_back(PhysicalVolume{
            .pv_name    = get_string(row, "pv_name"),
            .size_bytes = get_uint(row, "pv_size"),
            .free_bytes = get_uint(row, "pv_free"),
            .vg_name    = get_string(row, "vg_name"),
            .format     = get_string(row, "pv_fmt"),
        });
    });
    if (!status) {
        return std::unexpected(std::move(status.error()));
    }
    return pvs;
}

auto parse_vgs_report(std::string_view json_output) noexcept -> std::expected<std::vector<VolumeGroup>, std::string> {
    std::vector<VolumeGroup> vgs{};
    auto status = for_each_report_row(json_output, "vg", [&](const rapidjson::Value& row) {
        vgs.emplace_back(VolumeGroup{
            .vg_name           = get_string(row, "vg_name"),
            .size_bytes        = get_uint(row, "vg_size"),
            .free_bytes        = get_uint(row, "vg_free"),
            .pv_count          = get_uint(row, "pv_count"),
            .lv_count          = get_uint(row, "lv_count"),
            .attributes        = get_string(row, "vg_attr"),
            .extent_size_bytes = get_uint(row, "vg_extent_size"),
        });
    });
    if (!status) {
        return std::unexpected(std::move(status.error()));
    }
    return vgs;
}

auto parse_lvs_report(std::string_view json_output) noexcept -> std::expected<std::vector<LogicalVolume>, std::string> {
    std::vector<LogicalVolume> lvs{};
    auto status = for_each_report_row(json_output, "lv", [&](const rapidjson::Value& row) {
        lvs.emplace_back(LogicalVolume{
            .vg_name              = get_string(row, "vg_name"),
            .lv_name              = get_string(row, "lv_name"),
            .size_bytes           = get_uint(row, "lv_size"),
            .segment_extent_count = get_uint(row, "seg_size_pe"),
            .segment_start_extent = get_uint(row, "seg_start_pe"),
            .device_placement     = get_string(row, "devices"),
        });
    });
    if (!status) {
        return std::unexpected(std::move(status.error()));
    }
    return lvs;
}

auto build_lvm_tables(std::vector<PhysicalVolume> pvs, std::vector<VolumeGroup> vgs, std::vector<LogicalVolume> lvs) noexcept -> LvmTables {
    LvmTables tables{};

    for (auto&& pv : pvs) {
        auto pv_name = pv.pv_name;
        if (!tables.pv_by_path.contains(pv_name)) {
            tables.pv_order.push_back(pv_name);
        }
        tables.pv_by_path.insert_or_assign(std::move(pv_name), std::move(pv));
    }
    for (auto&& vg : vgs) {
        auto vg_name = vg.vg_name;
        if (!tables.vg_by_name.contains(vg_name)) {
            tables.vg_order.push_back(vg_name);
        }
        tables.vg_by_name.insert_or_assign(std::move(vg_name), std::move(vg));
    }
    for (auto&& lv : lvs) {
        auto vg_name = lv.vg_name;
        tables.lv_rows_by_vg[std::move(vg_name)].emplace_back(std::move(lv));
    }

    spdlog::debug("lvm: {} pvs, {} vgs, {} lv segment rows", tables.pv_by_path.size(), tables.vg_by_name.size(), lvs.size());
    return tables;
}

auto parse_device_placement(std::string_view placement) noexcept -> DevicePlacement {
    DevicePlacement result{};

    for (auto&& raw_token : utils::make_split_view(placement, ',')) {
        const auto token = utils::trim(raw_token);
        if (token.empty()) {
            continue;
        }

        const auto open_pos  = token.find('(');
        const auto close_pos = token.find(')', open_pos == std::string_view::npos ? 0 : open_pos);
        if (open_pos != std::string_view::npos && open_pos > 0 && close_pos != std::string_view::npos) {
            result.devices.emplace_back(utils::trim(token.substr(0, open_pos)));
            result.start_extents.emplace_back(token.substr(open_pos + 1, close_pos - open_pos - 1));
        } else {
            // no "(start)" suffix, passed through unchanged
            result.devices.emplace_back(token);
        }
    }
    return result;
}

auto read_pvs_report(const utils::RunOptions& options) noexcept -> std::expected<std::string, utils::CommandError> {
    return utils::run_text(make_report_command("pvs"sv, PVS_COLUMNS), options);
}

auto read_vgs_report(const utils::RunOptions& options) noexcept -> std::expected<std::string, utils::CommandError> {
    return utils::run_text(make_report_command("vgs"sv, VGS_COLUMNS), options);
}

auto read_lvs_report(const utils::RunOptions& options) noexcept -> std::expected<std::string, utils::CommandError> {
    return utils::run_text(make_report_command("lvs"sv, LVS_COLUMNS), options);
}

}  // namespace lvb::lvm
