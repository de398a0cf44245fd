#include "archi/fstab.hpp"
#include "archi/file_utils.hpp"
#include "archi/io_utils.hpp"
#include "archi/string_utils.hpp"

#include <cstddef>  // for size_t

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// fields: <file system> <dir> <type> <options> <dump> <pass>
constexpr std::size_t FSTAB_OPTIONS_FIELD = 3;

auto rewrite_options_field(std::string_view line) noexcept -> std::string {
    std::string result{};
    std::size_t field_index{};
    std::size_t pos{};
    while (pos < line.size()) {
        const auto field_begin = line.find_first_not_of(" \t"sv, pos);
        if (field_begin == std::string_view::npos) {
            result += line.substr(pos);
            break;
        }
        result += line.substr(pos, field_begin - pos);

        auto field_end = line.find_first_of(" \t"sv, field_begin);
        if (field_end == std::string_view::npos) {
            field_end = line.size();
        }
        const auto field = line.substr(field_begin, field_end - field_begin);
        if (field_index == FSTAB_OPTIONS_FIELD) {
            result += archi::utils::replace_all(std::string{field}, "relatime"sv, "noatime"sv);
        } else {
            result += field;
        }
        ++field_index;
        pos = field_end;
    }
    return result;
}

}  // namespace

namespace archi::fs {

auto append_generated_fstab(utils::CommandRunner& runner, std::string_view root_mountpoint) noexcept -> bool {
    const auto& fstab_filepath = fmt::format(FMT_COMPILE("{}/etc/fstab"), root_mountpoint);

    // run command to generate fstab
    const auto& fstab_cmd = fmt::format(FMT_COMPILE("genfstab -U {}"), root_mountpoint);
    const auto& result    = runner.run(fstab_cmd);
    if (!result.success() || result.output.empty()) {
        spdlog::error("Failed to run genfstab: {}", fstab_cmd);
        return false;
    }

    if (!file_utils::append_to_file(result.output, fstab_filepath)) {
        spdlog::error("Failed to open fstab for writing {}", fstab_filepath);
        return false;
    }

    // dump generated entries into the log
    spdlog::info("Generated fstab entries:\n{}", result.output);
    return true;
}

auto prefer_noatime(std::string_view fstab_content) noexcept -> std::string {
    std::string result{};
    result.reserve(fstab_content.size());

    std::size_t pos{};
    while (pos < fstab_content.size()) {
        auto line_end = fstab_content.find('\n', pos);
        const bool has_newline = line_end != std::string_view::npos;
        if (!has_newline) {
            line_end = fstab_content.size();
        }
        const auto line = fstab_content.substr(pos, line_end - pos);
        if (line.starts_with('#') || utils::trim(line).empty()) {
            result += line;
        } else {
            result += rewrite_options_field(line);
        }
        if (has_newline) {
            result += '\n';
        }
        pos = line_end + 1;
    }
    return result;
}

auto apply_noatime(std::string_view root_mountpoint) noexcept -> bool {
    const auto& fstab_filepath = fmt::format(FMT_COMPILE("{}/etc/fstab"), root_mountpoint);
    const auto& fstab_content  = file_utils::read_whole_file(fstab_filepath);
    if (fstab_content.empty()) {
        spdlog::error("fstab is empty or missing: {}", fstab_filepath);
        return false;
    }
    if (!file_utils::create_file_for_overwrite(fstab_filepath, prefer_noatime(fstab_content))) {
        spdlog::error("Failed to open fstab for writing {}", fstab_filepath);
        return false;
    }
    return true;
}

}  // namespace archi::fs
