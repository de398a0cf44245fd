#include "archi/pacmanconf.hpp"
#include "archi/file_utils.hpp"
#include "archi/string_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// matches "Key", "#Key", "Key = x", "#Key=x"
auto is_option_line(std::string_view line, std::string_view key) noexcept -> bool {
    if (line.starts_with('#')) {
        line.remove_prefix(1);
    }
    if (!line.starts_with(key)) {
        return false;
    }
    const auto rest = archi::utils::trim(line.substr(key.size()));
    return rest.empty() || rest.starts_with('=');
}

}  // namespace

namespace archi::pacmanconf {

auto set_option(std::string_view content, std::string_view key, std::string_view value) noexcept -> std::string {
    const auto& option_line = value.empty() ? std::string{key} : fmt::format(FMT_COMPILE("{} = {}"), key, value);

    std::vector<std::string> lines{};
    bool in_options{false};
    bool found_options{false};
    bool replaced{false};
    std::size_t insert_pos{0};

    std::size_t begin{0};
    while (begin <= content.size()) {
        auto end = content.find('\n', begin);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        const auto line = content.substr(begin, end - begin);
        begin           = end + 1;
        if (end == content.size() && line.empty()) {
            break;
        }

        if (line.starts_with('[')) {
            in_options = (line == "[options]"sv);
            if (in_options) {
                found_options = true;
                insert_pos    = lines.size() + 1;
            }
        } else if (in_options && !replaced && is_option_line(line, key)) {
            lines.emplace_back(option_line);
            replaced = true;
            continue;
        }
        lines.emplace_back(line);
    }

    if (!found_options) {
        spdlog::error("[PACMANCONF] no [options] section, '{}' not set", key);
        return std::string{content};
    }
    if (!replaced) {
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(insert_pos), option_line);
    }

    auto result = utils::join(lines);
    if (content.ends_with('\n')) {
        result += '\n';
    }
    return result;
}

auto set_option_in_file(std::string_view file_path, std::string_view key, std::string_view value) noexcept -> bool {
    const auto& file_content = file_utils::read_whole_file(file_path);
    if (file_content.empty()) {
        spdlog::error("[PACMANCONF] '{}' error occurred!", file_path);
        return false;
    }
    return file_utils::write_to_file(set_option(file_content, key, value), file_path);
}

auto gen_mirrorlist(const std::vector<std::string_view>& servers) noexcept -> std::string {
    std::string mirrorlist{};
    for (auto&& server : servers) {
        mirrorlist += fmt::format(FMT_COMPILE("Server = {}\n"), server);
    }
    return mirrorlist;
}

}  // namespace archi::pacmanconf
