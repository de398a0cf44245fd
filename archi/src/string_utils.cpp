#include "archi/string_utils.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace archi::utils {

auto make_multiline(std::string_view str, bool reverse, char delim) noexcept -> std::vector<std::string> {
    std::vector<std::string> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    if (reverse) {
        std::ranges::reverse(lines);
    }
    return lines;
}

auto make_multiline_view(std::string_view str, bool reverse, char delim) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    if (reverse) {
        std::ranges::reverse(lines);
    }
    return lines;
}

auto join(const std::vector<std::string>& lines, std::string_view delim) noexcept -> std::string {
    return fmt::format("{}", fmt::join(lines, delim));
}

auto tail_lines(std::string_view text, std::size_t count) noexcept -> std::string {
    auto lines = utils::make_multiline(text);
    if (lines.size() > count) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(count));
    }
    return utils::join(lines);
}

auto trim(std::string_view str) noexcept -> std::string_view {
    static constexpr std::string_view whitespace{" \t\r\n"};
    const auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(whitespace);
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

}  // namespace archi::utils
