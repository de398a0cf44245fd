#include "archi/locale.hpp"
#include "archi/file_utils.hpp"
#include "archi/io_utils.hpp"
#include "archi/string_utils.hpp"

#include <filesystem>  // for directory_iterator, remove_all

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace {

constexpr auto VCONSOLE_FONT = "lat9w-16"sv;

auto has_locale_gen_entry(std::string_view locale_gen, std::string_view entry) noexcept -> bool {
    for (auto&& line : archi::utils::make_split_view(locale_gen)) {
        if (archi::utils::trim(line) == entry) {
            return true;
        }
    }
    return false;
}

}  // namespace

namespace archi::locale {

auto prepare_locale_set(std::string_view locale, std::string_view mountpoint) noexcept -> bool {
    const auto& locale_config_path = fmt::format(FMT_COMPILE("{}/etc/locale.conf"), mountpoint);
    const auto& locale_gen_path    = fmt::format(FMT_COMPILE("{}/etc/locale.gen"), mountpoint);

    std::error_code err{};
    if (!fs::exists(locale_gen_path, err)) {
        spdlog::error("'{}' does not exist", locale_gen_path);
        return false;
    }

    const auto& locale_gen_entry = fmt::format(FMT_COMPILE("{} UTF-8"), locale);
    const auto& locale_gen       = file_utils::read_whole_file(locale_gen_path);
    if (!has_locale_gen_entry(locale_gen, locale_gen_entry)
        && !file_utils::append_to_file(fmt::format(FMT_COMPILE("{}\n"), locale_gen_entry), locale_gen_path)) {
        spdlog::error("Failed to add '{}' to {}", locale_gen_entry, locale_gen_path);
        return false;
    }

    if (!file_utils::create_file_for_overwrite(locale_config_path, fmt::format(FMT_COMPILE("LANG={}\n"), locale))) {
        spdlog::error("Failed to open locale config for writing {}", locale_config_path);
        return false;
    }
    return true;
}

auto set_locale(utils::CommandRunner& runner, std::string_view locale, std::string_view mountpoint) noexcept -> bool {
    if (!prepare_locale_set(locale, mountpoint)) {
        return false;
    }

    // Generate locales
    if (!runner.chroot_checked("locale-gen"sv, mountpoint)) {
        spdlog::error("Failed to run locale-gen with locale '{}'", locale);
        return false;
    }
    return true;
}

auto set_keymap(std::string_view keymap, std::string_view mountpoint) noexcept -> bool {
    const auto& vconsole_path = fmt::format(FMT_COMPILE("{}/etc/vconsole.conf"), mountpoint);
    const auto& vconsole_text = fmt::format(FMT_COMPILE("KEYMAP={}\nFONT={}\n"), keymap, VCONSOLE_FONT);
    if (!file_utils::create_file_for_overwrite(vconsole_path, vconsole_text)) {
        spdlog::error("Failed to write {}", vconsole_path);
        return false;
    }
    return true;
}

auto locale_base_language(std::string_view locale) noexcept -> std::string_view {
    const auto pos = locale.find_first_of("_.@"sv);
    return (pos != std::string_view::npos) ? locale.substr(0, pos) : locale;
}

auto select_locales_to_remove(const std::vector<std::string>& entries, std::string_view locale) noexcept -> std::vector<std::string> {
    const auto language = locale_base_language(locale);
    if (language.empty()) {
        return {};
    }

    std::vector<std::string> to_remove{};
    for (const auto& entry : entries) {
        if (locale_base_language(entry) == language) {
            continue;
        }
        to_remove.emplace_back(entry);
    }
    return to_remove;
}

auto strip_locales(std::string_view locale, std::string_view mountpoint) noexcept -> bool {
    const auto& locale_dir = fmt::format(FMT_COMPILE("{}/usr/share/locale"), mountpoint);

    std::error_code err{};
    std::vector<std::string> entries{};
    for (const auto& entry : fs::directory_iterator(locale_dir, err)) {
        // locale.alias and friends stay
        if (entry.is_directory(err)) {
            entries.emplace_back(entry.path().filename().string());
        }
    }
    if (err) {
        spdlog::error("Failed to list '{}': {}", locale_dir, err.message());
        return false;
    }

    const auto& to_remove = select_locales_to_remove(entries, locale);
    for (const auto& entry : to_remove) {
        fs::remove_all(fs::path{locale_dir} / entry, err);
        if (err) {
            spdlog::warn("Failed to remove translations '{}': {}", entry, err.message());
        }
    }
    spdlog::info("Removed {} of {} translation directories", to_remove.size(), entries.size());
    return true;
}

}  // namespace archi::locale
