#include "utils.hpp"
#include "config.hpp"
#include "definitions.hpp"
#include "installer_config.hpp"

// import archi
#include "archi/fetch_file.hpp"
#include "archi/file_utils.hpp"
#include "archi/io_utils.hpp"
#include "archi/package_profiles.hpp"
#include "archi/string_utils.hpp"

#include <algorithm>   // for sort, unique
#include <filesystem>  // for exists
#include <iostream>    // for cin
#include <string>      // for string, getline

#include <fmt/compile.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace utils {

bool is_connected([[maybe_unused]] std::string_view url) noexcept {
#ifdef NDEVENV
    return archi::fetch::is_url_reachable(url);
#else
    return true;
#endif
}

bool check_root([[maybe_unused]] archi::utils::CommandRunner& runner) noexcept {
#ifdef NDEVENV
    const auto& result = runner.run("whoami"sv);
    return result.success() && archi::utils::trim(result.output) == "root"sv;
#else
    return true;
#endif
}

void clear_screen() noexcept {
    static constexpr auto CLEAR_SCREEN_ANSI = "\033[1;1H\033[2J";
    output_inter(FMT_COMPILE("{}"), CLEAR_SCREEN_ANSI);
}

void show_iwctl(archi::utils::CommandRunner& runner) noexcept {
    info_inter("\nInstructions to connect to wifi using iwctl:\n");
    info_inter("1 - To find your wifi device name (ex: wlan0) type `device list`\n");
    info_inter("2 - type `station wlan0 scan`, and wait couple seconds\n");
    info_inter("3 - type `station wlan0 get-networks` (find your wifi Network name ex. my_wifi)\n");
    info_inter("4 - type `station wlan0 connect my_wifi` (don't forget to press TAB for auto completion!\n");
    info_inter("5 - type `station wlan0 show` (status should be connected)\n");
    info_inter("6 - type `exit`\n");

    fmt::print("{}{}{}\n", CYAN, "Press a key to continue...", RESET);
    std::string tmp{};
    if (!std::getline(std::cin, tmp)) {
        return;
    }
    // attach the interactive session to the terminal, the runner captures stdout otherwise
    if (!runner.run_checked("iwctl </dev/tty >/dev/tty 2>&1"sv)) {
        spdlog::warn("iwctl exited with an error");
    }
}

auto parse_supported_locales(std::string_view content) noexcept -> std::vector<std::string> {
    std::vector<std::string> locales{};
    for (auto&& line : archi::utils::make_multiline_view(content)) {
        line = archi::utils::trim(line);
        if (line.empty() || line.starts_with('#') || !line.ends_with("UTF-8"sv)) {
            continue;
        }
        const auto& name_end = line.find_first_of(" \t"sv);
        locales.emplace_back(line.substr(0, name_end));
    }

    std::ranges::sort(locales);
    const auto [first, last] = std::ranges::unique(locales);
    locales.erase(first, last);
    return locales;
}

auto list_supported_locales(std::string_view supported_path) noexcept -> std::vector<std::string> {
    auto locales = parse_supported_locales(archi::file_utils::read_whole_file(supported_path));
    if (locales.empty()) {
        spdlog::warn("No locales read from '{}', offering {}", supported_path, DEFAULT_LOCALE);
        locales.emplace_back(DEFAULT_LOCALE);
    }
    return locales;
}

auto load_package_catalog(const installer::RuntimeSettings& settings) noexcept -> std::optional<archi::profile::PackageCatalog> {
    const auto& catalog_content = archi::fetch::fetch_file_from_url(settings.catalog_url, settings.catalog_fallback_url);
    if (!catalog_content) {
        spdlog::error("Failed to fetch package catalog from '{}' and '{}'", settings.catalog_url, settings.catalog_fallback_url);
        return std::nullopt;
    }
    return archi::profile::parse_package_catalog(*catalog_content);
}

auto load_installer_config(std::string_view config_path) noexcept -> std::expected<installer::InstallerConfig, std::string> {
    std::error_code err{};
    if (!fs::exists(config_path, err)) {
        spdlog::info("Config '{}' not found, running with defaults", config_path);
        return installer::InstallerConfig{};
    }

    const auto& content = archi::file_utils::read_whole_file(config_path);
    auto config         = installer::parse_installer_config(content);
    if (!config) {
        return std::unexpected(fmt::format(FMT_COMPILE("{}: {}"), config_path, config.error()));
    }
    return config;
}

}  // namespace utils
