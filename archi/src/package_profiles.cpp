#include "archi/package_profiles.hpp"

#include <algorithm>  // for find_if

#include <spdlog/spdlog.h>

#define TOML_EXCEPTIONS 0  // disable exceptions
#include <toml++/toml.h>

using namespace std::string_view_literals;

namespace {

inline void parse_toml_array(const toml::array* arr, std::vector<std::string>& vec) noexcept {
    if (arr == nullptr) {
        return;
    }
    for (const auto& node_el : *arr) {
        if (auto elem = node_el.value<std::string_view>(); elem) {
            vec.emplace_back(*elem);
        }
    }
}

auto find_desktop(const archi::profile::PackageCatalog& catalog, std::string_view name) noexcept
    -> const archi::profile::DesktopProfile* {
    auto it = std::ranges::find_if(catalog.desktop_profiles, [name](auto&& profile) { return profile.profile_name == name; });
    return it != catalog.desktop_profiles.end() ? &*it : nullptr;
}

}  // namespace

namespace archi::profile {

auto parse_package_catalog(std::string_view config_content) noexcept -> std::optional<PackageCatalog> {
    toml::parse_result catalog_result = toml::parse(config_content);
    if (catalog_result.failed()) {
        spdlog::error("Failed to parse package catalog: {}", catalog_result.error().description());
        return std::nullopt;
    }
    const auto& catalog_table = std::move(catalog_result).table();

    if (!catalog_table["base"]["packages"].is_array()) {
        spdlog::error("Package catalog has no [base] packages");
        return std::nullopt;
    }

    PackageCatalog catalog{};
    parse_toml_array(catalog_table["base"]["packages"].as_array(), catalog.base_packages);
    parse_toml_array(catalog_table["base"]["uefi"]["packages"].as_array(), catalog.uefi_packages);
    parse_toml_array(catalog_table["theme"]["packages"].as_array(), catalog.theme_packages);
    parse_toml_array(catalog_table["gaming"]["packages"].as_array(), catalog.gaming_packages);
    parse_toml_array(catalog_table["ssh"]["packages"].as_array(), catalog.ssh_packages);
    catalog.browser            = catalog_table["browser"]["default"].value_or(""sv);
    catalog.browser_low_memory = catalog_table["browser"]["low_memory"].value_or(std::string_view{catalog.browser});

    if (auto* desktop_table = catalog_table["desktop"].as_table(); desktop_table != nullptr) {
        for (auto&& [key, value] : *desktop_table) {
            auto* value_table = value.as_table();
            if (value_table == nullptr) {
                continue;
            }
            DesktopProfile desktop_profile{.profile_name = std::string{std::string_view{key}}};
            parse_toml_array((*value_table)["packages"].as_array(), desktop_profile.packages);
            if (auto fallback = (*value_table)["fallback"].value<std::string>(); fallback) {
                desktop_profile.fallback = std::move(*fallback);
            }
            catalog.desktop_profiles.emplace_back(std::move(desktop_profile));
        }
    }

    if (auto* vm_table = catalog_table["vm"].as_table(); vm_table != nullptr) {
        for (auto&& [key, value] : *vm_table) {
            auto* value_table = value.as_table();
            if (value_table == nullptr) {
                continue;
            }
            VmProfile vm_profile{.profile_name = std::string{std::string_view{key}}};
            parse_toml_array((*value_table)["packages"].as_array(), vm_profile.packages);
            catalog.vm_profiles.emplace_back(std::move(vm_profile));
        }
    }
    return std::make_optional<PackageCatalog>(std::move(catalog));
}

auto assemble_package_sets(const PackageCatalog& catalog, const PackageSelection& selection) noexcept -> std::vector<PackageSet> {
    PackageSet base_set{.name = "base", .packages = catalog.base_packages};
    if (selection.is_uefi) {
        base_set.packages.insert(base_set.packages.end(), catalog.uefi_packages.begin(), catalog.uefi_packages.end());
    }
    if (selection.ssh) {
        base_set.packages.insert(base_set.packages.end(), catalog.ssh_packages.begin(), catalog.ssh_packages.end());
    }

    PackageSet desktop_set{.name = "desktop"};
    const auto* desktop = find_desktop(catalog, selection.desktop);
    if (desktop != nullptr && desktop->fallback) {
        spdlog::info("Desktop '{}' is not packaged, installing '{}' instead", desktop->profile_name, *desktop->fallback);
        const auto* fallback_desktop = find_desktop(catalog, *desktop->fallback);
        if (fallback_desktop != nullptr) {
            desktop_set.packages = fallback_desktop->packages;
        }
        desktop_set.packages.insert(desktop_set.packages.end(), desktop->packages.begin(), desktop->packages.end());
    } else if (desktop != nullptr) {
        desktop_set.packages = desktop->packages;
    } else {
        spdlog::warn("Unknown desktop profile '{}'", selection.desktop);
    }

    const auto& browser = (selection.memory_mb < LIGHT_BROWSER_THRESHOLD_MB) ? catalog.browser_low_memory : catalog.browser;
    if (!browser.empty()) {
        desktop_set.packages.emplace_back(browser);
    }
    if (selection.gaming && selection.memory_mb >= GAMING_MIN_MEMORY_MB) {
        desktop_set.packages.insert(desktop_set.packages.end(), catalog.gaming_packages.begin(), catalog.gaming_packages.end());
    } else if (selection.gaming) {
        spdlog::info("Skipping gaming packages, {} MB is below {} MB", selection.memory_mb, GAMING_MIN_MEMORY_MB);
    }

    PackageSet vm_set{.name = "vm"};
    const auto vm_name = system::vm_guest_to_string(selection.vm);
    for (const auto& vm_profile : catalog.vm_profiles) {
        if (vm_profile.profile_name == vm_name) {
            vm_set.packages = vm_profile.packages;
        }
    }

    return {
        std::move(base_set),
        std::move(desktop_set),
        PackageSet{.name = "theme", .packages = catalog.theme_packages},
        std::move(vm_set),
    };
}

auto flatten_package_sets(const std::vector<PackageSet>& sets) noexcept -> std::vector<std::string> {
    std::vector<std::string> packages{};
    for (const auto& set : sets) {
        packages.insert(packages.end(), set.packages.begin(), set.packages.end());
    }
    return packages;
}

}  // namespace archi::profile
