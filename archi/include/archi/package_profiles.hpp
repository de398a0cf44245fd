#ifndef PACKAGE_PROFILES_HPP
#define PACKAGE_PROFILES_HPP

#include "archi/system_query.hpp"

#include <cstdint>      // for uint64_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::profile {

/// Below this the lightweight browser is picked
inline constexpr std::uint64_t LIGHT_BROWSER_THRESHOLD_MB = 1024;
/// Gaming extras need at least this much memory
inline constexpr std::uint64_t GAMING_MIN_MEMORY_MB = 2048;

struct DesktopProfile {
    std::string profile_name{};
    std::vector<std::string> packages{};
    /// Profile installed in place of this one when it can't be packaged
    std::optional<std::string> fallback{};
};

struct VmProfile {
    std::string profile_name{};
    std::vector<std::string> packages{};
};

struct PackageCatalog {
    std::vector<std::string> base_packages{};
    std::vector<std::string> uefi_packages{};
    std::vector<std::string> theme_packages{};
    std::vector<std::string> gaming_packages{};
    std::vector<std::string> ssh_packages{};
    std::string browser{};
    std::string browser_low_memory{};
    std::vector<DesktopProfile> desktop_profiles{};
    std::vector<VmProfile> vm_profiles{};
};

/// @brief Named, ordered collection of packages
struct PackageSet {
    std::string name{};
    std::vector<std::string> packages{};
};

/// @brief Choices that decide which packages get installed
struct PackageSelection {
    bool is_uefi{false};
    std::string desktop{};
    std::uint64_t memory_mb{0};
    bool gaming{false};
    bool ssh{false};
    system::VmGuest vm{system::VmGuest::None};
};

// Parse package catalog
auto parse_package_catalog(std::string_view config_content) noexcept -> std::optional<PackageCatalog>;

/// @brief Build the base, desktop, theme and vm sets, in install order.
/// Desktop carries the browser and gaming extras. Unknown desktop profiles produce an empty desktop set.
auto assemble_package_sets(const PackageCatalog& catalog, const PackageSelection& selection) noexcept -> std::vector<PackageSet>;

/// @brief Concatenate the sets, duplicates are left for the install tool.
auto flatten_package_sets(const std::vector<PackageSet>& sets) noexcept -> std::vector<std::string>;

}  // namespace archi::profile

#endif  // PACKAGE_PROFILES_HPP
