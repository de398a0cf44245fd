#ifndef UTILS_HPP
#define UTILS_HPP

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::profile {
struct PackageCatalog;
}  // namespace archi::profile

namespace installer {
struct InstallerConfig;
struct RuntimeSettings;
}  // namespace installer

namespace utils {

inline constexpr std::string_view DEFAULT_LOCALE = "en_US.UTF-8";

[[nodiscard]] bool is_connected(std::string_view url) noexcept;
[[nodiscard]] bool check_root(archi::utils::CommandRunner& runner) noexcept;
void clear_screen() noexcept;
void show_iwctl(archi::utils::CommandRunner& runner) noexcept;

/// @brief UTF-8 entries of an i18n SUPPORTED list, sorted and deduplicated.
auto parse_supported_locales(std::string_view content) noexcept -> std::vector<std::string>;
/// @brief Locales offered to the operator, DEFAULT_LOCALE alone when the list is unavailable.
auto list_supported_locales(std::string_view supported_path = "/usr/share/i18n/SUPPORTED") noexcept -> std::vector<std::string>;

/// @brief Fetch and parse the package catalog, the local copy is used when the URL can't be fetched.
auto load_package_catalog(const installer::RuntimeSettings& settings) noexcept -> std::optional<archi::profile::PackageCatalog>;
/// @brief Read installer configuration from path.
/// A missing file yields the defaults.
auto load_installer_config(std::string_view config_path) noexcept -> std::expected<installer::InstallerConfig, std::string>;

}  // namespace utils

#endif  // UTILS_HPP
