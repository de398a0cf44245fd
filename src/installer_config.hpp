#ifndef INSTALLER_CONFIG_HPP
#define INSTALLER_CONFIG_HPP

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace installer {

/// Installer configuration read from settings.json.
///
/// Every field is optional. In headless mode the file answers the whole
/// questionnaire, the target device still has to be given twice.
struct InstallerConfig {
    bool headless_mode{false};

    // Run profile
    bool safe_profile{false};
    bool minimal_footprint{false};
    std::optional<std::string> mirror_mode{};

    // Device
    std::optional<std::string> device{};
    std::optional<std::string> device_confirm{};

    // System settings
    std::optional<std::string> hostname{};
    std::optional<std::string> locale{};
    std::optional<std::string> keymap{};
    std::optional<std::string> timezone{};

    // User settings
    std::optional<std::string> user_name{};
    std::optional<std::string> user_pass{};
    std::optional<std::string> root_pass{};

    // Packages
    std::optional<std::string> desktop{};
    std::optional<std::string> openbox_theme{};
    std::optional<std::string> vm{};
    bool gaming{false};
    bool ssh{false};

    // Runtime overrides
    std::optional<std::string> mountpoint{};
    std::optional<std::string> template_dir{};
    std::optional<std::string> catalog_url{};
};

/// Parses installer configuration from JSON string content.
/// @param json_content The JSON configuration content.
/// @return InstallerConfig on success, or error string on failure.
[[nodiscard]] auto parse_installer_config(std::string_view json_content) noexcept
    -> std::expected<InstallerConfig, std::string>;

/// Validates that all required fields are present for headless mode.
/// @param config The configuration to validate.
/// @return void on success, or error string describing missing fields.
[[nodiscard]] auto validate_headless_config(const InstallerConfig& config) noexcept
    -> std::expected<void, std::string>;

}  // namespace installer

#endif  // INSTALLER_CONFIG_HPP
