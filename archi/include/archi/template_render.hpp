#ifndef TEMPLATE_RENDER_HPP
#define TEMPLATE_RENDER_HPP

#include <cstddef>      // for size_t
#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::theme {

// Values substituted into @TOKEN@ placeholders
struct ThemeTokens final {
    std::string theme_name{"Breeze-Dark"};
    std::string icon_theme{"Papirus-Dark"};
    std::string accent_color{};
    std::string username{};
    std::string keyboard_layout{};
};

struct OpenboxTheme final {
    std::string_view name;
    std::string_view description;
    std::string_view accent_color;
};

enum class TemplateScope : std::uint8_t {
    System,  ///< rendered relative to the target root
    User,    ///< rendered relative to the primary account's home
};

struct TemplateSpec final {
    // path relative to the template directory
    std::string_view source;
    // path relative to the scope root
    std::string_view target;
    TemplateScope scope{TemplateScope::System};
    // built-in minimal content used when the template is absent
    std::string_view fallback;
};

struct RenderReport final {
    std::size_t rendered{};
    std::vector<std::string> missing_templates{};
    std::vector<std::string> failed_targets{};
};

/// @brief Openbox themes offered to the operator.
auto openbox_themes() noexcept -> const std::vector<OpenboxTheme>&;

/// @brief Lookup openbox theme by its name.
auto find_openbox_theme(std::string_view name) noexcept -> std::optional<OpenboxTheme>;

/// @brief Build tokens for the selected openbox theme and account.
auto make_theme_tokens(std::string_view openbox_theme, std::string_view username, std::string_view keyboard_layout) noexcept -> ThemeTokens;

/// @brief Substitute every known @TOKEN@ in the text. Unknown tokens are left as is.
auto render_template(std::string_view text, const ThemeTokens& tokens) noexcept -> std::string;

/// @brief The fixed set of appearance templates consumed by the installer.
auto default_template_set() noexcept -> const std::vector<TemplateSpec>&;

/// @brief Resolve the destination path of a template on the target.
auto resolve_target_path(const TemplateSpec& spec, std::string_view mountpoint, std::string_view username) noexcept -> std::string;

/// @brief Render every template of the set into the target.
///
/// Absent templates are replaced by their built-in fallback and reported as missing.
/// Never fails as a whole, write failures are collected in the report.
auto render_template_set(const std::vector<TemplateSpec>& templates, std::string_view template_dir, const ThemeTokens& tokens, std::string_view mountpoint) noexcept -> RenderReport;

}  // namespace archi::theme

#endif  // TEMPLATE_RENDER_HPP
