#include "archi/template_render.hpp"
#include "archi/file_utils.hpp"
#include "archi/string_utils.hpp"

#include <algorithm>   // for find_if
#include <array>       // for array
#include <filesystem>  // for exists
#include <utility>     // for pair

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace {

// NOLINTNEXTLINE
static constexpr auto GTK3_FALLBACK = R"([Settings]
gtk-theme-name = @THEME_NAME@
gtk-icon-theme-name = @ICON_THEME@
gtk-cursor-theme-name = Breeze
)"sv;

// NOLINTNEXTLINE
static constexpr auto GTK2_FALLBACK = R"(gtk-theme-name = "@THEME_NAME@"
gtk-icon-theme-name = "@ICON_THEME@"
gtk-cursor-theme-name = "Breeze"
)"sv;

// NOLINTNEXTLINE
static constexpr auto QT5CT_FALLBACK = R"([Appearance]
icon_theme=@ICON_THEME@
style=Breeze
)"sv;

// NOLINTNEXTLINE
static constexpr auto XINITRC_FALLBACK = R"(#!/bin/sh
setxkbmap @KEYBOARD_LAYOUT@ 2>/dev/null || true
xsetroot -solid "@ACCENT_COLOR@"
exec openbox-session
)"sv;

// NOLINTNEXTLINE
static constexpr auto AUTOSTART_FALLBACK = R"(xsetroot -solid "@ACCENT_COLOR@" &
)"sv;

}  // namespace

namespace archi::theme {

auto openbox_themes() noexcept -> const std::vector<OpenboxTheme>& {
    static const std::vector<OpenboxTheme> themes{
        {.name = "Raven"sv, .description = "dark theme with green accents"sv, .accent_color = "#6a8759"sv},
        {.name = "Triste"sv, .description = "dark theme with red/burgundy accents"sv, .accent_color = "#cc7832"sv},
    };
    return themes;
}

auto find_openbox_theme(std::string_view name) noexcept -> std::optional<OpenboxTheme> {
    const auto& themes = openbox_themes();
    const auto& it     = std::ranges::find_if(themes, [name](auto&& theme) { return theme.name == name; });
    if (it == themes.end()) {
        return std::nullopt;
    }
    return *it;
}

auto make_theme_tokens(std::string_view openbox_theme, std::string_view username, std::string_view keyboard_layout) noexcept -> ThemeTokens {
    ThemeTokens tokens{};
    tokens.username        = std::string{username};
    tokens.keyboard_layout = std::string{keyboard_layout};

    const auto& theme = find_openbox_theme(openbox_theme);
    if (!theme) {
        spdlog::warn("Unknown openbox theme '{}', using '{}'", openbox_theme, openbox_themes().front().name);
    }
    tokens.accent_color = std::string{theme ? theme->accent_color : openbox_themes().front().accent_color};
    return tokens;
}

auto render_template(std::string_view text, const ThemeTokens& tokens) noexcept -> std::string {
    const std::array<std::pair<std::string_view, std::string_view>, 5> substitutions{{
        {"@THEME_NAME@"sv, tokens.theme_name},
        {"@ICON_THEME@"sv, tokens.icon_theme},
        {"@ACCENT_COLOR@"sv, tokens.accent_color},
        {"@USERNAME@"sv, tokens.username},
        {"@KEYBOARD_LAYOUT@"sv, tokens.keyboard_layout},
    }};

    std::string result{text};
    for (auto&& [token, value] : substitutions) {
        result = utils::replace_all(std::move(result), token, value);
    }
    return result;
}

auto default_template_set() noexcept -> const std::vector<TemplateSpec>& {
    static const std::vector<TemplateSpec> templates{
        {.source = "gtk-3.0/settings.ini"sv, .target = "etc/gtk-3.0/settings.ini"sv, .scope = TemplateScope::System, .fallback = GTK3_FALLBACK},
        {.source = "gtk-2.0/gtkrc"sv, .target = "etc/gtk-2.0/gtkrc"sv, .scope = TemplateScope::System, .fallback = GTK2_FALLBACK},
        {.source = "qt5ct/qt5ct.conf"sv, .target = "etc/xdg/qt5ct/qt5ct.conf"sv, .scope = TemplateScope::System, .fallback = QT5CT_FALLBACK},
        {.source = "xinitrc"sv, .target = ".xinitrc"sv, .scope = TemplateScope::User, .fallback = XINITRC_FALLBACK},
        {.source = "openbox/autostart"sv, .target = ".config/openbox/autostart"sv, .scope = TemplateScope::User, .fallback = AUTOSTART_FALLBACK},
    };
    return templates;
}

auto resolve_target_path(const TemplateSpec& spec, std::string_view mountpoint, std::string_view username) noexcept -> std::string {
    if (spec.scope == TemplateScope::User) {
        return fmt::format(FMT_COMPILE("{}/home/{}/{}"), mountpoint, username, spec.target);
    }
    return fmt::format(FMT_COMPILE("{}/{}"), mountpoint, spec.target);
}

auto render_template_set(const std::vector<TemplateSpec>& templates, std::string_view template_dir, const ThemeTokens& tokens, std::string_view mountpoint) noexcept -> RenderReport {
    RenderReport report{};
    for (const auto& spec : templates) {
        const auto& source_path = fmt::format(FMT_COMPILE("{}/{}"), template_dir, spec.source);

        std::error_code err{};
        std::string template_text{};
        if (fs::exists(source_path, err)) {
            template_text = file_utils::read_whole_file(source_path);
        } else {
            spdlog::warn("Template '{}' is missing, using built-in fallback", source_path);
            report.missing_templates.emplace_back(spec.source);
            template_text = std::string{spec.fallback};
        }

        const auto& target_path = resolve_target_path(spec, mountpoint, tokens.username);
        if (!file_utils::create_file_for_overwrite(target_path, render_template(template_text, tokens))) {
            spdlog::warn("Failed to render template into {}", target_path);
            report.failed_targets.emplace_back(target_path);
            continue;
        }
        ++report.rendered;
    }
    return report;
}

}  // namespace archi::theme
