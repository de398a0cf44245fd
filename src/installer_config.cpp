#include "installer_config.hpp"

#include <array>        // for array
#include <expected>     // for expected, unexpected
#include <string_view>  // for string_view
#include <utility>      // for pair

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

auto read_string_field(const rapidjson::Document& doc, const char* name, std::optional<std::string>& field) noexcept -> std::expected<void, std::string> {
    if (!doc.HasMember(name)) {
        return {};
    }
    if (!doc[name].IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a string"), name));
    }
    field = doc[name].GetString();
    return {};
}

auto read_bool_field(const rapidjson::Document& doc, const char* name, bool& field) noexcept -> std::expected<void, std::string> {
    if (!doc.HasMember(name)) {
        return {};
    }
    if (!doc[name].IsBool()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a boolean"), name));
    }
    field = doc[name].GetBool();
    return {};
}

}  // namespace

namespace installer {

auto parse_installer_config(std::string_view json_content) noexcept
    -> std::expected<InstallerConfig, std::string> {
    if (json_content.empty()) {
        return InstallerConfig{};
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    InstallerConfig config{};

    const std::array<std::pair<const char*, bool*>, 5> bool_fields{{
        {"headless_mode", &config.headless_mode},
        {"safe_profile", &config.safe_profile},
        {"minimal_footprint", &config.minimal_footprint},
        {"gaming", &config.gaming},
        {"ssh", &config.ssh},
    }};
    for (auto&& [name, field] : bool_fields) {
        if (auto res = read_bool_field(doc, name, *field); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }

    const std::array<std::pair<const char*, std::optional<std::string>*>, 16> string_fields{{
        {"mirror_mode", &config.mirror_mode},
        {"device", &config.device},
        {"device_confirm", &config.device_confirm},
        {"hostname", &config.hostname},
        {"locale", &config.locale},
        {"keymap", &config.keymap},
        {"timezone", &config.timezone},
        {"user_name", &config.user_name},
        {"user_pass", &config.user_pass},
        {"root_pass", &config.root_pass},
        {"desktop", &config.desktop},
        {"openbox_theme", &config.openbox_theme},
        {"vm", &config.vm},
        {"mountpoint", &config.mountpoint},
        {"template_dir", &config.template_dir},
        {"catalog_url", &config.catalog_url},
    }};
    for (auto&& [name, field] : string_fields) {
        if (auto res = read_string_field(doc, name, *field); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }

    if (config.mountpoint && !config.mountpoint->starts_with('/')) {
        return std::unexpected("'mountpoint' must be an absolute path");
    }

    return config;
}

auto validate_headless_config(const InstallerConfig& config) noexcept
    -> std::expected<void, std::string> {
    if (!config.headless_mode) {
        return {};
    }

    std::string missing_fields;
    if (!config.device || !config.device_confirm) {
        missing_fields += "'device', 'device_confirm', ";
    }
    if (!config.mirror_mode) {
        missing_fields += "'mirror_mode', ";
    }
    if (!config.locale) {
        missing_fields += "'locale', ";
    }
    if (!config.keymap) {
        missing_fields += "'keymap', ";
    }
    if (!config.timezone) {
        missing_fields += "'timezone', ";
    }
    if (!config.user_name || !config.user_pass) {
        missing_fields += "'user_name', 'user_pass', ";
    }
    if (!config.desktop) {
        missing_fields += "'desktop', ";
    }

    if (!missing_fields.empty()) {
        missing_fields.resize(missing_fields.size() - 2);
        return std::unexpected(fmt::format(FMT_COMPILE("HEADLESS mode requires: {}"), missing_fields));
    }

    return {};
}

}  // namespace installer
