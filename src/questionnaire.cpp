#include "questionnaire.hpp"
#include "utils.hpp"
#include "widgets.hpp"

// import archi
#include "archi/string_utils.hpp"
#include "archi/template_render.hpp"
#include "archi/timezone.hpp"

#include <algorithm>    // for find, transform
#include <array>        // for array
#include <cstddef>      // for size_t
#include <cstdint>      // for int32_t
#include <iterator>     // for back_inserter, distance
#include <string_view>  // for string_view
#include <utility>      // for pair, move
#include <vector>       // for vector

#include <fmt/compile.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <ftxui/component/component.hpp>           // for Renderer, Button
#include <ftxui/component/screen_interactive.hpp>  // for ScreenInteractive
#include <ftxui/dom/elements.hpp>                  // for size, GREATER_THAN

using namespace ftxui;
using namespace std::string_view_literals;

namespace tui {

namespace {

static constexpr auto KEYMAPS = "us uk de fr es it br ru jp"sv;

// Menu entries for mirror modes, in the order of the menu
static constexpr std::array MIRROR_MENU{
    std::pair{archi::mirrors::MirrorMode::Auto, "auto (rank mirrors by speed)"sv},
    std::pair{archi::mirrors::MirrorMode::Stable, "stable (fixed, well-known mirrors)"sv},
    std::pair{archi::mirrors::MirrorMode::Us, "us"sv},
    std::pair{archi::mirrors::MirrorMode::Eu, "eu"sv},
    std::pair{archi::mirrors::MirrorMode::Asia, "asia"sv},
};

static constexpr std::array VM_MENU{
    archi::system::VmGuest::None,
    archi::system::VmGuest::Qemu,
    archi::system::VmGuest::Vbox,
    archi::system::VmGuest::Vmware,
};

auto index_of(const std::vector<std::string>& entries, std::string_view entry) noexcept -> std::int32_t {
    const auto& iter = std::ranges::find(entries, entry);
    return (iter != entries.end()) ? static_cast<std::int32_t>(std::distance(entries.begin(), iter)) : 0;
}

// Shows a menu, returns index of the chosen entry or nullopt on cancel
auto select_entry(const std::vector<std::string>& entries, std::string_view body, std::int32_t selected = 0) noexcept -> std::optional<std::size_t> {
    auto screen = ScreenInteractive::Fullscreen();
    bool success{};
    auto ok_callback = [&] {
        success = true;
        screen.ExitLoopClosure()();
    };

    auto content_size = size(HEIGHT, GREATER_THAN, 10) | size(WIDTH, GREATER_THAN, 40) | vscroll_indicator | yframe | flex;
    detail::menu_widget(entries, ok_callback, &selected, &screen, body, {std::move(content_size), size(HEIGHT, GREATER_THAN, 1)});

    /* clang-format off */
    if (!success) { return std::nullopt; }
    /* clang-format on */
    return static_cast<std::size_t>(selected);
}

auto ask_username() noexcept -> std::optional<std::string> {
    static constexpr auto user_body = "\nEnter the name of the account to create.\n\nIt must start with a lowercase letter, may contain\nlowercase letters, digits, '_' and '-', and is at most 32 characters.\n"sv;
    std::string username{};
    while (true) {
        if (!detail::inputbox_widget(username, user_body, size(HEIGHT, GREATER_THAN, 4))) {
            return std::nullopt;
        }
        if (installer::is_valid_username(username)) {
            return username;
        }
        detail::msgbox_widget(fmt::format(FMT_COMPILE("\n'{}' is not a valid username.\n"), username));
    }
}

// Password typed twice, masked. Both entries are returned as typed
auto ask_password(std::string_view body) noexcept -> std::optional<std::pair<std::string, std::string>> {
    while (true) {
        std::string password{};
        if (!detail::inputbox_widget(password, body, size(HEIGHT, GREATER_THAN, 1), true)) {
            return std::nullopt;
        }
        std::string confirm{};
        if (!detail::inputbox_widget(confirm, "\nRe-enter the password.\n"sv, size(HEIGHT, GREATER_THAN, 1), true)) {
            return std::nullopt;
        }
        if (password.empty()) {
            detail::msgbox_widget("\nThe password must not be empty.\n"sv);
            continue;
        }
        if (password != confirm) {
            detail::msgbox_widget("\nThe passwords do not match.\n"sv);
            continue;
        }
        return std::pair{std::move(password), std::move(confirm)};
    }
}

auto ask_timezone() noexcept -> std::optional<std::string> {
    auto regions = archi::timezone::get_timezone_regions();
    if (regions.empty()) {
        spdlog::warn("No timezone regions found, using UTC");
        return std::string{"UTC"};
    }
    static constexpr auto region_body = "\nThe time zone is used to correctly set your system clock.\n\nSelect your region.\n"sv;
    const auto& region_idx            = select_entry(regions, region_body, index_of(regions, "Europe"sv));
    /* clang-format off */
    if (!region_idx) { return std::nullopt; }
    /* clang-format on */
    const auto& region = regions[*region_idx];

    const auto& zones = archi::timezone::get_timezone_zones(region);
    if (zones.empty()) {
        return region;
    }
    const auto& zone_idx = select_entry(zones, fmt::format(FMT_COMPILE("\nSelect the city nearest to you in {}.\n"), region));
    /* clang-format off */
    if (!zone_idx) { return std::nullopt; }
    /* clang-format on */
    return fmt::format(FMT_COMPILE("{}/{}"), region, zones[*zone_idx]);
}

}  // namespace

auto run_questionnaire(const archi::system::HardwareInfo& hw_info) noexcept -> std::optional<QuestionnaireResult> {
    QuestionnaireResult result{};
    auto& choices = result.choices;

    choices.is_uefi    = hw_info.is_uefi;
    choices.memory_mb  = hw_info.memory_mb;
    choices.low_memory = hw_info.is_low_memory();

    choices.safe_profile = detail::yesno_widget("\nUse the safe install profile?\n\nLowers download concurrency, disables the download\ntimeout and runs the installer at low priority.\nRecommended on slow or unreliable connections.\n"sv, size(HEIGHT, LESS_THAN, 15) | size(WIDTH, LESS_THAN, 75));

    {
        std::vector<std::string> entries{};
        std::ranges::transform(MIRROR_MENU, std::back_inserter(entries), [](auto&& entry) { return std::string{entry.second}; });
        const auto& idx = select_entry(entries, "\nChoose how package mirrors are selected.\n"sv);
        /* clang-format off */
        if (!idx) { return std::nullopt; }
        /* clang-format on */
        choices.mirror_mode = MIRROR_MENU[*idx].first;
    }

    {
        const auto& locales = utils::list_supported_locales();
        static constexpr auto lang_body = "\nChoose the system language.\n\nThe format is language_COUNTRY (e.g. en_US is english, United States;\nen_GB is english, Great Britain).\n"sv;
        const auto& idx = select_entry(locales, lang_body, index_of(locales, utils::DEFAULT_LOCALE));
        /* clang-format off */
        if (!idx) { return std::nullopt; }
        /* clang-format on */
        choices.locale = locales[*idx];
    }

    {
        const auto& keymaps = archi::utils::make_multiline(KEYMAPS, false, ' ');
        const auto& idx     = select_entry(keymaps, "\nSelect the console keyboard layout.\n"sv);
        /* clang-format off */
        if (!idx) { return std::nullopt; }
        /* clang-format on */
        choices.keymap = keymaps[*idx];
    }

    const auto& timezone = ask_timezone();
    /* clang-format off */
    if (!timezone) { return std::nullopt; }
    /* clang-format on */
    choices.timezone = *timezone;

    choices.minimal_footprint = detail::yesno_widget("\nInstall only the chosen locale and strip other\ntranslations, documentation and man pages to save disk space?\n"sv, size(HEIGHT, LESS_THAN, 15) | size(WIDTH, LESS_THAN, 75));
    choices.gaming            = detail::yesno_widget("\nInstall gaming extras (Steam, Lutris, MangoHud, GameMode)?\n\nSkipped on machines with less than 2 GB of memory.\n"sv, size(HEIGHT, LESS_THAN, 15) | size(WIDTH, LESS_THAN, 75));

    {
        const auto& desktops = installer::known_desktops();
        const auto& idx      = select_entry(desktops, "\nSelect the window manager to install.\n"sv);
        /* clang-format off */
        if (!idx) { return std::nullopt; }
        /* clang-format on */
        choices.desktop = desktops[*idx];
    }

    if (choices.desktop == "openbox"sv) {
        std::vector<std::string> entries{};
        std::ranges::transform(archi::theme::openbox_themes(), std::back_inserter(entries),
            [](auto&& theme) { return fmt::format(FMT_COMPILE("{} - {}"), theme.name, theme.description); });
        const auto& idx = select_entry(entries, "\nSelect the openbox theme.\n"sv);
        /* clang-format off */
        if (!idx) { return std::nullopt; }
        /* clang-format on */
        choices.openbox_theme = std::string{archi::theme::openbox_themes()[*idx].name};
    }

    choices.ssh = detail::yesno_widget("\nEnable the SSH server on the installed system?\n"sv, size(HEIGHT, LESS_THAN, 15) | size(WIDTH, LESS_THAN, 75));

    {
        std::vector<std::string> entries{};
        std::ranges::transform(VM_MENU, std::back_inserter(entries), [](auto&& guest) { return std::string{archi::system::vm_guest_to_string(guest)}; });
        const auto& detected = static_cast<std::int32_t>(std::distance(VM_MENU.begin(), std::ranges::find(VM_MENU, hw_info.virt)));
        const auto& idx      = select_entry(entries, "\nInstall guest tools for a virtual machine?\n"sv, detected);
        /* clang-format off */
        if (!idx) { return std::nullopt; }
        /* clang-format on */
        choices.vm = VM_MENU[*idx];
    }

    auto username = ask_username();
    /* clang-format off */
    if (!username) { return std::nullopt; }
    /* clang-format on */
    choices.username = std::move(*username);

    auto password = ask_password(fmt::format(FMT_COMPILE("\nEnter the password for {}.\n"), choices.username));
    /* clang-format off */
    if (!password) { return std::nullopt; }
    /* clang-format on */
    choices.password         = std::move(password->first);
    choices.password_confirm = std::move(password->second);

    const auto& reuse_password = detail::yesno_widget("\nUse the same password for the administrator (root) account?\n"sv, size(HEIGHT, LESS_THAN, 15) | size(WIDTH, LESS_THAN, 75));
    if (!reuse_password) {
        auto root_password = ask_password("\nEnter the administrator (root) password.\n"sv);
        /* clang-format off */
        if (!root_password) { return std::nullopt; }
        /* clang-format on */
        choices.root_password = std::move(root_password->first);
    }

    {
        std::vector<std::string> entries{};
        std::ranges::transform(hw_info.disks, std::back_inserter(entries), [](auto&& disk) {
            return fmt::format(FMT_COMPILE("{} {} {}"), disk.device, archi::disk::format_size(disk.size), disk.model.value_or(""));
        });
        const auto& idx = select_entry(entries, "\nSelect the disk to install to.\n\nEvery partition on it will be destroyed.\n"sv);
        /* clang-format off */
        if (!idx) { return std::nullopt; }
        /* clang-format on */
        choices.device = hw_info.disks[*idx].device;
        choices.is_ssd = hw_info.disks[*idx].is_ssd;
    }

    const auto& confirm_body = fmt::format(FMT_COMPILE("\nALL DATA ON {} WILL BE ERASED.\n\nContinue?\n"), choices.device);
    if (!detail::yesno_widget(confirm_body, size(HEIGHT, LESS_THAN, 15) | size(WIDTH, LESS_THAN, 75))) {
        spdlog::info("Installation declined at confirmation");
        return std::nullopt;
    }

    const auto& retype_body = fmt::format(FMT_COMPILE("\nType the device path ({}) again to confirm.\n"), choices.device);
    if (!detail::inputbox_widget(result.retyped_device, retype_body, size(HEIGHT, GREATER_THAN, 1))) {
        return std::nullopt;
    }
    return result;
}

}  // namespace tui
