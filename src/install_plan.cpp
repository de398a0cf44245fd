#include "install_plan.hpp"
#include "installer_config.hpp"

#include <algorithm>  // for find, find_if

#include <ctre.hpp>  // for ctre::match

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace installer {

auto known_desktops() noexcept -> const std::vector<std::string>& {
    static const std::vector<std::string> desktops{"openbox", "i3", "dwm", "none"};
    return desktops;
}

auto is_valid_username(std::string_view username) noexcept -> bool {
    return static_cast<bool>(ctre::match<"[a-z][a-z0-9_-]{0,31}">(username));
}

auto InstallPlan::confirm(PlanChoices choices, std::string_view retyped_device) noexcept
    -> std::expected<InstallPlan, std::string> {
    if (choices.device.empty()) {
        return std::unexpected("no target device selected");
    }
    if (retyped_device != choices.device) {
        return std::unexpected(fmt::format(FMT_COMPILE("device confirmation '{}' does not match '{}'"), retyped_device, choices.device));
    }
    if (!is_valid_username(choices.username)) {
        return std::unexpected(fmt::format(FMT_COMPILE("invalid username '{}'"), choices.username));
    }
    if (choices.password.empty()) {
        return std::unexpected("password must not be empty");
    }
    if (choices.password != choices.password_confirm) {
        return std::unexpected("passwords do not match");
    }
    if (choices.root_password && choices.root_password->empty()) {
        return std::unexpected("root password must not be empty");
    }
    if (std::ranges::find(known_desktops(), choices.desktop) == known_desktops().end()) {
        return std::unexpected(fmt::format(FMT_COMPILE("unknown desktop variant '{}'"), choices.desktop));
    }
    if (choices.locale.empty() || choices.keymap.empty() || choices.timezone.empty()) {
        return std::unexpected("locale, keyboard and timezone must be set");
    }

    if (!choices.root_password) {
        spdlog::warn("root account shares the password of '{}'", choices.username);
    }
    return InstallPlan{std::move(choices)};
}

auto InstallPlan::root_password() const noexcept -> std::string_view {
    return m_choices.root_password ? std::string_view{*m_choices.root_password} : std::string_view{m_choices.password};
}

auto choices_from_config(const InstallerConfig& config, const archi::system::HardwareInfo& hw_info) noexcept
    -> std::expected<PlanChoices, std::string> {
    PlanChoices choices{};
    choices.is_uefi    = hw_info.is_uefi;
    choices.memory_mb  = hw_info.memory_mb;
    choices.low_memory = hw_info.is_low_memory();
    choices.vm         = hw_info.virt;

    choices.safe_profile      = config.safe_profile;
    choices.minimal_footprint = config.minimal_footprint;
    choices.gaming            = config.gaming;
    choices.ssh               = config.ssh;

    if (config.mirror_mode) {
        const auto& mirror_mode = archi::mirrors::string_to_mirror_mode(*config.mirror_mode);
        if (!mirror_mode) {
            return std::unexpected(fmt::format(FMT_COMPILE("unknown mirror mode '{}'"), *config.mirror_mode));
        }
        choices.mirror_mode = *mirror_mode;
    }
    if (config.vm) {
        const auto& vm = archi::system::string_to_vm_guest(*config.vm);
        if (!vm) {
            return std::unexpected(fmt::format(FMT_COMPILE("unknown vm variant '{}'"), *config.vm));
        }
        choices.vm = *vm;
    }

    choices.device   = config.device.value_or("");
    choices.locale   = config.locale.value_or(choices.locale);
    choices.keymap   = config.keymap.value_or(choices.keymap);
    choices.timezone = config.timezone.value_or(choices.timezone);
    choices.desktop  = config.desktop.value_or(choices.desktop);

    choices.openbox_theme    = config.openbox_theme.value_or(choices.openbox_theme);
    choices.username         = config.user_name.value_or("");
    choices.password         = config.user_pass.value_or("");
    choices.password_confirm = choices.password;
    choices.root_password    = config.root_pass;

    const auto& disk = std::ranges::find_if(hw_info.disks, [&](auto&& disk_info) { return disk_info.device == choices.device; });
    if (disk == hw_info.disks.end()) {
        return std::unexpected(fmt::format(FMT_COMPILE("device '{}' is not a candidate disk"), choices.device));
    }
    choices.is_ssd = disk->is_ssd;
    return choices;
}

void dump_plan_to_log(const InstallPlan& plan) noexcept {
    const auto& choices = plan.choices();
    spdlog::info(R"(Install plan:
  firmware: {}
  memory: {} MB (low memory: {})
  device: {} (ssd: {})
  mirror mode: {} (safe profile: {})
  locale: {}, keymap: {}, timezone: {}
  desktop: {} (theme: {}), gaming: {}, ssh: {}, vm: {}
  user: {} (separate root password: {})
  minimal footprint: {})",
        choices.is_uefi ? "UEFI"sv : "BIOS"sv,
        choices.memory_mb, choices.low_memory,
        choices.device, choices.is_ssd,
        archi::mirrors::mirror_mode_to_string(choices.mirror_mode), choices.safe_profile,
        choices.locale, choices.keymap, choices.timezone,
        choices.desktop, choices.openbox_theme, choices.gaming, choices.ssh, archi::system::vm_guest_to_string(choices.vm),
        choices.username, !plan.reuses_user_password(),
        choices.minimal_footprint);
}

}  // namespace installer
