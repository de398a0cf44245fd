#include "configurator.hpp"
#include "config.hpp"
#include "install_plan.hpp"

// import archi
#include "archi/action_log.hpp"
#include "archi/cpu.hpp"
#include "archi/firewall.hpp"
#include "archi/fstab.hpp"
#include "archi/io_utils.hpp"
#include "archi/locale.hpp"
#include "archi/swap.hpp"
#include "archi/systemd_services.hpp"
#include "archi/template_render.hpp"
#include "archi/timezone.hpp"
#include "archi/user.hpp"

#include <array>       // for array
#include <filesystem>  // for directory_iterator, remove_all
#include <vector>      // for vector

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace {

// Drop everything below the directory, keep the directory itself
auto clear_directory(const std::string& dir_path) noexcept -> bool {
    std::error_code err{};
    if (!fs::exists(dir_path, err)) {
        return true;
    }
    for (const auto& entry : fs::directory_iterator(dir_path, err)) {
        fs::remove_all(entry.path(), err);
        if (err) {
            spdlog::warn("Failed to remove '{}': {}", entry.path().string(), err.message());
            return false;
        }
    }
    return !err;
}

constexpr auto vm_guest_service(archi::system::VmGuest guest) noexcept -> std::string_view {
    switch (guest) {
    case archi::system::VmGuest::Qemu:
        return "qemu-guest-agent"sv;
    case archi::system::VmGuest::Vbox:
        return "vboxservice"sv;
    case archi::system::VmGuest::Vmware:
        return "vmtoolsd"sv;
    case archi::system::VmGuest::None:
        break;
    }
    return {};
}

}  // namespace

namespace installer {

void Configurator::best_effort(bool is_ok, std::string_view step) noexcept {
    if (is_ok) {
        m_ctx.action_log.record("configure: {} done", step);
        return;
    }
    ++m_failed_steps;
    spdlog::warn("Configuration step '{}' failed, continuing", step);
    m_ctx.action_log.record("configure: {} FAILED (non-fatal)", step);
}

auto Configurator::set_locale_and_time() noexcept -> std::expected<void, InstallError> {
    const auto& choices    = m_ctx.plan.choices();
    const auto& mountpoint = m_ctx.settings.mountpoint;

    if (!archi::locale::set_locale(m_ctx.runner, choices.locale, mountpoint)) {
        return std::unexpected(InstallError{.stage = InstallStage::Configure, .message = fmt::format(FMT_COMPILE("failed to set locale '{}'"), choices.locale)});
    }
    if (!archi::locale::set_keymap(choices.keymap, mountpoint)) {
        return std::unexpected(InstallError{.stage = InstallStage::Configure, .message = fmt::format(FMT_COMPILE("failed to set keymap '{}'"), choices.keymap)});
    }
    if (!archi::timezone::set_timezone(choices.timezone, mountpoint)) {
        return std::unexpected(InstallError{.stage = InstallStage::Configure, .message = fmt::format(FMT_COMPILE("failed to set timezone '{}'"), choices.timezone)});
    }
    m_ctx.action_log.record("configure: locale {}, keymap {}, timezone {}", choices.locale, choices.keymap, choices.timezone);

    best_effort(archi::timezone::sync_hwclock(m_ctx.runner, mountpoint), "hardware clock"sv);
    return {};
}

void Configurator::set_host() noexcept {
    best_effort(archi::user::set_hostname(m_ctx.settings.hostname, m_ctx.settings.mountpoint), "hostname"sv);
}

auto Configurator::create_accounts() noexcept -> std::expected<void, InstallError> {
    const auto& choices    = m_ctx.plan.choices();
    const auto& mountpoint = m_ctx.settings.mountpoint;

    const archi::user::UserInfo user_info{
        .username      = choices.username,
        .password      = choices.password,
        .shell         = "/bin/bash"sv,
        .sudoers_group = "wheel"sv,
    };
    if (!archi::user::create_new_user(m_ctx.runner, user_info, archi::user::default_user_groups(), mountpoint)) {
        return std::unexpected(InstallError{.stage = InstallStage::Configure, .message = fmt::format(FMT_COMPILE("failed to create user '{}'"), choices.username)});
    }
    m_ctx.action_log.record("configure: created user {} with sudo through wheel", choices.username);

    if (!archi::user::set_root_password(m_ctx.runner, m_ctx.plan.root_password(), mountpoint)) {
        return std::unexpected(InstallError{.stage = InstallStage::Configure, .message = "failed to set root password"});
    }
    if (m_ctx.plan.reuses_user_password()) {
        m_ctx.action_log.record("configure: WARNING root password is the same as {}'s", choices.username);
    } else {
        m_ctx.action_log.record("configure: separate root password set");
    }
    return {};
}

void Configurator::enable_core_services() noexcept {
    static constexpr std::array CORE_SERVICES{
        "NetworkManager"sv,
        "systemd-timesyncd"sv,
        "cups"sv,
        "udisks2"sv,
        "bluetooth"sv,
    };
    for (auto&& service : CORE_SERVICES) {
        best_effort(archi::services::enable_systemd_service(m_ctx.runner, service, m_ctx.settings.mountpoint), fmt::format(FMT_COMPILE("enable {}"), service));
    }
}

void Configurator::setup_firewall() noexcept {
    best_effort(archi::firewall::configure_ufw(m_ctx.runner, m_ctx.settings.mountpoint), "firewall"sv);
}

void Configurator::setup_zram() noexcept {
    if (!m_ctx.plan.choices().low_memory) {
        return;
    }
    best_effort(archi::swap::write_zram_config(m_ctx.settings.mountpoint), "zram swap"sv);
}

void Configurator::setup_cpu_governor() noexcept {
    const auto governor = archi::cpu::select_governor(m_ctx.plan.choices().gaming);
    best_effort(archi::cpu::set_cpu_governor(m_ctx.runner, governor, m_ctx.settings.mountpoint),
        fmt::format(FMT_COMPILE("cpu governor {}"), archi::cpu::governor_to_string(governor)));
}

void Configurator::tune_fstab() noexcept {
    best_effort(archi::fs::apply_noatime(m_ctx.settings.mountpoint), "noatime in fstab"sv);
}

void Configurator::setup_vm_guest() noexcept {
    const auto& service = vm_guest_service(m_ctx.plan.choices().vm);
    if (service.empty()) {
        return;
    }
    best_effort(archi::services::enable_systemd_service(m_ctx.runner, service, m_ctx.settings.mountpoint), fmt::format(FMT_COMPILE("enable {}"), service));
}

void Configurator::setup_ssh() noexcept {
    const auto& mountpoint = m_ctx.settings.mountpoint;
    if (m_ctx.plan.choices().ssh) {
        best_effort(archi::services::enable_systemd_service(m_ctx.runner, "sshd"sv, mountpoint), "enable sshd"sv);
    } else {
        best_effort(archi::services::disable_systemd_service(m_ctx.runner, "sshd"sv, mountpoint), "disable sshd"sv);
    }
}

void Configurator::render_theme() noexcept {
    const auto& choices = m_ctx.plan.choices();
    const bool has_wm   = choices.desktop != "none"sv;

    // user scope files belong to the window manager session
    std::vector<archi::theme::TemplateSpec> templates{};
    for (const auto& spec : archi::theme::default_template_set()) {
        if (spec.scope == archi::theme::TemplateScope::System || has_wm) {
            templates.push_back(spec);
        }
    }

    const auto& tokens = archi::theme::make_theme_tokens(choices.openbox_theme, choices.username, choices.keymap);
    const auto& report = archi::theme::render_template_set(templates, m_ctx.settings.template_dir, tokens, m_ctx.settings.mountpoint);
    for (const auto& missing : report.missing_templates) {
        m_ctx.action_log.record("configure: template {} missing, built-in fallback used", missing);
    }
    best_effort(report.failed_targets.empty(), fmt::format(FMT_COMPILE("theme {} ({} files)"), choices.openbox_theme, report.rendered));

    if (has_wm) {
        const auto& chown_cmd = fmt::format(FMT_COMPILE("chown -R {0}:{0} /home/{0}"), choices.username);
        best_effort(m_ctx.runner.chroot_checked(chown_cmd, m_ctx.settings.mountpoint), "home ownership"sv);
    }
}

void Configurator::strip_footprint() noexcept {
    const auto& choices    = m_ctx.plan.choices();
    const auto& mountpoint = m_ctx.settings.mountpoint;

    if (choices.minimal_footprint) {
        best_effort(m_ctx.runner.chroot_checked("pacman -Rns --noconfirm man-db man-pages texinfo"sv, mountpoint), "remove manuals"sv);
        best_effort(archi::locale::strip_locales(choices.locale, mountpoint), "strip translations"sv);

        static constexpr std::array DOC_DIRS{"usr/share/doc"sv, "usr/share/info"sv, "usr/share/gtk-doc"sv};
        bool is_cleared{true};
        for (auto&& doc_dir : DOC_DIRS) {
            is_cleared = clear_directory(fmt::format(FMT_COMPILE("{}/{}"), mountpoint, doc_dir)) && is_cleared;
        }
        best_effort(is_cleared, "remove documentation"sv);
    }

    best_effort(m_ctx.runner.chroot_checked("pacman -Scc --noconfirm"sv, mountpoint), "clean package cache"sv);
}

void Configurator::finalize_system() noexcept {
    const auto& mountpoint = m_ctx.settings.mountpoint;
    if (m_ctx.plan.choices().is_ssd) {
        best_effort(archi::services::enable_systemd_service(m_ctx.runner, "fstrim.timer"sv, mountpoint), "enable fstrim.timer"sv);
    }
    best_effort(m_ctx.runner.chroot_checked("systemd-machine-id-setup"sv, mountpoint), "machine id"sv);
}

auto Configurator::run() noexcept -> std::expected<void, InstallError> {
    if (auto res = set_locale_and_time(); !res) {
        return res;
    }
    set_host();
    if (auto res = create_accounts(); !res) {
        return res;
    }
    enable_core_services();
    setup_firewall();
    setup_zram();
    setup_cpu_governor();
    tune_fstab();
    setup_vm_guest();
    setup_ssh();
    render_theme();
    strip_footprint();
    finalize_system();

    if (m_failed_steps > 0) {
        spdlog::warn("{} configuration steps failed, the system is still bootable", m_failed_steps);
    }
    return {};
}

}  // namespace installer
