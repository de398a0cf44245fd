#include "archi/bootloader.hpp"
#include "archi/io_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace archi::bootloader {

auto make_grub_install_config(bool is_efi, std::string_view device) noexcept -> GrubInstallConfig {
    if (is_efi) {
        return GrubInstallConfig{.is_efi = true, .do_recheck = true, .efi_directory = "/boot", .bootloader_id = "Arch", .device = std::nullopt};
    }
    return GrubInstallConfig{.is_efi = false, .do_recheck = true, .efi_directory = std::nullopt, .bootloader_id = std::nullopt, .device = std::string{device}};
}

auto gen_grub_install_command(const GrubInstallConfig& grub_install_config) noexcept -> std::optional<std::string> {
    if (!grub_install_config.is_efi && (!grub_install_config.device || grub_install_config.device->empty())) {
        spdlog::error("BIOS grub install requires the target device");
        return std::nullopt;
    }

    std::string result{"grub-install --target="};
    result += grub_install_config.is_efi ? "x86_64-efi"sv : "i386-pc"sv;

    if (grub_install_config.is_efi && grub_install_config.efi_directory) {
        result += fmt::format(FMT_COMPILE(" --efi-directory={}"), *grub_install_config.efi_directory);
    }
    if (grub_install_config.is_efi && grub_install_config.bootloader_id) {
        result += fmt::format(FMT_COMPILE(" --bootloader-id={}"), *grub_install_config.bootloader_id);
    }
    if (grub_install_config.do_recheck) {
        result += " --recheck";
    }
    if (!grub_install_config.is_efi) {
        result += fmt::format(FMT_COMPILE(" {}"), *grub_install_config.device);
    }
    return std::make_optional<std::string>(std::move(result));
}

auto install_grub(utils::CommandRunner& runner, const GrubInstallConfig& grub_install_config, std::string_view root_mountpoint) noexcept -> bool {
    const auto& grub_install_cmd = gen_grub_install_command(grub_install_config);
    if (!grub_install_cmd) {
        return false;
    }

    // Install grub on the system
    if (!runner.chroot_checked(*grub_install_cmd, root_mountpoint)) {
        spdlog::error("Failed to install grub on path {} with: {}", root_mountpoint, *grub_install_cmd);
        return false;
    }

    // Generate grub configuration on the boot partition
    static constexpr auto grub_config_cmd = "grub-mkconfig -o /boot/grub/grub.cfg"sv;
    if (!runner.chroot_checked(grub_config_cmd, root_mountpoint)) {
        spdlog::error("Failed to generate grub on path {} with: {}", root_mountpoint, grub_config_cmd);
        return false;
    }

    return true;
}

}  // namespace archi::bootloader
