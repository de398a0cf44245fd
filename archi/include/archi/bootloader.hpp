#ifndef BOOTLOADER_HPP
#define BOOTLOADER_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::bootloader {

struct GrubInstallConfig final {
    bool is_efi{};
    bool do_recheck{true};
    std::optional<std::string> efi_directory{};
    std::optional<std::string> bootloader_id{};
    // e.g /dev/sda, MBR target for BIOS installs
    std::optional<std::string> device{};
};

// Default grub-install settings for the firmware mode
auto make_grub_install_config(bool is_efi, std::string_view device) noexcept -> GrubInstallConfig;

// Generate grub-install command line
auto gen_grub_install_command(const GrubInstallConfig& grub_install_config) noexcept -> std::optional<std::string>;

// Installs grub and generates its menu on system
auto install_grub(utils::CommandRunner& runner, const GrubInstallConfig& grub_install_config, std::string_view root_mountpoint) noexcept -> bool;

}  // namespace archi::bootloader

#endif  // BOOTLOADER_HPP
