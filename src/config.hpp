#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>  // for string

namespace installer {

struct InstallerConfig;

/// Paths and defaults of a single run, built once in main and passed by const reference.
struct RuntimeSettings final {
    std::string mountpoint{"/mnt"};
    std::string action_log{"/tmp/arch-installer.log"};
    std::string session_log{"/tmp/arch-installer-session.log"};
    std::string install_log{"/tmp/pacstrap.log"};
    std::string mirrorlist{"/etc/pacman.d/mirrorlist"};
    std::string pacman_conf{"/etc/pacman.conf"};
    std::string efivars{"/sys/firmware/efi/efivars"};
    std::string meminfo{"/proc/meminfo"};
    std::string template_dir{"/usr/share/arch-guided-installer/templates"};

    // Package catalog, the local copy is used when the URL can't be fetched
    std::string catalog_url{"file:///etc/arch-guided-installer/package-catalog.toml"};
    std::string catalog_fallback_url{"file:///usr/share/arch-guided-installer/package-catalog.toml"};

    // URL probed to check for an active network connection
    std::string connectivity_url{"https://archlinux.org"};

    std::string hostname{"arch-custom"};
};

/// Apply path overrides given in settings.json.
void apply_config_overrides(RuntimeSettings& settings, const InstallerConfig& config) noexcept;

}  // namespace installer

#endif  // CONFIG_HPP
