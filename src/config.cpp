#include "config.hpp"
#include "installer_config.hpp"

#include <spdlog/spdlog.h>

namespace installer {

void apply_config_overrides(RuntimeSettings& settings, const InstallerConfig& config) noexcept {
    if (config.mountpoint) {
        spdlog::info("Using mountpoint '{}' from config", *config.mountpoint);
        settings.mountpoint = *config.mountpoint;
    }
    if (config.template_dir) {
        settings.template_dir = *config.template_dir;
    }
    if (config.catalog_url) {
        settings.catalog_url = *config.catalog_url;
    }
    if (config.hostname) {
        settings.hostname = *config.hostname;
    }
}

}  // namespace installer
