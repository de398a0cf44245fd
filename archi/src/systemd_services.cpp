#include "archi/systemd_services.hpp"
#include "archi/io_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace archi::services {

auto enable_systemd_service(utils::CommandRunner& runner, std::string_view service_name, std::string_view root_mountpoint) noexcept -> bool {
    // Enable service
    const auto& systemctl_cmd = fmt::format(FMT_COMPILE("systemctl enable {}"), service_name);
    if (!runner.chroot_checked(systemctl_cmd, root_mountpoint)) {
        spdlog::error("Failed to enable systemd service on {}: {}", root_mountpoint, service_name);
        return false;
    }

    return true;
}

auto disable_systemd_service(utils::CommandRunner& runner, std::string_view service_name, std::string_view root_mountpoint) noexcept -> bool {
    const auto& systemctl_cmd = fmt::format(FMT_COMPILE("systemctl disable {}"), service_name);
    if (!runner.chroot_checked(systemctl_cmd, root_mountpoint)) {
        spdlog::error("Failed to disable systemd service on {}: {}", root_mountpoint, service_name);
        return false;
    }

    return true;
}

}  // namespace archi::services
