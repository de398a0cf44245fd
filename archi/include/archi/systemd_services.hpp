#ifndef SYSTEMD_SERVICES_HPP
#define SYSTEMD_SERVICES_HPP

#include <string_view>  // for string_view

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::services {

// Enables systemd service on the system
auto enable_systemd_service(utils::CommandRunner& runner, std::string_view service_name, std::string_view root_mountpoint) noexcept -> bool;

// Disables systemd service on the system
auto disable_systemd_service(utils::CommandRunner& runner, std::string_view service_name, std::string_view root_mountpoint) noexcept -> bool;

}  // namespace archi::services

#endif  // SYSTEMD_SERVICES_HPP
