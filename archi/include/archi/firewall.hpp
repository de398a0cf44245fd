#ifndef FIREWALL_HPP
#define FIREWALL_HPP

#include <string_view>  // for string_view

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::firewall {

// Deny incoming, allow outgoing, turn ufw on and enable its unit.
// Every rule is attempted even when a previous one failed
auto configure_ufw(utils::CommandRunner& runner, std::string_view mountpoint) noexcept -> bool;

}  // namespace archi::firewall

#endif  // FIREWALL_HPP
