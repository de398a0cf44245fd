#ifndef USER_HPP
#define USER_HPP

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::user {

struct UserInfo final {
    std::string_view username;
    std::string_view password;
    std::string_view shell;
    std::string_view sudoers_group;
};

// Supplementary groups granting desktop, audio, video and input access
auto default_user_groups() noexcept -> std::vector<std::string>;

// Set user password on the system
auto set_user_password(utils::CommandRunner& runner, std::string_view username, std::string_view password, std::string_view mountpoint) noexcept -> bool;

// Create user on the system
auto create_new_user(utils::CommandRunner& runner, const user::UserInfo& user_info, const std::vector<std::string>& default_groups, std::string_view mountpoint) noexcept -> bool;

// Allow members of the group to escalate privileges
auto enable_group_sudo(std::string_view group, std::string_view mountpoint) noexcept -> bool;

// Set system hostname
auto set_hostname(std::string_view hostname, std::string_view mountpoint) noexcept -> bool;

// Set system hosts
auto set_hosts(std::string_view hostname, std::string_view mountpoint) noexcept -> bool;

// Set password for root user
auto set_root_password(utils::CommandRunner& runner, std::string_view password, std::string_view mountpoint) noexcept -> bool;

}  // namespace archi::user

#endif  // USER_HPP
