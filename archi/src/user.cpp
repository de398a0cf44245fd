#include "archi/user.hpp"
#include "archi/file_utils.hpp"
#include "archi/io_utils.hpp"
#include "archi/string_utils.hpp"

#include <filesystem>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <range/v3/algorithm/contains.hpp>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace fs = std::filesystem;

using namespace std::string_view_literals;

namespace archi::user {

auto default_user_groups() noexcept -> std::vector<std::string> {
    return {"wheel", "audio", "video", "input"};
}

auto set_user_password(utils::CommandRunner& runner, std::string_view username, std::string_view password, std::string_view mountpoint) noexcept -> bool {
    // chpasswd reads "name:password" from stdin, the secret never shows up in argv
    const auto& chpasswd_cmd = utils::make_chroot_cmd("chpasswd"sv, mountpoint);
    const auto& credential   = fmt::format(FMT_COMPILE("{}:{}\n"), username, password);
    if (!runner.run_with_input(chpasswd_cmd, credential).success()) {
        spdlog::error("Failed to set password for user {}", username);
        return false;
    }
    return true;
}

auto create_new_user(utils::CommandRunner& runner, const user::UserInfo& user_info, const std::vector<std::string>& default_groups, std::string_view mountpoint) noexcept -> bool {
    if (!user_info.sudoers_group.empty() && !ranges::contains(default_groups, user_info.sudoers_group)) {
        spdlog::error("Failed to create user {}! User default groups doesn't contain sudoers group({})", user_info.username, user_info.sudoers_group);
        return false;
    }

    // Create the user
    spdlog::info("Creating user {}", user_info.username);
    const auto& usercmd = [&default_groups](auto&& username, auto&& user_shell) -> std::string {
        static constexpr auto USER_BASE_CMD = "useradd -m"sv;
        std::string result{USER_BASE_CMD};
        if (!default_groups.empty()) {
            result += fmt::format(FMT_COMPILE(" -G {}"), utils::join(default_groups, ","));
        }
        if (!user_shell.empty()) {
            result += fmt::format(FMT_COMPILE(" -s {}"), user_shell);
        }
        return fmt::format(FMT_COMPILE("{} {}"), result, username);
    }(user_info.username, user_info.shell);

    if (!runner.chroot_checked(usercmd, mountpoint)) {
        spdlog::error("Failed to create user with {}", usercmd);
        return false;
    }

    // Set user password
    if (!set_user_password(runner, user_info.username, user_info.password, mountpoint)) {
        return false;
    }

    // Setup sudoers
    if (user_info.sudoers_group.empty()) {
        spdlog::info("skipping sudoers group is empty");
        return true;
    }
    return enable_group_sudo(user_info.sudoers_group, mountpoint);
}

auto enable_group_sudo(std::string_view group, std::string_view mountpoint) noexcept -> bool {
    const auto& sudoers_filepath = fmt::format(FMT_COMPILE("{}/etc/sudoers.d/10-installer"), mountpoint);
    {
        const auto& sudoers_line = fmt::format(FMT_COMPILE("%{} ALL=(ALL:ALL) ALL\n"), group);
        if (!file_utils::create_file_for_overwrite(sudoers_filepath, sudoers_line)) {
            spdlog::error("Failed to open sudoers for writing {}", sudoers_filepath);
            return false;
        }
    }

    std::error_code err{};
    fs::permissions(sudoers_filepath,
        fs::perms::owner_read | fs::perms::group_read,  // 0440
        fs::perm_options::replace, err);
    if (err) {
        spdlog::error("Failed to set permissions for sudoers file: {}", err.message());
        return false;
    }
    return true;
}

auto set_hostname(std::string_view hostname, std::string_view mountpoint) noexcept -> bool {
    {
        const auto& hostname_filepath = fmt::format(FMT_COMPILE("{}/etc/hostname"), mountpoint);
        const auto& hostname_line     = fmt::format(FMT_COMPILE("{}\n"), hostname);
        if (!file_utils::create_file_for_overwrite(hostname_filepath, hostname_line)) {
            spdlog::error("Failed to open hostname for writing {}", hostname_filepath);
            return false;
        }
    }

    if (!user::set_hosts(hostname, mountpoint)) {
        spdlog::error("Failed to set hosts");
        return false;
    }
    return true;
}

auto set_hosts(std::string_view hostname, std::string_view mountpoint) noexcept -> bool {
    static constexpr auto STANDARD_HOSTS = R"(127.0.0.1  localhost
::1        localhost
)"sv;
    static constexpr auto REQUESTED_HOST = "127.0.1.1  {0}.localdomain {0}\n";

    const auto& hosts_filepath = fmt::format(FMT_COMPILE("{}/etc/hosts"), mountpoint);
    const auto& hosts_text     = fmt::format(FMT_COMPILE("{}{}"), STANDARD_HOSTS, hostname.empty() ? std::string{} : fmt::format(REQUESTED_HOST, hostname));
    if (!file_utils::create_file_for_overwrite(hosts_filepath, hosts_text)) {
        spdlog::error("Failed to open hosts for writing {}", hosts_filepath);
        return false;
    }
    return true;
}

auto set_root_password(utils::CommandRunner& runner, std::string_view password, std::string_view mountpoint) noexcept -> bool {
    return set_user_password(runner, "root"sv, password, mountpoint);
}

}  // namespace archi::user
