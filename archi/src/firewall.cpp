#include "archi/firewall.hpp"
#include "archi/io_utils.hpp"
#include "archi/systemd_services.hpp"

#include <array>  // for array

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace archi::firewall {

auto configure_ufw(utils::CommandRunner& runner, std::string_view mountpoint) noexcept -> bool {
    static constexpr std::array UFW_RULES{
        "ufw default deny incoming"sv,
        "ufw default allow outgoing"sv,
        "ufw --force enable"sv,
    };

    bool is_ok{true};
    for (auto&& rule : UFW_RULES) {
        if (!runner.chroot_checked(rule, mountpoint)) {
            spdlog::warn("Failed to apply firewall rule: {}", rule);
            is_ok = false;
        }
    }
    if (!services::enable_systemd_service(runner, "ufw"sv, mountpoint)) {
        is_ok = false;
    }
    return is_ok;
}

}  // namespace archi::firewall
