#ifndef MIRRORS_HPP
#define MIRRORS_HPP

#include <chrono>       // for seconds
#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::mirrors {

enum class MirrorMode : std::uint8_t {
    /// rank mirrors by measured speed
    Auto,
    /// fixed, well-known mirrors
    Stable,
    Us,
    Eu,
    Asia,
    /// keep mirrors, lower download concurrency and disable the download timeout
    Safe,
};

/// Single source used when provisioning has to be retried
inline constexpr std::string_view FALLBACK_MIRROR = "https://geo.mirror.pkgbuild.com/$repo/os/$arch";

/// Time limit of auto mode ranking
inline constexpr std::chrono::seconds RANKING_TIMEOUT{90};

struct MirrorPaths final {
    std::string mirrorlist{"/etc/pacman.d/mirrorlist"};
    std::string pacman_conf{"/etc/pacman.conf"};
};

auto mirror_mode_to_string(MirrorMode mode) noexcept -> std::string_view;
auto string_to_mirror_mode(std::string_view mode) noexcept -> std::optional<MirrorMode>;

/// @brief Auto mode under the safe run profile degrades into safe mode.
auto effective_mirror_mode(MirrorMode mode, bool safe_profile) noexcept -> MirrorMode;

/// @brief Fixed server list of stable and regional modes, empty for others.
auto mirror_servers(MirrorMode mode) noexcept -> std::vector<std::string_view>;

/// @brief Limit downloads to a single connection without timeout.
auto apply_safe_download_settings(std::string_view pacman_conf) noexcept -> bool;

/// @brief Rewrite the package source configuration for the chosen mode.
///
/// Never fatal: every tool call is best-effort. Auto mode keeps the previous
/// mirrorlist when ranking is unavailable, fails or runs out of time.
/// @return Mode which took effect in the end.
auto apply_mirror_mode(utils::CommandRunner& runner, MirrorMode mode, const MirrorPaths& paths) noexcept -> MirrorMode;

}  // namespace archi::mirrors

#endif  // MIRRORS_HPP
