#include "archi/mirrors.hpp"
#include "archi/file_utils.hpp"
#include "archi/io_utils.hpp"
#include "archi/pacmanconf.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

constexpr auto KERNEL_ORG_MIRROR = "https://mirrors.edge.kernel.org/archlinux/$repo/os/$arch"sv;
constexpr auto GEO_MIRROR        = archi::mirrors::FALLBACK_MIRROR;

auto rank_mirrors(archi::utils::CommandRunner& runner, const archi::mirrors::MirrorPaths& paths) noexcept -> bool {
    if (!runner.run_checked("pacman -Sy --noconfirm --needed reflector"sv)) {
        spdlog::warn("[mirrors] reflector unavailable, keeping current mirrorlist");
        return false;
    }

    const auto& previous_list = archi::file_utils::read_whole_file(paths.mirrorlist);

    const std::vector<std::string> reflector_cmd{"reflector", "--protocol", "https", "--latest", "20",
        "--sort", "rate", "--save", paths.mirrorlist};
    const auto& result = runner.run_timed(reflector_cmd, archi::mirrors::RANKING_TIMEOUT);
    if (result.success()) {
        return true;
    }

    if (result.timed_out) {
        spdlog::warn("[mirrors] mirror ranking exceeded {}s", archi::mirrors::RANKING_TIMEOUT.count());
    } else {
        spdlog::warn("[mirrors] mirror ranking failed with {}", result.exit_code);
    }
    // reflector could have left a partial file behind
    if (!previous_list.empty() && !archi::file_utils::write_to_file(previous_list, paths.mirrorlist)) {
        spdlog::error("[mirrors] failed to restore '{}'", paths.mirrorlist);
    }
    return false;
}

}  // namespace

namespace archi::mirrors {

auto mirror_mode_to_string(MirrorMode mode) noexcept -> std::string_view {
    switch (mode) {
    case MirrorMode::Auto:
        return "auto"sv;
    case MirrorMode::Stable:
        return "stable"sv;
    case MirrorMode::Us:
        return "us"sv;
    case MirrorMode::Eu:
        return "eu"sv;
    case MirrorMode::Asia:
        return "asia"sv;
    case MirrorMode::Safe:
        return "safe"sv;
    }
    return "auto"sv;
}

auto string_to_mirror_mode(std::string_view mode) noexcept -> std::optional<MirrorMode> {
    if (mode == "auto"sv) {
        return MirrorMode::Auto;
    } else if (mode == "stable"sv) {
        return MirrorMode::Stable;
    } else if (mode == "us"sv) {
        return MirrorMode::Us;
    } else if (mode == "eu"sv) {
        return MirrorMode::Eu;
    } else if (mode == "asia"sv) {
        return MirrorMode::Asia;
    } else if (mode == "safe"sv) {
        return MirrorMode::Safe;
    }
    return std::nullopt;
}

auto effective_mirror_mode(MirrorMode mode, bool safe_profile) noexcept -> MirrorMode {
    if (safe_profile && mode == MirrorMode::Auto) {
        return MirrorMode::Safe;
    }
    return mode;
}

auto mirror_servers(MirrorMode mode) noexcept -> std::vector<std::string_view> {
    switch (mode) {
    case MirrorMode::Stable:
        return {KERNEL_ORG_MIRROR, GEO_MIRROR};
    case MirrorMode::Us:
        return {KERNEL_ORG_MIRROR, "https://mirror.rackspace.com/archlinux/$repo/os/$arch"sv, GEO_MIRROR};
    case MirrorMode::Eu:
        return {KERNEL_ORG_MIRROR, "https://ftp.halifax.rwth-aachen.de/archlinux/$repo/os/$arch"sv,
            "https://mirror.netcologne.de/archlinux/$repo/os/$arch"sv, GEO_MIRROR};
    case MirrorMode::Asia:
        return {KERNEL_ORG_MIRROR, "https://ftp.jaist.ac.jp/pub/Linux/ArchLinux/$repo/os/$arch"sv,
            "https://download.nus.edu.sg/mirror/archlinux/$repo/os/$arch"sv, GEO_MIRROR};
    case MirrorMode::Auto:
    case MirrorMode::Safe:
        return {};
    }
    return {};
}

auto apply_safe_download_settings(std::string_view pacman_conf) noexcept -> bool {
    return pacmanconf::set_option_in_file(pacman_conf, "ParallelDownloads"sv, "1"sv)
        && pacmanconf::set_option_in_file(pacman_conf, "DisableDownloadTimeout"sv, ""sv);
}

auto apply_mirror_mode(utils::CommandRunner& runner, MirrorMode mode, const MirrorPaths& paths) noexcept -> MirrorMode {
    spdlog::info("[mirrors] applying mode '{}'", mirror_mode_to_string(mode));
    if (!runner.run_checked("pacman -Sy --noconfirm --needed archlinux-keyring"sv)) {
        spdlog::warn("[mirrors] keyring refresh failed");
    }

    switch (mode) {
    case MirrorMode::Auto:
        if (!rank_mirrors(runner, paths)) {
            spdlog::info("[mirrors] default mirrorlist kept");
        }
        return MirrorMode::Auto;
    case MirrorMode::Safe:
        if (!apply_safe_download_settings(paths.pacman_conf)) {
            spdlog::warn("[mirrors] failed to apply safe download settings to '{}'", paths.pacman_conf);
        }
        return MirrorMode::Safe;
    case MirrorMode::Stable:
    case MirrorMode::Us:
    case MirrorMode::Eu:
    case MirrorMode::Asia:
        break;
    }

    const auto& mirrorlist = pacmanconf::gen_mirrorlist(mirror_servers(mode));
    if (!file_utils::create_file_for_overwrite(paths.mirrorlist, mirrorlist)) {
        spdlog::warn("[mirrors] failed to write '{}', keeping previous list", paths.mirrorlist);
        return mode;
    }
    if (!runner.run_checked("pacman -Syy --noconfirm"sv)) {
        spdlog::warn("[mirrors] database refresh failed");
    }
    return mode;
}

}  // namespace archi::mirrors
