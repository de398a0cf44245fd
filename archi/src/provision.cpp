#include "archi/provision.hpp"
#include "archi/file_utils.hpp"
#include "archi/io_utils.hpp"
#include "archi/pacmanconf.hpp"
#include "archi/string_utils.hpp"
#include "archi/swap.hpp"

#include <charconv>  // for from_chars

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

auto run_install_attempt(archi::utils::CommandRunner& runner, const archi::provision::ProvisionConfig& config,
    std::string_view install_cmd, std::uint32_t number, std::string_view mirror_config) noexcept -> archi::provision::ProvisionAttempt {
    spdlog::info("[provision] attempt {}/{}: '{}'", number, archi::provision::MAX_INSTALL_ATTEMPTS, install_cmd);
    const auto& result = runner.run(install_cmd);

    // first attempt starts a fresh log, the retry is appended to it
    const bool is_written = (number == 1)
        ? archi::file_utils::create_file_for_overwrite(config.install_log, result.output)
        : archi::file_utils::append_to_file(result.output, config.install_log);
    if (!is_written) {
        spdlog::warn("[provision] failed to write '{}'", config.install_log);
    }

    return archi::provision::ProvisionAttempt{
        .number        = number,
        .mirror_config = std::string{mirror_config},
        .exit_code     = result.exit_code,
        .output_tail   = archi::utils::tail_lines(result.output, archi::provision::DIAGNOSTIC_TAIL_LINES),
    };
}

}  // namespace

namespace archi::provision {

auto parse_df_available_kb(std::string_view df_output) noexcept -> std::optional<std::uint64_t> {
    // Filesystem 1024-blocks Used Available Capacity Mounted on
    const auto& lines = utils::make_multiline_view(df_output);
    if (lines.size() < 2) {
        return std::nullopt;
    }
    const auto& columns = utils::make_multiline_view(lines[1], false, ' ');
    if (columns.size() < 4) {
        return std::nullopt;
    }
    const auto available = columns[3];
    std::uint64_t result{0};
    const auto [ptr, ec] = std::from_chars(available.data(), available.data() + available.size(), result);
    if (ec != std::errc{} || ptr != available.data() + available.size()) {
        return std::nullopt;
    }
    return result;
}

auto gen_install_command(std::string_view mountpoint, const std::vector<std::string>& packages, bool safe_profile) noexcept -> std::string {
    const auto& pacstrap_cmd = fmt::format(FMT_COMPILE("pacstrap -K {} {}"), mountpoint, fmt::join(packages, " "));
    if (safe_profile) {
        return fmt::format(FMT_COMPILE("nice -n 10 ionice -c2 -n7 {}"), pacstrap_cmd);
    }
    return pacstrap_cmd;
}

void prepare_target(utils::CommandRunner& runner, std::string_view mountpoint) noexcept {
    if (!runner.run_checked("timedatectl set-ntp true"sv)) {
        spdlog::warn("[provision] time synchronization request failed");
    }
    if (!runner.run_checked(fmt::format(FMT_COMPILE("rm -f {}/var/lib/pacman/db.lck"), mountpoint))) {
        spdlog::warn("[provision] failed to remove stale database lock");
    }
}

auto apply_fallback_mirror(utils::CommandRunner& runner, const mirrors::MirrorPaths& paths) noexcept -> bool {
    const auto& mirrorlist = pacmanconf::gen_mirrorlist({mirrors::FALLBACK_MIRROR});
    if (!file_utils::create_file_for_overwrite(paths.mirrorlist, mirrorlist)) {
        spdlog::error("[provision] failed to write fallback mirrorlist '{}'", paths.mirrorlist);
        return false;
    }
    if (!pacmanconf::set_option_in_file(paths.pacman_conf, "ParallelDownloads"sv, "1"sv)) {
        spdlog::warn("[provision] failed to limit parallel downloads in '{}'", paths.pacman_conf);
    }
    if (!runner.run_checked("pacman -Syy --noconfirm archlinux-keyring"sv)) {
        spdlog::warn("[provision] keyring refresh failed");
    }
    return true;
}

auto provision_packages(utils::CommandRunner& runner, const ProvisionConfig& config, const std::vector<std::string>& packages) noexcept
    -> std::expected<ProvisionReport, ProvisionError> {
    ProvisionReport report{};
    prepare_target(runner, config.mountpoint);

    const auto& df_result = runner.run(fmt::format(FMT_COMPILE("df -Pk {}"), config.mountpoint));
    if (df_result.success()) {
        report.available_kb = parse_df_available_kb(df_result.output);
    }
    if (report.available_kb && *report.available_kb < LOW_SPACE_WARNING_KB) {
        spdlog::warn("[provision] only {} KiB free on target, the install may not fit", *report.available_kb);
    }

    // the swapfile goes on the target disk, the live medium runs from RAM
    bool swap_attempted{false};
    if (config.low_memory && report.available_kb) {
        const auto swap_mb = swap::temp_swap_size_mb(*report.available_kb);
        if (swap_mb > 0) {
            swap_attempted = true;
            if (swap::make_swapfile(runner, config.mountpoint, swap_mb)) {
                report.swap_mb = swap_mb;
            } else {
                spdlog::warn("[provision] continuing without temporary swap");
            }
        } else {
            spdlog::info("[provision] not enough free space for temporary swap");
        }
    }

    const auto& install_cmd = gen_install_command(config.mountpoint, packages, config.safe_profile);
    report.attempts.emplace_back(run_install_attempt(runner, config, install_cmd, 1, OPERATOR_MIRRORS));

    if (report.attempts.back().exit_code != 0) {
        spdlog::warn("[provision] install failed with {}, retrying once with fallback mirror", report.attempts.back().exit_code);
        if (!apply_fallback_mirror(runner, config.mirror_paths)) {
            spdlog::warn("[provision] retrying with the current mirror configuration");
        }
        report.attempts.emplace_back(run_install_attempt(runner, config, install_cmd, 2, mirrors::FALLBACK_MIRROR));
    }

    if (swap_attempted && !swap::remove_swapfile(runner, config.mountpoint)) {
        spdlog::warn("[provision] temporary swapfile was not removed");
    }

    const auto& last_attempt = report.attempts.back();
    if (last_attempt.exit_code != 0) {
        return std::unexpected(ProvisionError{
            .message         = fmt::format(FMT_COMPILE("package installation failed after retry (code {})"), last_attempt.exit_code),
            .diagnostic_tail = last_attempt.output_tail,
            .log_path        = config.install_log,
            .attempts        = std::move(report.attempts),
        });
    }
    return report;
}

}  // namespace archi::provision
