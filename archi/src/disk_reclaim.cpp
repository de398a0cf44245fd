#include "archi/disk_reclaim.hpp"
#include "archi/block_devices.hpp"
#include "archi/io_utils.hpp"

#include <algorithm>  // for sort
#include <ranges>     // for ranges::*

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

void run_step(archi::utils::CommandRunner& runner, std::string_view command, archi::disk::ReclaimReport& report) noexcept {
    if (!runner.run_checked(command)) {
        spdlog::debug("[reclaim] step failed (ignored): '{}'", command);
        report.failed_steps.emplace_back(command);
    }
}

}  // namespace

namespace archi::disk {

auto reclaim_device(utils::CommandRunner& runner, std::string_view device, std::string_view staging_mountpoint) noexcept -> ReclaimReport {
    ReclaimReport report{};
    spdlog::info("[reclaim] releasing '{}'", device);

    // (a) our own staging tree from a previous run
    if (runner.run_checked(fmt::format(FMT_COMPILE("mountpoint -q {}"), staging_mountpoint))) {
        run_step(runner, fmt::format(FMT_COMPILE("umount -R {}"), staging_mountpoint), report);
    }

    const auto& initial_state = query_block_device(runner, device);
    if (!initial_state) {
        spdlog::warn("[reclaim] could not read state of '{}', running blind", device);
    }

    // (b) deepest mountpoints first
    if (initial_state) {
        auto mounted = initial_state->mounted_nodes();
        std::ranges::sort(mounted, std::ranges::greater{}, [](auto&& node) { return node.mountpoint->size(); });
        for (const auto& node : mounted) {
            run_step(runner, fmt::format(FMT_COMPILE("umount -lf {}"), node.name), report);
        }
    }

    // (c)
    run_step(runner, "swapoff -a"sv, report);

    // (d) inner mappings close before the ones they sit on
    if (initial_state) {
        auto crypts = initial_state->crypt_nodes();
        for (const auto& node : crypts | std::views::reverse) {
            run_step(runner, fmt::format(FMT_COMPILE("cryptsetup close {}"), node.name), report);
        }
    }

    // (e)
    run_step(runner, "vgchange -an"sv, report);
    run_step(runner, "mdadm --stop --scan"sv, report);

    // (f) whatever survived the previous steps
    const auto& current_state = query_block_device(runner, device);
    if (current_state) {
        const auto& holders = current_state->holder_nodes();
        for (const auto& node : holders | std::views::reverse) {
            if (node.type.starts_with("raid"sv)) {
                run_step(runner, fmt::format(FMT_COMPILE("mdadm --stop {}"), node.name), report);
                continue;
            }
            run_step(runner, fmt::format(FMT_COMPILE("dmsetup remove -f {}"), node.name), report);
        }
    }

    // (g)
    run_step(runner, "udevadm settle"sv, report);
    run_step(runner, fmt::format(FMT_COMPILE("partprobe {}"), device), report);
    run_step(runner, fmt::format(FMT_COMPILE("blockdev --rereadpt {}"), device), report);

    const auto& final_state = query_block_device(runner, device);
    report.device_free      = final_state.has_value() && !final_state->is_busy();
    if (report.device_free) {
        spdlog::info("[reclaim] '{}' is free ({} step(s) reported failure)", device, report.failed_steps.size());
    } else {
        spdlog::warn("[reclaim] '{}' still looks busy after reclaim", device);
    }
    return report;
}

}  // namespace archi::disk
