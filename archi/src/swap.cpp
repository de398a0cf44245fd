#include "archi/swap.hpp"
#include "archi/file_utils.hpp"
#include "archi/io_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace archi::swap {

auto swapfile_path(std::string_view root_mountpoint) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{}/swapfile"), root_mountpoint);
}

auto make_swapfile(utils::CommandRunner& runner, std::string_view root_mountpoint, std::uint32_t size_mb) noexcept -> bool {
    const auto& swapfile = swapfile_path(root_mountpoint);

    // allocate size for the file, not every filesystem supports fallocate
    const auto& alloc_cmd = fmt::format(FMT_COMPILE("fallocate -l {}M {}"), size_mb, swapfile);
    if (!runner.run_checked(alloc_cmd)) {
        spdlog::warn("fallocate failed, falling back to dd: {}", alloc_cmd);
        const auto& dd_cmd = fmt::format(FMT_COMPILE("dd if=/dev/zero of={} bs=1M count={} status=none"), swapfile, size_mb);
        if (!runner.run_checked(dd_cmd)) {
            spdlog::error("Failed to allocate swapfile: {}", dd_cmd);
            return false;
        }
    }

    // create swap
    if (!runner.run_checked(fmt::format(FMT_COMPILE("chmod 600 {}"), swapfile))
        || !runner.run_checked(fmt::format(FMT_COMPILE("mkswap {}"), swapfile))) {
        spdlog::error("Failed to run mkswap on {}", swapfile);
        return false;
    }

    // enable swap on file
    if (!runner.run_checked(fmt::format(FMT_COMPILE("swapon {}"), swapfile))) {
        spdlog::error("Failed to run swapon on {}", swapfile);
        return false;
    }
    return true;
}

auto remove_swapfile(utils::CommandRunner& runner, std::string_view root_mountpoint) noexcept -> bool {
    const auto& swapfile = swapfile_path(root_mountpoint);
    if (!runner.run_checked(fmt::format(FMT_COMPILE("swapoff {}"), swapfile))) {
        spdlog::warn("Failed to run swapoff on {}", swapfile);
    }
    if (!runner.run_checked(fmt::format(FMT_COMPILE("rm -f {}"), swapfile))) {
        spdlog::error("Failed to remove {}", swapfile);
        return false;
    }
    return true;
}

auto gen_zram_config() noexcept -> std::string {
    return "[zram0]\nzram-size = ram / 2\ncompression-algorithm = lz4\n";
}

auto write_zram_config(std::string_view root_mountpoint) noexcept -> bool {
    const auto& zram_config_path = fmt::format(FMT_COMPILE("{}/etc/systemd/zram-generator.conf"), root_mountpoint);
    if (!file_utils::create_file_for_overwrite(zram_config_path, gen_zram_config())) {
        spdlog::error("Failed to open zram config for writing {}", zram_config_path);
        return false;
    }
    return true;
}

}  // namespace archi::swap
