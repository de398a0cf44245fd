#include "archi/partitioning.hpp"
#include "archi/block_devices.hpp"
#include "archi/io_utils.hpp"
#include "archi/mount_partitions.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace archi::disk {

auto wipe_device(utils::CommandRunner& runner, std::string_view device) noexcept -> bool {
    if (!runner.run_checked(fmt::format(FMT_COMPILE("wipefs -a {}"), device))) {
        spdlog::warn("wipefs rejected '{}', retrying after udev settles", device);
        if (!runner.run_checked("udevadm settle"sv)) {
            spdlog::debug("udevadm settle failed");
        }
        if (!runner.run_checked(fmt::format(FMT_COMPILE("wipefs -f -a {}"), device))) {
            spdlog::error("Failed to wipe signatures on '{}'", device);
            return false;
        }
    }

    if (!runner.run_checked(fmt::format(FMT_COMPILE("sgdisk -Z {}"), device))) {
        spdlog::error("Failed to zap partition table on '{}'", device);
        return false;
    }
    return true;
}

auto gen_layout_commands(std::string_view device, bool is_efi) noexcept -> std::vector<std::string> {
    if (is_efi) {
        return {
            fmt::format(FMT_COMPILE(R"(sgdisk -n 1:0:+512M -t 1:ef00 -c 1:"EFI System" {})"), device),
            fmt::format(FMT_COMPILE(R"(sgdisk -n 2:0:0 -t 2:8300 -c 2:"Linux Root" {})"), device),
        };
    }
    // 1MiB offset keeps the partition aligned
    return {
        fmt::format(FMT_COMPILE("parted -s {} mklabel msdos"), device),
        fmt::format(FMT_COMPILE("parted -s {} mkpart primary ext4 1MiB 100%"), device),
    };
}

auto create_default_layout(utils::CommandRunner& runner, std::string_view device, bool is_efi, std::string_view staging_mountpoint) noexcept -> std::expected<PartitionLayout, std::string> {
    if (!wipe_device(runner, device)) {
        return std::unexpected(fmt::format(FMT_COMPILE("failed to wipe '{}'"), device));
    }

    for (const auto& layout_cmd : gen_layout_commands(device, is_efi)) {
        if (!runner.run_checked(layout_cmd)) {
            spdlog::error("Partitioning command failed: '{}'", layout_cmd);
            return std::unexpected(fmt::format(FMT_COMPILE("failed to partition '{}'"), device));
        }
    }

    // let the kernel and udev catch up before looking for the new nodes
    if (!runner.run_checked(fmt::format(FMT_COMPILE("partprobe {}"), device))) {
        spdlog::warn("partprobe failed on '{}'", device);
    }
    if (!runner.run_checked("udevadm settle"sv)) {
        spdlog::warn("udevadm settle failed");
    }

    const auto& device_state = query_block_device(runner, device);
    if (!device_state) {
        return std::unexpected(fmt::format(FMT_COMPILE("failed to read partitions of '{}'"), device));
    }
    const auto& partitions     = device_state->partitions();
    const std::size_t expected = is_efi ? 2 : 1;
    if (partitions.size() < expected) {
        spdlog::error("Expected {} partition(s) on '{}', found {}", expected, device, partitions.size());
        return std::unexpected(fmt::format(FMT_COMPILE("partitions missing on '{}'"), device));
    }

    PartitionLayout layout{};
    if (is_efi) {
        layout.efi_device  = partitions[0];
        layout.root_device = partitions[1];
    } else {
        layout.root_device = partitions[0];
    }

    if (layout.efi_device && !runner.run_checked(fmt::format(FMT_COMPILE("mkfs.fat -F32 {}"), *layout.efi_device))) {
        return std::unexpected(fmt::format(FMT_COMPILE("failed to format EFI partition '{}'"), *layout.efi_device));
    }
    if (!runner.run_checked(fmt::format(FMT_COMPILE("mkfs.ext4 -F {}"), layout.root_device))) {
        return std::unexpected(fmt::format(FMT_COMPILE("failed to format root partition '{}'"), layout.root_device));
    }

    if (!mount::mount_partition(runner, layout.root_device, staging_mountpoint)) {
        return std::unexpected(fmt::format(FMT_COMPILE("failed to mount root partition '{}'"), layout.root_device));
    }
    if (layout.efi_device) {
        const auto& boot_dir = fmt::format(FMT_COMPILE("{}/boot"), staging_mountpoint);
        if (!mount::mount_partition(runner, *layout.efi_device, boot_dir)) {
            return std::unexpected(fmt::format(FMT_COMPILE("failed to mount EFI partition '{}'"), *layout.efi_device));
        }
    }

    spdlog::info("Layout ready on '{}': root='{}' efi='{}'", device, layout.root_device, layout.efi_device.value_or("-"));
    return layout;
}

}  // namespace archi::disk
