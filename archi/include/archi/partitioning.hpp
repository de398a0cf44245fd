#ifndef PARTITIONING_HPP
#define PARTITIONING_HPP

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::disk {

/// @brief Mounted result of the default layout
struct PartitionLayout final {
    /// Root partition device, mounted at the staging mountpoint
    std::string root_device;
    /// EFI system partition, mounted at <staging>/boot. Only set under UEFI.
    std::optional<std::string> efi_device;
};

/// @brief Remove all signatures and partition table metadata from the device.
/// The first wipe is retried once with force after udev settles.
auto wipe_device(utils::CommandRunner& runner, std::string_view device) noexcept -> bool;

/// @brief Generates commands which create the default layout.
/// UEFI: GPT with 512MiB ESP followed by a root partition spanning the rest.
/// BIOS: MBR with single root partition starting at 1MiB.
auto gen_layout_commands(std::string_view device, bool is_efi) noexcept -> std::vector<std::string>;

/// @brief Wipe the device, create the default layout, format and mount it.
///
/// Partition nodes are read back from lsblk after partitioning. Any failure
/// past the wipe is fatal, the device content is already gone.
auto create_default_layout(utils::CommandRunner& runner, std::string_view device, bool is_efi, std::string_view staging_mountpoint) noexcept -> std::expected<PartitionLayout, std::string>;

}  // namespace archi::disk

#endif  // PARTITIONING_HPP
