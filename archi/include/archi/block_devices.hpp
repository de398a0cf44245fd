#ifndef BLOCK_DEVICES_HPP
#define BLOCK_DEVICES_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::disk {

/// @brief One node below a disk in the lsblk tree
struct BlockNode final {
    /// Device path, e.g. /dev/sda1 or /dev/mapper/cryptroot
    std::string name;
    /// lsblk type: part, crypt, lvm, raid1, ...
    std::string type;
    /// Mountpoint if mounted, "[SWAP]" for active swap
    std::optional<std::string> mountpoint;
};

/// @brief Live state of a block device
struct BlockDevice final {
    std::string device;
    std::optional<std::string> pttype;
    /// Every descendant in depth-first order
    std::vector<BlockNode> nodes;

    /// Partition device nodes in table order
    [[nodiscard]] auto partitions() const noexcept -> std::vector<std::string>;
    /// Nodes which are mounted (swap excluded)
    [[nodiscard]] auto mounted_nodes() const noexcept -> std::vector<BlockNode>;
    /// Encrypted mappings stacked on the device
    [[nodiscard]] auto crypt_nodes() const noexcept -> std::vector<BlockNode>;
    /// Device-mapper or md nodes (crypt, lvm, raid*)
    [[nodiscard]] auto holder_nodes() const noexcept -> std::vector<BlockNode>;

    [[nodiscard]] auto has_partition_table() const noexcept -> bool;
    /// Busy means something still holds the device: a mount, active swap or a stacked mapping.
    [[nodiscard]] auto is_busy() const noexcept -> bool;
};

/// @brief Parses the JSON output of `lsblk -J -p -o NAME,TYPE,MOUNTPOINT,PTTYPE <device>`
/// @return BlockDevice of the first top-level entry, std::nullopt on error
auto parse_device_tree_json(std::string_view json_output) noexcept -> std::optional<BlockDevice>;

/// @brief Query the current state of the device
auto query_block_device(utils::CommandRunner& runner, std::string_view device) noexcept -> std::optional<BlockDevice>;

}  // namespace archi::disk

#endif  // BLOCK_DEVICES_HPP
