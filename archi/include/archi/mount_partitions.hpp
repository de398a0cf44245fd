#ifndef MOUNT_PARTITIONS_HPP
#define MOUNT_PARTITIONS_HPP

#include <string_view>  // for string_view

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::mount {

// Mount partition on the directory, creating the directory when missing
auto mount_partition(utils::CommandRunner& runner, std::string_view partition, std::string_view mount_dir, std::string_view mount_opts = {}) noexcept -> bool;

}  // namespace archi::mount

#endif  // MOUNT_PARTITIONS_HPP
