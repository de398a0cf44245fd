#ifndef FSTAB_HPP
#define FSTAB_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::fs {

// Generates fstab using genfstab -U and appends it to the target's fstab
auto append_generated_fstab(utils::CommandRunner& runner, std::string_view root_mountpoint) noexcept -> bool;

// Swap relatime for noatime in the options column of every entry
auto prefer_noatime(std::string_view fstab_content) noexcept -> std::string;

// Rewrite fstab on the system with noatime mount options
auto apply_noatime(std::string_view root_mountpoint) noexcept -> bool;

}  // namespace archi::fs

#endif  // FSTAB_HPP
