#ifndef SWAP_HPP
#define SWAP_HPP

#include <cstdint>      // for uint64_t, uint32_t
#include <string>       // for string
#include <string_view>  // for string_view

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::swap {

/// @brief Size of the temporary install-time swapfile for the given free space.
/// 1024MB from ~1.5GB free, 512MB from ~800MB free, otherwise none.
/// @param available_kb Free space on the target root in KiB.
/// @return Swap size in MB, 0 means no swapfile.
constexpr auto temp_swap_size_mb(std::uint64_t available_kb) noexcept -> std::uint32_t {
    if (available_kb >= 1'500'000) {
        return 1024;
    }
    if (available_kb >= 800'000) {
        return 512;
    }
    return 0;
}

/// @brief Path of the swapfile under the root mountpoint
auto swapfile_path(std::string_view root_mountpoint) noexcept -> std::string;

/// @brief Allocate, format and activate swapfile on the root mountpoint.
/// @return true when the swapfile is active.
auto make_swapfile(utils::CommandRunner& runner, std::string_view root_mountpoint, std::uint32_t size_mb) noexcept -> bool;

/// @brief Deactivate and delete the swapfile.
auto remove_swapfile(utils::CommandRunner& runner, std::string_view root_mountpoint) noexcept -> bool;

/// @brief Generate zram-generator configuration using half of RAM with lz4.
auto gen_zram_config() noexcept -> std::string;

/// @brief Write zram-generator configuration, the generator sets up zram0 on next boot.
auto write_zram_config(std::string_view root_mountpoint) noexcept -> bool;

}  // namespace archi::swap

#endif  // SWAP_HPP
