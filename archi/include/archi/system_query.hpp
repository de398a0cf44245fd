#ifndef SYSTEM_QUERY_HPP
#define SYSTEM_QUERY_HPP

#include <cstdint>      // for uint64_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::disk {

/// @brief Information about a candidate install disk
struct DiskInfo final {
    /// Disk device path
    std::string device;
    /// Disk model name
    std::optional<std::string> model;
    /// Total disk size in bytes
    std::uint64_t size{0};
    /// Whether the disk is an SSD
    bool is_ssd{false};
    /// Whether the disk is removable
    bool is_removable{false};
};

/// @brief Formats a size in bytes to human-readable string
/// @param bytes Size in bytes
/// @return Human-readable size string
auto format_size(std::uint64_t bytes) noexcept -> std::string;

/// @brief Determines if a storage device is an SSD
/// @param device The device path
/// @return True if the device is non-rotational (SSD/NVMe), false otherwise
auto is_device_ssd(std::string_view device) noexcept -> bool;

/// @brief Parses JSON output from lsblk into the non-removable disks it lists
/// @param json_output The JSON string from lsblk -J -d command
/// @return vector of DiskInfo, empty on error
auto parse_lsblk_disks_json(std::string_view json_output) noexcept -> std::vector<DiskInfo>;

/// @brief Lists non-removable disk devices
/// @return Optional vector of DiskInfo, std::nullopt when lsblk fails
auto list_candidate_disks(utils::CommandRunner& runner) noexcept -> std::optional<std::vector<DiskInfo>>;

/// @brief Parses disk name(base) from device
/// @param device The device path
/// @return extracted disk name of the device
auto get_disk_name_from_device(std::string_view device) noexcept -> std::string_view;

}  // namespace archi::disk

namespace archi::system {

enum class VmGuest : std::uint8_t {
    None,
    Qemu,
    Vbox,
    Vmware,
};

auto vm_guest_to_string(VmGuest guest) noexcept -> std::string_view;
auto string_to_vm_guest(std::string_view guest) noexcept -> std::optional<VmGuest>;

/// @brief Map `systemd-detect-virt` output onto a guest tools variant
auto parse_virt_type(std::string_view detect_virt_output) noexcept -> VmGuest;
auto detect_virtualization(utils::CommandRunner& runner) noexcept -> VmGuest;

/// Machines below this are treated as low-memory targets
inline constexpr std::uint64_t LOW_MEMORY_THRESHOLD_MB = 2048;

struct ProbePaths final {
    std::string efivars{"/sys/firmware/efi/efivars"};
    std::string meminfo{"/proc/meminfo"};
};

struct HardwareInfo final {
    bool is_uefi{false};
    std::uint64_t memory_mb{0};
    std::vector<disk::DiskInfo> disks{};
    VmGuest virt{VmGuest::None};

    [[nodiscard]] constexpr auto is_low_memory() const noexcept -> bool {
        return memory_mb < LOW_MEMORY_THRESHOLD_MB;
    }
};

/// @brief UEFI is reported when the firmware variables interface is present
auto is_uefi_firmware(std::string_view efivars_path) noexcept -> bool;

/// @brief Parses MemTotal from /proc/meminfo content
/// @return Total memory in megabytes
auto parse_meminfo_total_mb(std::string_view meminfo_content) noexcept -> std::optional<std::uint64_t>;
auto get_total_memory_mb(std::string_view meminfo_path) noexcept -> std::optional<std::uint64_t>;

/// @brief Gather firmware mode, memory and candidate disks. Has no side effects.
/// Having no candidate disk is an error, there is no possible target.
auto probe_hardware(utils::CommandRunner& runner, const ProbePaths& paths) noexcept -> std::expected<HardwareInfo, std::string>;

}  // namespace archi::system

#endif  // SYSTEM_QUERY_HPP
