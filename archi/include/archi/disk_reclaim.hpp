#ifndef DISK_RECLAIM_HPP
#define DISK_RECLAIM_HPP

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::disk {

struct ReclaimReport final {
    /// Steps that reported a failure, for the log only
    std::vector<std::string> failed_steps{};
    /// Whether the device looked free once every step ran
    bool device_free{false};
};

/// @brief Release the device from every prior user so it can be repartitioned.
///
/// Unmounts the staging tree and every mounted child, disables swap, closes
/// crypt mappings, deactivates LVM and md arrays, drops residual mapper nodes
/// and makes the kernel re-read the partition table. Each step is best-effort.
/// Running it against an already free device does nothing harmful.
auto reclaim_device(utils::CommandRunner& runner, std::string_view device, std::string_view staging_mountpoint) noexcept -> ReclaimReport;

}  // namespace archi::disk

#endif  // DISK_RECLAIM_HPP
