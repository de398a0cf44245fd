#ifndef TIMEZONE_HPP
#define TIMEZONE_HPP

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::timezone {

// Point /etc/localtime of the target at its zoneinfo entry
auto set_timezone(std::string_view timezone, std::string_view mountpoint) noexcept -> bool;

// Write system time into the hardware clock of the target
auto sync_hwclock(utils::CommandRunner& runner, std::string_view mountpoint) noexcept -> bool;

// Top level zoneinfo regions (Europe, America, ...)
auto get_timezone_regions() noexcept -> std::vector<std::string>;

// Zones of the region, relative to it
auto get_timezone_zones(std::string_view region) noexcept -> std::vector<std::string>;

}  // namespace archi::timezone

#endif  // TIMEZONE_HPP
