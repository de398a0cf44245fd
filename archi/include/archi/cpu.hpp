#ifndef CPU_HPP
#define CPU_HPP

#include <cstdint>      // for uint8_t
#include <string>       // for string
#include <string_view>  // for string_view

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::cpu {

enum class CpuGovernor : std::uint8_t {
    Performance,
    Ondemand,
};

auto governor_to_string(CpuGovernor governor) noexcept -> std::string_view;

// Maximum performance for gaming setups, adaptive scaling otherwise
constexpr auto select_governor(bool gaming) noexcept -> CpuGovernor {
    return gaming ? CpuGovernor::Performance : CpuGovernor::Ondemand;
}

// Generate /etc/default/cpupower into string
auto gen_cpupower_config(CpuGovernor governor) noexcept -> std::string;

// Writes cpupower defaults and enables cpupower service on the system
auto set_cpu_governor(utils::CommandRunner& runner, CpuGovernor governor, std::string_view mountpoint) noexcept -> bool;

}  // namespace archi::cpu

#endif  // CPU_HPP
