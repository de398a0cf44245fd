#include "archi/cpu.hpp"
#include "archi/file_utils.hpp"
#include "archi/systemd_services.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace archi::cpu {

auto governor_to_string(CpuGovernor governor) noexcept -> std::string_view {
    switch (governor) {
    case CpuGovernor::Performance:
        return "performance"sv;
    case CpuGovernor::Ondemand:
        return "ondemand"sv;
    }
    return "ondemand"sv;
}

auto gen_cpupower_config(CpuGovernor governor) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("# Generated by the installer\ngovernor='{}'\n"), governor_to_string(governor));
}

auto set_cpu_governor(utils::CommandRunner& runner, CpuGovernor governor, std::string_view mountpoint) noexcept -> bool {
    const auto& cpupower_path = fmt::format(FMT_COMPILE("{}/etc/default/cpupower"), mountpoint);
    if (!file_utils::create_file_for_overwrite(cpupower_path, gen_cpupower_config(governor))) {
        spdlog::error("Failed to open cpupower config for writing {}", cpupower_path);
        return false;
    }
    spdlog::info("CPU governor set to '{}'", governor_to_string(governor));
    return services::enable_systemd_service(runner, "cpupower"sv, mountpoint);
}

}  // namespace archi::cpu
