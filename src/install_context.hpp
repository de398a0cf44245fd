#ifndef INSTALL_CONTEXT_HPP
#define INSTALL_CONTEXT_HPP

#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::report {
class ActionLog;
}  // namespace archi::report

namespace installer {

class InstallPlan;
struct RuntimeSettings;

enum class InstallStage : std::uint8_t {
    Reclaim,
    Partition,
    Mirrors,
    Provision,
    Configure,
    Bootloader,
    Report,
};

auto install_stage_to_string(InstallStage stage) noexcept -> std::string_view;

/// Fatal failure of the pipeline.
struct InstallError final {
    InstallStage stage{InstallStage::Reclaim};
    std::string message{};
    /// Tail of the failing tool's output, when there is one
    std::string diagnostic_tail{};
    std::optional<std::string> log_path{};
};

/// State shared by every stage of a run. Read-only except for the runner and the action log.
struct PipelineContext final {
    const InstallPlan& plan;
    const RuntimeSettings& settings;
    archi::utils::CommandRunner& runner;
    archi::report::ActionLog& action_log;
};

}  // namespace installer

#endif  // INSTALL_CONTEXT_HPP
