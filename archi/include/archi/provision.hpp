#ifndef PROVISION_HPP
#define PROVISION_HPP

#include "archi/mirrors.hpp"

#include <cstddef>      // for size_t
#include <cstdint>      // for uint64_t, uint32_t, int32_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::provision {

inline constexpr std::size_t DIAGNOSTIC_TAIL_LINES   = 50;
inline constexpr std::uint64_t LOW_SPACE_WARNING_KB  = 7'000'000;
inline constexpr std::uint32_t MAX_INSTALL_ATTEMPTS  = 2;
inline constexpr std::string_view OPERATOR_MIRRORS   = "operator-selected";

struct ProvisionConfig final {
    std::string mountpoint{"/mnt"};
    /// Captured output of the latest install attempt
    std::string install_log{"/tmp/pacstrap.log"};
    mirrors::MirrorPaths mirror_paths{};
    bool low_memory{false};
    /// Run the install tool with reduced CPU/IO priority
    bool safe_profile{false};
};

/// @brief One run of the bulk install tool
struct ProvisionAttempt final {
    std::uint32_t number{0};
    /// Mirror configuration in effect
    std::string mirror_config{};
    std::int32_t exit_code{-1};
    /// Last lines of the captured output
    std::string output_tail{};
};

struct ProvisionReport final {
    std::vector<ProvisionAttempt> attempts{};
    std::optional<std::uint64_t> available_kb{};
    /// Size of the temporary swapfile, 0 when none was created
    std::uint32_t swap_mb{0};
};

struct ProvisionError final {
    std::string message{};
    /// Last ~50 lines of the final attempt's output
    std::string diagnostic_tail{};
    std::string log_path{};
    std::vector<ProvisionAttempt> attempts{};
};

/// @brief Parses available KiB from `df -Pk <path>` output.
auto parse_df_available_kb(std::string_view df_output) noexcept -> std::optional<std::uint64_t>;

/// @brief Build the bulk install command line.
auto gen_install_command(std::string_view mountpoint, const std::vector<std::string>& packages, bool safe_profile) noexcept -> std::string;

/// @brief Sync time and drop a stale package database lock on the target.
void prepare_target(utils::CommandRunner& runner, std::string_view mountpoint) noexcept;

/// @brief Switch to the single fallback mirror with one download at a time and refresh the keyring.
auto apply_fallback_mirror(utils::CommandRunner& runner, const mirrors::MirrorPaths& paths) noexcept -> bool;

/// @brief Install packages onto the mounted target.
///
/// Creates a temporary swapfile on low-memory targets when the target has
/// room for it, runs the install tool and retries exactly once with the
/// fallback mirror. The swapfile is removed afterwards whatever the outcome.
auto provision_packages(utils::CommandRunner& runner, const ProvisionConfig& config, const std::vector<std::string>& packages) noexcept
    -> std::expected<ProvisionReport, ProvisionError>;

}  // namespace archi::provision

#endif  // PROVISION_HPP
