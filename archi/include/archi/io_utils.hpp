#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include <chrono>       // for seconds
#include <cstdint>      // for int32_t
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::utils {

struct CommandResult final {
    std::int32_t exit_code{-1};
    std::string output{};
    bool timed_out{false};

    [[nodiscard]] constexpr auto success() const noexcept -> bool {
        return exit_code == 0 && !timed_out;
    }
};

/// @brief Narrow interface for running external tools.
///
/// Every component talks to the host only through this interface, so the
/// orchestration logic can be driven by canned results in tests.
class CommandRunner {
 public:
    CommandRunner()                                        = default;
    virtual ~CommandRunner()                               = default;
    CommandRunner(const CommandRunner&)                    = delete;
    auto operator=(const CommandRunner&) -> CommandRunner& = delete;

    /// @brief Run a shell command line, capturing combined stdout and stderr.
    virtual auto run(std::string_view command) noexcept -> CommandResult = 0;

    /// @brief Run a shell command line feeding `input` to its stdin. Output is not captured.
    virtual auto run_with_input(std::string_view command, std::string_view input) noexcept -> CommandResult = 0;

    /// @brief Spawn args directly with a hard wall-clock deadline.
    /// The child is killed when the deadline expires and the result is marked timed out.
    virtual auto run_timed(const std::vector<std::string>& args, std::chrono::seconds timeout) noexcept -> CommandResult = 0;

    auto run_checked(std::string_view command) noexcept -> bool;
    auto chroot(std::string_view command, std::string_view mountpoint) noexcept -> CommandResult;
    auto chroot_checked(std::string_view command, std::string_view mountpoint) noexcept -> bool;
};

// Runs commands on the live host
class SystemRunner final : public CommandRunner {
 public:
    auto run(std::string_view command) noexcept -> CommandResult override;
    auto run_with_input(std::string_view command, std::string_view input) noexcept -> CommandResult override;
    auto run_timed(const std::vector<std::string>& args, std::chrono::seconds timeout) noexcept -> CommandResult override;
};

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

/// @brief Format command to be executed inside the target root.
auto make_chroot_cmd(std::string_view command, std::string_view mountpoint) noexcept -> std::string;

}  // namespace archi::utils

#endif  // IO_UTILS_HPP
