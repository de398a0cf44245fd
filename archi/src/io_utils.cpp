#include "archi/io_utils.hpp"
#include "archi/subprocess.hpp"

#include <sys/wait.h>  // for WEXITSTATUS, WIFEXITED

#include <cstdio>   // for feof, fgets, pclose, popen
#include <cstdlib>  // for getenv

#include <array>   // for array
#include <memory>  // for unique_ptr

#include <fmt/compile.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace archi::utils {

namespace {

auto decode_status(std::int32_t status) noexcept -> std::int32_t {
    if (status == -1) {
        return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

}  // namespace

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto make_chroot_cmd(std::string_view command, std::string_view mountpoint) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("arch-chroot {} {}"), mountpoint, command);
}

auto CommandRunner::run_checked(std::string_view command) noexcept -> bool {
    return run(command).success();
}

auto CommandRunner::chroot(std::string_view command, std::string_view mountpoint) noexcept -> CommandResult {
    return run(make_chroot_cmd(command, mountpoint));
}

auto CommandRunner::chroot_checked(std::string_view command, std::string_view mountpoint) noexcept -> bool {
    return chroot(command, mountpoint).success();
}

auto SystemRunner::run(std::string_view command) noexcept -> CommandResult {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
    const bool dirty_cmd_run = utils::safe_getenv("DIRTY_CMD_RUN") == "1"sv;

    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec] cmd := '{}'", command);
    }
    if (dirty_cmd_run) {
        return {.exit_code = 0};
    }

    const auto& cmd_formatted = fmt::format(FMT_COMPILE("{} 2>&1"), command);
    auto* pipe                = popen(cmd_formatted.c_str(), "r");
    if (pipe == nullptr) {
        spdlog::error("popen failed! '{}'", command);
        return {};
    }

    CommandResult result{};
    std::array<char, 512> buffer{};
    while (!feof(pipe)) {
        if (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
            result.output += buffer.data();
        }
    }
    result.exit_code = decode_status(pclose(pipe));

    if (result.exit_code != 0) {
        spdlog::debug("[exec] '{}' exited with {}", command, result.exit_code);
    }
    return result;
}

auto SystemRunner::run_with_input(std::string_view command, std::string_view input) noexcept -> CommandResult {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
    const bool dirty_cmd_run = utils::safe_getenv("DIRTY_CMD_RUN") == "1"sv;

    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec] cmd (with stdin) := '{}'", command);
    }
    if (dirty_cmd_run) {
        return {.exit_code = 0};
    }

    auto* pipe = popen(std::string{command}.c_str(), "w");
    if (pipe == nullptr) {
        spdlog::error("popen failed! '{}'", command);
        return {};
    }
    const auto written = std::fwrite(input.data(), sizeof(char), input.size(), pipe);
    const auto status  = pclose(pipe);
    if (written != input.size()) {
        spdlog::error("[exec] short write to '{}'", command);
        return {};
    }
    return {.exit_code = decode_status(status)};
}

auto SystemRunner::run_timed(const std::vector<std::string>& args, std::chrono::seconds timeout) noexcept -> CommandResult {
    return utils::exec_timed(args, timeout);
}

}  // namespace archi::utils
