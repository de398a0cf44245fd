#include "archi/subprocess.hpp"

#include <subprocess.h>

#include <cstdint>  // for int32_t, uint32_t

#include <algorithm>    // for transform
#include <array>        // for array
#include <bit>          // for bit_cast
#include <string_view>  // for string_view_literals
#include <thread>       // for thread, sleep_for

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
using namespace std::chrono_literals;

namespace archi::utils {

auto exec_timed(const std::vector<std::string>& vec, std::chrono::seconds timeout) noexcept -> CommandResult {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
    const bool dirty_cmd_run = utils::safe_getenv("DIRTY_CMD_RUN") == "1"sv;

    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec_timed] cmd := {} (timeout {}s)", vec, timeout.count());
    }
    if (dirty_cmd_run) {
        return {.exit_code = 0};
    }
    if (vec.empty()) {
        spdlog::error("[exec_timed] empty command");
        return {};
    }

    std::vector<char*> args;
    std::transform(vec.cbegin(), vec.cend(), std::back_inserter(args),
        [=](const std::string& arg) -> char* { return std::bit_cast<char*>(arg.data()); });
    args.push_back(nullptr);

    subprocess_s process{};
    char** command                             = args.data();
    static constexpr const char* environment[] = {"PATH=/sbin:/bin:/usr/local/sbin:/usr/local/bin:/usr/bin:/usr/sbin", nullptr};
    if (subprocess_create_ex(command, subprocess_option_enable_async | subprocess_option_combined_stdout_stderr, environment, &process) != 0) {
        spdlog::error("[exec_timed] failed to spawn '{}'", vec[0]);
        return {};
    }

    CommandResult result{};

    // the reader sees EOF once the child exits or gets killed
    std::thread reader([&process, &result] {
        std::array<char, 8192> buf{};
        std::uint32_t bytes_read{};
        do {
            bytes_read = subprocess_read_stdout(&process, buf.data(), static_cast<std::uint32_t>(buf.size()));
            if (bytes_read > 0) {
                result.output.append(buf.data(), bytes_read);
            }
        } while (bytes_read != 0);
    });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (subprocess_alive(&process) != 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("[exec_timed] '{}' exceeded {}s, killing it", vec[0], timeout.count());
            result.timed_out = true;
            if (subprocess_terminate(&process) != 0) {
                spdlog::error("[exec_timed] failed to terminate '{}'", vec[0]);
            }
            break;
        }
        std::this_thread::sleep_for(100ms);
    }
    reader.join();

    std::int32_t ret{-1};
    if (subprocess_join(&process, &ret) != 0) {
        spdlog::error("[exec_timed] Failed to join process: return code {}", ret);
    }
    if (subprocess_destroy(&process) != 0) {
        spdlog::error("[exec_timed] Failed to destroy process");
    }
    result.exit_code = result.timed_out ? -1 : ret;
    return result;
}

}  // namespace archi::utils
