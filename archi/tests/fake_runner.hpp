#ifndef FAKE_RUNNER_HPP
#define FAKE_RUNNER_HPP

#include "archi/io_utils.hpp"
#include "archi/logger.hpp"

#include <algorithm>    // for count_if, find_if, any_of
#include <chrono>       // for seconds
#include <cstddef>      // for size_t
#include <deque>        // for deque
#include <iterator>     // for prev, distance
#include <memory>       // for make_shared
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

namespace archi::test {

/// @brief In-memory CommandRunner.
///
/// Every command is recorded. Results are picked by the longest registered
/// prefix of the command; results queued for one prefix are handed out in
/// order and the last one keeps answering. Unknown commands succeed with
/// empty output.
class FakeRunner final : public utils::CommandRunner {
 public:
    void add_response(std::string prefix, utils::CommandResult result) {
        auto iter = std::ranges::find_if(m_responses, [&](auto&& response) { return response.prefix == prefix; });
        if (iter == m_responses.end()) {
            m_responses.push_back({.prefix = std::move(prefix), .results = {}});
            iter = std::prev(m_responses.end());
        }
        iter->results.push_back(std::move(result));
    }

    void add_output(std::string prefix, std::string output) {
        add_response(std::move(prefix), {.exit_code = 0, .output = std::move(output)});
    }

    void add_failure(std::string prefix, std::string output = {}) {
        add_response(std::move(prefix), {.exit_code = 1, .output = std::move(output)});
    }

    auto run(std::string_view command) noexcept -> utils::CommandResult override {
        commands.emplace_back(command);
        return answer(command);
    }

    auto run_with_input(std::string_view command, std::string_view input) noexcept -> utils::CommandResult override {
        commands.emplace_back(command);
        inputs.emplace_back(input);
        return answer(command);
    }

    auto run_timed(const std::vector<std::string>& args, std::chrono::seconds timeout) noexcept -> utils::CommandResult override {
        std::string command{};
        for (auto&& arg : args) {
            if (!command.empty()) {
                command += ' ';
            }
            command += arg;
        }
        timeouts.push_back(timeout);
        commands.push_back(command);
        return answer(command);
    }

    [[nodiscard]] auto count(std::string_view prefix) const noexcept -> std::size_t {
        return static_cast<std::size_t>(std::ranges::count_if(commands, [&](auto&& cmd) { return cmd.starts_with(prefix); }));
    }

    [[nodiscard]] auto ran(std::string_view prefix) const noexcept -> bool {
        return count(prefix) > 0;
    }

    /// Position of the first command starting with prefix, commands.size() when never run
    [[nodiscard]] auto index_of(std::string_view prefix) const noexcept -> std::size_t {
        const auto& iter = std::ranges::find_if(commands, [&](auto&& cmd) { return cmd.starts_with(prefix); });
        return static_cast<std::size_t>(std::distance(commands.begin(), iter));
    }

    std::vector<std::string> commands{};
    std::vector<std::string> inputs{};
    std::vector<std::chrono::seconds> timeouts{};

 private:
    struct Response final {
        std::string prefix;
        std::deque<utils::CommandResult> results;
    };

    auto answer(std::string_view command) noexcept -> utils::CommandResult {
        Response* best{};
        for (auto& response : m_responses) {
            if (command.starts_with(response.prefix) && (best == nullptr || response.prefix.size() > best->prefix.size())) {
                best = &response;
            }
        }
        if (best == nullptr) {
            return {.exit_code = 0, .output = {}};
        }
        auto result = best->results.front();
        if (best->results.size() > 1) {
            best->results.pop_front();
        }
        return result;
    }

    std::vector<Response> m_responses{};
};

// Route library logging into a no-op sink
inline void install_noop_logger() {
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger = std::make_shared<spdlog::logger>("default", callback_sink);
    archi::logger::set_logger(logger);
}

}  // namespace archi::test

#endif  // FAKE_RUNNER_HPP
