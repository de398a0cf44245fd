#ifndef ACTION_LOG_HPP
#define ACTION_LOG_HPP

#include <chrono>       // for system_clock
#include <cstdint>      // for uint64_t
#include <memory>       // for shared_ptr
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <fmt/format.h>

/* clang-format off */
namespace spdlog { class logger; }
/* clang-format on */

namespace archi::report {

struct ActionRecord final {
    std::chrono::system_clock::time_point timestamp{};
    std::string message{};
};

/// @brief Append-only, timestamped log of every action the pipeline takes.
///
/// Each record goes to the log file immediately (flushed per record) and is
/// kept in memory in write order.
class ActionLog final {
 public:
    /// @brief Open log file in append mode.
    /// @return nullopt when the file cannot be opened.
    static auto open(std::string_view log_path) noexcept -> std::optional<ActionLog>;

    void record(std::string_view message) noexcept;

    template <typename... Args>
    void record(fmt::format_string<Args...> fmt_str, Args&&... args) noexcept {
        record(std::string_view{fmt::format(fmt_str, std::forward<Args>(args)...)});
    }

    [[nodiscard]] auto records() const noexcept -> const std::vector<ActionRecord>& { return m_records; }
    [[nodiscard]] auto path() const noexcept -> std::string_view { return m_path; }

    /// @brief Copy the action log and the raw session log into the installed system.
    /// Action log lands at <mountpoint>/var/log/arch-installer.log,
    /// session log at <mountpoint>/var/log/arch-installer-live.log.
    auto copy_into_target(std::string_view session_log_path, std::string_view mountpoint) noexcept -> bool;

 private:
    ActionLog(std::string path, std::shared_ptr<spdlog::logger> logger) noexcept;

    std::string m_path;
    std::shared_ptr<spdlog::logger> m_logger;
    std::vector<ActionRecord> m_records;
};

struct InstallSummary final {
    std::string username{};
    std::string locale{};
    std::string keyboard{};
    std::string timezone{};
    std::string desktop{};
    std::string device{};
    std::uint64_t memory_mb{};
    bool is_uefi{};
    std::string log_path{};
};

/// @brief Render the final boxed summary shown on success.
auto format_summary(const InstallSummary& summary) noexcept -> std::string;

}  // namespace archi::report

#endif  // ACTION_LOG_HPP
