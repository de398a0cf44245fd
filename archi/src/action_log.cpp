#include "archi/action_log.hpp"
#include "archi/logger.hpp"

#include <filesystem>  // for copy_file, create_directories
#include <utility>     // for move

#include <fmt/compile.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace archi::report {

ActionLog::ActionLog(std::string path, std::shared_ptr<spdlog::logger> logger) noexcept
  : m_path(std::move(path)), m_logger(std::move(logger)) { }

auto ActionLog::open(std::string_view log_path) noexcept -> std::optional<ActionLog> {
    try {
        // truncate = false, the log is never rewritten
        auto sink   = std::make_shared<spdlog::sinks::basic_file_sink_mt>(std::string{log_path}, false);
        auto logger = std::make_shared<spdlog::logger>("action_log", std::move(sink));
        logger->set_pattern("%Y-%m-%d %H:%M:%S: %v");
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        return ActionLog{std::string{log_path}, std::move(logger)};
    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::error("Failed to open action log '{}': {}", log_path, ex.what());
    }
    return std::nullopt;
}

void ActionLog::record(std::string_view message) noexcept {
    m_records.emplace_back(ActionRecord{.timestamp = std::chrono::system_clock::now(), .message = std::string{message}});
    m_logger->info(message);
    spdlog::info("[action] {}", message);
}

auto ActionLog::copy_into_target(std::string_view session_log_path, std::string_view mountpoint) noexcept -> bool {
    m_logger->flush();
    logger::make_default_logger_sync();

    const auto& log_dir = fmt::format(FMT_COMPILE("{}/var/log"), mountpoint);
    std::error_code err{};
    fs::create_directories(log_dir, err);
    if (err) {
        spdlog::error("Failed to create '{}': {}", log_dir, err.message());
        return false;
    }

    const auto& action_dest = fmt::format(FMT_COMPILE("{}/arch-installer.log"), log_dir);
    fs::copy_file(m_path, action_dest, fs::copy_options::overwrite_existing, err);
    if (err) {
        spdlog::error("Failed to copy action log into '{}': {}", action_dest, err.message());
        return false;
    }

    const auto& session_dest = fmt::format(FMT_COMPILE("{}/arch-installer-live.log"), log_dir);
    fs::copy_file(session_log_path, session_dest, fs::copy_options::overwrite_existing, err);
    if (err) {
        // the action log already made it over
        spdlog::warn("Failed to copy session log into '{}': {}", session_dest, err.message());
    }
    return true;
}

auto format_summary(const InstallSummary& summary) noexcept -> std::string {
    static constexpr std::size_t box_width = 80;
    return fmt::format("┌{0:─^{9}}┐\n"
                       "│{1: ^{9}}│\n"
                       "│{2: ^{9}}│\n"
                       "│{3: ^{9}}│\n"
                       "│{4: ^{9}}│\n"
                       "│{5: ^{9}}│\n"
                       "│{6: ^{9}}│\n"
                       "│{7: ^{9}}│\n"
                       "│{8: ^{9}}│\n"
                       "└{0:─^{9}}┘\n",
        " Installation complete ",
        fmt::format(FMT_COMPILE("User: {}"), summary.username),
        fmt::format(FMT_COMPILE("Locale: {}"), summary.locale),
        fmt::format(FMT_COMPILE("Keyboard: {}"), summary.keyboard),
        fmt::format(FMT_COMPILE("Timezone: {}"), summary.timezone),
        fmt::format(FMT_COMPILE("Desktop: {}"), summary.desktop),
        fmt::format(FMT_COMPILE("Device: {} ({})"), summary.device, summary.is_uefi ? "UEFI" : "BIOS"),
        fmt::format(FMT_COMPILE("Memory: {} MB"), summary.memory_mb),
        fmt::format(FMT_COMPILE("Log: {}"), summary.log_path), box_width);
}

}  // namespace archi::report
