#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>       // for shared_ptr
#include <string_view>  // for string_view

#include <spdlog/spdlog.h>

namespace archi::logger {

// Set library default logger
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

/// @brief Create the async session logger writing every library message into the file.
/// @param log_path Path of the raw session log.
/// @return The created logger, or nullptr if the sink could not be opened.
auto make_session_logger(std::string_view log_path) noexcept -> std::shared_ptr<spdlog::logger>;

/// @brief Swap an async default logger for a synchronous one on the same sinks.
///
/// Drains the async queue first, so every message logged before the call is in
/// the sinks once this returns. No-op when the default logger is synchronous.
void make_default_logger_sync() noexcept;

}  // namespace archi::logger

#endif  // LOGGER_HPP
