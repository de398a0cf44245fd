#include "archi/logger.hpp"

#include <chrono>   // for seconds
#include <memory>   // for make_shared, dynamic_pointer_cast
#include <string>   // for string
#include <utility>  // for move

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>

using namespace std::chrono_literals;

namespace archi::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    spdlog::set_default_logger(std::move(default_logger));
}

auto make_session_logger(std::string_view log_path) noexcept -> std::shared_ptr<spdlog::logger> {
    try {
        auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("archi_session", std::string{log_path});
        logger->set_pattern("[%r][%^---%L---%$] %v");
        logger->set_level(spdlog::level::debug);
        spdlog::flush_every(5s);
        return logger;
    } catch (const spdlog::spdlog_ex& ex) {
        fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
    return nullptr;
}

void make_default_logger_sync() noexcept {
    auto current = spdlog::default_logger();
    if (std::dynamic_pointer_cast<spdlog::async_logger>(current) == nullptr) {
        return;
    }

    auto sync_logger = std::make_shared<spdlog::logger>(current->name(), current->sinks().begin(), current->sinks().end());
    sync_logger->set_pattern("[%r][%^---%L---%$] %v");
    sync_logger->set_level(current->level());
    sync_logger->flush_on(spdlog::level::trace);

    // queued flush runs before the pool terminates
    current->flush();
    spdlog::set_default_logger(std::move(sync_logger));
    current.reset();

    // destroying the pool joins the workers after the queue is drained
    spdlog::details::registry::instance().set_tp(nullptr);
    spdlog::default_logger_raw()->flush();
}

}  // namespace archi::logger
