#include "config.hpp"            // for RuntimeSettings
#include "definitions.hpp"       // for error_inter
#include "install_context.hpp"   // for PipelineContext
#include "install_plan.hpp"      // for InstallPlan
#include "installer_config.hpp"  // for InstallerConfig
#include "pipeline.hpp"          // for run_pipeline, probe_stage
#include "questionnaire.hpp"     // for run_questionnaire
#include "utils.hpp"             // for check_root, is_connected

// import archi
#include "archi/action_log.hpp"
#include "archi/io_utils.hpp"
#include "archi/logger.hpp"
#include "archi/system_query.hpp"

#include <expected>     // for expected, unexpected
#include <regex>        // for regex_search
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move

#include <fmt/format.h>

#include <spdlog/spdlog.h>  // for shutdown

using namespace std::string_view_literals;

namespace {

// Config path given with --config, settings.json in the working directory otherwise
auto config_path_from_args(int argc, char** argv) noexcept -> std::string_view {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string_view{argv[i]} == "--config"sv) {
            return argv[i + 1];
        }
    }
    return "settings.json"sv;
}

// Interactive run or headless config, both end at the same confirmation gate
auto collect_plan(const installer::InstallerConfig& config, const archi::system::HardwareInfo& hw_info) noexcept
    -> std::expected<installer::InstallPlan, std::string> {
    if (config.headless_mode) {
        spdlog::info("Running in HEADLESS mode!");
        if (auto valid = installer::validate_headless_config(config); !valid) {
            return std::unexpected(std::move(valid.error()));
        }
        auto choices = installer::choices_from_config(config, hw_info);
        if (!choices) {
            return std::unexpected(std::move(choices.error()));
        }
        return installer::InstallPlan::confirm(std::move(*choices), *config.device_confirm);
    }

    spdlog::info("Running in NORMAL mode!");
    auto answers = tui::run_questionnaire(hw_info);
    utils::clear_screen();
    if (!answers) {
        return std::unexpected("installation cancelled, nothing was changed");
    }
    return installer::InstallPlan::confirm(std::move(answers->choices), answers->retyped_device);
}

}  // namespace

int main(int argc, char** argv) {
    archi::utils::SystemRunner runner{};

    const auto& tty = runner.run("tty"sv);
    const std::regex tty_regex("/dev/tty[0-9]*");
    if (std::regex_search(tty.output, tty_regex) && !runner.run_checked("setterm -blank 0 -powersave off"sv)) {
        spdlog::debug("setterm failed");
    }

    // Check if installer has enough permissions.
    if (!utils::check_root(runner)) {
        error_inter("Installer must be launched with root privileges!\n");
        return 1;
    }

    installer::RuntimeSettings settings{};

    auto action_log = archi::report::ActionLog::open(settings.action_log);
    if (!action_log) {
        error_inter("Failed to open action log '{}'\n", settings.action_log);
        return 1;
    }
    action_log->record("Installer started");

    // Initialize logger.
    auto logger = archi::logger::make_session_logger(settings.session_log);
    if (!logger) {
        installer::record_startup_failure(*action_log, fmt::format("failed to open session log '{}'", settings.session_log));
        error_inter("Failed to open session log '{}'\n", settings.session_log);
        return 1;
    }
    archi::logger::set_logger(std::move(logger));

    if (!utils::is_connected(settings.connectivity_url)) {
        warning_inter("An active network connection could not be detected.\n");
        utils::show_iwctl(runner);
        if (!utils::is_connected(settings.connectivity_url)) {
            installer::record_startup_failure(*action_log, "no network connection");
            error_inter("An active network connection could not be detected, please connect and restart the installer.\n");
            spdlog::shutdown();
            return 1;
        }
    }

    const auto& config = utils::load_installer_config(config_path_from_args(argc, argv));
    if (!config) {
        installer::record_startup_failure(*action_log, config.error());
        error_inter("Error occurred during initialization: {}\n", config.error());
        spdlog::shutdown();
        return 1;
    }
    installer::apply_config_overrides(settings, *config);

    const auto& hw_info = installer::probe_stage(runner, settings, *action_log);
    if (!hw_info) {
        error_inter("{}\n", hw_info.error());
        spdlog::shutdown();
        return 1;
    }

    const auto& plan = collect_plan(*config, *hw_info);
    if (!plan) {
        installer::record_startup_failure(*action_log, plan.error());
        error_inter("{}\n", plan.error());
        spdlog::shutdown();
        return 1;
    }

    const auto& catalog = utils::load_package_catalog(settings);
    if (!catalog) {
        installer::record_startup_failure(*action_log, "failed to load the package catalog");
        error_inter("Failed to load the package catalog\n");
        spdlog::shutdown();
        return 1;
    }

    const installer::PipelineContext ctx{.plan = *plan, .settings = settings, .runner = runner, .action_log = *action_log};
    const auto& summary = installer::run_pipeline(ctx, *catalog);
    if (!summary) {
        const auto& err = summary.error();
        error_inter("Installation failed during {}: {}\n", installer::install_stage_to_string(err.stage), err.message);
        if (!err.diagnostic_tail.empty()) {
            error_inter("{}\n", err.diagnostic_tail);
        }
        if (err.log_path) {
            error_inter("Full log: {}\n", *err.log_path);
        }
        spdlog::shutdown();
        return 1;
    }

    success_inter("{}\n", archi::report::format_summary(*summary));
    spdlog::shutdown();
    return 0;
}
