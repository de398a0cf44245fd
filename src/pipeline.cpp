#include "pipeline.hpp"
#include "config.hpp"
#include "configurator.hpp"
#include "install_plan.hpp"

// import archi
#include "archi/bootloader.hpp"
#include "archi/fstab.hpp"
#include "archi/io_utils.hpp"
#include "archi/string_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace installer {

auto install_stage_to_string(InstallStage stage) noexcept -> std::string_view {
    switch (stage) {
    case InstallStage::Reclaim:
        return "reclaim"sv;
    case InstallStage::Partition:
        return "partition"sv;
    case InstallStage::Mirrors:
        return "mirrors"sv;
    case InstallStage::Provision:
        return "provision"sv;
    case InstallStage::Configure:
        return "configure"sv;
    case InstallStage::Bootloader:
        return "bootloader"sv;
    case InstallStage::Report:
        return "report"sv;
    }
    return "unknown"sv;
}

void record_startup_failure(archi::report::ActionLog& action_log, std::string_view message) noexcept {
    action_log.record("FATAL [startup]: {}", message);
    spdlog::error("[startup] {}", message);
}

auto probe_stage(archi::utils::CommandRunner& runner, const RuntimeSettings& settings, archi::report::ActionLog& action_log) noexcept
    -> std::expected<archi::system::HardwareInfo, std::string> {
    auto hw_info = archi::system::probe_hardware(runner, {.efivars = settings.efivars, .meminfo = settings.meminfo});
    if (!hw_info) {
        record_startup_failure(action_log, hw_info.error());
        return hw_info;
    }
    action_log.record("probe: {} firmware, {} MB memory, {} candidate disks", hw_info->is_uefi ? "UEFI"sv : "BIOS"sv, hw_info->memory_mb, hw_info->disks.size());
    return hw_info;
}

auto reclaim_stage(const PipelineContext& ctx) noexcept -> archi::disk::ReclaimReport {
    const auto& device = ctx.plan.choices().device;
    ctx.action_log.record("reclaim: releasing {}", device);

    auto report = archi::disk::reclaim_device(ctx.runner, device, ctx.settings.mountpoint);
    for (const auto& step : report.failed_steps) {
        spdlog::debug("reclaim step failed: {}", step);
    }
    if (!report.device_free) {
        spdlog::warn("{} still looks busy after reclaim", device);
    }
    ctx.action_log.record("reclaim: {} ({} steps failed)", report.device_free ? "device free"sv : "device still busy"sv, report.failed_steps.size());
    return report;
}

auto partition_stage(const PipelineContext& ctx) noexcept -> std::expected<archi::disk::PartitionLayout, InstallError> {
    const auto& choices = ctx.plan.choices();
    ctx.action_log.record("partition: {} layout on {}", choices.is_uefi ? "UEFI"sv : "BIOS"sv, choices.device);

    auto layout = archi::disk::create_default_layout(ctx.runner, choices.device, choices.is_uefi, ctx.settings.mountpoint);
    if (!layout) {
        return std::unexpected(InstallError{.stage = InstallStage::Partition, .message = std::move(layout.error())});
    }

    ctx.action_log.record("partition: root {} mounted at {}", layout->root_device, ctx.settings.mountpoint);
    if (layout->efi_device) {
        ctx.action_log.record("partition: EFI {} mounted at {}/boot", *layout->efi_device, ctx.settings.mountpoint);
    }
    return *layout;
}

auto mirror_stage(const PipelineContext& ctx) noexcept -> archi::mirrors::MirrorMode {
    const auto& choices = ctx.plan.choices();
    const auto mode     = archi::mirrors::effective_mirror_mode(choices.mirror_mode, choices.safe_profile);

    const archi::mirrors::MirrorPaths paths{.mirrorlist = ctx.settings.mirrorlist, .pacman_conf = ctx.settings.pacman_conf};
    const auto applied = archi::mirrors::apply_mirror_mode(ctx.runner, mode, paths);
    ctx.action_log.record("mirrors: requested {}, applied {}", archi::mirrors::mirror_mode_to_string(choices.mirror_mode), archi::mirrors::mirror_mode_to_string(applied));
    return applied;
}

auto plan_package_sets(const InstallPlan& plan, const archi::profile::PackageCatalog& catalog) noexcept -> std::vector<archi::profile::PackageSet> {
    const auto& choices = plan.choices();
    const archi::profile::PackageSelection selection{
        .is_uefi   = choices.is_uefi,
        .desktop   = choices.desktop,
        .memory_mb = choices.memory_mb,
        .gaming    = choices.gaming,
        .ssh       = choices.ssh,
        .vm        = choices.vm,
    };
    return archi::profile::assemble_package_sets(catalog, selection);
}

auto provision_stage(const PipelineContext& ctx, const std::vector<archi::profile::PackageSet>& package_sets) noexcept
    -> std::expected<archi::provision::ProvisionReport, InstallError> {
    const auto& choices = ctx.plan.choices();
    for (const auto& package_set : package_sets) {
        ctx.action_log.record("provision: {} set, {} packages", package_set.name, package_set.packages.size());
    }

    const archi::provision::ProvisionConfig config{
        .mountpoint   = ctx.settings.mountpoint,
        .install_log  = ctx.settings.install_log,
        .mirror_paths = {.mirrorlist = ctx.settings.mirrorlist, .pacman_conf = ctx.settings.pacman_conf},
        .low_memory   = choices.low_memory,
        .safe_profile = choices.safe_profile,
    };
    auto report = archi::provision::provision_packages(ctx.runner, config, archi::profile::flatten_package_sets(package_sets));
    if (!report) {
        auto& error = report.error();
        for (const auto& attempt : error.attempts) {
            ctx.action_log.record("provision: attempt {} with {} mirrors exited {}", attempt.number, attempt.mirror_config, attempt.exit_code);
        }
        return std::unexpected(InstallError{
            .stage           = InstallStage::Provision,
            .message         = std::move(error.message),
            .diagnostic_tail = std::move(error.diagnostic_tail),
            .log_path        = std::move(error.log_path),
        });
    }

    if (report->swap_mb > 0) {
        ctx.action_log.record("provision: temporary swap of {} MB used and removed", report->swap_mb);
    }
    for (const auto& attempt : report->attempts) {
        ctx.action_log.record("provision: attempt {} with {} mirrors exited {}", attempt.number, attempt.mirror_config, attempt.exit_code);
    }

    if (!archi::fs::append_generated_fstab(ctx.runner, ctx.settings.mountpoint)) {
        return std::unexpected(InstallError{.stage = InstallStage::Provision, .message = "failed to generate fstab"});
    }
    ctx.action_log.record("provision: fstab generated");
    return *report;
}

auto bootloader_stage(const PipelineContext& ctx) noexcept -> std::expected<void, InstallError> {
    const auto& choices      = ctx.plan.choices();
    const auto& grub_config  = archi::bootloader::make_grub_install_config(choices.is_uefi, choices.device);
    const auto& grub_install = archi::bootloader::gen_grub_install_command(grub_config);
    ctx.action_log.record("bootloader: {}", grub_install.value_or("invalid grub-install configuration"));

    if (!archi::bootloader::install_grub(ctx.runner, grub_config, ctx.settings.mountpoint)) {
        return std::unexpected(InstallError{.stage = InstallStage::Bootloader, .message = "failed to install the GRUB boot loader"});
    }
    ctx.action_log.record("bootloader: GRUB installed and configured");
    return {};
}

auto report_stage(const PipelineContext& ctx) noexcept -> archi::report::InstallSummary {
    const auto& choices = ctx.plan.choices();
    ctx.action_log.record("Installation completed successfully - system ready for reboot");

    std::string log_path{"/var/log/arch-installer.log"};
    if (!ctx.action_log.copy_into_target(ctx.settings.session_log, ctx.settings.mountpoint)) {
        spdlog::warn("Action log stays at {}", ctx.action_log.path());
        log_path = std::string{ctx.action_log.path()};
    }

    return archi::report::InstallSummary{
        .username  = choices.username,
        .locale    = choices.locale,
        .keyboard  = choices.keymap,
        .timezone  = choices.timezone,
        .desktop   = (choices.desktop == "openbox"sv) ? fmt::format(FMT_COMPILE("openbox ({})"), choices.openbox_theme) : choices.desktop,
        .device    = choices.device,
        .memory_mb = choices.memory_mb,
        .is_uefi   = choices.is_uefi,
        .log_path  = std::move(log_path),
    };
}

auto run_pipeline(const PipelineContext& ctx, const archi::profile::PackageCatalog& catalog) noexcept
    -> std::expected<archi::report::InstallSummary, InstallError> {
    const auto& fail = [&ctx](InstallError error) -> std::expected<archi::report::InstallSummary, InstallError> {
        ctx.action_log.record("FATAL [{}]: {}", install_stage_to_string(error.stage), error.message);
        spdlog::error("[{}] {}", install_stage_to_string(error.stage), error.message);
        return std::unexpected(std::move(error));
    };

    dump_plan_to_log(ctx.plan);
    ctx.action_log.record("Starting installation on {}", ctx.plan.choices().device);

    reclaim_stage(ctx);

    if (auto layout = partition_stage(ctx); !layout) {
        return fail(std::move(layout.error()));
    }

    mirror_stage(ctx);

    const auto& package_sets = plan_package_sets(ctx.plan, catalog);
    if (auto provision = provision_stage(ctx, package_sets); !provision) {
        return fail(std::move(provision.error()));
    }

    Configurator configurator{ctx};
    if (auto configured = configurator.run(); !configured) {
        return fail(std::move(configured.error()));
    }

    if (auto bootloader = bootloader_stage(ctx); !bootloader) {
        return fail(std::move(bootloader.error()));
    }

    return report_stage(ctx);
}

}  // namespace installer
