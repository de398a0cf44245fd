#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include "install_context.hpp"

// import archi
#include "archi/action_log.hpp"
#include "archi/disk_reclaim.hpp"
#include "archi/mirrors.hpp"
#include "archi/package_profiles.hpp"
#include "archi/partitioning.hpp"
#include "archi/provision.hpp"
#include "archi/system_query.hpp"

#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace installer {

/// Record a failure that ends the run before any disk is touched.
void record_startup_failure(archi::report::ActionLog& action_log, std::string_view message) noexcept;

/// Probe firmware, memory and disks of the live system. A failed probe is recorded as fatal.
[[nodiscard]] auto probe_stage(archi::utils::CommandRunner& runner, const RuntimeSettings& settings, archi::report::ActionLog& action_log) noexcept
    -> std::expected<archi::system::HardwareInfo, std::string>;

/// Release the target device. Never fatal, the wipe that follows does the verification.
auto reclaim_stage(const PipelineContext& ctx) noexcept -> archi::disk::ReclaimReport;

/// Wipe, partition, format and mount the target device.
[[nodiscard]] auto partition_stage(const PipelineContext& ctx) noexcept -> std::expected<archi::disk::PartitionLayout, InstallError>;

/// Rewrite package sources. Never fatal.
auto mirror_stage(const PipelineContext& ctx) noexcept -> archi::mirrors::MirrorMode;

/// Package sets of the plan, in install order.
auto plan_package_sets(const InstallPlan& plan, const archi::profile::PackageCatalog& catalog) noexcept -> std::vector<archi::profile::PackageSet>;

/// Install the package sets onto the mounted target, then generate its fstab.
[[nodiscard]] auto provision_stage(const PipelineContext& ctx, const std::vector<archi::profile::PackageSet>& package_sets) noexcept
    -> std::expected<archi::provision::ProvisionReport, InstallError>;

/// Install the boot loader for the firmware mode and generate its menu.
[[nodiscard]] auto bootloader_stage(const PipelineContext& ctx) noexcept -> std::expected<void, InstallError>;

/// Copy logs into the target and build the final summary.
auto report_stage(const PipelineContext& ctx) noexcept -> archi::report::InstallSummary;

/// Run every stage in order, stopping at the first fatal error.
[[nodiscard]] auto run_pipeline(const PipelineContext& ctx, const archi::profile::PackageCatalog& catalog) noexcept
    -> std::expected<archi::report::InstallSummary, InstallError>;

}  // namespace installer

#endif  // PIPELINE_HPP
