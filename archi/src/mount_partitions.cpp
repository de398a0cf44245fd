#include "archi/mount_partitions.hpp"
#include "archi/io_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace archi::mount {

auto mount_partition(utils::CommandRunner& runner, std::string_view partition, std::string_view mount_dir, std::string_view mount_opts) noexcept -> bool {
    if (!runner.run_checked(fmt::format(FMT_COMPILE("mkdir -p {}"), mount_dir))) {
        spdlog::error("Failed to create mount directory '{}'", mount_dir);
        return false;
    }

    const auto& mount_cmd = mount_opts.empty()
        ? fmt::format(FMT_COMPILE("mount {} {}"), partition, mount_dir)
        : fmt::format(FMT_COMPILE("mount -o {} {} {}"), mount_opts, partition, mount_dir);
    if (!runner.run_checked(mount_cmd)) {
        spdlog::error("Failed to mount '{}' on '{}'", partition, mount_dir);
        return false;
    }
    return true;
}

}  // namespace archi::mount
