#include "archi/timezone.hpp"
#include "archi/io_utils.hpp"

#include <algorithm>   // for sort
#include <cctype>      // for isupper
#include <filesystem>  // for exists, directory_iterator

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

static constexpr auto ZONEINFO_PATH = "/usr/share/zoneinfo"sv;

namespace {

auto is_valid_tz_entry(std::string_view name) noexcept -> bool {
    return !name.empty()
        && name != "posix"sv && name != "right"sv
        && !name.starts_with('+')
        && std::isupper(static_cast<unsigned char>(name[0]));
}

}  // namespace

namespace archi::timezone {

auto set_timezone(std::string_view timezone, std::string_view mountpoint) noexcept -> bool {
    std::error_code ec{};

    // Verify the timezone exists in the target's tzdata
    const auto& zoneinfo_path = fs::path{ZONEINFO_PATH} / timezone;
    const auto& target_zone   = fmt::format(FMT_COMPILE("{}{}"), mountpoint, zoneinfo_path.string());
    if (timezone.empty() || !fs::exists(target_zone, ec)) {
        spdlog::error("Invalid timezone '{}'", timezone);
        return false;
    }

    const auto& localtime_path = fmt::format(FMT_COMPILE("{}/etc/localtime"), mountpoint);
    if (fs::is_symlink(localtime_path, ec) || fs::exists(localtime_path, ec)) {
        fs::remove(localtime_path, ec);
        if (ec) {
            spdlog::error("Failed to remove existing localtime: {}", ec.message());
            return false;
        }
    }

    fs::create_symlink(zoneinfo_path, localtime_path, ec);
    if (ec) {
        spdlog::error("Failed to create timezone symlink: {}", ec.message());
        return false;
    }

    spdlog::info("Timezone set to '{}' at {}", timezone, mountpoint);
    return true;
}

auto sync_hwclock(utils::CommandRunner& runner, std::string_view mountpoint) noexcept -> bool {
    if (runner.chroot_checked("hwclock --systohc"sv, mountpoint)) {
        return true;
    }

    // try fallback with direct ISA
    if (runner.chroot_checked("hwclock --systohc --directisa"sv, mountpoint)) {
        spdlog::info("hwclock set using direct ISA on '{}'", mountpoint);
        return true;
    }
    spdlog::error("Failed to set hwclock on '{}'", mountpoint);
    return false;
}

auto get_timezone_regions() noexcept -> std::vector<std::string> {
    std::error_code ec{};
    std::vector<std::string> regions{};
    for (const auto& entry : fs::directory_iterator(ZONEINFO_PATH, ec)) {
        auto name = entry.path().filename().string();
        if (entry.is_directory(ec) && is_valid_tz_entry(name)) {
            regions.emplace_back(std::move(name));
        }
    }

    std::ranges::sort(regions);
    return regions;
}

auto get_timezone_zones(std::string_view region) noexcept -> std::vector<std::string> {
    std::error_code ec{};
    const auto region_path = fs::path{ZONEINFO_PATH} / region;
    if (!fs::is_directory(region_path, ec)) {
        spdlog::warn("Invalid timezone region: {}", region);
        return {};
    }

    std::vector<std::string> zones{};
    for (const auto& entry : fs::recursive_directory_iterator(region_path, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        zones.emplace_back(fs::relative(entry.path(), region_path, ec).string());
    }

    std::ranges::sort(zones);
    return zones;
}

}  // namespace archi::timezone
