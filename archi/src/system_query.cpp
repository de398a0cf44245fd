#include "archi/system_query.hpp"
#include "archi/io_utils.hpp"
#include "archi/string_utils.hpp"

#include <charconv>    // for from_chars
#include <filesystem>  // for exists
#include <fstream>     // for ifstream
#include <iterator>    // for istreambuf_iterator

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

static constexpr auto DEV_PATH_PREFIX  = "/dev/"sv;
static constexpr auto TRAILING_NUMBERS = "0123456789"sv;

namespace {

// lsblk reports booleans either as JSON bools or as "0"/"1" depending on its version
auto get_json_flag(const rapidjson::Value& doc, const char* key) -> bool {
    if (!doc.HasMember(key)) {
        return false;
    }
    const auto& value = doc[key];
    if (value.IsBool()) {
        return value.GetBool();
    }
    if (value.IsString()) {
        return std::string_view{value.GetString()} == "1"sv;
    }
    if (value.IsInt()) {
        return value.GetInt() != 0;
    }
    return false;
}

auto get_json_size(const rapidjson::Value& doc) -> std::uint64_t {
    if (!doc.HasMember("size")) {
        return 0;
    }
    const auto& value = doc["size"];
    if (value.IsUint64()) {
        return value.GetUint64();
    }
    if (value.IsString()) {
        const std::string_view size_str{value.GetString()};
        std::uint64_t result{0};
        std::from_chars(size_str.data(), size_str.data() + size_str.size(), result);
        return result;
    }
    return 0;
}

auto get_disk_from_json(const rapidjson::Value& doc) -> archi::disk::DiskInfo {
    archi::disk::DiskInfo disk{};

    if (doc.HasMember("name") && doc["name"].IsString()) {
        disk.device = doc["name"].GetString();
    }
    if (doc.HasMember("model") && doc["model"].IsString()) {
        disk.model = std::string{archi::utils::trim(doc["model"].GetString())};
    }
    disk.size         = get_json_size(doc);
    disk.is_removable = get_json_flag(doc, "rm");
    disk.is_ssd       = doc.HasMember("rota") ? !get_json_flag(doc, "rota") : archi::disk::is_device_ssd(disk.device);

    return disk;
}

}  // namespace

namespace archi::disk {

auto get_disk_name_from_device(std::string_view device) noexcept -> std::string_view {
    if (device.starts_with(DEV_PATH_PREFIX)) {
        device.remove_prefix(DEV_PATH_PREFIX.size());
    }

    if (device.starts_with("nvme"sv) || device.starts_with("mmcblk"sv)) {
        if (auto pos = device.find_last_of('p'); pos != std::string_view::npos && pos + 1 < device.size()
            && TRAILING_NUMBERS.contains(device[pos + 1])) {
            return device.substr(0, pos);
        }
        return device;
    }

    auto pos = device.find_last_not_of(TRAILING_NUMBERS);
    return (pos != std::string_view::npos) ? device.substr(0, pos + 1) : device;
}

auto format_size(std::uint64_t bytes) noexcept -> std::string {
    constexpr std::uint64_t KiB = 1024ULL;
    constexpr std::uint64_t MiB = KiB * 1024;
    constexpr std::uint64_t GiB = MiB * 1024;
    constexpr std::uint64_t TiB = GiB * 1024;

    if (bytes >= TiB) {
        return fmt::format(FMT_COMPILE("{:.1f}TiB"), static_cast<double>(bytes) / TiB);
    } else if (bytes >= GiB) {
        return fmt::format(FMT_COMPILE("{:.1f}GiB"), static_cast<double>(bytes) / GiB);
    } else if (bytes >= MiB) {
        return fmt::format(FMT_COMPILE("{:.0f}MiB"), static_cast<double>(bytes) / MiB);
    } else if (bytes >= KiB) {
        return fmt::format(FMT_COMPILE("{:.0f}KiB"), static_cast<double>(bytes) / KiB);
    }
    return fmt::format(FMT_COMPILE("{}B"), bytes);
}

auto is_device_ssd(std::string_view device) noexcept -> bool {
    const auto base_device     = get_disk_name_from_device(device);
    const auto rotational_path = fmt::format(FMT_COMPILE("/sys/block/{}/queue/rotational"), base_device);

    // Note: can't use file_utils::read_whole_file because sysfs files report size 0
    std::ifstream file(rotational_path);
    if (!file.is_open()) {
        return base_device.starts_with("nvme"sv);
    }

    char rotational{};
    file >> rotational;
    return rotational == '0';
}

auto parse_lsblk_disks_json(std::string_view json_output) noexcept -> std::vector<DiskInfo> {
    if (json_output.empty()) {
        return {};
    }

    rapidjson::Document document;
    document.Parse(json_output.data(), json_output.size());

    if (document.HasParseError()) {
        spdlog::error("Failed to parse lsblk output: {}", rapidjson::GetParseError_En(document.GetParseError()));
        return {};
    }
    if (document.IsNull() || !document.IsObject()) {
        spdlog::error("lsblk output is not a valid JSON object");
        return {};
    }

    std::vector<DiskInfo> disks{};
    if (document.HasMember("blockdevices") && document["blockdevices"].IsArray()) {
        for (const auto& device_json : document["blockdevices"].GetArray()) {
            if (!device_json.HasMember("type") || !device_json["type"].IsString()) {
                continue;
            }
            if (std::string_view{device_json["type"].GetString()} != "disk"sv) {
                continue;
            }
            auto disk = get_disk_from_json(device_json);
            if (disk.is_removable) {
                spdlog::debug("Skipping removable disk '{}'", disk.device);
                continue;
            }
            disks.emplace_back(std::move(disk));
        }
    }
    return disks;
}

auto list_candidate_disks(utils::CommandRunner& runner) noexcept -> std::optional<std::vector<DiskInfo>> {
    const auto& lsblk_result = runner.run("lsblk -J -d -b -p -o NAME,TYPE,SIZE,MODEL,RM,ROTA"sv);
    if (!lsblk_result.success() || lsblk_result.output.empty()) {
        spdlog::error("Failed to get lsblk output");
        return std::nullopt;
    }
    return std::make_optional<std::vector<DiskInfo>>(parse_lsblk_disks_json(lsblk_result.output));
}

}  // namespace archi::disk

namespace archi::system {

auto vm_guest_to_string(VmGuest guest) noexcept -> std::string_view {
    switch (guest) {
    case VmGuest::Qemu:
        return "qemu"sv;
    case VmGuest::Vbox:
        return "vbox"sv;
    case VmGuest::Vmware:
        return "vmware"sv;
    case VmGuest::None:
        return "none"sv;
    }
    return "none"sv;
}

auto string_to_vm_guest(std::string_view guest) noexcept -> std::optional<VmGuest> {
    if (guest == "none"sv) {
        return VmGuest::None;
    } else if (guest == "qemu"sv) {
        return VmGuest::Qemu;
    } else if (guest == "vbox"sv) {
        return VmGuest::Vbox;
    } else if (guest == "vmware"sv) {
        return VmGuest::Vmware;
    }
    return std::nullopt;
}

auto parse_virt_type(std::string_view detect_virt_output) noexcept -> VmGuest {
    const auto virt = utils::trim(detect_virt_output);
    if (virt == "kvm"sv || virt == "qemu"sv) {
        return VmGuest::Qemu;
    } else if (virt == "oracle"sv) {
        return VmGuest::Vbox;
    } else if (virt == "vmware"sv) {
        return VmGuest::Vmware;
    }
    return VmGuest::None;
}

auto detect_virtualization(utils::CommandRunner& runner) noexcept -> VmGuest {
    // exits non-zero on bare metal while still printing "none"
    const auto& result = runner.run("systemd-detect-virt"sv);
    return parse_virt_type(result.output);
}

auto is_uefi_firmware(std::string_view efivars_path) noexcept -> bool {
    std::error_code err{};
    return fs::exists(efivars_path, err);
}

auto parse_meminfo_total_mb(std::string_view meminfo_content) noexcept -> std::optional<std::uint64_t> {
    static constexpr auto mem_total_key = "MemTotal:"sv;
    for (auto&& line : utils::make_split_view(meminfo_content)) {
        if (!line.starts_with(mem_total_key)) {
            continue;
        }
        auto value = utils::trim(line.substr(mem_total_key.size()));
        std::uint64_t total_kb{0};
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), total_kb);
        if (ec != std::errc{}) {
            spdlog::error("Malformed MemTotal line: '{}'", line);
            return std::nullopt;
        }
        return total_kb / 1024;
    }
    spdlog::error("MemTotal not found in meminfo");
    return std::nullopt;
}

auto get_total_memory_mb(std::string_view meminfo_path) noexcept -> std::optional<std::uint64_t> {
    // procfs files report size 0
    std::ifstream file{std::string{meminfo_path}};
    if (!file.is_open()) {
        spdlog::error("Failed to open '{}'", meminfo_path);
        return std::nullopt;
    }
    const std::string content{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    return parse_meminfo_total_mb(content);
}

auto probe_hardware(utils::CommandRunner& runner, const ProbePaths& paths) noexcept -> std::expected<HardwareInfo, std::string> {
    HardwareInfo info{};
    info.is_uefi = is_uefi_firmware(paths.efivars);

    const auto& memory_mb = get_total_memory_mb(paths.meminfo);
    if (!memory_mb) {
        return std::unexpected("failed to read total memory");
    }
    info.memory_mb = *memory_mb;

    auto disks = disk::list_candidate_disks(runner);
    if (!disks || disks->empty()) {
        return std::unexpected("no candidate block devices found");
    }
    info.disks = std::move(*disks);
    info.virt  = detect_virtualization(runner);

    spdlog::info("Firmware: {}, memory: {} MB, disks: {}, virt: {}", info.is_uefi ? "UEFI" : "BIOS",
        info.memory_mb, info.disks.size(), vm_guest_to_string(info.virt));
    return info;
}

}  // namespace archi::system
