#include "archi/block_devices.hpp"
#include "archi/io_utils.hpp"

#include <algorithm>  // for any_of, copy_if
#include <iterator>   // for back_inserter

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
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

using namespace std::string_view_literals;

namespace {

constexpr auto SWAP_MOUNTPOINT = "[SWAP]"sv;

constexpr auto is_holder_type(std::string_view type) noexcept -> bool {
    return type == "crypt"sv || type == "lvm"sv || type == "dm"sv || type.starts_with("raid"sv);
}

// newer lsblk reports all mountpoints in an array
auto get_mountpoint(const rapidjson::Value& doc) -> std::optional<std::string> {
    if (doc.HasMember("mountpoint") && doc["mountpoint"].IsString()) {
        return std::string{doc["mountpoint"].GetString()};
    }
    if (doc.HasMember("mountpoints") && doc["mountpoints"].IsArray()) {
        for (const auto& mountpoint : doc["mountpoints"].GetArray()) {
            if (mountpoint.IsString()) {
                return std::string{mountpoint.GetString()};
            }
        }
    }
    return std::nullopt;
}

void collect_children(const rapidjson::Value& doc, std::vector<archi::disk::BlockNode>& nodes) {
    if (!doc.HasMember("children") || !doc["children"].IsArray()) {
        return;
    }
    for (const auto& child : doc["children"].GetArray()) {
        archi::disk::BlockNode node{};
        if (child.HasMember("name") && child["name"].IsString()) {
            node.name = child["name"].GetString();
        }
        if (child.HasMember("type") && child["type"].IsString()) {
            node.type = child["type"].GetString();
        }
        node.mountpoint = get_mountpoint(child);
        nodes.emplace_back(std::move(node));

        collect_children(child, nodes);
    }
}

}  // namespace

namespace archi::disk {

auto BlockDevice::partitions() const noexcept -> std::vector<std::string> {
    std::vector<std::string> parts{};
    for (const auto& node : nodes) {
        if (node.type == "part"sv) {
            parts.emplace_back(node.name);
        }
    }
    return parts;
}

auto BlockDevice::mounted_nodes() const noexcept -> std::vector<BlockNode> {
    std::vector<BlockNode> mounted{};
    std::ranges::copy_if(nodes, std::back_inserter(mounted), [](auto&& node) {
        return node.mountpoint.has_value() && *node.mountpoint != SWAP_MOUNTPOINT;
    });
    return mounted;
}

auto BlockDevice::crypt_nodes() const noexcept -> std::vector<BlockNode> {
    std::vector<BlockNode> crypts{};
    std::ranges::copy_if(nodes, std::back_inserter(crypts), [](auto&& node) { return node.type == "crypt"sv; });
    return crypts;
}

auto BlockDevice::holder_nodes() const noexcept -> std::vector<BlockNode> {
    std::vector<BlockNode> holders{};
    std::ranges::copy_if(nodes, std::back_inserter(holders), [](auto&& node) { return is_holder_type(node.type); });
    return holders;
}

auto BlockDevice::has_partition_table() const noexcept -> bool {
    return pttype.has_value() || !partitions().empty();
}

auto BlockDevice::is_busy() const noexcept -> bool {
    return std::ranges::any_of(nodes, [](auto&& node) {
        return node.mountpoint.has_value() || is_holder_type(node.type);
    });
}

auto parse_device_tree_json(std::string_view json_output) noexcept -> std::optional<BlockDevice> {
    if (json_output.empty()) {
        return std::nullopt;
    }

    rapidjson::Document document;
    document.Parse(json_output.data(), json_output.size());
    if (document.HasParseError()) {
        spdlog::error("Failed to parse lsblk output: {}", rapidjson::GetParseError_En(document.GetParseError()));
        return std::nullopt;
    }
    if (!document.IsObject() || !document.HasMember("blockdevices") || !document["blockdevices"].IsArray()) {
        spdlog::error("lsblk output has no 'blockdevices' array");
        return std::nullopt;
    }

    const auto& devices = document["blockdevices"].GetArray();
    if (devices.Empty()) {
        return std::nullopt;
    }
    const auto& root = devices[0];

    BlockDevice block_device{};
    if (root.HasMember("name") && root["name"].IsString()) {
        block_device.device = root["name"].GetString();
    }
    if (root.HasMember("pttype") && root["pttype"].IsString()) {
        block_device.pttype = root["pttype"].GetString();
    }
    // a disk used directly as swap or mounted without a partition table
    if (auto root_mount = get_mountpoint(root); root_mount) {
        block_device.nodes.emplace_back(BlockNode{.name = block_device.device, .type = "disk", .mountpoint = std::move(root_mount)});
    }
    collect_children(root, block_device.nodes);
    return block_device;
}

auto query_block_device(utils::CommandRunner& runner, std::string_view device) noexcept -> std::optional<BlockDevice> {
    const auto& lsblk_result = runner.run(fmt::format(FMT_COMPILE("lsblk -J -p -o NAME,TYPE,MOUNTPOINT,PTTYPE {}"), device));
    if (!lsblk_result.success()) {
        spdlog::error("Failed to query block device '{}'", device);
        return std::nullopt;
    }
    return parse_device_tree_json(lsblk_result.output);
}

}  // namespace archi::disk
