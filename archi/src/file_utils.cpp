#include "archi/file_utils.hpp"

#include <cerrno>   // for errno
#include <cstdio>   // for fopen, fread, fclose
#include <cstring>  // for strerror

#include <filesystem>  // for create_directories
#include <fstream>     // for ofstream

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace archi::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::string {
    // Use std::fopen because it's faster than std::ifstream
    auto* file = std::fopen(std::string{filepath}.c_str(), "rb");
    if (file == nullptr) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    std::fseek(file, 0u, SEEK_END);
    const auto size = static_cast<std::size_t>(std::ftell(file));
    std::fseek(file, 0u, SEEK_SET);

    std::string buf;
    buf.resize(size);

    const std::size_t read = std::fread(buf.data(), sizeof(char), size, file);
    std::fclose(file);
    if (read != size) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    return buf;
}

auto write_to_file(std::string_view data, std::string_view filepath) noexcept -> bool {
    std::ofstream file{std::string{filepath}};
    if (!file.is_open()) {
        spdlog::error("[WRITE_TO_FILE] '{}' open failed: {}", filepath, std::strerror(errno));
        return false;
    }
    file << data;
    return true;
}

auto append_to_file(std::string_view data, std::string_view filepath) noexcept -> bool {
    std::ofstream file{std::string{filepath}, std::ios::out | std::ios::app};
    if (!file.is_open()) {
        spdlog::error("[APPEND_TO_FILE] '{}' open failed: {}", filepath, std::strerror(errno));
        return false;
    }
    file << data;
    return true;
}

auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool {
    std::error_code err{};
    const auto parent = fs::path{filepath}.parent_path();
    if (!parent.empty() && !fs::exists(parent, err)) {
        fs::create_directories(parent, err);
        if (err) {
            spdlog::error("[CREATE_FILE] failed to create '{}': {}", parent.string(), err.message());
            return false;
        }
    }

    std::ofstream file{std::string{filepath}, std::ios::out | std::ios::trunc};
    if (!file.is_open()) {
        spdlog::error("[CREATE_FILE] '{}' open failed: {}", filepath, std::strerror(errno));
        return false;
    }
    file << data;
    return true;
}

}  // namespace archi::file_utils
