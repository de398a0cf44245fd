#ifndef PACMANCONF_HPP
#define PACMANCONF_HPP

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::pacmanconf {

/// @brief Set an option inside the [options] section.
///
/// Commented or existing occurrences of the key are replaced in place,
/// otherwise the option is inserted right after the section header.
/// An empty value writes a bare flag (e.g. DisableDownloadTimeout).
/// @return The updated content, unchanged when no [options] section exists.
auto set_option(std::string_view content, std::string_view key, std::string_view value) noexcept -> std::string;

/// @brief Set an option in the file at file_path.
auto set_option_in_file(std::string_view file_path, std::string_view key, std::string_view value) noexcept -> bool;

/// @brief Render a mirrorlist with one `Server =` line per server.
auto gen_mirrorlist(const std::vector<std::string_view>& servers) noexcept -> std::string;

}  // namespace archi::pacmanconf

#endif  // PACMANCONF_HPP
