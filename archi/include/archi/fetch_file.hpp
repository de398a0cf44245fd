#ifndef FETCH_FILE_HPP
#define FETCH_FILE_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace archi::fetch {

/// @brief Download the content at url, trying fallback_url when that fails.
/// Both may be file:// URLs.
auto fetch_file_from_url(std::string_view url, std::string_view fallback_url) noexcept -> std::optional<std::string>;

/// @brief Whether url answers with a success or redirect status within the timeout.
auto is_url_reachable(std::string_view url) noexcept -> bool;

}  // namespace archi::fetch

#endif  // FETCH_FILE_HPP
