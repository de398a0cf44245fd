#ifndef LOCALE_HPP
#define LOCALE_HPP

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace archi::utils {
class CommandRunner;
}  // namespace archi::utils

namespace archi::locale {

// Prepare system language.
// Writes locale.gen and locale.conf without generating locales
auto prepare_locale_set(std::string_view locale, std::string_view mountpoint) noexcept -> bool;

// Set system language and generate it inside the target
auto set_locale(utils::CommandRunner& runner, std::string_view locale, std::string_view mountpoint) noexcept -> bool;

// Set virtual console keymap
auto set_keymap(std::string_view keymap, std::string_view mountpoint) noexcept -> bool;

/// @brief Language part of a locale, e.g. "en" for "en_US.UTF-8".
auto locale_base_language(std::string_view locale) noexcept -> std::string_view;

/// @brief Pick translation directories which do not belong to the locale's language.
/// @param entries Names of directories under /usr/share/locale.
/// @param locale Selected system locale.
auto select_locales_to_remove(const std::vector<std::string>& entries, std::string_view locale) noexcept -> std::vector<std::string>;

/// @brief Remove translations of every other language from <mountpoint>/usr/share/locale.
auto strip_locales(std::string_view locale, std::string_view mountpoint) noexcept -> bool;

}  // namespace archi::locale

#endif  // LOCALE_HPP
