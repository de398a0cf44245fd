#ifndef INSTALL_PLAN_HPP
#define INSTALL_PLAN_HPP

// import archi
#include "archi/mirrors.hpp"
#include "archi/system_query.hpp"

#include <cstdint>      // for uint64_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

namespace installer {

struct InstallerConfig;

/// Answers collected by the questionnaire (or read from settings.json).
struct PlanChoices {
    // Environment
    bool is_uefi{false};
    std::uint64_t memory_mb{0};
    bool low_memory{false};
    bool is_ssd{false};

    // Run profile
    bool safe_profile{false};
    bool minimal_footprint{false};
    archi::mirrors::MirrorMode mirror_mode{archi::mirrors::MirrorMode::Auto};

    std::string device{};
    std::string locale{"en_US.UTF-8"};
    std::string keymap{"us"};
    std::string timezone{"UTC"};

    std::string desktop{"openbox"};
    std::string openbox_theme{"Raven"};
    bool gaming{false};
    bool ssh{false};
    archi::system::VmGuest vm{archi::system::VmGuest::None};

    std::string username{};
    std::string password{};
    std::string password_confirm{};
    // nullopt reuses the account password for root
    std::optional<std::string> root_password{};
};

/// Immutable record of every decision, created only through confirm().
class InstallPlan final {
 public:
    /// @brief The single gate before any destructive action.
    /// The device path has to be typed a second time, identically.
    [[nodiscard]] static auto confirm(PlanChoices choices, std::string_view retyped_device) noexcept
        -> std::expected<InstallPlan, std::string>;

    [[nodiscard]] auto choices() const noexcept -> const PlanChoices& { return m_choices; }
    [[nodiscard]] auto root_password() const noexcept -> std::string_view;
    [[nodiscard]] auto reuses_user_password() const noexcept -> bool { return !m_choices.root_password.has_value(); }

 private:
    explicit InstallPlan(PlanChoices choices) noexcept
      : m_choices(std::move(choices)) { }

    PlanChoices m_choices;
};

/// Window-manager variants known to the package catalog.
auto known_desktops() noexcept -> const std::vector<std::string>&;

/// Lowercase start, then [a-z0-9_-], at most 32 characters.
auto is_valid_username(std::string_view username) noexcept -> bool;

/// Fill choices from a headless config and the probed hardware.
[[nodiscard]] auto choices_from_config(const InstallerConfig& config, const archi::system::HardwareInfo& hw_info) noexcept
    -> std::expected<PlanChoices, std::string>;

/// Log every decision, secrets excluded.
void dump_plan_to_log(const InstallPlan& plan) noexcept;

}  // namespace installer

#endif  // INSTALL_PLAN_HPP
