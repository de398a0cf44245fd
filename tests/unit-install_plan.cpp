#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "install_plan.hpp"
#include "installer_config.hpp"

#include <string>
#include <string_view>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

auto make_choices() -> installer::PlanChoices {
    installer::PlanChoices choices{};
    choices.is_uefi          = true;
    choices.memory_mb        = 4096;
    choices.device           = "/dev/sda"s;
    choices.username         = "alice"s;
    choices.password         = "secret"s;
    choices.password_confirm = "secret"s;
    return choices;
}

auto make_hardware() -> archi::system::HardwareInfo {
    archi::system::HardwareInfo hw_info{};
    hw_info.is_uefi   = false;
    hw_info.memory_mb = 1024;
    hw_info.virt      = archi::system::VmGuest::Vbox;
    hw_info.disks.push_back({.device = "/dev/sda", .model = "QEMU HARDDISK", .size = 21474836480, .is_ssd = false});
    hw_info.disks.push_back({.device = "/dev/nvme0n1", .model = std::nullopt, .size = 512110190592, .is_ssd = true});
    return hw_info;
}

}  // namespace

TEST_CASE("install plan confirmation")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);

    SECTION("matching device confirms")
    {
        auto plan = installer::InstallPlan::confirm(make_choices(), "/dev/sda"sv);
        REQUIRE(plan.has_value());
        REQUIRE_EQ(plan->choices().device, "/dev/sda"sv);
        REQUIRE(plan->reuses_user_password());
        REQUIRE_EQ(plan->root_password(), "secret"sv);
    }
    SECTION("separate root password")
    {
        auto choices          = make_choices();
        choices.root_password = "toor"s;

        auto plan = installer::InstallPlan::confirm(std::move(choices), "/dev/sda"sv);
        REQUIRE(plan.has_value());
        REQUIRE(!plan->reuses_user_password());
        REQUIRE_EQ(plan->root_password(), "toor"sv);
    }
    SECTION("mismatched device is refused")
    {
        auto plan = installer::InstallPlan::confirm(make_choices(), "/dev/sdb"sv);
        REQUIRE(!plan.has_value());
        REQUIRE(plan.error().contains("does not match"sv));

        REQUIRE(!installer::InstallPlan::confirm(make_choices(), "/dev/sda "sv).has_value());
        REQUIRE(!installer::InstallPlan::confirm(make_choices(), ""sv).has_value());
    }
    SECTION("no device selected")
    {
        auto choices   = make_choices();
        choices.device = ""s;

        auto plan = installer::InstallPlan::confirm(std::move(choices), ""sv);
        REQUIRE(!plan.has_value());
        REQUIRE(plan.error().contains("no target device"sv));
    }
    SECTION("password mismatch")
    {
        auto choices             = make_choices();
        choices.password_confirm = "secreT"s;

        auto plan = installer::InstallPlan::confirm(std::move(choices), "/dev/sda"sv);
        REQUIRE(!plan.has_value());
        REQUIRE(plan.error().contains("do not match"sv));
    }
    SECTION("empty passwords")
    {
        auto choices             = make_choices();
        choices.password         = ""s;
        choices.password_confirm = ""s;
        REQUIRE(!installer::InstallPlan::confirm(std::move(choices), "/dev/sda"sv).has_value());

        auto root_choices          = make_choices();
        root_choices.root_password = ""s;
        REQUIRE(!installer::InstallPlan::confirm(std::move(root_choices), "/dev/sda"sv).has_value());
    }
    SECTION("invalid username")
    {
        auto choices     = make_choices();
        choices.username = "Alice"s;

        auto plan = installer::InstallPlan::confirm(std::move(choices), "/dev/sda"sv);
        REQUIRE(!plan.has_value());
        REQUIRE(plan.error().contains("invalid username"sv));
    }
    SECTION("unknown desktop")
    {
        auto choices    = make_choices();
        choices.desktop = "kde"s;

        auto plan = installer::InstallPlan::confirm(std::move(choices), "/dev/sda"sv);
        REQUIRE(!plan.has_value());
        REQUIRE(plan.error().contains("kde"sv));
    }
}

TEST_CASE("username validation")
{
    REQUIRE(installer::is_valid_username("alice"sv));
    REQUIRE(installer::is_valid_username("a"sv));
    REQUIRE(installer::is_valid_username("dev_user-2"sv));
    REQUIRE(installer::is_valid_username(std::string(32, 'a')));

    REQUIRE(!installer::is_valid_username(""sv));
    REQUIRE(!installer::is_valid_username("2alice"sv));
    REQUIRE(!installer::is_valid_username("_alice"sv));
    REQUIRE(!installer::is_valid_username("Alice"sv));
    REQUIRE(!installer::is_valid_username("al ice"sv));
    REQUIRE(!installer::is_valid_username(std::string(33, 'a')));
}

TEST_CASE("choices from headless config")
{
    installer::InstallerConfig config{};
    config.headless_mode  = true;
    config.mirror_mode    = "stable"s;
    config.device         = "/dev/nvme0n1"s;
    config.device_confirm = "/dev/nvme0n1"s;
    config.locale         = "fr_FR.UTF-8"s;
    config.keymap         = "fr"s;
    config.timezone       = "Europe/Paris"s;
    config.user_name      = "bob"s;
    config.user_pass      = "hunter2"s;
    config.desktop        = "i3"s;
    config.gaming         = true;

    SECTION("fields and hardware are merged")
    {
        auto choices = installer::choices_from_config(config, make_hardware());
        REQUIRE(choices.has_value());
        REQUIRE(!choices->is_uefi);
        REQUIRE_EQ(choices->memory_mb, 1024);
        REQUIRE(choices->low_memory);
        REQUIRE(choices->is_ssd);
        REQUIRE_EQ(choices->mirror_mode, archi::mirrors::MirrorMode::Stable);
        REQUIRE_EQ(choices->vm, archi::system::VmGuest::Vbox);
        REQUIRE_EQ(choices->locale, "fr_FR.UTF-8"sv);
        REQUIRE_EQ(choices->keymap, "fr"sv);
        REQUIRE_EQ(choices->timezone, "Europe/Paris"sv);
        REQUIRE_EQ(choices->desktop, "i3"sv);
        REQUIRE_EQ(choices->openbox_theme, "Raven"sv);
        REQUIRE_EQ(choices->password_confirm, "hunter2"sv);
        REQUIRE(choices->gaming);
        REQUIRE(!choices->root_password.has_value());

        auto plan = installer::InstallPlan::confirm(std::move(*choices), *config.device_confirm);
        REQUIRE(plan.has_value());
    }
    SECTION("vm override")
    {
        config.vm    = "none"s;
        auto choices = installer::choices_from_config(config, make_hardware());
        REQUIRE(choices.has_value());
        REQUIRE_EQ(choices->vm, archi::system::VmGuest::None);
    }
    SECTION("unknown mirror mode")
    {
        config.mirror_mode = "fastest"s;
        auto choices       = installer::choices_from_config(config, make_hardware());
        REQUIRE(!choices.has_value());
        REQUIRE(choices.error().contains("fastest"sv));
    }
    SECTION("unknown vm")
    {
        config.vm    = "hyperv"s;
        auto choices = installer::choices_from_config(config, make_hardware());
        REQUIRE(!choices.has_value());
        REQUIRE(choices.error().contains("hyperv"sv));
    }
    SECTION("device not among the candidates")
    {
        config.device = "/dev/sdz"s;
        auto choices  = installer::choices_from_config(config, make_hardware());
        REQUIRE(!choices.has_value());
        REQUIRE(choices.error().contains("/dev/sdz"sv));
    }
}
