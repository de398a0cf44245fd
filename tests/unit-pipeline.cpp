#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "fake_runner.hpp"

#include "config.hpp"
#include "install_plan.hpp"
#include "pipeline.hpp"

// import archi
#include "archi/action_log.hpp"
#include "archi/file_utils.hpp"
#include "archi/package_profiles.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

constexpr std::string_view TEST_ROOT{"/tmp/test-pipeline-unittest"};
constexpr std::string_view TEST_MOUNTPOINT{"/tmp/test-pipeline-unittest/root"};

constexpr auto GPT_LAYOUT_JSON = R"({
   "blockdevices": [
      {"name":"/dev/vda", "type":"disk", "mountpoint":null, "pttype":"gpt",
         "children": [
            {"name":"/dev/vda1", "type":"part", "mountpoint":null},
            {"name":"/dev/vda2", "type":"part", "mountpoint":null}
         ]
      }
   ]
})"sv;

constexpr auto MBR_LAYOUT_JSON = R"({
   "blockdevices": [
      {"name":"/dev/sda", "type":"disk", "mountpoint":null, "pttype":"dos",
         "children": [
            {"name":"/dev/sda1", "type":"part", "mountpoint":null}
         ]
      }
   ]
})"sv;

constexpr auto DF_LARGE = R"(Filesystem     1024-blocks    Used Available Capacity Mounted on
/dev/vda2         20511312   45080  19401272       1% /tmp/test-pipeline-unittest/root
)"sv;

constexpr auto DF_SMALL = R"(Filesystem     1024-blocks    Used Available Capacity Mounted on
/dev/sda1          2097152   45080   1000000       5% /tmp/test-pipeline-unittest/root
)"sv;

constexpr auto GENFSTAB_OUTPUT = "# /dev/vda2\nUUID=1f2e3d4c / ext4 rw,relatime 0 1\n"sv;

void prepare_target_root() {
    fs::remove_all(TEST_ROOT);
    REQUIRE(archi::file_utils::create_file_for_overwrite("/tmp/test-pipeline-unittest/root/etc/locale.gen"sv, "#en_US.UTF-8 UTF-8\n"sv));
    REQUIRE(archi::file_utils::create_file_for_overwrite("/tmp/test-pipeline-unittest/root/usr/share/zoneinfo/UTC"sv, "TZif"sv));
    REQUIRE(archi::file_utils::create_file_for_overwrite("/tmp/test-pipeline-unittest/root/etc/fstab"sv, "# Static information about the filesystems.\n"sv));
    REQUIRE(archi::file_utils::create_file_for_overwrite("/tmp/test-pipeline-unittest/live/pacman.conf"sv, "[options]\nParallelDownloads = 5\n"sv));
    REQUIRE(archi::file_utils::create_file_for_overwrite("/tmp/test-pipeline-unittest/live/session.log"sv, "session\n"sv));
}

auto make_settings() -> installer::RuntimeSettings {
    installer::RuntimeSettings settings{};
    settings.mountpoint   = std::string{TEST_MOUNTPOINT};
    settings.action_log   = "/tmp/test-pipeline-unittest/live/actions.log"s;
    settings.session_log  = "/tmp/test-pipeline-unittest/live/session.log"s;
    settings.install_log  = "/tmp/test-pipeline-unittest/live/pacstrap.log"s;
    settings.mirrorlist   = "/tmp/test-pipeline-unittest/live/mirrorlist"s;
    settings.pacman_conf  = "/tmp/test-pipeline-unittest/live/pacman.conf"s;
    settings.template_dir = "/tmp/test-pipeline-unittest/templates"s;
    return settings;
}

auto make_catalog() -> archi::profile::PackageCatalog {
    archi::profile::PackageCatalog catalog{};
    catalog.base_packages      = {"base", "linux", "linux-firmware", "grub"};
    catalog.uefi_packages      = {"efibootmgr"};
    catalog.theme_packages     = {"papirus-icon-theme"};
    catalog.gaming_packages    = {"steam"};
    catalog.ssh_packages       = {"openssh"};
    catalog.browser            = "firefox"s;
    catalog.browser_low_memory = "falkon"s;
    catalog.desktop_profiles   = {{.profile_name = "openbox", .packages = {"openbox", "xorg-server"}, .fallback = std::nullopt}};
    return catalog;
}

auto make_choices(std::string_view device, bool is_uefi, std::uint64_t memory_mb) -> installer::PlanChoices {
    installer::PlanChoices choices{};
    choices.is_uefi          = is_uefi;
    choices.memory_mb        = memory_mb;
    choices.low_memory       = memory_mb < archi::system::LOW_MEMORY_THRESHOLD_MB;
    choices.device           = std::string{device};
    choices.username         = "alice"s;
    choices.password         = "secret"s;
    choices.password_confirm = "secret"s;
    return choices;
}

void install_noop_default_logger() {
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
}

}  // namespace

TEST_CASE("pipeline end to end")
{
    install_noop_default_logger();
    prepare_target_root();

    const auto& settings = make_settings();
    const auto& catalog  = make_catalog();
    auto action_log      = archi::report::ActionLog::open(settings.action_log);
    REQUIRE(action_log.has_value());

    SECTION("uefi machine with plenty of memory")
    {
        auto plan = installer::InstallPlan::confirm(make_choices("/dev/vda"sv, true, 4096), "/dev/vda"sv);
        REQUIRE(plan.has_value());

        archi::test::FakeRunner runner{};
        runner.add_output("lsblk -J -p", std::string{GPT_LAYOUT_JSON});
        runner.add_output("df -Pk", std::string{DF_LARGE});
        runner.add_output("pacstrap", "installing base\ninstalling linux\n"s);
        runner.add_output("genfstab -U", std::string{GENFSTAB_OUTPUT});

        const installer::PipelineContext ctx{.plan = *plan, .settings = settings, .runner = runner, .action_log = *action_log};
        auto summary = installer::run_pipeline(ctx, catalog);
        REQUIRE(summary.has_value());

        // two partitions
        CHECK(runner.ran("mkfs.fat -F32 /dev/vda1"));
        CHECK(runner.ran("mkfs.ext4 -F /dev/vda2"));
        CHECK(runner.ran("mount /dev/vda1 /tmp/test-pipeline-unittest/root/boot"));

        // no swap, a single attempt
        CHECK(!runner.ran("fallocate"));
        CHECK(runner.count("pacstrap") == 1);
        CHECK(runner.commands[runner.index_of("pacstrap")] == "pacstrap -K /tmp/test-pipeline-unittest/root base linux linux-firmware grub efibootmgr openbox xorg-server firefox papirus-icon-theme"sv);
        CHECK(archi::file_utils::read_whole_file(settings.install_log) == "installing base\ninstalling linux\n"sv);

        // stage order
        CHECK(runner.index_of("wipefs") < runner.index_of("pacman -Sy --noconfirm --needed archlinux-keyring"));
        CHECK(runner.index_of("pacman -Sy --noconfirm --needed archlinux-keyring") < runner.index_of("pacstrap"));
        CHECK(runner.index_of("pacstrap") < runner.index_of("genfstab"));
        CHECK(runner.index_of("genfstab") < runner.index_of("arch-chroot /tmp/test-pipeline-unittest/root locale-gen"));
        CHECK(runner.index_of("arch-chroot /tmp/test-pipeline-unittest/root systemd-machine-id-setup")
            < runner.index_of("arch-chroot /tmp/test-pipeline-unittest/root grub-install"));

        CHECK(archi::file_utils::read_whole_file("/tmp/test-pipeline-unittest/root/etc/default/cpupower"sv).contains("ondemand"));
        CHECK(runner.ran("arch-chroot /tmp/test-pipeline-unittest/root systemctl disable sshd"));
        CHECK(runner.ran("arch-chroot /tmp/test-pipeline-unittest/root grub-install --target=x86_64-efi --efi-directory=/boot --bootloader-id=Arch --recheck"));
        CHECK(runner.ran("arch-chroot /tmp/test-pipeline-unittest/root grub-mkconfig -o /boot/grub/grub.cfg"));

        CHECK(summary->is_uefi);
        CHECK(summary->desktop == "openbox (Raven)"sv);
        CHECK(summary->log_path == "/var/log/arch-installer.log"sv);
        CHECK(archi::file_utils::read_whole_file("/tmp/test-pipeline-unittest/root/var/log/arch-installer.log"sv).contains("system ready for reboot"));
        CHECK(archi::file_utils::read_whole_file("/tmp/test-pipeline-unittest/root/var/log/arch-installer-live.log"sv) == "session\n"sv);
    }
    SECTION("bios machine with little memory")
    {
        auto choices   = make_choices("/dev/sda"sv, false, 1024);
        choices.gaming = true;
        auto plan      = installer::InstallPlan::confirm(std::move(choices), "/dev/sda"sv);
        REQUIRE(plan.has_value());

        archi::test::FakeRunner runner{};
        runner.add_output("lsblk -J -p", std::string{MBR_LAYOUT_JSON});
        runner.add_output("df -Pk", std::string{DF_SMALL});
        runner.add_output("genfstab -U", std::string{GENFSTAB_OUTPUT});

        const installer::PipelineContext ctx{.plan = *plan, .settings = settings, .runner = runner, .action_log = *action_log};
        auto summary = installer::run_pipeline(ctx, catalog);
        REQUIRE(summary.has_value());

        CHECK(!runner.ran("mkfs.fat"));
        CHECK(runner.ran("mkfs.ext4 -F /dev/sda1"));

        // temporary swap around the install
        CHECK(runner.ran("fallocate -l 512M /tmp/test-pipeline-unittest/root/swapfile"));
        CHECK(runner.index_of("swapon /tmp/test-pipeline-unittest/root/swapfile") < runner.index_of("pacstrap"));
        CHECK(runner.index_of("pacstrap") < runner.index_of("swapoff /tmp/test-pipeline-unittest/root/swapfile"));
        CHECK(runner.ran("rm -f /tmp/test-pipeline-unittest/root/swapfile"));

        // not enough memory for the gaming extras
        REQUIRE(runner.ran("pacstrap"));
        CHECK(runner.commands[runner.index_of("pacstrap")] == "pacstrap -K /tmp/test-pipeline-unittest/root base linux linux-firmware grub openbox xorg-server firefox papirus-icon-theme"sv);

        CHECK(archi::file_utils::read_whole_file("/tmp/test-pipeline-unittest/root/etc/default/cpupower"sv).contains("performance"));
        CHECK(fs::exists("/tmp/test-pipeline-unittest/root/etc/systemd/zram-generator.conf"));
        CHECK(runner.ran("arch-chroot /tmp/test-pipeline-unittest/root grub-install --target=i386-pc --recheck /dev/sda"));
        CHECK(!summary->is_uefi);
    }
    SECTION("failed install is retried once with the fallback mirror")
    {
        auto plan = installer::InstallPlan::confirm(make_choices("/dev/vda"sv, true, 4096), "/dev/vda"sv);
        REQUIRE(plan.has_value());

        archi::test::FakeRunner runner{};
        runner.add_output("lsblk -J -p", std::string{GPT_LAYOUT_JSON});
        runner.add_response("pacstrap", {.exit_code = 1, .output = "error: failed retrieving file\n"});
        runner.add_response("pacstrap", {.exit_code = 0, .output = "installing base\n"});
        runner.add_output("genfstab -U", std::string{GENFSTAB_OUTPUT});

        const installer::PipelineContext ctx{.plan = *plan, .settings = settings, .runner = runner, .action_log = *action_log};
        REQUIRE(installer::run_pipeline(ctx, catalog).has_value());

        CHECK(runner.count("pacstrap") == 2);
        CHECK(runner.index_of("pacman -Syy --noconfirm archlinux-keyring") > runner.index_of("pacstrap"));
        CHECK(archi::file_utils::read_whole_file(settings.mirrorlist) == "Server = https://geo.mirror.pkgbuild.com/$repo/os/$arch\n"sv);
        CHECK(archi::file_utils::read_whole_file(settings.install_log) == "error: failed retrieving file\ninstalling base\n"sv);
    }
    SECTION("install failure stops the pipeline")
    {
        auto plan = installer::InstallPlan::confirm(make_choices("/dev/vda"sv, true, 4096), "/dev/vda"sv);
        REQUIRE(plan.has_value());

        archi::test::FakeRunner runner{};
        runner.add_output("lsblk -J -p", std::string{GPT_LAYOUT_JSON});
        runner.add_response("pacstrap", {.exit_code = 1, .output = "error: target not found: foo\n"});

        const installer::PipelineContext ctx{.plan = *plan, .settings = settings, .runner = runner, .action_log = *action_log};
        auto summary = installer::run_pipeline(ctx, catalog);
        REQUIRE(!summary.has_value());

        const auto& error = summary.error();
        CHECK(error.stage == installer::InstallStage::Provision);
        CHECK(error.diagnostic_tail.contains("target not found"));
        CHECK(error.log_path == settings.install_log);
        CHECK(runner.count("pacstrap") == 2);
        CHECK(!runner.ran("genfstab"));
        CHECK(!runner.ran("arch-chroot"));
        CHECK(action_log->records().back().message.starts_with("FATAL [provision]"));
    }
    SECTION("partitioning failure leaves the packages alone")
    {
        auto plan = installer::InstallPlan::confirm(make_choices("/dev/vda"sv, true, 4096), "/dev/vda"sv);
        REQUIRE(plan.has_value());

        archi::test::FakeRunner runner{};
        runner.add_output("lsblk -J -p", std::string{GPT_LAYOUT_JSON});
        runner.add_failure("wipefs");

        const installer::PipelineContext ctx{.plan = *plan, .settings = settings, .runner = runner, .action_log = *action_log};
        auto summary = installer::run_pipeline(ctx, catalog);
        REQUIRE(!summary.has_value());
        CHECK(summary.error().stage == installer::InstallStage::Partition);
        CHECK(!runner.ran("sgdisk -n"));
        CHECK(!runner.ran("pacstrap"));
        CHECK(!runner.ran("reflector"));
    }
    SECTION("boot loader failure is fatal")
    {
        auto plan = installer::InstallPlan::confirm(make_choices("/dev/vda"sv, true, 4096), "/dev/vda"sv);
        REQUIRE(plan.has_value());

        archi::test::FakeRunner runner{};
        runner.add_output("lsblk -J -p", std::string{GPT_LAYOUT_JSON});
        runner.add_output("genfstab -U", std::string{GENFSTAB_OUTPUT});
        runner.add_failure("arch-chroot /tmp/test-pipeline-unittest/root grub-install");

        const installer::PipelineContext ctx{.plan = *plan, .settings = settings, .runner = runner, .action_log = *action_log};
        auto summary = installer::run_pipeline(ctx, catalog);
        REQUIRE(!summary.has_value());
        CHECK(summary.error().stage == installer::InstallStage::Bootloader);
        CHECK(!fs::exists("/tmp/test-pipeline-unittest/root/var/log/arch-installer.log"));
    }

    fs::remove_all(TEST_ROOT);
}

TEST_CASE("install plan is logged once per run")
{
    prepare_target_root();

    std::size_t plan_dumps{};
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([&plan_dumps](const spdlog::details::log_msg& msg) {
        if (std::string_view{msg.payload.data(), msg.payload.size()}.starts_with("Install plan:"sv)) {
            ++plan_dumps;
        }
    });
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("default", callback_sink));

    const auto& settings = make_settings();
    auto action_log      = archi::report::ActionLog::open(settings.action_log);
    REQUIRE(action_log.has_value());
    auto plan = installer::InstallPlan::confirm(make_choices("/dev/vda"sv, true, 4096), "/dev/vda"sv);
    REQUIRE(plan.has_value());

    archi::test::FakeRunner runner{};
    runner.add_output("lsblk -J -p", std::string{GPT_LAYOUT_JSON});
    runner.add_output("df -Pk", std::string{DF_LARGE});
    runner.add_output("genfstab -U", std::string{GENFSTAB_OUTPUT});

    const installer::PipelineContext ctx{.plan = *plan, .settings = settings, .runner = runner, .action_log = *action_log};
    REQUIRE(installer::run_pipeline(ctx, make_catalog()).has_value());
    CHECK(plan_dumps == 1);

    install_noop_default_logger();
    fs::remove_all(TEST_ROOT);
}

TEST_CASE("hardware probe stage")
{
    install_noop_default_logger();
    prepare_target_root();

    auto settings    = make_settings();
    settings.efivars = "/tmp/test-pipeline-unittest/live/efivars"s;
    settings.meminfo = "/tmp/test-pipeline-unittest/live/meminfo"s;
    REQUIRE(archi::file_utils::create_file_for_overwrite(settings.meminfo, "MemTotal:        4194304 kB\nMemFree:         2097152 kB\n"sv));

    auto action_log = archi::report::ActionLog::open(settings.action_log);
    REQUIRE(action_log.has_value());

    SECTION("no candidate disks ends the run with a fatal record")
    {
        archi::test::FakeRunner runner{};
        runner.add_output("lsblk -J -d", R"({"blockdevices": []})"s);

        const auto& hw_info = installer::probe_stage(runner, settings, *action_log);
        REQUIRE(!hw_info.has_value());
        CHECK(hw_info.error() == "no candidate block devices found"sv);

        REQUIRE(!action_log->records().empty());
        CHECK(action_log->records().back().message == "FATAL [startup]: no candidate block devices found"sv);
        CHECK(archi::file_utils::read_whole_file(settings.action_log).contains("FATAL [startup]: no candidate block devices found"));
    }
    SECTION("probed hardware is recorded")
    {
        archi::test::FakeRunner runner{};
        runner.add_output("lsblk -J -d", R"({"blockdevices": [{"name":"/dev/vda", "type":"disk", "size":68719476736, "model":null, "rm":false, "rota":false}]})"s);

        const auto& hw_info = installer::probe_stage(runner, settings, *action_log);
        REQUIRE(hw_info.has_value());
        CHECK(!hw_info->is_uefi);
        CHECK(hw_info->memory_mb == 4096);
        REQUIRE(hw_info->disks.size() == 1);
        CHECK(action_log->records().back().message == "probe: BIOS firmware, 4096 MB memory, 1 candidate disks"sv);
    }

    fs::remove_all(TEST_ROOT);
}

TEST_CASE("mirror stage")
{
    install_noop_default_logger();
    prepare_target_root();

    const auto& settings = make_settings();
    auto action_log      = archi::report::ActionLog::open(settings.action_log);
    REQUIRE(action_log.has_value());

    SECTION("safe profile turns auto into safe")
    {
        auto choices         = make_choices("/dev/vda"sv, true, 4096);
        choices.safe_profile = true;
        auto plan            = installer::InstallPlan::confirm(std::move(choices), "/dev/vda"sv);
        REQUIRE(plan.has_value());

        archi::test::FakeRunner runner{};
        const installer::PipelineContext ctx{.plan = *plan, .settings = settings, .runner = runner, .action_log = *action_log};
        CHECK(installer::mirror_stage(ctx) == archi::mirrors::MirrorMode::Safe);
        CHECK(!runner.ran("reflector"));

        const auto& pacman_conf = archi::file_utils::read_whole_file(settings.pacman_conf);
        CHECK(pacman_conf.contains("ParallelDownloads = 1"));
        CHECK(pacman_conf.contains("DisableDownloadTimeout"));
    }
    SECTION("ranking timeout keeps the previous list")
    {
        REQUIRE(archi::file_utils::create_file_for_overwrite(settings.mirrorlist, "Server = https://old.example/$repo/os/$arch\n"sv));
        auto plan = installer::InstallPlan::confirm(make_choices("/dev/vda"sv, true, 4096), "/dev/vda"sv);
        REQUIRE(plan.has_value());

        archi::test::FakeRunner runner{};
        runner.add_response("reflector", {.exit_code = -1, .output = {}, .timed_out = true});
        const installer::PipelineContext ctx{.plan = *plan, .settings = settings, .runner = runner, .action_log = *action_log};
        CHECK(installer::mirror_stage(ctx) == archi::mirrors::MirrorMode::Auto);
        CHECK(archi::file_utils::read_whole_file(settings.mirrorlist) == "Server = https://old.example/$repo/os/$arch\n"sv);
    }

    fs::remove_all(TEST_ROOT);
}
