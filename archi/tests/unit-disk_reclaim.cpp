#include "doctest_compatibility.h"

#include "fake_runner.hpp"

#include "archi/disk_reclaim.hpp"

#include <string>
#include <string_view>

using namespace std::string_view_literals;

static constexpr auto LSBLK_QUERY = "lsblk -J -p -o NAME,TYPE,MOUNTPOINT,PTTYPE /dev/sda"sv;

static constexpr auto BUSY_JSON = R"({
   "blockdevices": [
      {"name":"/dev/sda", "type":"disk", "mountpoint":null, "pttype":"gpt",
         "children": [
            {"name":"/dev/sda1", "type":"part", "mountpoint":"/mnt/boot"},
            {"name":"/dev/sda2", "type":"part", "mountpoint":null,
               "children": [
                  {"name":"/dev/mapper/cryptroot", "type":"crypt", "mountpoint":"/mnt"}
               ]
            },
            {"name":"/dev/sda3", "type":"part", "mountpoint":"[SWAP]"}
         ]
      }
   ]
})"sv;

static constexpr auto LEFTOVER_JSON = R"({
   "blockdevices": [
      {"name":"/dev/sda", "type":"disk", "mountpoint":null, "pttype":"gpt",
         "children": [
            {"name":"/dev/sda2", "type":"part", "mountpoint":null,
               "children": [
                  {"name":"/dev/mapper/cryptroot", "type":"crypt", "mountpoint":null}
               ]
            }
         ]
      }
   ]
})"sv;

static constexpr auto FREE_JSON = R"({
   "blockdevices": [
      {"name":"/dev/sda", "type":"disk", "mountpoint":null, "pttype":"gpt",
         "children": [
            {"name":"/dev/sda1", "type":"part", "mountpoint":null},
            {"name":"/dev/sda2", "type":"part", "mountpoint":null}
         ]
      }
   ]
})"sv;

TEST_CASE("disk reclaim test")
{
    archi::test::install_noop_logger();
    archi::test::FakeRunner runner{};

    SECTION("releases every holder")
    {
        runner.add_output(std::string{LSBLK_QUERY}, std::string{BUSY_JSON});
        runner.add_output(std::string{LSBLK_QUERY}, std::string{LEFTOVER_JSON});
        runner.add_output(std::string{LSBLK_QUERY}, std::string{FREE_JSON});

        const auto& report = archi::disk::reclaim_device(runner, "/dev/sda"sv, "/mnt"sv);
        CHECK(report.device_free);
        CHECK(report.failed_steps.empty());

        CHECK(runner.ran("umount -R /mnt"));
        // deeper mountpoint goes first
        CHECK(runner.index_of("umount -lf /dev/sda1") < runner.index_of("umount -lf /dev/mapper/cryptroot"));
        CHECK(runner.index_of("umount -lf /dev/mapper/cryptroot") < runner.index_of("swapoff -a"));
        CHECK(runner.index_of("swapoff -a") < runner.index_of("cryptsetup close /dev/mapper/cryptroot"));
        CHECK(runner.index_of("cryptsetup close") < runner.index_of("vgchange -an"));
        CHECK(runner.index_of("vgchange -an") < runner.index_of("mdadm --stop --scan"));
        CHECK(runner.index_of("mdadm --stop --scan") < runner.index_of("dmsetup remove -f /dev/mapper/cryptroot"));
        CHECK(runner.index_of("dmsetup remove") < runner.index_of("udevadm settle"));
        CHECK(runner.index_of("udevadm settle") < runner.index_of("partprobe /dev/sda"));
        CHECK(runner.index_of("partprobe /dev/sda") < runner.index_of("blockdev --rereadpt /dev/sda"));
        CHECK(runner.count("lsblk") == 3);
    }
    SECTION("already free device")
    {
        runner.add_failure("mountpoint -q /mnt");
        runner.add_output(std::string{LSBLK_QUERY}, std::string{FREE_JSON});

        const auto& report = archi::disk::reclaim_device(runner, "/dev/sda"sv, "/mnt"sv);
        CHECK(report.device_free);
        CHECK(!runner.ran("umount"));
        CHECK(!runner.ran("cryptsetup"));
        CHECK(!runner.ran("dmsetup"));
        CHECK(runner.ran("swapoff -a"));
    }
    SECTION("failing steps are reported, never fatal")
    {
        runner.add_failure("mountpoint -q /mnt");
        runner.add_output(std::string{LSBLK_QUERY}, std::string{FREE_JSON});
        runner.add_failure("vgchange -an");
        runner.add_failure("mdadm --stop --scan");

        const auto& report = archi::disk::reclaim_device(runner, "/dev/sda"sv, "/mnt"sv);
        CHECK(report.device_free);
        REQUIRE_EQ(report.failed_steps.size(), 2);
        CHECK(report.failed_steps[0] == "vgchange -an"sv);
        CHECK(report.failed_steps[1] == "mdadm --stop --scan"sv);
        CHECK(runner.ran("blockdev --rereadpt /dev/sda"));
    }
    SECTION("device still busy")
    {
        runner.add_failure("mountpoint -q /mnt");
        runner.add_output(std::string{LSBLK_QUERY}, std::string{BUSY_JSON});

        const auto& report = archi::disk::reclaim_device(runner, "/dev/sda"sv, "/mnt"sv);
        CHECK(!report.device_free);
    }
    SECTION("unreadable state runs blind")
    {
        runner.add_failure("mountpoint -q /mnt");
        runner.add_failure("lsblk");

        const auto& report = archi::disk::reclaim_device(runner, "/dev/sda"sv, "/mnt"sv);
        CHECK(!report.device_free);
        CHECK(runner.ran("swapoff -a"));
        CHECK(runner.ran("vgchange -an"));
        CHECK(runner.ran("partprobe /dev/sda"));
    }
}
