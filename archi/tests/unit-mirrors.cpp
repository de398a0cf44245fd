#include "doctest_compatibility.h"

#include "fake_runner.hpp"

#include "archi/file_utils.hpp"
#include "archi/mirrors.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;
using namespace std::string_view_literals;
using archi::mirrors::MirrorMode;

static constexpr auto PACMANCONF_STR = "[options]\n#ParallelDownloads = 5\n\n[core]\nInclude = /etc/pacman.d/mirrorlist\n"sv;
static constexpr auto OLD_MIRRORLIST = "Server = https://old.example/$repo/os/$arch\n"sv;

TEST_CASE("mirror mode names")
{
    SECTION("round trip of every mode")
    {
        for (auto&& mode : {MirrorMode::Auto, MirrorMode::Stable, MirrorMode::Us, MirrorMode::Eu, MirrorMode::Asia, MirrorMode::Safe}) {
            REQUIRE_EQ(archi::mirrors::string_to_mirror_mode(archi::mirrors::mirror_mode_to_string(mode)), mode);
        }
    }
    SECTION("unknown name")
    {
        REQUIRE(!archi::mirrors::string_to_mirror_mode("fastest"sv).has_value());
        REQUIRE(!archi::mirrors::string_to_mirror_mode("Auto"sv).has_value());
    }
}

TEST_CASE("effective mirror mode")
{
    REQUIRE_EQ(archi::mirrors::effective_mirror_mode(MirrorMode::Auto, true), MirrorMode::Safe);
    REQUIRE_EQ(archi::mirrors::effective_mirror_mode(MirrorMode::Auto, false), MirrorMode::Auto);
    REQUIRE_EQ(archi::mirrors::effective_mirror_mode(MirrorMode::Eu, true), MirrorMode::Eu);
    REQUIRE_EQ(archi::mirrors::effective_mirror_mode(MirrorMode::Stable, true), MirrorMode::Stable);
}

TEST_CASE("mirror servers")
{
    SECTION("stable")
    {
        const auto& servers = archi::mirrors::mirror_servers(MirrorMode::Stable);
        REQUIRE_EQ(servers.size(), 2);
        REQUIRE_EQ(servers.back(), archi::mirrors::FALLBACK_MIRROR);
    }
    SECTION("regions keep the stable mirrors")
    {
        for (auto&& mode : {MirrorMode::Us, MirrorMode::Eu, MirrorMode::Asia}) {
            const auto& servers = archi::mirrors::mirror_servers(mode);
            REQUIRE(servers.size() > 2);
            REQUIRE(servers.front().contains("kernel.org"sv));
            REQUIRE_EQ(servers.back(), archi::mirrors::FALLBACK_MIRROR);
        }
    }
    SECTION("no fixed list")
    {
        REQUIRE(archi::mirrors::mirror_servers(MirrorMode::Auto).empty());
        REQUIRE(archi::mirrors::mirror_servers(MirrorMode::Safe).empty());
    }
}

TEST_CASE("apply mirror mode")
{
    archi::test::install_noop_logger();

    static constexpr std::string_view folder_testpath{"/tmp/archi-mirrors-unittest"};
    const archi::mirrors::MirrorPaths paths{
        .mirrorlist  = std::string{folder_testpath} + "/mirrorlist",
        .pacman_conf = std::string{folder_testpath} + "/pacman.conf",
    };
    fs::create_directories(folder_testpath);
    REQUIRE(archi::file_utils::create_file_for_overwrite(paths.mirrorlist, OLD_MIRRORLIST));
    REQUIRE(archi::file_utils::create_file_for_overwrite(paths.pacman_conf, PACMANCONF_STR));

    archi::test::FakeRunner runner{};

    SECTION("regional list is written and the database refreshed")
    {
        REQUIRE_EQ(archi::mirrors::apply_mirror_mode(runner, MirrorMode::Eu, paths), MirrorMode::Eu);

        const auto& mirrorlist = archi::file_utils::read_whole_file(paths.mirrorlist);
        REQUIRE(mirrorlist.contains("Server = https://mirror.netcologne.de/archlinux/$repo/os/$arch\n"sv));
        REQUIRE(!mirrorlist.contains("old.example"sv));
        REQUIRE(runner.index_of("pacman -Sy --noconfirm --needed archlinux-keyring") < runner.index_of("pacman -Syy --noconfirm"));
    }
    SECTION("keyring failure is not fatal")
    {
        runner.add_failure("pacman -Sy --noconfirm --needed archlinux-keyring");
        REQUIRE_EQ(archi::mirrors::apply_mirror_mode(runner, MirrorMode::Stable, paths), MirrorMode::Stable);
        REQUIRE(runner.ran("pacman -Syy --noconfirm"));
    }
    SECTION("safe mode keeps mirrors and limits downloads")
    {
        REQUIRE_EQ(archi::mirrors::apply_mirror_mode(runner, MirrorMode::Safe, paths), MirrorMode::Safe);

        REQUIRE_EQ(archi::file_utils::read_whole_file(paths.mirrorlist), OLD_MIRRORLIST);
        const auto& pacman_conf = archi::file_utils::read_whole_file(paths.pacman_conf);
        REQUIRE(pacman_conf.contains("ParallelDownloads = 1\n"sv));
        REQUIRE(pacman_conf.contains("\nDisableDownloadTimeout\n"sv));
        REQUIRE(!runner.ran("pacman -Syy"));
    }
    SECTION("auto mode ranks with a deadline")
    {
        REQUIRE_EQ(archi::mirrors::apply_mirror_mode(runner, MirrorMode::Auto, paths), MirrorMode::Auto);
        REQUIRE(runner.ran("reflector --protocol https --latest 20 --sort rate --save"));
        REQUIRE_EQ(runner.timeouts.size(), 1);
        REQUIRE_EQ(runner.timeouts[0], archi::mirrors::RANKING_TIMEOUT);
    }
    SECTION("ranking timeout keeps the previous list")
    {
        runner.add_response("reflector", {.exit_code = -1, .output = {}, .timed_out = true});
        REQUIRE_EQ(archi::mirrors::apply_mirror_mode(runner, MirrorMode::Auto, paths), MirrorMode::Auto);
        REQUIRE_EQ(archi::file_utils::read_whole_file(paths.mirrorlist), OLD_MIRRORLIST);
    }
    SECTION("reflector unavailable")
    {
        runner.add_failure("pacman -Sy --noconfirm --needed reflector");
        REQUIRE_EQ(archi::mirrors::apply_mirror_mode(runner, MirrorMode::Auto, paths), MirrorMode::Auto);
        REQUIRE(!runner.ran("reflector"));
        REQUIRE_EQ(archi::file_utils::read_whole_file(paths.mirrorlist), OLD_MIRRORLIST);
    }

    fs::remove_all(folder_testpath);
}
