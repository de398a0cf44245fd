#include "doctest_compatibility.h"

#include "archi/file_utils.hpp"
#include "archi/pacmanconf.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

static constexpr auto PACMANCONF_STR = R"(
[options]
HoldPkg     = pacman glibc
Architecture = auto

# Misc options
Color
CheckSpace
#ParallelDownloads = 5

[core]
Include = /etc/pacman.d/mirrorlist

[extra]
Include = /etc/pacman.d/mirrorlist
)"sv;

static constexpr auto PACMANCONF_TEST = R"(
[options]
HoldPkg     = pacman glibc
Architecture = auto

# Misc options
Color
CheckSpace
ParallelDownloads = 1

[core]
Include = /etc/pacman.d/mirrorlist

[extra]
Include = /etc/pacman.d/mirrorlist
)"sv;

TEST_CASE("pacmanconf set option test")
{
    SECTION("commented option is replaced in place")
    {
        REQUIRE_EQ(archi::pacmanconf::set_option(PACMANCONF_STR, "ParallelDownloads"sv, "1"sv), PACMANCONF_TEST);
    }
    SECTION("existing option keeps its position")
    {
        const auto& content = archi::pacmanconf::set_option(PACMANCONF_TEST, "ParallelDownloads"sv, "3"sv);
        REQUIRE(content.contains("CheckSpace\nParallelDownloads = 3\n"));
        REQUIRE(!content.contains("ParallelDownloads = 1"));
    }
    SECTION("missing option is inserted after the header")
    {
        const auto& content = archi::pacmanconf::set_option(PACMANCONF_STR, "DisableDownloadTimeout"sv, ""sv);
        REQUIRE(content.contains("[options]\nDisableDownloadTimeout\nHoldPkg"));
    }
    SECTION("similar key is left alone")
    {
        static constexpr auto input = "[options]\nColorful = yes\n"sv;
        const auto& content         = archi::pacmanconf::set_option(input, "Color"sv, ""sv);
        REQUIRE_EQ(content, "[options]\nColor\nColorful = yes\n");
    }
    SECTION("options of other sections are not touched")
    {
        static constexpr auto input = "[options]\nColor\n\n[custom]\n#ParallelDownloads = 5\n"sv;
        const auto& content         = archi::pacmanconf::set_option(input, "ParallelDownloads"sv, "1"sv);
        REQUIRE_EQ(content, "[options]\nParallelDownloads = 1\nColor\n\n[custom]\n#ParallelDownloads = 5\n");
    }
    SECTION("no options section")
    {
        static constexpr auto input = "[core]\nInclude = /etc/pacman.d/mirrorlist\n"sv;
        REQUIRE_EQ(archi::pacmanconf::set_option(input, "ParallelDownloads"sv, "1"sv), input);
    }
}

TEST_CASE("pacmanconf file test")
{
    static constexpr std::string_view filename{"/tmp/archi-pacman.conf"};

    SECTION("rewrite file")
    {
        REQUIRE(archi::file_utils::create_file_for_overwrite(filename, PACMANCONF_STR));
        REQUIRE(archi::pacmanconf::set_option_in_file(filename, "ParallelDownloads"sv, "1"sv));
        REQUIRE_EQ(archi::file_utils::read_whole_file(filename), PACMANCONF_TEST);
        fs::remove(filename);
    }
    SECTION("missing file")
    {
        REQUIRE(!archi::pacmanconf::set_option_in_file("/tmp/archi-missing-pacman.conf"sv, "Color"sv, ""sv));
    }
}

TEST_CASE("mirrorlist test")
{
    const std::vector<std::string_view> servers{"https://a.example/$repo/os/$arch", "https://b.example/$repo/os/$arch"};
    REQUIRE_EQ(archi::pacmanconf::gen_mirrorlist(servers), "Server = https://a.example/$repo/os/$arch\nServer = https://b.example/$repo/os/$arch\n");
    REQUIRE(archi::pacmanconf::gen_mirrorlist({}).empty());
}
