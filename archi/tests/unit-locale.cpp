#include "doctest_compatibility.h"

#include "fake_runner.hpp"

#include "archi/file_utils.hpp"
#include "archi/locale.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

static constexpr auto LOCALE_GEN_TAIL = "#ru_RU.UTF-8 UTF-8\nru_RU.UTF-8 UTF-8\n"sv;

TEST_CASE("locale test")
{
    archi::test::install_noop_logger();

    // prepare test data
    static constexpr std::string_view folder_testpath{"/tmp/test-locale-unittest"};
    static constexpr std::string_view folder_path{"/tmp/test-locale-unittest/etc"};
    static constexpr std::string_view dest_locale_gen{"/tmp/test-locale-unittest/etc/locale.gen"};
    static constexpr std::string_view dest_locale_conf{"/tmp/test-locale-unittest/etc/locale.conf"};

    fs::remove_all(folder_testpath);

    SECTION("set test locale")
    {
        fs::create_directories(folder_path);
        fs::copy_file(ARCHI_TEST_DIR "/files/locale.gen", dest_locale_gen, fs::copy_options::overwrite_existing);

        REQUIRE(archi::locale::prepare_locale_set("ru_RU.UTF-8"sv, folder_testpath));
        CHECK(archi::file_utils::read_whole_file(dest_locale_conf) == "LANG=ru_RU.UTF-8\n"sv);
        CHECK(archi::file_utils::read_whole_file(dest_locale_gen).ends_with(LOCALE_GEN_TAIL));

        // Cleanup.
        fs::remove_all(folder_testpath);
    }
    SECTION("entry is added only once")
    {
        fs::create_directories(folder_path);
        fs::copy_file(ARCHI_TEST_DIR "/files/locale.gen", dest_locale_gen, fs::copy_options::overwrite_existing);

        REQUIRE(archi::locale::prepare_locale_set("ru_RU.UTF-8"sv, folder_testpath));
        REQUIRE(archi::locale::prepare_locale_set("ru_RU.UTF-8"sv, folder_testpath));
        CHECK(archi::file_utils::read_whole_file(dest_locale_gen).ends_with(LOCALE_GEN_TAIL));

        fs::remove_all(folder_testpath);
    }
    SECTION("set locale at invalid file path")
    {
        REQUIRE(!archi::locale::prepare_locale_set("ru_RU.UTF-8"sv, folder_testpath));
    }
    SECTION("locale-gen runs inside the target")
    {
        fs::create_directories(folder_path);
        fs::copy_file(ARCHI_TEST_DIR "/files/locale.gen", dest_locale_gen, fs::copy_options::overwrite_existing);

        archi::test::FakeRunner runner{};
        REQUIRE(archi::locale::set_locale(runner, "en_US.UTF-8"sv, folder_testpath));
        CHECK(runner.commands == std::vector<std::string>{"arch-chroot /tmp/test-locale-unittest locale-gen"});

        runner.add_failure("arch-chroot /tmp/test-locale-unittest locale-gen");
        CHECK(!archi::locale::set_locale(runner, "en_US.UTF-8"sv, folder_testpath));

        fs::remove_all(folder_testpath);
    }
    SECTION("keymap")
    {
        REQUIRE(archi::locale::set_keymap("de"sv, folder_testpath));
        CHECK(archi::file_utils::read_whole_file("/tmp/test-locale-unittest/etc/vconsole.conf"sv) == "KEYMAP=de\nFONT=lat9w-16\n"sv);
        fs::remove_all(folder_testpath);
    }
}

TEST_CASE("locale strip test")
{
    archi::test::install_noop_logger();

    SECTION("base language")
    {
        CHECK(archi::locale::locale_base_language("en_US.UTF-8"sv) == "en"sv);
        CHECK(archi::locale::locale_base_language("en@quot"sv) == "en"sv);
        CHECK(archi::locale::locale_base_language("pt_BR"sv) == "pt"sv);
        CHECK(archi::locale::locale_base_language("de"sv) == "de"sv);
    }
    SECTION("selection keeps the chosen language")
    {
        const std::vector<std::string> entries{"de", "en", "en@quot", "en_GB", "en_US", "fr", "pt_BR"};
        const auto& to_remove = archi::locale::select_locales_to_remove(entries, "en_US.UTF-8"sv);
        CHECK(to_remove == std::vector<std::string>{"de", "fr", "pt_BR"});
    }
    SECTION("empty locale removes nothing")
    {
        const std::vector<std::string> entries{"de", "en"};
        CHECK(archi::locale::select_locales_to_remove(entries, ""sv).empty());
    }
    SECTION("strip translation directories")
    {
        static constexpr std::string_view folder_testpath{"/tmp/test-locale-strip-unittest"};
        const auto& locale_dir = fs::path{folder_testpath} / "usr/share/locale";
        for (auto&& dir : {"de/LC_MESSAGES", "en_GB/LC_MESSAGES", "en/LC_MESSAGES", "ja/LC_MESSAGES"}) {
            fs::create_directories(locale_dir / dir);
        }
        REQUIRE(archi::file_utils::create_file_for_overwrite((locale_dir / "locale.alias").string(), "# aliases\n"sv));

        REQUIRE(archi::locale::strip_locales("en_US.UTF-8"sv, folder_testpath));
        CHECK(fs::exists(locale_dir / "en"));
        CHECK(fs::exists(locale_dir / "en_GB"));
        CHECK(fs::exists(locale_dir / "locale.alias"));
        CHECK(!fs::exists(locale_dir / "de"));
        CHECK(!fs::exists(locale_dir / "ja"));

        fs::remove_all(folder_testpath);
    }
    SECTION("missing locale directory")
    {
        CHECK(!archi::locale::strip_locales("en_US.UTF-8"sv, "/tmp/test-locale-missing-unittest"sv));
    }
}
