#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "IniConfig.hpp"
#include "Settings.hpp"
#include "TestHelpers.hpp"

#include <fstream>

namespace {

std::string write_config(const std::filesystem::path& dir, const std::string& contents)
{
    const auto path = dir / "config.ini";
    std::ofstream out(path);
    out << contents;
    return path.string();
}

}

TEST_CASE("settings load every resolver option") {
    TempDir temp_dir;
    const std::string path = write_config(temp_dir.path(),
        "; resolver defaults\n"
        "[Resolver]\n"
        "support_multi_version = false\n"
        "parse_name = no\n"
        "media_kind = TvShows\n"
        "library_root = /srv/media\n"
        "recursive_scan = yes\n"
        "\n"
        "[Naming]\n"
        "extra_video_extensions = .foo, bar\n"
        "\n"
        "[Logging]\n"
        "level = debug\n");

    Settings settings(path);
    REQUIRE(settings.load());

    CHECK_FALSE(settings.get_support_multi_version());
    CHECK_FALSE(settings.get_parse_name());
    CHECK(settings.get_media_kind() == MediaKind::TvShows);
    CHECK(settings.get_library_root() == "/srv/media");
    CHECK(settings.get_recursive_scan());
    CHECK(settings.get_extra_video_extensions() == std::vector<std::string>{".foo", "bar"});
    CHECK(settings.get_log_level() == spdlog::level::debug);
}

TEST_CASE("a missing config file keeps the defaults") {
    TempDir temp_dir;
    Settings settings((temp_dir.path() / "absent.ini").string());

    CHECK_FALSE(settings.load());
    CHECK(settings.get_support_multi_version());
    CHECK(settings.get_parse_name());
    CHECK_FALSE(settings.get_media_kind().has_value());
    CHECK_FALSE(settings.get_recursive_scan());
    CHECK(settings.get_log_level() == spdlog::level::info);
}

TEST_CASE("an unknown media kind is a configuration error") {
    TempDir temp_dir;
    Settings settings(write_config(temp_dir.path(), "[Resolver]\nmedia_kind = anime\n"));
    CHECK_THROWS_AS(settings.load(), ErrorCodes::AppException);
}

TEST_CASE("an unknown log level is a configuration error") {
    TempDir temp_dir;
    Settings settings(write_config(temp_dir.path(), "[Logging]\nlevel = chatty\n"));
    CHECK_THROWS_AS(settings.load(), ErrorCodes::AppException);
}

TEST_CASE("an invalid boolean falls back to the default") {
    TempDir temp_dir;
    Settings settings(write_config(temp_dir.path(), "[Resolver]\nsupport_multi_version = maybe\n"));
    REQUIRE(settings.load());
    CHECK(settings.get_support_multi_version());
}

TEST_CASE("saved settings load back") {
    TempDir temp_dir;
    const std::string path = (temp_dir.path() / "nested" / "config.ini").string();

    Settings original(path);
    original.set_media_kind(MediaKind::MusicVideos);
    original.set_parse_name(false);
    original.set_extra_video_extensions({".foo"});
    original.set_log_level(spdlog::level::warn);
    REQUIRE(original.save());

    Settings reloaded(path);
    REQUIRE(reloaded.load());
    CHECK(reloaded.get_media_kind() == MediaKind::MusicVideos);
    CHECK_FALSE(reloaded.get_parse_name());
    CHECK(reloaded.get_extra_video_extensions() == std::vector<std::string>{".foo"});
    CHECK(reloaded.get_log_level() == spdlog::level::warn);
}

TEST_CASE("default config path honours the override directory") {
    TempDir temp_dir;
    EnvVarGuard guard("VIDEO_LIST_RESOLVER_CONFIG_DIR", temp_dir.path().string());

    Settings settings;
    const auto expected = temp_dir.path() / "VideoListResolver" / "config.ini";
    CHECK(settings.get_config_path() == expected.string());
    CHECK(settings.get_config_dir() == expected.parent_path().string());
}

TEST_CASE("ini parser skips comments and malformed lines") {
    TempDir temp_dir;
    const std::string path = write_config(temp_dir.path(),
        "# comment\n"
        "[Section]\n"
        "key = value with spaces \n"
        "not a pair\n"
        "= no key\n"
        "[Other]\n"
        "key=second\n");

    IniConfig config;
    REQUIRE(config.load(path));
    CHECK(config.getValue("Section", "key") == "value with spaces");
    CHECK(config.getValue("Other", "key") == "second");
    CHECK_FALSE(config.hasValue("Section", "not a pair"));
    CHECK(config.getValue("Missing", "key", "fallback") == "fallback");
}
