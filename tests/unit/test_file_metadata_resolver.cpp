#include <catch2/catch_test_macros.hpp>
#include "FileMetadataResolver.hpp"
#include "NamingOptions.hpp"

TEST_CASE("a movie file resolves to title, year and container") {
    const NamingOptions options;
    const auto record = FileMetadataResolver::resolve(
        "/movies/Movie (2020)/Movie (2020).mkv", false, options);

    REQUIRE(record.has_value());
    CHECK(record->display_name == "Movie");
    CHECK(record->year == 2020);
    CHECK(record->container == "mkv");
    CHECK_FALSE(record->is_directory);
    CHECK_FALSE(record->extra_kind.has_value());
    CHECK_FALSE(record->version_tag.has_value());
}

TEST_CASE("release tags are stripped from the display name") {
    const NamingOptions options;
    const auto record = FileMetadataResolver::resolve(
        "/movies/Movie.2011.1080p.BluRay.MKV", false, options);

    REQUIRE(record.has_value());
    CHECK(record->display_name == "Movie");
    CHECK(record->year == 2011);
    CHECK(record->container == "mkv");
}

TEST_CASE("non-video files and empty paths are rejected") {
    const NamingOptions options;
    CHECK_FALSE(FileMetadataResolver::resolve("/movies/notes.txt", false, options).has_value());
    CHECK_FALSE(FileMetadataResolver::resolve("", false, options).has_value());
}

TEST_CASE("extra video extensions extend the defaults") {
    const NamingOptions defaults;
    const NamingOptions extended({"foo", ".BAR"});
    CHECK_FALSE(FileMetadataResolver::resolve("/m/Clip.foo", false, defaults).has_value());
    CHECK(FileMetadataResolver::resolve("/m/Clip.foo", false, extended).has_value());
    CHECK(FileMetadataResolver::resolve("/m/Clip.bar", false, extended).has_value());
}

TEST_CASE("folders resolve without a container") {
    const NamingOptions options;
    const auto record = FileMetadataResolver::resolve("/movies/Movie (2020)", true, options);

    REQUIRE(record.has_value());
    CHECK(record->is_directory);
    CHECK(record->container.empty());
    CHECK(record->display_name == "Movie");
    CHECK(record->year == 2020);
}

TEST_CASE("dots in a folder name are not an extension") {
    const NamingOptions options;
    const auto folder = FileMetadataResolver::resolve("/movies/Some.Movie.2020", true, options);
    const auto file = FileMetadataResolver::resolve("/movies/Some.Movie.2020.mkv", false, options);

    REQUIRE(folder.has_value());
    REQUIRE(file.has_value());
    CHECK(folder->display_name == "Some.Movie");
    CHECK(folder->year == 2020);
    CHECK(folder->display_name == file->display_name);

    const auto raw = FileMetadataResolver::resolve("/movies/Some.Movie.2020", true, options, false);
    REQUIRE(raw.has_value());
    CHECK(raw->display_name == "Some.Movie.2020");
}

TEST_CASE("name parsing can be switched off") {
    const NamingOptions options;
    const auto record = FileMetadataResolver::resolve(
        "/movies/Movie (2020) - [4K].mkv", false, options, false);

    REQUIRE(record.has_value());
    CHECK(record->display_name == "Movie (2020) - [4K]");
    CHECK_FALSE(record->year.has_value());
}

TEST_CASE("extra kinds come from folder names, file names and suffixes") {
    const NamingOptions options;
    CHECK(FileMetadataResolver::resolve_extra_kind("/m/Movie/trailers/Teaser.mkv", false, options)
          == ExtraKind::Trailer);
    CHECK(FileMetadataResolver::resolve_extra_kind("/m/Movie/Extras/Gag reel.mkv", false, options)
          == ExtraKind::Unknown);
    CHECK(FileMetadataResolver::resolve_extra_kind("/m/Movie/sample.mkv", false, options)
          == ExtraKind::Sample);
    CHECK(FileMetadataResolver::resolve_extra_kind("/m/Movie/Movie-trailer.mkv", false, options)
          == ExtraKind::Trailer);
    CHECK(FileMetadataResolver::resolve_extra_kind("/m/Movie/Movie-deleted.mkv", false, options)
          == ExtraKind::DeletedScene);
    CHECK_FALSE(FileMetadataResolver::resolve_extra_kind("/m/Movie/Movie.mkv", false, options).has_value());
}

TEST_CASE("the library root folder is never an extras folder") {
    const NamingOptions options;
    CHECK_FALSE(FileMetadataResolver::resolve_extra_kind("/lib/trailers/Movie.mkv", false, options,
                                                         "/lib/trailers/").has_value());
    CHECK(FileMetadataResolver::resolve_extra_kind("/lib/trailers/Movie.mkv", false, options, "/lib")
          == ExtraKind::Trailer);
}

TEST_CASE("extras folders are recognised by name") {
    const NamingOptions options;
    CHECK(FileMetadataResolver::is_extras_folder("Trailers", options));
    CHECK(FileMetadataResolver::is_extras_folder("extras", options));
    CHECK_FALSE(FileMetadataResolver::is_extras_folder("Movie disc1", options));
    CHECK_FALSE(FileMetadataResolver::is_extras_folder("Movie (2020)", options));
}

TEST_CASE("clean_date_time splits off a release year") {
    const NamingOptions options;

    const auto with_year = FileMetadataResolver::clean_date_time("Movie (2020)", options);
    CHECK(with_year.name == "Movie");
    CHECK(with_year.year == 2020);

    const auto without_year = FileMetadataResolver::clean_date_time("No Year Here", options);
    CHECK(without_year.name == "No Year Here");
    CHECK_FALSE(without_year.year.has_value());
}
