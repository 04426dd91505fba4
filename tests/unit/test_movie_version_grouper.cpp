#include <catch2/catch_test_macros.hpp>
#include "MovieVersionGrouper.hpp"
#include "NamingOptions.hpp"
#include "TestHelpers.hpp"
#include "TitleGrouper.hpp"
#include "VideoListResolver.hpp"

namespace {

std::vector<LogicalEntry> single_entries(const std::vector<std::string>& paths,
                                         const NamingOptions& options)
{
    std::vector<LogicalEntry> entries;
    for (const auto& record : make_records(paths, options)) {
        entries.push_back(TitleGrouper::single_file_entry(record));
    }
    return entries;
}

}

TEST_CASE("versions in a movie folder collapse into one title") {
    const NamingOptions options;
    const VideoListResolver resolver(options);
    const auto records = make_records({
        "/movies/Movie (2020)/Movie (2020).mkv",
        "/movies/Movie (2020)/Movie (2020) - [1080p].mkv",
        "/movies/Movie (2020)/Movie (2020) - [4K].mkv"
    }, options);

    const auto result = resolver.resolve(records);

    REQUIRE(result.size() == 1);
    const LogicalEntry& entry = result.front();
    CHECK(entry.name == "Movie (2020)");
    CHECK(entry.year == 2020);
    REQUIRE(entry.files.size() == 1);
    CHECK(entry.files.front().path == "/movies/Movie (2020)/Movie (2020).mkv");
    REQUIRE(entry.alternate_versions.size() == 2);
    CHECK(entry.alternate_versions[0].path == "/movies/Movie (2020)/Movie (2020) - [1080p].mkv");
    CHECK(entry.alternate_versions[1].path == "/movies/Movie (2020)/Movie (2020) - [4K].mkv");
}

TEST_CASE("resolution-marked versions rank highest resolution first") {
    const NamingOptions options;
    const MovieVersionGrouper grouper(options, nullptr);
    const auto entries = single_entries({
        "/movies/Movie/Movie - 720p.mkv",
        "/movies/Movie/Movie - 2160p.mkv",
        "/movies/Movie/Movie - 1080p.mkv"
    }, options);

    const auto result = grouper.group(entries);

    REQUIRE(result.size() == 1);
    CHECK(result[0].name == "Movie");
    CHECK(result[0].files.front().path == "/movies/Movie/Movie - 2160p.mkv");
    REQUIRE(result[0].alternate_versions.size() == 2);
    CHECK(result[0].alternate_versions[0].path == "/movies/Movie/Movie - 1080p.mkv");
    CHECK(result[0].alternate_versions[1].path == "/movies/Movie/Movie - 720p.mkv");
}

TEST_CASE("one unrelated title keeps the whole folder ungrouped") {
    const NamingOptions options;
    const MovieVersionGrouper grouper(options, nullptr);
    const auto entries = single_entries({
        "/movies/Movie (2020)/Movie (2020).mkv",
        "/movies/Movie (2020)/Movie (2020) - [4K].mkv",
        "/movies/Movie (2020)/Other Film (2020).mkv"
    }, options);

    CHECK(grouper.group(entries) == entries);
}

TEST_CASE("grouping requires a shared year") {
    const NamingOptions options;
    const MovieVersionGrouper grouper(options, nullptr);
    auto entries = single_entries({
        "/movies/Movie/Movie.mkv",
        "/movies/Movie/Movie - [4K].mkv"
    }, options);
    REQUIRE(grouper.is_eligible(entries, "Movie"));

    entries[1].year = 1999;
    CHECK_FALSE(grouper.is_eligible(entries, "Movie"));
}

TEST_CASE("single-character folders and stacks are never grouped") {
    const NamingOptions options;
    const MovieVersionGrouper grouper(options, nullptr);
    auto entries = single_entries({"/movies/M/M.mkv", "/movies/M/M - [4K].mkv"}, options);
    CHECK_FALSE(grouper.is_eligible(entries, "M"));

    entries = single_entries({"/movies/Movie/Movie.mkv", "/movies/Movie/Movie - [4K].mkv"}, options);
    entries[0].files.push_back(entries[0].files.front());
    CHECK_FALSE(grouper.is_eligible(entries, "Movie"));
}

TEST_CASE("file names qualify only with a version suffix") {
    const NamingOptions options;
    const MovieVersionGrouper grouper(options, nullptr);
    CHECK(grouper.is_eligible_file_name("Movie (2020)", "Movie (2020)"));
    CHECK(grouper.is_eligible_file_name("Movie (2020)", "movie (2020) - [4K]"));
    CHECK(grouper.is_eligible_file_name("Movie (2020)", "Movie (2020) [Director's Cut]"));
    CHECK_FALSE(grouper.is_eligible_file_name("Movie (2020)", "Movie (2020) Remastered"));
    CHECK_FALSE(grouper.is_eligible_file_name("Movie (2020)", "Other (2020)"));
}

TEST_CASE("grouping an already grouped folder changes nothing") {
    const NamingOptions options;
    const MovieVersionGrouper grouper(options, nullptr);
    const auto entries = single_entries({
        "/movies/Movie (2020)/Movie (2020).mkv",
        "/movies/Movie (2020)/Movie (2020) - [1080p].mkv",
        "/movies/Movie (2020)/Movie (2020) - [4K].mkv"
    }, options);

    const auto once = grouper.group(entries);
    const auto twice = grouper.group(once);
    CHECK(twice == once);
}

TEST_CASE("folder_name_of uses the first file's parent folder") {
    const NamingOptions options;
    const auto entries = single_entries({"/movies/Movie (2020)/Movie (2020).mkv"}, options);
    CHECK(MovieVersionGrouper::folder_name_of(entries) == "Movie (2020)");
    CHECK(MovieVersionGrouper::folder_name_of({}).empty());
}
