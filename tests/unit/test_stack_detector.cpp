#include <catch2/catch_test_macros.hpp>
#include "NamingOptions.hpp"
#include "StackDetector.hpp"
#include "Utils.hpp"

#include <string>
#include <vector>

namespace {

std::vector<FileEntry> files(const std::vector<std::string>& paths)
{
    std::vector<FileEntry> entries;
    for (const auto& path : paths) {
        entries.push_back(FileEntry{path, Utils::file_name_of(path), FileType::File});
    }
    return entries;
}

}

TEST_CASE("numbered parts form a stack") {
    const NamingOptions options;
    const auto stacks = StackDetector::resolve(
        files({"/m/Movie cd1.avi", "/m/Movie cd2.avi"}), options);

    REQUIRE(stacks.size() == 1);
    CHECK(stacks[0].name == "Movie");
    CHECK_FALSE(stacks[0].is_directory_stack);
    CHECK(stacks[0].files == std::vector<std::string>{"/m/Movie cd1.avi", "/m/Movie cd2.avi"});
}

TEST_CASE("parts are ordered by path") {
    const NamingOptions options;
    const auto stacks = StackDetector::resolve(
        files({"/m/Movie part3.mkv", "/m/Movie part1.mkv", "/m/Movie part2.mkv"}), options);

    REQUIRE(stacks.size() == 1);
    CHECK(stacks[0].files == std::vector<std::string>{
        "/m/Movie part1.mkv", "/m/Movie part2.mkv", "/m/Movie part3.mkv"});
}

TEST_CASE("lettered parts form a stack") {
    const NamingOptions options;
    const auto stacks = StackDetector::resolve(
        files({"/m/Movie parta.avi", "/m/Movie partb.avi"}), options);

    REQUIRE(stacks.size() == 1);
    CHECK(stacks[0].name == "Movie");
    CHECK(stacks[0].files.size() == 2);
}

TEST_CASE("a name ending in a bracket needs no separator") {
    const NamingOptions options;
    const auto stacks = StackDetector::resolve(
        files({"/m/Movie (2020)[cd1].avi", "/m/Movie (2020)[cd2].avi"}), options);

    REQUIRE(stacks.size() == 1);
    CHECK(stacks[0].name == "Movie (2020)");
}

TEST_CASE("a single part is not a stack") {
    const NamingOptions options;
    CHECK(StackDetector::resolve(files({"/m/Movie cd1.avi", "/m/Other.avi"}), options).empty());
}

TEST_CASE("mixed part types do not stack") {
    const NamingOptions options;
    CHECK(StackDetector::resolve(files({"/m/Movie cd1.avi", "/m/Movie part2.avi"}), options).empty());
}

TEST_CASE("duplicate part numbers do not stack") {
    const NamingOptions options;
    CHECK(StackDetector::resolve(files({"/m/Movie cd1.avi", "/m/Movie cd1.mkv"}), options).empty());
}

TEST_CASE("non-video files never take part") {
    const NamingOptions options;
    CHECK(StackDetector::resolve(files({"/m/Movie cd1.srt", "/m/Movie cd2.srt"}), options).empty());
}

TEST_CASE("folders stack with folders") {
    const NamingOptions options;
    const std::vector<FileEntry> entries = {
        {"/m/Movie disc1", "Movie disc1", FileType::Directory},
        {"/m/Movie disc2", "Movie disc2", FileType::Directory}
    };
    const auto stacks = StackDetector::resolve(entries, options);

    REQUIRE(stacks.size() == 1);
    CHECK(stacks[0].is_directory_stack);
    CHECK(stacks[0].contains("/m/movie DISC1", true));
    CHECK_FALSE(stacks[0].contains("/m/Movie disc1", false));
}

TEST_CASE("stacks are reported in path order of their first part") {
    const NamingOptions options;
    const auto stacks = StackDetector::resolve(
        files({"/m/B cd1.avi", "/m/B cd2.avi", "/m/A cd1.avi", "/m/A cd2.avi"}), options);

    REQUIRE(stacks.size() == 2);
    CHECK(stacks[0].name == "A");
    CHECK(stacks[1].name == "B");
}
