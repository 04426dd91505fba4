#include <catch2/catch_test_macros.hpp>
#include "FileScanner.hpp"
#include "TestHelpers.hpp"
#include <filesystem>

TEST_CASE("hidden files require explicit flag") {
    TempDir temp_dir;
    touch_file(temp_dir.path() / ".secret.mkv");

    FileScanner scanner;
    auto entries = scanner.get_directory_entries(temp_dir.path().string(),
        FileScanOptions::Files);
    REQUIRE(entries.empty());

    entries = scanner.get_directory_entries(temp_dir.path().string(),
        FileScanOptions::Files | FileScanOptions::HiddenFiles);
    REQUIRE(entries.size() == 1);
    CHECK(entries.front().file_name == ".secret.mkv");
    CHECK(entries.front().type == FileType::File);
}

TEST_CASE("junk files are skipped regardless of flags") {
    TempDir temp_dir;
    touch_file(temp_dir.path() / ".DS_Store");
    touch_file(temp_dir.path() / "Thumbs.db");

    FileScanner scanner;
    auto entries = scanner.get_directory_entries(temp_dir.path().string(),
        FileScanOptions::Files | FileScanOptions::HiddenFiles);
    REQUIRE(entries.empty());
}

TEST_CASE("entries come back sorted by path") {
    TempDir temp_dir;
    touch_file(temp_dir.path() / "b.mkv");
    touch_file(temp_dir.path() / "a.mkv");
    touch_file(temp_dir.path() / "c.mkv");

    FileScanner scanner;
    const auto entries = scanner.get_directory_entries(temp_dir.path().string(),
        FileScanOptions::Files);
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].file_name == "a.mkv");
    CHECK(entries[1].file_name == "b.mkv");
    CHECK(entries[2].file_name == "c.mkv");
}

TEST_CASE("subfolders are only entered when scanning recursively") {
    TempDir temp_dir;
    touch_file(temp_dir.path() / "Movie (2020).mkv");
    touch_file(temp_dir.path() / "trailers" / "Teaser.mkv");

    FileScanner scanner;
    auto flat = scanner.get_directory_entries(temp_dir.path().string(),
        FileScanOptions::Files);
    REQUIRE(flat.size() == 1);
    CHECK(flat.front().file_name == "Movie (2020).mkv");

    auto deep = scanner.get_directory_entries(temp_dir.path().string(),
        FileScanOptions::Files | FileScanOptions::Recursive);
    REQUIRE(deep.size() == 2);
    CHECK(deep[1].file_name == "Teaser.mkv");
    CHECK(std::filesystem::path(deep[1].full_path).parent_path().filename() == "trailers");
}

TEST_CASE("hidden folders are not descended into") {
    TempDir temp_dir;
    touch_file(temp_dir.path() / ".cache" / "leftover.mkv");
    touch_file(temp_dir.path() / "@eaDir" / "thumb.mkv");
    touch_file(temp_dir.path() / "Movie.mkv");

    FileScanner scanner;
    const auto entries = scanner.get_directory_entries(temp_dir.path().string(),
        FileScanOptions::Files | FileScanOptions::Recursive);
    REQUIRE(entries.size() == 1);
    CHECK(entries.front().file_name == "Movie.mkv");
}

TEST_CASE("directories are listed only when requested") {
    TempDir temp_dir;
    std::filesystem::create_directories(temp_dir.path() / "Movie disc1");
    touch_file(temp_dir.path() / "Movie.mkv");

    FileScanner scanner;
    const auto dirs = scanner.get_directory_entries(temp_dir.path().string(),
        FileScanOptions::Directories);
    REQUIRE(dirs.size() == 1);
    CHECK(dirs.front().file_name == "Movie disc1");
    CHECK(dirs.front().type == FileType::Directory);
}

TEST_CASE("missing directory raises a filesystem error") {
    TempDir temp_dir;
    FileScanner scanner;
    CHECK_THROWS_AS(scanner.get_directory_entries((temp_dir.path() / "absent").string(),
                                                  FileScanOptions::Files),
                    std::filesystem::filesystem_error);
}
