#ifndef UTILS_HPP
#define UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);
bool is_valid_directory(const std::string& path);

std::string trim_copy(std::string_view value);
std::string to_lower_copy(std::string_view value);
bool equals_ignore_case(std::string_view lhs, std::string_view rhs);
bool starts_with_ignore_case(std::string_view value, std::string_view prefix);
bool ends_with_ignore_case(std::string_view value, std::string_view suffix);

std::vector<std::string> split_list(const std::string& value, char delimiter = ',');
std::string join_list(const std::vector<std::string>& items, const std::string& delimiter = ",");

// "/a/b/Movie (2020) - [4K].mkv" -> "Movie (2020) - [4K]"
std::string file_name_without_extension(const std::string& path);
// Folders keep their whole name: "/a/Some.Movie.2020" -> "Some.Movie.2020"
std::string base_name_of(const std::string& path, bool is_directory);
// "/a/b/Movie.mkv" -> ".mkv"
std::string extension_of(const std::string& path);
// "/a/b/Movie.mkv" -> "/a/b"
std::string parent_directory(const std::string& path);
// "/a/b/Movie.mkv" -> "b"
std::string parent_directory_name(const std::string& path);
// "/a/b/" -> "b"
std::string file_name_of(const std::string& path);

} // namespace Utils

#endif
