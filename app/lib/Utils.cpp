#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

unsigned char lower_char(char ch)
{
    return static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(ch)));
}

// Trailing separators make std::filesystem report an empty filename.
std::filesystem::path without_trailing_separator(const std::string& path)
{
    std::string trimmed = path;
    while (trimmed.size() > 1 && (trimmed.back() == '/' || trimmed.back() == '\\')) {
        trimmed.pop_back();
    }
    return Utils::utf8_to_path(trimmed);
}

}

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path)
{
#ifdef _WIN32
    const auto utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
#else
    return path.string();
#endif
}

std::filesystem::path utf8_to_path(const std::string& value)
{
#ifdef _WIN32
    std::u8string utf8(value.begin(), value.end());
    return std::filesystem::path(utf8);
#else
    return std::filesystem::path(value);
#endif
}

bool is_valid_directory(const std::string& path)
{
    std::error_code ec;
    return !path.empty() && std::filesystem::is_directory(utf8_to_path(path), ec);
}

std::string trim_copy(std::string_view value)
{
    const char* whitespace = " \t\n\r\f\v";
    const auto start = value.find_first_not_of(whitespace);
    if (start == std::string_view::npos) {
        return std::string();
    }
    const auto end = value.find_last_not_of(whitespace);
    return std::string(value.substr(start, end - start + 1));
}

std::string to_lower_copy(std::string_view value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(), lower_char);
    return result;
}

bool equals_ignore_case(std::string_view lhs, std::string_view rhs)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (lower_char(lhs[i]) != lower_char(rhs[i])) {
            return false;
        }
    }
    return true;
}

bool starts_with_ignore_case(std::string_view value, std::string_view prefix)
{
    return value.size() >= prefix.size()
        && equals_ignore_case(value.substr(0, prefix.size()), prefix);
}

bool ends_with_ignore_case(std::string_view value, std::string_view suffix)
{
    return value.size() >= suffix.size()
        && equals_ignore_case(value.substr(value.size() - suffix.size()), suffix);
}

std::vector<std::string> split_list(const std::string& value, char delimiter)
{
    std::vector<std::string> result;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        item = trim_copy(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::string join_list(const std::vector<std::string>& items, const std::string& delimiter)
{
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

std::string file_name_without_extension(const std::string& path)
{
    return path_to_utf8(without_trailing_separator(path).stem());
}

std::string base_name_of(const std::string& path, bool is_directory)
{
    return is_directory ? file_name_of(path) : file_name_without_extension(path);
}

std::string extension_of(const std::string& path)
{
    return path_to_utf8(without_trailing_separator(path).extension());
}

std::string parent_directory(const std::string& path)
{
    return path_to_utf8(without_trailing_separator(path).parent_path());
}

std::string parent_directory_name(const std::string& path)
{
    return path_to_utf8(without_trailing_separator(path).parent_path().filename());
}

std::string file_name_of(const std::string& path)
{
    return path_to_utf8(without_trailing_separator(path).filename());
}

} // namespace Utils
