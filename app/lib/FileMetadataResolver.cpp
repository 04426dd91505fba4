#include "FileMetadataResolver.hpp"
#include "NameCleaner.hpp"
#include "NamingOptions.hpp"
#include "Utils.hpp"

#include <regex>

namespace {

std::string strip_trailing_separators(std::string value)
{
    while (value.size() > 1 && (value.back() == '/' || value.back() == '\\')) {
        value.pop_back();
    }
    return value;
}

std::string trim_end(const std::string& value)
{
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return end == std::string::npos ? std::string() : value.substr(0, end + 1);
}

}


std::optional<FileRecord> FileMetadataResolver::resolve(const std::string& path,
                                                        bool is_directory,
                                                        const NamingOptions& options,
                                                        bool parse_name,
                                                        const std::string& library_root)
{
    if (path.empty()) {
        return std::nullopt;
    }

    FileRecord record;
    record.path = path;
    record.is_directory = is_directory;

    if (!is_directory) {
        const std::string extension = Utils::extension_of(path);
        if (!options.is_video_extension(extension)) {
            return std::nullopt;
        }
        record.container = Utils::to_lower_copy(extension.substr(1));
    }

    record.extra_kind = resolve_extra_kind(path, is_directory, options, library_root);

    std::string name = Utils::base_name_of(path, is_directory);
    if (parse_name) {
        auto cleaned = clean_date_time(name, options);
        name = std::move(cleaned.name);
        record.year = cleaned.year;

        if (auto clean_name = NameCleaner::try_clean(name, options)) {
            name = std::move(*clean_name);
        }
    }
    record.display_name = std::move(name);
    return record;
}


std::optional<ExtraKind> FileMetadataResolver::resolve_extra_kind(const std::string& path,
                                                                  bool is_directory,
                                                                  const NamingOptions& options,
                                                                  const std::string& library_root)
{
    const std::string base_name = Utils::base_name_of(path, is_directory);
    const std::string directory = Utils::parent_directory(path);
    const std::string directory_name = Utils::parent_directory_name(path);

    for (const auto& rule : options.extra_rules()) {
        switch (rule.type) {
            case ExtraRuleType::DirectoryName:
                if (Utils::equals_ignore_case(directory_name, rule.token)
                    && !is_library_root(directory, library_root)) {
                    return rule.kind;
                }
                break;
            case ExtraRuleType::Filename:
                if (Utils::equals_ignore_case(base_name, rule.token)) {
                    return rule.kind;
                }
                break;
            case ExtraRuleType::Suffix:
                if (Utils::ends_with_ignore_case(base_name, rule.token)) {
                    return rule.kind;
                }
                break;
        }
    }
    return std::nullopt;
}


bool FileMetadataResolver::is_extras_folder(const std::string& folder_name,
                                            const NamingOptions& options)
{
    for (const auto& rule : options.extra_rules()) {
        if (rule.type == ExtraRuleType::DirectoryName
            && Utils::equals_ignore_case(folder_name, rule.token)) {
            return true;
        }
    }
    return false;
}


CleanDateTimeResult FileMetadataResolver::clean_date_time(const std::string& name,
                                                          const NamingOptions& options)
{
    CleanDateTimeResult result{name, std::nullopt};
    if (name.empty()) {
        return result;
    }

    for (const auto& pattern : options.clean_date_time_regexes()) {
        std::smatch match;
        if (!std::regex_search(name, match, pattern)) {
            continue;
        }
        if (!match[1].matched || !match[2].matched) {
            continue;
        }
        result.name = trim_end(match[1].str());
        result.year = std::stoi(match[2].str());
        return result;
    }
    return result;
}


bool FileMetadataResolver::is_library_root(const std::string& directory, const std::string& library_root)
{
    if (library_root.empty()) {
        return false;
    }
    return Utils::equals_ignore_case(strip_trailing_separators(directory),
                                     strip_trailing_separators(library_root));
}
