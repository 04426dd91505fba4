#include "MovieVersionGrouper.hpp"
#include "NameCleaner.hpp"
#include "NamingOptions.hpp"
#include "Utils.hpp"
#include "VersionOrdering.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <regex>

namespace {

constexpr int kMissingYear = -1;

std::string primary_base_name(const LogicalEntry& entry)
{
    const FileRecord& file = entry.files.front();
    return Utils::base_name_of(file.path, file.is_directory);
}

}


MovieVersionGrouper::MovieVersionGrouper(const NamingOptions& options,
                                         std::shared_ptr<spdlog::logger> logger)
    : options(options),
      logger(std::move(logger))
{
}


std::vector<LogicalEntry> MovieVersionGrouper::group(std::vector<LogicalEntry> entries) const
{
    if (entries.empty()) {
        return entries;
    }

    const std::string folder_name = folder_name_of(entries);
    if (!is_eligible(entries, folder_name)) {
        if (logger) {
            logger->debug("Folder '{}' is not eligible for version grouping ({} entries)",
                          folder_name, entries.size());
        }
        return entries;
    }

    std::vector<LogicalEntry> result;
    result.push_back(merge(entries, folder_name));
    if (logger) {
        logger->debug("Grouped folder '{}' into one title with {} alternate(s)",
                      folder_name, result.front().alternate_versions.size());
    }
    return result;
}


bool MovieVersionGrouper::is_eligible(const std::vector<LogicalEntry>& entries,
                                      const std::string& folder_name) const
{
    if (folder_name.size() <= 1 || !have_same_year(entries)) {
        return false;
    }

    for (const auto& entry : entries) {
        // Stacks keep their parts; merging would drop or mix them.
        if (entry.files.size() != 1) {
            return false;
        }
        if (entry.extra_kind.has_value()) {
            continue;
        }
        if (!is_eligible_file_name(folder_name, primary_base_name(entry))) {
            return false;
        }
    }
    return true;
}


bool MovieVersionGrouper::is_eligible_file_name(const std::string& folder_name,
                                                const std::string& base_name) const
{
    if (!Utils::starts_with_ignore_case(base_name, folder_name)) {
        return false;
    }

    std::string remainder = Utils::trim_copy(std::string_view(base_name).substr(folder_name.size()));
    if (auto cleaned = NameCleaner::try_clean(remainder, options)) {
        remainder = Utils::trim_copy(*cleaned);
    }

    return remainder.empty()
        || remainder.front() == '-'
        || std::regex_search(remainder, options.movie_version_regex());
}


std::string MovieVersionGrouper::folder_name_of(const std::vector<LogicalEntry>& entries)
{
    if (entries.empty() || entries.front().files.empty()) {
        return std::string();
    }
    return Utils::parent_directory_name(entries.front().files.front().path);
}


bool MovieVersionGrouper::have_same_year(const std::vector<LogicalEntry>& entries)
{
    const int first_year = entries.front().year.value_or(kMissingYear);
    return std::all_of(entries.begin(), entries.end(), [first_year](const LogicalEntry& entry) {
        return entry.year.value_or(kMissingYear) == first_year;
    });
}


LogicalEntry MovieVersionGrouper::merge(std::vector<LogicalEntry>& entries,
                                        const std::string& folder_name) const
{
    std::optional<std::size_t> primary_index;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (!entries[i].extra_kind.has_value() && primary_base_name(entries[i]) == folder_name) {
            primary_index = i;
        }
    }

    std::vector<std::size_t> ordered;
    if (entries.size() > 1) {
        std::vector<VersionOrdering::Candidate> candidates;
        candidates.reserve(entries.size());
        for (const auto& entry : entries) {
            const std::string base_name = primary_base_name(entry);
            candidates.push_back(VersionOrdering::Candidate{base_name, base_name});
        }
        ordered = VersionOrdering::order(candidates, options.resolution_regex());
    } else {
        ordered.push_back(0);
    }

    const std::size_t primary = primary_index.value_or(ordered.front());
    LogicalEntry merged = std::move(entries[primary]);
    for (std::size_t index : ordered) {
        if (index == primary) {
            continue;
        }
        auto& other = entries[index];
        merged.alternate_versions.push_back(std::move(other.files.front()));
        for (auto& alternate : other.alternate_versions) {
            merged.alternate_versions.push_back(std::move(alternate));
        }
    }
    merged.name = folder_name;
    return merged;
}
