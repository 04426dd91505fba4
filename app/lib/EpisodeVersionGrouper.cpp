#include "EpisodeVersionGrouper.hpp"
#include "NamingOptions.hpp"
#include "Utils.hpp"
#include "VersionOrdering.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>
#include <unordered_map>

namespace {

constexpr std::size_t kExpectedMaxVersions = 2;

std::string base_name_of(const FileRecord& file)
{
    return Utils::base_name_of(file.path, file.is_directory);
}

}

struct EpisodeVersionGrouper::EpisodeGroup {
    std::string base_key;
    std::string name;
    std::optional<int> year;
    std::vector<FileRecord> files;
    std::vector<FileRecord> carried_alternates;
    // Multi-part stacks are emitted unchanged at their position.
    std::optional<LogicalEntry> passthrough;
};


EpisodeVersionGrouper::EpisodeVersionGrouper(const NamingOptions& options,
                                             std::shared_ptr<spdlog::logger> logger,
                                             WarningSink warning_sink)
    : options(options),
      logger(std::move(logger)),
      warning_sink(std::move(warning_sink))
{
}


std::vector<LogicalEntry> EpisodeVersionGrouper::group(const std::vector<LogicalEntry>& entries) const
{
    if (entries.size() < 2) {
        return entries;
    }

    std::vector<EpisodeGroup> groups;
    std::unordered_map<std::string, std::size_t> group_by_key;

    for (const auto& entry : entries) {
        if (entry.files.empty()) {
            continue;
        }
        if (entry.files.size() > 1) {
            EpisodeGroup stack_group;
            stack_group.passthrough = entry;
            groups.push_back(std::move(stack_group));
            continue;
        }

        FileRecord file = entry.files.front();
        EpisodeKey key = extract_key(base_name_of(file));
        if (key.version_tag) {
            file.version_tag = key.version_tag;
        }

        const std::string lookup = Utils::to_lower_copy(key.base_key);
        auto found = group_by_key.find(lookup);
        if (found == group_by_key.end()) {
            EpisodeGroup fresh;
            fresh.base_key = key.base_key;
            fresh.name = entry.name;
            fresh.year = entry.year;
            groups.push_back(std::move(fresh));
            found = group_by_key.emplace(lookup, groups.size() - 1).first;
        }

        EpisodeGroup& target = groups[found->second];
        target.files.push_back(std::move(file));
        target.carried_alternates.insert(target.carried_alternates.end(),
                                         entry.alternate_versions.begin(),
                                         entry.alternate_versions.end());
    }

    std::vector<LogicalEntry> result;
    result.reserve(groups.size());
    for (auto& group : groups) {
        if (group.passthrough) {
            result.push_back(std::move(*group.passthrough));
        } else {
            result.push_back(build_entry(group));
        }
    }

    if (logger) {
        logger->debug("Episode version grouping: {} entries -> {} entries",
                      entries.size(), result.size());
    }
    return result;
}


EpisodeKey EpisodeVersionGrouper::extract_key(const std::string& base_name) const
{
    std::smatch match;
    if (std::regex_match(base_name, match, options.episode_version_regex())) {
        EpisodeKey key;
        key.base_key = match[1].str();
        if (match[2].matched) {
            key.version_tag = match[2].str();
        } else if (match[3].matched) {
            key.version_tag = match[3].str();
        }
        return key;
    }
    return EpisodeKey{base_name, std::nullopt};
}


std::vector<FileRecord> EpisodeVersionGrouper::sort_versions(const std::vector<FileRecord>& files) const
{
    if (files.size() <= 1) {
        return files;
    }

    std::vector<VersionOrdering::Candidate> candidates;
    candidates.reserve(files.size());
    for (const auto& file : files) {
        candidates.push_back(VersionOrdering::Candidate{
            file.version_tag.value_or(file.display_name),
            base_name_of(file)});
    }

    std::vector<FileRecord> ordered;
    ordered.reserve(files.size());
    for (std::size_t index : VersionOrdering::order(candidates, options.resolution_regex())) {
        ordered.push_back(files[index]);
    }
    return ordered;
}


LogicalEntry EpisodeVersionGrouper::build_entry(EpisodeGroup& group) const
{
    if (group.files.size() > kExpectedMaxVersions) {
        report_oversized_group(group.base_key, group.files.size());
    }

    std::vector<FileRecord> ordered = sort_versions(group.files);
    auto primary = std::find_if(ordered.begin(), ordered.end(), [&group](const FileRecord& file) {
        return Utils::equals_ignore_case(base_name_of(file), group.base_key);
    });
    if (primary == ordered.end()) {
        primary = ordered.begin();
    }

    LogicalEntry entry;
    entry.name = std::move(group.name);
    entry.year = group.year;
    entry.files.push_back(*primary);
    for (auto it = ordered.begin(); it != ordered.end(); ++it) {
        if (it != primary) {
            entry.alternate_versions.push_back(std::move(*it));
        }
    }
    for (auto& alternate : group.carried_alternates) {
        entry.alternate_versions.push_back(std::move(alternate));
    }
    return entry;
}


void EpisodeVersionGrouper::report_oversized_group(const std::string& base_key, std::size_t file_count) const
{
    if (logger) {
        logger->warn("Found {} versions for episode '{}'. This might indicate an incompatible file naming scheme.",
                     file_count, base_key);
    }
    if (warning_sink) {
        warning_sink(VersionGroupingWarning{base_key, file_count});
    }
}
