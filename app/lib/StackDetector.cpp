#include "StackDetector.hpp"
#include "Logger.hpp"
#include "NamingOptions.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <regex>

namespace {

struct PartMatch {
    std::string stack_name;
    std::string part_type;
    std::string part_number;
};

struct StackBuilder {
    std::string name;
    bool is_directory{false};
    bool is_numerical{true};
    std::string part_type;
    std::vector<std::string> part_numbers;
    std::vector<std::string> files;

    bool contains_part(const std::string& number) const {
        return std::any_of(part_numbers.begin(), part_numbers.end(),
            [&number](const std::string& existing) {
                return Utils::equals_ignore_case(existing, number);
            });
    }
};

std::optional<PartMatch> match_rule(const std::string& file_name, const StackRule& rule)
{
    std::smatch match;
    if (!std::regex_match(file_name, match, rule.pattern)) {
        return std::nullopt;
    }
    PartMatch result;
    result.stack_name = match[1].matched ? match[1].str() : match[2].str();
    result.part_type = Utils::to_lower_copy(match[3].str());
    result.part_number = match[4].str();
    return result;
}

bool is_stack_candidate(const FileEntry& entry, const NamingOptions& options)
{
    if (entry.type == FileType::Directory) {
        return true;
    }
    return options.is_video_extension(Utils::extension_of(entry.full_path));
}

}


bool FileStack::contains(const std::string& path, bool is_directory) const
{
    if (is_directory_stack != is_directory) {
        return false;
    }
    return std::any_of(files.begin(), files.end(), [&path](const std::string& file) {
        return Utils::equals_ignore_case(file, path);
    });
}


std::vector<FileStack> StackDetector::resolve(const std::vector<FileEntry>& entries,
                                              const NamingOptions& options)
{
    std::vector<const FileEntry*> candidates;
    for (const auto& entry : entries) {
        if (is_stack_candidate(entry, options)) {
            candidates.push_back(&entry);
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const FileEntry* lhs, const FileEntry* rhs) {
            return lhs->full_path < rhs->full_path;
        });

    std::vector<StackBuilder> builders;
    for (const FileEntry* entry : candidates) {
        const bool is_directory = entry->type == FileType::Directory;
        std::string name = entry->file_name;
        if (name.empty()) {
            name = Utils::file_name_of(entry->full_path);
        }

        for (const auto& rule : options.stack_rules()) {
            const auto part = match_rule(name, rule);
            if (!part) {
                continue;
            }

            auto builder = std::find_if(builders.begin(), builders.end(),
                [&part](const StackBuilder& existing) {
                    return existing.name == part->stack_name;
                });
            if (builder == builders.end()) {
                StackBuilder fresh;
                fresh.name = part->stack_name;
                fresh.is_directory = is_directory;
                fresh.is_numerical = rule.is_numerical;
                fresh.part_type = part->part_type;
                builders.push_back(std::move(fresh));
                builder = std::prev(builders.end());
            }

            if (!builder->files.empty()) {
                if (builder->is_directory != is_directory
                    || builder->part_type != part->part_type
                    || builder->contains_part(part->part_number)) {
                    continue;
                }
                if (builder->is_numerical != rule.is_numerical) {
                    break;
                }
            }

            builder->part_numbers.push_back(part->part_number);
            builder->files.push_back(entry->full_path);
            break;
        }
    }

    std::vector<FileStack> stacks;
    for (auto& builder : builders) {
        if (builder.files.size() < 2) {
            continue;
        }
        stacks.push_back(FileStack{builder.name, std::move(builder.files), builder.is_directory});
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Stack detection over {} candidate(s) produced {} stack(s)",
                      candidates.size(), stacks.size());
    }
    return stacks;
}
