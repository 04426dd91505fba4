#include "TitleGrouper.hpp"
#include "FileMetadataResolver.hpp"
#include "Logger.hpp"
#include "NamingOptions.hpp"

std::vector<LogicalEntry> TitleGrouper::group(const std::vector<FileStack>& stacks,
                                              const std::vector<FileRecord>& standalone,
                                              const NamingOptions& options,
                                              bool parse_name,
                                              const std::string& library_root)
{
    std::vector<LogicalEntry> entries;
    entries.reserve(stacks.size() + standalone.size());

    for (const auto& stack : stacks) {
        LogicalEntry entry;
        entry.name = stack.name;
        for (const auto& path : stack.files) {
            if (auto record = FileMetadataResolver::resolve(path, stack.is_directory_stack,
                                                            options, parse_name, library_root)) {
                entry.files.push_back(std::move(*record));
            }
        }
        if (entry.files.empty()) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->warn("Dropping stack '{}': none of its {} part(s) resolved",
                             stack.name, stack.files.size());
            }
            continue;
        }
        entry.year = entry.files.front().year;
        entries.push_back(std::move(entry));
    }

    for (const auto& record : standalone) {
        entries.push_back(single_file_entry(record));
    }
    return entries;
}


LogicalEntry TitleGrouper::single_file_entry(const FileRecord& record)
{
    LogicalEntry entry;
    entry.name = record.display_name;
    entry.year = record.year;
    entry.files.push_back(record);
    entry.extra_kind = record.extra_kind;
    return entry;
}
