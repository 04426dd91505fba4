#include "Partitioner.hpp"
#include "NamingOptions.hpp"
#include "Utils.hpp"

#include <algorithm>

PartitionResult Partitioner::partition(const std::vector<FileRecord>& records,
                                       const NamingOptions& options)
{
    std::vector<FileEntry> non_extras;
    for (const auto& record : records) {
        if (record.extra_kind.has_value()) {
            continue;
        }
        non_extras.push_back(FileEntry{
            record.path,
            Utils::file_name_of(record.path),
            record.is_directory ? FileType::Directory : FileType::File});
    }

    PartitionResult result;
    result.stacks = StackDetector::resolve(non_extras, options);

    for (const auto& record : records) {
        const bool stacked = std::any_of(result.stacks.begin(), result.stacks.end(),
            [&record](const FileStack& stack) {
                return stack.contains(record.path, record.is_directory);
            });
        if (stacked) {
            continue;
        }

        if (record.extra_kind.has_value()) {
            result.remaining_extras.push_back(record);
        } else {
            result.standalone.push_back(record);
        }
    }
    return result;
}
