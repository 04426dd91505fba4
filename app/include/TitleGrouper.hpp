#ifndef TITLE_GROUPER_HPP
#define TITLE_GROUPER_HPP

#include "StackDetector.hpp"
#include "Types.hpp"

#include <string>
#include <vector>

class NamingOptions;

class TitleGrouper {
public:
    /**
     * @brief One entry per stack (parts re-resolved, unresolvable parts dropped)
     * followed by one entry per standalone record, in input order.
     */
    static std::vector<LogicalEntry> group(const std::vector<FileStack>& stacks,
                                           const std::vector<FileRecord>& standalone,
                                           const NamingOptions& options,
                                           bool parse_name,
                                           const std::string& library_root);

    static LogicalEntry single_file_entry(const FileRecord& record);
};

#endif
