#pragma once

#ifdef VIDEO_LIST_RESOLVER_TEST_BUILD

#include "EpisodeVersionGrouper.hpp"

#include <vector>

class EpisodeVersionGrouperTestAccess {
public:
    static std::vector<FileRecord> sort_versions(const EpisodeVersionGrouper& grouper,
                                                 const std::vector<FileRecord>& files)
    {
        return grouper.sort_versions(files);
    }
};

#endif // VIDEO_LIST_RESOLVER_TEST_BUILD
