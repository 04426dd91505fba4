#ifndef PARTITIONER_HPP
#define PARTITIONER_HPP

#include "StackDetector.hpp"
#include "Types.hpp"

#include <vector>

class NamingOptions;

struct PartitionResult {
    std::vector<FileStack> stacks;
    std::vector<FileRecord> standalone;
    std::vector<FileRecord> remaining_extras;
};

/**
 * @brief Splits one folder's records into stacks, standalone titles and extras.
 *
 * Extras never take part in stack detection, so a trailer next to
 * "Movie cd1"/"Movie cd2" cannot break or join the stack.
 */
class Partitioner {
public:
    static PartitionResult partition(const std::vector<FileRecord>& records,
                                     const NamingOptions& options);
};

#endif
