#ifndef STACK_DETECTOR_HPP
#define STACK_DETECTOR_HPP

#include "Types.hpp"

#include <string>
#include <vector>

class NamingOptions;

/**
 * @brief Parts of one title split across several files or folders
 * ("Movie cd1.avi", "Movie cd2.avi").
 */
struct FileStack {
    std::string name;
    std::vector<std::string> files;
    bool is_directory_stack{false};

    bool contains(const std::string& path, bool is_directory) const;
};

class StackDetector {
public:
    /**
     * @brief Detect multi-part stacks among @p entries.
     *
     * Only directories and files with a known video extension take part.
     * A stack needs at least two parts sharing the directory flag and part
     * type ("cd", "part", "disc", ...); numeric and letter part rules never
     * mix within one stack.
     *
     * @return Stacks in order of first appearance by path, parts in path order.
     */
    static std::vector<FileStack> resolve(const std::vector<FileEntry>& entries,
                                          const NamingOptions& options);
};

#endif
