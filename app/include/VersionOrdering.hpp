#ifndef VERSION_ORDERING_HPP
#define VERSION_ORDERING_HPP

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

/**
 * @brief Deterministic ranking of alternate versions of one title.
 *
 * Candidates whose bucket label carries a resolution marker (720p, 1080i, ...)
 * come first, highest resolution first, ties broken by base name. The
 * remaining candidates follow in base-name order. All comparisons use
 * natural order and the sort is stable.
 */
class VersionOrdering {
public:
    struct Candidate {
        std::string bucket_label;  ///< Decides which bucket the candidate lands in
        std::string base_name;     ///< File name without extension
    };

    // Returns candidate indices in rank order.
    static std::vector<std::size_t> order(const std::vector<Candidate>& candidates,
                                          const std::regex& resolution_regex);

    // First resolution marker in @p text, or an empty string.
    static std::string resolution_marker(const std::string& text,
                                         const std::regex& resolution_regex);
};

#endif
