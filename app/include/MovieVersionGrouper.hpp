#ifndef MOVIE_VERSION_GROUPER_HPP
#define MOVIE_VERSION_GROUPER_HPP

#include "Types.hpp"

#include <memory>
#include <string>
#include <vector>

class NamingOptions;
namespace spdlog { class logger; }

/**
 * @brief Collapses every title of a movie (or music video) folder into one
 * entry holding a primary file and its alternate versions.
 *
 * Grouping is all-or-nothing: either every entry qualifies and the folder
 * collapses into a single entry, or the input comes back untouched.
 *
 * @par Example:
 * @code
 * Movie (2020)/
 *   Movie (2020).mkv              -> primary
 *   Movie (2020) - [1080p].mkv    -> alternate 1
 *   Movie (2020) - [4K].mkv       -> alternate 2
 * @endcode
 */
class MovieVersionGrouper {
public:
    MovieVersionGrouper(const NamingOptions& options,
                        std::shared_ptr<spdlog::logger> logger);
    MovieVersionGrouper(NamingOptions&&, std::shared_ptr<spdlog::logger>) = delete;

    std::vector<LogicalEntry> group(std::vector<LogicalEntry> entries) const;

    /**
     * @brief True when @p entries may be merged under @p folder_name.
     *
     * Requires a folder name longer than one character, one shared year,
     * single-file entries only, and a base name for every non-extra entry that
     * reduces to a version suffix once the folder name is stripped.
     */
    bool is_eligible(const std::vector<LogicalEntry>& entries,
                     const std::string& folder_name) const;

    /**
     * @brief "Movie (2020) - [4K]" under "Movie (2020)" qualifies; "Movie (2020) Remastered" does not.
     */
    bool is_eligible_file_name(const std::string& folder_name,
                               const std::string& base_name) const;

    // Name of the folder holding the first entry's first file.
    static std::string folder_name_of(const std::vector<LogicalEntry>& entries);

private:
    static bool have_same_year(const std::vector<LogicalEntry>& entries);
    LogicalEntry merge(std::vector<LogicalEntry>& entries, const std::string& folder_name) const;

    const NamingOptions& options;
    std::shared_ptr<spdlog::logger> logger;
};

#endif
