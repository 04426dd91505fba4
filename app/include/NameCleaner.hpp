#ifndef NAME_CLEANER_HPP
#define NAME_CLEANER_HPP

#include <optional>
#include <regex>
#include <string>
#include <vector>

class NamingOptions;

/**
 * @brief Strips release tags (codec, resolution, source, trailing brackets)
 * from a file name using the first matching clean-string pattern.
 */
class NameCleaner {
public:
    /**
     * @brief Apply @p patterns in order; the first one that matches wins.
     * @return Capture group 1 of the winning pattern, trimmed, or std::nullopt
     *         when no pattern matches.
     */
    static std::optional<std::string> try_clean(const std::string& text,
                                                const std::vector<std::regex>& patterns);

    static std::optional<std::string> try_clean(const std::string& text,
                                                const NamingOptions& options);
};

#endif
