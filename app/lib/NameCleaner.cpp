#include "NameCleaner.hpp"
#include "NamingOptions.hpp"
#include "Utils.hpp"

std::optional<std::string> NameCleaner::try_clean(const std::string& text,
                                                  const std::vector<std::regex>& patterns)
{
    for (const auto& pattern : patterns) {
        std::smatch match;
        if (std::regex_search(text, match, pattern) && match.size() > 1) {
            return Utils::trim_copy(match[1].str());
        }
    }
    return std::nullopt;
}


std::optional<std::string> NameCleaner::try_clean(const std::string& text,
                                                  const NamingOptions& options)
{
    return try_clean(text, options.clean_string_regexes());
}
