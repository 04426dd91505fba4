#ifndef NAMING_OPTIONS_HPP
#define NAMING_OPTIONS_HPP

#include "Types.hpp"

#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

enum class ExtraRuleType {
    DirectoryName,  ///< Parent folder name equals the token ("trailers/")
    Filename,       ///< Base name equals the token ("trailer.mkv")
    Suffix          ///< Base name ends with the token ("Movie-trailer.mkv")
};

struct ExtraRule {
    ExtraKind kind;
    ExtraRuleType type;
    std::string token;
};

struct StackRule {
    std::regex pattern;
    bool is_numerical{true};
};

/**
 * @brief Precompiled naming patterns shared by the resolver and its collaborators.
 *
 * Built once (usually from Settings) and passed around by const reference.
 * Holds no mutable state, so one instance may serve concurrent resolutions.
 */
class NamingOptions {
public:
    NamingOptions();
    explicit NamingOptions(const std::vector<std::string>& extra_video_extensions);

    bool is_video_extension(const std::string& extension) const;

    const std::vector<std::regex>& clean_string_regexes() const { return clean_string_regexes_; }
    const std::vector<std::regex>& clean_date_time_regexes() const { return clean_date_time_regexes_; }
    const std::vector<StackRule>& stack_rules() const { return stack_rules_; }
    const std::vector<ExtraRule>& extra_rules() const { return extra_rules_; }

    /// `[0-9]{2}[0-9]+[ip]`: a resolution marker such as 720p or 1080i.
    const std::regex& resolution_regex() const { return resolution_regex_; }
    /// `^\[([^\]]*)\]`: a bracketed version tag left after the folder prefix.
    const std::regex& movie_version_regex() const { return movie_version_regex_; }
    /// `<base> - <version>` or `<base> - [<version>]`, never a bare S##E## suffix.
    const std::regex& episode_version_regex() const { return episode_version_regex_; }

    // Compiles a pattern, reporting bad expressions as CONFIG_PARSE_ERROR.
    static std::regex compile(const std::string& pattern, bool ignore_case = true);

private:
    void add_video_extension(const std::string& extension);

    std::unordered_set<std::string> video_extensions_;
    std::vector<std::regex> clean_string_regexes_;
    std::vector<std::regex> clean_date_time_regexes_;
    std::vector<StackRule> stack_rules_;
    std::vector<ExtraRule> extra_rules_;
    std::regex resolution_regex_;
    std::regex movie_version_regex_;
    std::regex episode_version_regex_;
};

#endif
