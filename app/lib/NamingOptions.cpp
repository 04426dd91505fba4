#include "NamingOptions.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

namespace {

const std::vector<std::string>& default_video_extensions()
{
    static const std::vector<std::string> extensions = {
        ".001", ".3g2", ".3gp", ".amv", ".asf", ".asx", ".avi", ".bin", ".bivx",
        ".divx", ".dv", ".dvr-ms", ".f4v", ".fli", ".flv", ".ifo", ".img", ".iso",
        ".m2t", ".m2ts", ".m2v", ".m4v", ".mkv", ".mk3d", ".mov", ".mp4", ".mpe",
        ".mpeg", ".mpg", ".mts", ".mxf", ".nrg", ".nsv", ".nuv", ".ogg", ".ogm",
        ".ogv", ".pva", ".qt", ".rec", ".rm", ".rmvb", ".strm", ".svq3", ".tp",
        ".ts", ".ty", ".viv", ".vob", ".vp3", ".webm", ".wmv", ".xvid"
    };
    return extensions;
}

// Capture group 1 of every pattern is the cleaned remainder.
const std::vector<std::string>& default_clean_string_patterns()
{
    static const std::vector<std::string> patterns = {
        R"(^\s*(.+?)[ _,.()\[\]-](3d|sbs|tab|hsbs|htab|mvc|HDR|HDC|UHD|UltraHD|4k|ac3|dts|custom|dc|divx|divx5|dsr|dsrip|dutch|dvd|dvdrip|dvdscr|dvdscreener|screener|dvdivx|cam|fragment|fs|hdtv|hdrip|hdtvrip|internal|limited|multi|subs|ntsc|ogg|ogm|pal|pdtv|proper|repack|rerip|retail|cd[1-9]|r5|bd5|bd|se|svcd|swedish|german|read\.nfo|nfofix|unrated|ws|telesync|ts|telecine|tc|brrip|bdrip|480p|480i|576p|576i|720p|720i|1080p|1080i|2160p|hrhd|hrhdtv|hddvd|bluray|blu-ray|x264|x265|h264|h265|xvid|xvidvd|xxx|www\.www|AAC|DTS|\[.*\])([ _,.()\[\]-]|$))",
        R"(^\s*(.+?)(\[.*\]))",
        R"(^\s*(.+?)\WE[0-9]+(-|~)E?[0-9]+(\W|$))",
        R"(^\s*\[[^\]]+\](?!\.\w+$)\s*(.+))",
        R"(^\s*(.+?)\s+-\s+[0-9]+\s*$)",
        R"(^\s*(.+?)(([-._ ](trailer|sample))|-(scene|clip|behindthescenes|deleted|deletedscene|featurette|short|interview|other|extra))$)"
    };
    return patterns;
}

// Group 1 is the name, group 2 the year.
const std::vector<std::string>& default_clean_date_time_patterns()
{
    static const std::vector<std::string> patterns = {
        R"((.+[^_,.()\[\]-])[_.()\[\]-](19[0-9]{2}|20[0-9]{2})(?![0-9]+|\W[0-9]{2}\W[0-9]{2})([ _,.()\[\]-][^0-9]|).*(19[0-9]{2}|20[0-9]{2})*)",
        R"((.+[^_,.()\[\]-])[ _.()\[\]-]+(19[0-9]{2}|20[0-9]{2})(?![0-9]+|\W[0-9]{2}\W[0-9]{2})([ _,.()\[\]-][^0-9]|).*(19[0-9]{2}|20[0-9]{2})*)"
    };
    return patterns;
}

// Groups: 1 name ending in a bracket, 2 name before a separator, 3 part type, 4 part number.
constexpr const char* kNumericStackPattern =
    R"(^(?:(.*?[\])}])|(.*?)[ _.-]+)[(\[]?(cd|dvd|part|pt|dis[ck])[ _.-]*([0-9]+)[)\]]?(?:\.[^.]+)?$)";
constexpr const char* kLetterStackPattern =
    R"(^(?:(.*?[\])}])|(.*?)[ _.-]+)[(\[]?(cd|dvd|part|pt|dis[ck])[ _.-]*([a-d])[)\]]?(?:\.[^.]+)?$)";

std::vector<ExtraRule> default_extra_rules()
{
    return {
        {ExtraKind::Trailer, ExtraRuleType::DirectoryName, "trailers"},
        {ExtraKind::ThemeVideo, ExtraRuleType::DirectoryName, "backdrops"},
        {ExtraKind::BehindTheScenes, ExtraRuleType::DirectoryName, "behind the scenes"},
        {ExtraKind::DeletedScene, ExtraRuleType::DirectoryName, "deleted scenes"},
        {ExtraKind::Interview, ExtraRuleType::DirectoryName, "interviews"},
        {ExtraKind::Scene, ExtraRuleType::DirectoryName, "scenes"},
        {ExtraKind::Sample, ExtraRuleType::DirectoryName, "samples"},
        {ExtraKind::Short, ExtraRuleType::DirectoryName, "shorts"},
        {ExtraKind::Featurette, ExtraRuleType::DirectoryName, "featurettes"},
        {ExtraKind::Clip, ExtraRuleType::DirectoryName, "clips"},
        {ExtraKind::Unknown, ExtraRuleType::DirectoryName, "extras"},
        {ExtraKind::Unknown, ExtraRuleType::DirectoryName, "extra"},
        {ExtraKind::Unknown, ExtraRuleType::DirectoryName, "other"},

        {ExtraKind::Trailer, ExtraRuleType::Filename, "trailer"},
        {ExtraKind::Sample, ExtraRuleType::Filename, "sample"},

        {ExtraKind::Trailer, ExtraRuleType::Suffix, "-trailer"},
        {ExtraKind::Trailer, ExtraRuleType::Suffix, ".trailer"},
        {ExtraKind::Trailer, ExtraRuleType::Suffix, "_trailer"},
        {ExtraKind::Trailer, ExtraRuleType::Suffix, " trailer"},
        {ExtraKind::Sample, ExtraRuleType::Suffix, "-sample"},
        {ExtraKind::Sample, ExtraRuleType::Suffix, ".sample"},
        {ExtraKind::Sample, ExtraRuleType::Suffix, "_sample"},
        {ExtraKind::Sample, ExtraRuleType::Suffix, " sample"},
        {ExtraKind::Scene, ExtraRuleType::Suffix, "-scene"},
        {ExtraKind::Clip, ExtraRuleType::Suffix, "-clip"},
        {ExtraKind::Interview, ExtraRuleType::Suffix, "-interview"},
        {ExtraKind::BehindTheScenes, ExtraRuleType::Suffix, "-behindthescenes"},
        {ExtraKind::DeletedScene, ExtraRuleType::Suffix, "-deleted"},
        {ExtraKind::DeletedScene, ExtraRuleType::Suffix, "-deletedscene"},
        {ExtraKind::Featurette, ExtraRuleType::Suffix, "-featurette"},
        {ExtraKind::Short, ExtraRuleType::Suffix, "-short"},
        {ExtraKind::Unknown, ExtraRuleType::Suffix, "-extra"},
        {ExtraKind::Unknown, ExtraRuleType::Suffix, "-other"}
    };
}

}


NamingOptions::NamingOptions()
    : NamingOptions(std::vector<std::string>{})
{
}


NamingOptions::NamingOptions(const std::vector<std::string>& extra_video_extensions)
    : extra_rules_(default_extra_rules()),
      resolution_regex_(compile("[0-9]{2}[0-9]+[ip]")),
      movie_version_regex_(compile(R"(^\[([^\]]*)\])", false)),
      episode_version_regex_(compile(R"(^(.+) - (?:\[(.+)\]|((?!s\d{2}e\d{2}$)[^\[\]]+))$)"))
{
    for (const auto& extension : default_video_extensions()) {
        add_video_extension(extension);
    }
    for (const auto& extension : extra_video_extensions) {
        add_video_extension(extension);
    }

    for (const auto& pattern : default_clean_string_patterns()) {
        clean_string_regexes_.push_back(compile(pattern));
    }
    for (const auto& pattern : default_clean_date_time_patterns()) {
        clean_date_time_regexes_.push_back(compile(pattern));
    }

    stack_rules_.push_back(StackRule{compile(kNumericStackPattern), true});
    stack_rules_.push_back(StackRule{compile(kLetterStackPattern), false});
}


bool NamingOptions::is_video_extension(const std::string& extension) const
{
    return video_extensions_.contains(Utils::to_lower_copy(extension));
}


void NamingOptions::add_video_extension(const std::string& extension)
{
    std::string normalized = Utils::to_lower_copy(Utils::trim_copy(extension));
    if (normalized.empty()) {
        return;
    }
    if (normalized.front() != '.') {
        normalized.insert(normalized.begin(), '.');
    }
    video_extensions_.insert(std::move(normalized));
}


std::regex NamingOptions::compile(const std::string& pattern, bool ignore_case)
{
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (ignore_case) {
        flags |= std::regex::icase;
    }
    try {
        return std::regex(pattern, flags);
    } catch (const std::regex_error& ex) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_PARSE_ERROR,
                            fmt::format("Invalid naming pattern: {}", ex.what()),
                            fmt::format("Pattern: {}", pattern));
    }
}
