#ifndef EPISODE_VERSION_GROUPER_HPP
#define EPISODE_VERSION_GROUPER_HPP

#include "Types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class NamingOptions;
namespace spdlog { class logger; }

struct EpisodeKey {
    std::string base_key;
    std::optional<std::string> version_tag;
};

/**
 * @brief Groups alternate versions of TV episodes by their base key.
 *
 * "Show S01E01.mkv" and "Show S01E01 - [1080p].mkv" share the base key
 * "Show S01E01" and become one entry. Every key is handled on its own; a
 * file whose name carries no version suffix simply forms its own group.
 */
class EpisodeVersionGrouper {
public:
    using WarningSink = std::function<void(const VersionGroupingWarning&)>;

    EpisodeVersionGrouper(const NamingOptions& options,
                          std::shared_ptr<spdlog::logger> logger,
                          WarningSink warning_sink = nullptr);
    // Holds a reference to the options; a temporary would dangle.
    EpisodeVersionGrouper(NamingOptions&&, std::shared_ptr<spdlog::logger>,
                          WarningSink = nullptr) = delete;

    std::vector<LogicalEntry> group(const std::vector<LogicalEntry>& entries) const;

    /**
     * @brief Split a base name into episode key and version tag.
     *
     * - "Show S01E01 - [HEVC]" -> {"Show S01E01", "HEVC"}
     * - "Show S01E01 - 720p"   -> {"Show S01E01", "720p"}
     * - "Show S01E01"          -> {"Show S01E01", none}
     * - "Show - S01E01"        -> {"Show - S01E01", none}
     */
    EpisodeKey extract_key(const std::string& base_name) const;

private:
    friend class EpisodeVersionGrouperTestAccess;
    struct EpisodeGroup;

    std::vector<FileRecord> sort_versions(const std::vector<FileRecord>& files) const;
    LogicalEntry build_entry(EpisodeGroup& group) const;
    void report_oversized_group(const std::string& base_key, std::size_t file_count) const;

    const NamingOptions& options;
    std::shared_ptr<spdlog::logger> logger;
    WarningSink warning_sink;
};

#endif
