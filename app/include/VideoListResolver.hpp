#ifndef VIDEO_LIST_RESOLVER_HPP
#define VIDEO_LIST_RESOLVER_HPP

#include "EpisodeVersionGrouper.hpp"
#include "Types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

class NamingOptions;
namespace spdlog { class logger; }

struct ResolveOptions {
    bool support_multi_version{true};
    bool parse_name{true};
    std::string library_root;
    /// Unset resolves with the movie policy.
    std::optional<MediaKind> media_kind;
    EpisodeVersionGrouper::WarningSink warning_sink;
};

/**
 * @brief Parse a media kind name ("movies", "tvshows", ...), case-insensitive.
 * @throws ErrorCodes::AppException CONFIG_INVALID_VALUE for anything else.
 */
MediaKind parse_media_kind(const std::string& value);

/**
 * @brief Resolves the video files of one folder into logical titles.
 *
 * Pipeline:
 * 1. Partition the records into stacks, standalone titles and extras.
 * 2. Build one entry per stack and per standalone title.
 * 3. When multi-version support is on, collapse alternate versions with the
 *    episode policy (TV shows) or the movie policy (everything else).
 * 4. Append one entry per extra.
 *
 * Caller records are never modified.
 */
class VideoListResolver {
public:
    explicit VideoListResolver(const NamingOptions& options,
                               std::shared_ptr<spdlog::logger> logger = nullptr);
    /// The options are held by reference and must outlive the resolver.
    explicit VideoListResolver(NamingOptions&&, std::shared_ptr<spdlog::logger> = nullptr) = delete;

    std::vector<LogicalEntry> resolve(const std::vector<FileRecord>& records,
                                      const ResolveOptions& resolve_options = {}) const;

private:
    std::vector<LogicalEntry> group_versions(std::vector<LogicalEntry> entries,
                                             const ResolveOptions& resolve_options) const;

    const NamingOptions& options;
    std::shared_ptr<spdlog::logger> logger;
};

#endif
