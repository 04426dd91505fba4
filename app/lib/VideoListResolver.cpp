#include "VideoListResolver.hpp"
#include "AppException.hpp"
#include "MovieVersionGrouper.hpp"
#include "NamingOptions.hpp"
#include "Partitioner.hpp"
#include "TitleGrouper.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

bool is_known_media_kind(MediaKind kind)
{
    switch (kind) {
        case MediaKind::Movies:
        case MediaKind::MusicVideos:
        case MediaKind::TvShows:
        case MediaKind::HomeVideos:
        case MediaKind::Mixed:
            return true;
    }
    return false;
}

}


MediaKind parse_media_kind(const std::string& value)
{
    const std::string lowered = Utils::to_lower_copy(Utils::trim_copy(value));
    for (MediaKind kind : {MediaKind::Movies, MediaKind::MusicVideos, MediaKind::TvShows,
                           MediaKind::HomeVideos, MediaKind::Mixed}) {
        if (lowered == to_string(kind)) {
            return kind;
        }
    }
    THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                        fmt::format("Unsupported media kind '{}'", value),
                        "Expected one of: movies, musicvideos, tvshows, homevideos, mixed");
}


VideoListResolver::VideoListResolver(const NamingOptions& options,
                                     std::shared_ptr<spdlog::logger> logger)
    : options(options),
      logger(std::move(logger))
{
}


std::vector<LogicalEntry> VideoListResolver::resolve(const std::vector<FileRecord>& records,
                                                     const ResolveOptions& resolve_options) const
{
    if (resolve_options.support_multi_version && resolve_options.media_kind
        && !is_known_media_kind(*resolve_options.media_kind)) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "Unsupported media kind for version grouping",
                            fmt::format("Media kind value: {}",
                                        static_cast<int>(*resolve_options.media_kind)));
    }

    PartitionResult partition = Partitioner::partition(records, options);
    if (logger) {
        logger->debug("Partitioned {} record(s): {} stack(s), {} standalone, {} extra(s)",
                      records.size(), partition.stacks.size(), partition.standalone.size(),
                      partition.remaining_extras.size());
    }

    std::vector<LogicalEntry> entries = TitleGrouper::group(partition.stacks,
                                                            partition.standalone,
                                                            options,
                                                            resolve_options.parse_name,
                                                            resolve_options.library_root);

    if (resolve_options.support_multi_version) {
        entries = group_versions(std::move(entries), resolve_options);
    }

    for (const auto& extra : partition.remaining_extras) {
        entries.push_back(TitleGrouper::single_file_entry(extra));
    }
    return entries;
}


std::vector<LogicalEntry> VideoListResolver::group_versions(std::vector<LogicalEntry> entries,
                                                            const ResolveOptions& resolve_options) const
{
    if (resolve_options.media_kind == MediaKind::TvShows) {
        EpisodeVersionGrouper grouper(options, logger, resolve_options.warning_sink);
        return grouper.group(entries);
    }

    MovieVersionGrouper grouper(options, logger);
    return grouper.group(std::move(entries));
}
