#ifndef FILE_METADATA_RESOLVER_HPP
#define FILE_METADATA_RESOLVER_HPP

#include "Types.hpp"

#include <optional>
#include <string>

class NamingOptions;

struct CleanDateTimeResult {
    std::string name;
    std::optional<int> year;
};

/**
 * @brief Turns a single path into a FileRecord: container, display name,
 * release year and extra kind.
 */
class FileMetadataResolver {
public:
    /**
     * @brief Resolve one file or folder.
     *
     * @param path Full path of the file or folder.
     * @param is_directory Whether @p path is a folder (a DVD/Blu-ray folder or a folder stack part).
     * @param options Naming patterns.
     * @param parse_name When true the year is split off and release tags are cleaned;
     *        when false the display name is the bare file name without extension.
     * @param library_root Top-level library folder; folder-name extra rules never fire on it.
     * @return std::nullopt for an empty path or a file that is not a video.
     */
    static std::optional<FileRecord> resolve(const std::string& path,
                                             bool is_directory,
                                             const NamingOptions& options,
                                             bool parse_name = true,
                                             const std::string& library_root = "");

    static std::optional<ExtraKind> resolve_extra_kind(const std::string& path,
                                                       bool is_directory,
                                                       const NamingOptions& options,
                                                       const std::string& library_root = "");

    // trailers/, extras/ and the like hold extras; they are never titles themselves.
    static bool is_extras_folder(const std::string& folder_name, const NamingOptions& options);

    // "Movie (2020)" -> {"Movie", 2020}; names without a year come back unchanged.
    static CleanDateTimeResult clean_date_time(const std::string& name,
                                               const NamingOptions& options);

private:
    static bool is_library_root(const std::string& directory, const std::string& library_root);
};

#endif
