#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

enum class FileType {File, Directory};

inline std::string to_string(FileType type) {
    switch (type) {
        case FileType::File: return "File";
        case FileType::Directory: return "Directory";
        default: return "Unknown";
    }
}

struct FileEntry {
    std::string full_path;
    std::string file_name;
    FileType type;
};

enum class ExtraKind {
    Unknown,
    Clip,
    Trailer,
    BehindTheScenes,
    DeletedScene,
    Interview,
    Scene,
    Sample,
    ThemeSong,
    ThemeVideo,
    Featurette,
    Short
};

inline std::string to_string(ExtraKind kind) {
    switch (kind) {
        case ExtraKind::Unknown: return "unknown";
        case ExtraKind::Clip: return "clip";
        case ExtraKind::Trailer: return "trailer";
        case ExtraKind::BehindTheScenes: return "behindthescenes";
        case ExtraKind::DeletedScene: return "deletedscene";
        case ExtraKind::Interview: return "interview";
        case ExtraKind::Scene: return "scene";
        case ExtraKind::Sample: return "sample";
        case ExtraKind::ThemeSong: return "themesong";
        case ExtraKind::ThemeVideo: return "themevideo";
        case ExtraKind::Featurette: return "featurette";
        case ExtraKind::Short: return "short";
        default: return "unknown";
    }
}

/**
 * @brief Library content type. Only TvShows selects the episode version policy.
 */
enum class MediaKind {
    Movies,
    MusicVideos,
    TvShows,
    HomeVideos,
    Mixed
};

inline std::string to_string(MediaKind kind) {
    switch (kind) {
        case MediaKind::Movies: return "movies";
        case MediaKind::MusicVideos: return "musicvideos";
        case MediaKind::TvShows: return "tvshows";
        case MediaKind::HomeVideos: return "homevideos";
        case MediaKind::Mixed: return "mixed";
        default: return "unknown";
    }
}

/**
 * @brief One physical video file or directory after name parsing.
 */
struct FileRecord {
    std::string path;
    bool is_directory{false};
    std::string display_name;
    std::optional<int> year;
    std::optional<ExtraKind> extra_kind;
    std::string container;
    /// Version label captured from an episode file name ("1080p" for "Show S01E01 - [1080p]").
    std::optional<std::string> version_tag;
};

inline bool operator==(const FileRecord& lhs, const FileRecord& rhs) {
    return lhs.path == rhs.path
        && lhs.is_directory == rhs.is_directory
        && lhs.display_name == rhs.display_name
        && lhs.year == rhs.year
        && lhs.extra_kind == rhs.extra_kind
        && lhs.container == rhs.container
        && lhs.version_tag == rhs.version_tag;
}

inline bool operator!=(const FileRecord& lhs, const FileRecord& rhs) {
    return !(lhs == rhs);
}

/**
 * @brief A logical title: a single file, a multi-part stack, or a primary
 * file with its alternate versions.
 *
 * An entry holding more than one file (a stack) never carries alternates.
 */
struct LogicalEntry {
    std::string name;
    std::optional<int> year;
    std::vector<FileRecord> files;
    std::vector<FileRecord> alternate_versions;
    std::optional<ExtraKind> extra_kind;
};

inline bool operator==(const LogicalEntry& lhs, const LogicalEntry& rhs) {
    return lhs.name == rhs.name
        && lhs.year == rhs.year
        && lhs.files == rhs.files
        && lhs.alternate_versions == rhs.alternate_versions
        && lhs.extra_kind == rhs.extra_kind;
}

inline bool operator!=(const LogicalEntry& lhs, const LogicalEntry& rhs) {
    return !(lhs == rhs);
}

/**
 * @brief Emitted when an episode group collects more versions than expected.
 */
struct VersionGroupingWarning {
    std::string base_key;
    std::size_t file_count{0};
};

enum class FileScanOptions {
    None        = 0,
    Files       = 1 << 0,   // 0001
    Directories = 1 << 1,   // 0010
    HiddenFiles = 1 << 2,   // 0100
    Recursive   = 1 << 3    // 1000
};

inline bool has_flag(FileScanOptions value, FileScanOptions flag) {
    return (static_cast<int>(value) & static_cast<int>(flag)) != 0;
}

inline FileScanOptions operator|(FileScanOptions a, FileScanOptions b) {
    return static_cast<FileScanOptions>(static_cast<int>(a) | static_cast<int>(b));
}

inline FileScanOptions operator&(FileScanOptions a, FileScanOptions b) {
    return static_cast<FileScanOptions>(static_cast<int>(a) & static_cast<int>(b));
}

inline FileScanOptions operator~(FileScanOptions a) {
    return static_cast<FileScanOptions>(~static_cast<int>(a));
}

#endif
