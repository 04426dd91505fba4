#include "FileScanner.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <filesystem>
#include <optional>
#include <type_traits>
#include <unordered_set>

#ifdef _WIN32
#include <windows.h>
#endif

namespace fs = std::filesystem;

struct FileScanner::ScanContext {
    bool include_files{false};
    bool include_directories{false};
    bool include_hidden{false};
    std::shared_ptr<spdlog::logger> logger;
};

std::vector<FileEntry>
FileScanner::get_directory_entries(const std::string &directory_path,
                                   FileScanOptions options) const
{
    std::vector<FileEntry> entries;
    auto logger = Logger::get_logger("core_logger");

    if (logger) {
        logger->debug("Scanning directory '{}' with options mask {}", directory_path, static_cast<int>(options));
    }

    ScanContext context;
    context.include_files = has_flag(options, FileScanOptions::Files);
    context.include_directories = has_flag(options, FileScanOptions::Directories);
    context.include_hidden = has_flag(options, FileScanOptions::HiddenFiles);
    context.logger = logger;

    try {
        const fs::path scan_path = Utils::utf8_to_path(directory_path);
        if (has_flag(options, FileScanOptions::Recursive)) {
            collect_entries(fs::recursive_directory_iterator(
                                scan_path, fs::directory_options::skip_permission_denied),
                            context, entries);
        } else {
            collect_entries(fs::directory_iterator(scan_path), context, entries);
        }
    } catch (const fs::filesystem_error& ex) {
        if (logger) {
            logger->warn("Error while scanning '{}': {}", directory_path, ex.what());
        }
        throw;
    }

    std::sort(entries.begin(), entries.end(), [](const FileEntry& lhs, const FileEntry& rhs) {
        return lhs.full_path < rhs.full_path;
    });

    if (logger) {
        logger->info("Directory scan complete for '{}': {} item(s) found", directory_path,
                     entries.size());
    }

    return entries;
}


template <typename Iterator>
void FileScanner::collect_entries(Iterator iterator,
                                  const ScanContext& context,
                                  std::vector<FileEntry>& entries) const
{
    for (auto it = fs::begin(iterator); it != fs::end(iterator); ++it) {
        const fs::directory_entry& entry = *it;
        if (auto entry_info = build_entry(entry, context)) {
            entries.push_back(std::move(*entry_info));
            continue;
        }
        if constexpr (std::is_same_v<Iterator, fs::recursive_directory_iterator>) {
            // Skipped folders are not descended into either.
            std::error_code ec;
            const bool skipped = is_junk_file(Utils::path_to_utf8(entry.path().filename()))
                || (!context.include_hidden && is_file_hidden(entry.path()));
            if (skipped && entry.is_directory(ec)) {
                it.disable_recursion_pending();
            }
        }
    }
}


bool FileScanner::is_file_hidden(const fs::path &path) const {
#ifdef _WIN32
    DWORD attrs = GetFileAttributesW(path.c_str());
    return (attrs != INVALID_FILE_ATTRIBUTES) &&
           (attrs & FILE_ATTRIBUTE_HIDDEN);
#else
    return path.filename().string().starts_with(".");
#endif
}


bool FileScanner::is_junk_file(const std::string& name) const {
    static const std::unordered_set<std::string> junk = {
        ".DS_Store", "Thumbs.db", "desktop.ini", "@eaDir", ".AppleDouble"
    };
    return junk.contains(name);
}


std::optional<FileEntry> FileScanner::build_entry(const fs::directory_entry& entry,
                                                  const ScanContext& context) const
{
    const fs::path& entry_path = entry.path();
    std::string full_path = Utils::path_to_utf8(entry_path);
    std::string file_name = Utils::path_to_utf8(entry_path.filename());

    if (should_skip_entry(entry_path, file_name, context, full_path)) {
        return std::nullopt;
    }

    if (auto type = classify_entry(entry, context)) {
        return FileEntry{std::move(full_path), std::move(file_name), *type};
    }
    return std::nullopt;
}

bool FileScanner::should_skip_entry(const fs::path& entry_path,
                                    const std::string& file_name,
                                    const ScanContext& context,
                                    const std::string& full_path) const
{
    if (is_junk_file(file_name)) {
        return true;
    }

    if (is_file_hidden(entry_path) && !context.include_hidden) {
        if (context.logger) {
            context.logger->trace("Skipping hidden entry '{}'", full_path);
        }
        return true;
    }

    return false;
}

std::optional<FileType> FileScanner::classify_entry(const fs::directory_entry& entry,
                                                    const ScanContext& context) const
{
    std::error_code ec;
    if (context.include_files && entry.is_regular_file(ec)) {
        return FileType::File;
    }

    if (context.include_directories && entry.is_directory(ec)) {
        return FileType::Directory;
    }

    return std::nullopt;
}
