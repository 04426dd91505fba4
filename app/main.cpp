#include "AppException.hpp"
#include "FileMetadataResolver.hpp"
#include "FileScanner.hpp"
#include "Logger.hpp"
#include "NamingOptions.hpp"
#include "ResultsReporter.hpp"
#include "Settings.hpp"
#include "Utils.hpp"
#include "VideoListResolver.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitInvalidArguments = 1;
constexpr int kExitFilesystemError = 2;

struct ParsedArguments {
    std::string directory;
    std::string config_file;
    std::optional<std::string> media_kind;
    std::optional<std::string> library_root;
    bool disable_multi_version{false};
    bool disable_parse_name{false};
    bool recursive{false};
    bool include_folders{false};
    bool verbose{false};
    bool show_help{false};
};

void print_usage(const char* program)
{
    std::printf(
        "Usage: %s [options] <directory>\n"
        "\n"
        "Groups the video files of one folder into titles, stacks, extras\n"
        "and alternate versions, and prints the result as JSON.\n"
        "\n"
        "Options:\n"
        "  --tv                   Same as --kind tvshows\n"
        "  --kind <kind>          movies, musicvideos, tvshows, homevideos or mixed\n"
        "  --no-multi-version     Do not group alternate versions\n"
        "  --no-parse-name        Use raw file names instead of parsed titles\n"
        "  --recursive            Include files from subfolders (trailers/, extras/, ...)\n"
        "  --folders              Treat subfolders as titles (DVD folders, disc1/disc2 stacks)\n"
        "  --library-root <dir>   Top-level library folder\n"
        "  --config <file>        Settings file (default: per-user config.ini)\n"
        "  --verbose              Debug logging\n"
        "  --help                 Show this text\n",
        program);
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    auto require_value = [&](int& index, const char* flag) -> std::string {
        if (index + 1 >= argc) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                                std::string("Missing value for ") + flag, flag);
        }
        return argv[++index];
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            parsed.show_help = true;
        } else if (std::strcmp(arg, "--tv") == 0) {
            parsed.media_kind = "tvshows";
        } else if (std::strcmp(arg, "--kind") == 0) {
            parsed.media_kind = require_value(i, "--kind");
        } else if (std::strcmp(arg, "--no-multi-version") == 0) {
            parsed.disable_multi_version = true;
        } else if (std::strcmp(arg, "--no-parse-name") == 0) {
            parsed.disable_parse_name = true;
        } else if (std::strcmp(arg, "--recursive") == 0) {
            parsed.recursive = true;
        } else if (std::strcmp(arg, "--folders") == 0) {
            parsed.include_folders = true;
        } else if (std::strcmp(arg, "--library-root") == 0) {
            parsed.library_root = require_value(i, "--library-root");
        } else if (std::strcmp(arg, "--config") == 0) {
            parsed.config_file = require_value(i, "--config");
        } else if (std::strcmp(arg, "--verbose") == 0) {
            parsed.verbose = true;
        } else if (arg[0] == '-' && arg[1] == '-') {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                                std::string("Unknown option ") + arg, arg);
        } else if (parsed.directory.empty()) {
            parsed.directory = arg;
        } else {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                                "Only one directory may be given", arg);
        }
    }
    return parsed;
}

bool initialize_loggers(spdlog::level::level_enum level)
{
    try {
        Logger::setup_loggers(level);
        return true;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

ResolveOptions build_resolve_options(const Settings& settings, const ParsedArguments& args)
{
    ResolveOptions options;
    options.support_multi_version = settings.get_support_multi_version() && !args.disable_multi_version;
    options.parse_name = settings.get_parse_name() && !args.disable_parse_name;
    options.library_root = args.library_root.value_or(settings.get_library_root());
    options.media_kind = args.media_kind ? std::optional<MediaKind>(parse_media_kind(*args.media_kind))
                                         : settings.get_media_kind();
    return options;
}

std::vector<FileRecord> resolve_records(const std::vector<FileEntry>& entries,
                                        const NamingOptions& naming,
                                        const ResolveOptions& options)
{
    std::vector<FileRecord> records;
    records.reserve(entries.size());
    for (const auto& entry : entries) {
        if (entry.type == FileType::Directory
            && FileMetadataResolver::is_extras_folder(entry.file_name, naming)) {
            continue;
        }
        if (auto record = FileMetadataResolver::resolve(entry.full_path,
                                                        entry.type == FileType::Directory,
                                                        naming,
                                                        options.parse_name,
                                                        options.library_root)) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

spdlog::level::level_enum resolve_log_level(const Settings& settings, bool verbose)
{
    if (verbose) {
        return spdlog::level::debug;
    }
    const char* env_level = std::getenv("VIDEO_LIST_RESOLVER_LOG_LEVEL");
    if (env_level == nullptr || *env_level == '\0') {
        return settings.get_log_level();
    }
    if (auto parsed = Logger::parse_level(env_level)) {
        return *parsed;
    }
    THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                        std::string("Unsupported log level '") + env_level + "'",
                        "VIDEO_LIST_RESOLVER_LOG_LEVEL");
}

int run(const ParsedArguments& args)
{
    Settings settings(args.config_file);
    settings.load();

    const auto level = resolve_log_level(settings, args.verbose);
    if (!initialize_loggers(level)) {
        return kExitInvalidArguments;
    }
    auto logger = Logger::get_logger("cli_logger");

    if (!Utils::is_valid_directory(args.directory)) {
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_INVALID, args.directory);
    }

    const ResolveOptions resolve_options = build_resolve_options(settings, args);
    const NamingOptions naming(settings.get_extra_video_extensions());

    FileScanOptions scan_options = FileScanOptions::Files;
    if (args.recursive || settings.get_recursive_scan()) {
        scan_options = scan_options | FileScanOptions::Recursive;
    }
    if (args.include_folders) {
        scan_options = scan_options | FileScanOptions::Directories;
    }

    FileScanner scanner;
    const std::vector<FileEntry> entries = scanner.get_directory_entries(args.directory, scan_options);
    const std::vector<FileRecord> records = resolve_records(entries, naming, resolve_options);
    if (logger) {
        logger->info("Resolving {} video file(s) out of {} scanned item(s) in '{}'",
                     records.size(), entries.size(), args.directory);
    }

    VideoListResolver resolver(naming, Logger::get_logger("core_logger"));
    const std::vector<LogicalEntry> resolved = resolver.resolve(records, resolve_options);

    std::cout << ResultsReporter::to_json_string(resolved) << std::endl;
    if (logger) {
        logger->info("Resolved into {} logical title(s)", resolved.size());
    }
    return kExitSuccess;
}

}


int main(int argc, char** argv)
{
    try {
        const ParsedArguments args = parse_command_line(argc, argv);
        if (args.show_help) {
            print_usage(argv[0]);
            return kExitSuccess;
        }
        if (args.directory.empty()) {
            print_usage(argv[0]);
            return kExitInvalidArguments;
        }
        return run(args);
    } catch (const ErrorCodes::AppException& ex) {
        std::fprintf(stderr, "%s\n", ex.get_full_details().c_str());
        const int code = ex.get_error_code_int();
        const bool filesystem_error = code >= 1200 && code < 1300;
        return filesystem_error ? kExitFilesystemError : kExitInvalidArguments;
    } catch (const std::filesystem::filesystem_error& ex) {
        std::fprintf(stderr, "Filesystem error: %s\n", ex.what());
        return kExitFilesystemError;
    }
}
