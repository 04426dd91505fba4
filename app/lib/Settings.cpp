#include "Settings.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include "VideoListResolver.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>


namespace {
constexpr const char* kAppName = "VideoListResolver";
constexpr const char* kResolverSection = "Resolver";
constexpr const char* kNamingSection = "Naming";
constexpr const char* kLoggingSection = "Logging";

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

bool parse_bool_or(const std::string& key, const std::string& value, bool fallback) {
    const std::string lowered = Utils::to_lower_copy(Utils::trim_copy(value));
    if (lowered.empty()) {
        return fallback;
    }
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        return false;
    }
    settings_log(spdlog::level::warn, "Invalid boolean '{}' for {}; keeping {}", value, key, fallback);
    return fallback;
}

std::string bool_to_string(bool value) {
    return value ? "true" : "false";
}
}


Settings::Settings(std::string config_file)
    : config_path(std::move(config_file))
{
    if (config_path.empty()) {
        config_path = define_config_path();
    }
    config_dir = Utils::utf8_to_path(config_path).parent_path();
}


std::string Settings::define_config_path()
{
    if (const char* override_root = std::getenv("VIDEO_LIST_RESOLVER_CONFIG_DIR")) {
        std::filesystem::path base = Utils::utf8_to_path(override_root);
        return Utils::path_to_utf8(base / kAppName / "config.ini");
    }
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg_config != '\0') {
            return Utils::path_to_utf8(Utils::utf8_to_path(xdg_config) / kAppName / "config.ini");
        }
    }
    if (const char* home = std::getenv("HOME")) {
        return Utils::path_to_utf8(Utils::utf8_to_path(home) / ".config" / kAppName / "config.ini");
    }
    THROW_APP_ERROR(ErrorCodes::Code::SYSTEM_ENVIRONMENT_VARIABLE_NOT_SET,
                    "Neither VIDEO_LIST_RESOLVER_CONFIG_DIR, XDG_CONFIG_HOME nor HOME is set");
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    support_multi_version = parse_bool_or("support_multi_version",
        config.getValue(kResolverSection, "support_multi_version"), true);
    parse_name = parse_bool_or("parse_name",
        config.getValue(kResolverSection, "parse_name"), true);
    recursive_scan = parse_bool_or("recursive_scan",
        config.getValue(kResolverSection, "recursive_scan"), false);
    library_root = config.getValue(kResolverSection, "library_root");

    const std::string kind = Utils::trim_copy(config.getValue(kResolverSection, "media_kind"));
    media_kind = kind.empty() ? std::nullopt : std::optional<MediaKind>(parse_media_kind(kind));

    extra_video_extensions = Utils::split_list(config.getValue(kNamingSection, "extra_video_extensions"));

    const std::string level = config.getValue(kLoggingSection, "level", "info");
    if (auto parsed = Logger::parse_level(level)) {
        log_level = *parsed;
    } else {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            fmt::format("Unsupported log level '{}'", level),
                            fmt::format("Config file: {}", config_path));
    }

    settings_log(spdlog::level::debug, "Loaded settings from {}", config_path);
    return true;
}


bool Settings::save()
{
    try {
        if (!config_dir.empty() && !std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
        return false;
    }

    config.setValue(kResolverSection, "support_multi_version", bool_to_string(support_multi_version));
    config.setValue(kResolverSection, "parse_name", bool_to_string(parse_name));
    config.setValue(kResolverSection, "recursive_scan", bool_to_string(recursive_scan));
    config.setValue(kResolverSection, "library_root", library_root);
    config.setValue(kResolverSection, "media_kind", media_kind ? to_string(*media_kind) : "");
    config.setValue(kNamingSection, "extra_video_extensions", Utils::join_list(extra_video_extensions));
    config.setValue(kLoggingSection, "level",
                    std::string(spdlog::level::to_string_view(log_level).data(),
                                spdlog::level::to_string_view(log_level).size()));

    return config.save(config_path);
}


bool Settings::get_support_multi_version() const
{
    return support_multi_version;
}


void Settings::set_support_multi_version(bool value)
{
    support_multi_version = value;
}


bool Settings::get_parse_name() const
{
    return parse_name;
}


void Settings::set_parse_name(bool value)
{
    parse_name = value;
}


std::optional<MediaKind> Settings::get_media_kind() const
{
    return media_kind;
}


void Settings::set_media_kind(std::optional<MediaKind> value)
{
    media_kind = value;
}


std::string Settings::get_library_root() const
{
    return library_root;
}


void Settings::set_library_root(const std::string& path)
{
    library_root = path;
}


bool Settings::get_recursive_scan() const
{
    return recursive_scan;
}


void Settings::set_recursive_scan(bool value)
{
    recursive_scan = value;
}


std::vector<std::string> Settings::get_extra_video_extensions() const
{
    return extra_video_extensions;
}


void Settings::set_extra_video_extensions(std::vector<std::string> values)
{
    extra_video_extensions = std::move(values);
}


spdlog::level::level_enum Settings::get_log_level() const
{
    return log_level;
}


void Settings::set_log_level(spdlog::level::level_enum level)
{
    log_level = level;
}


std::string Settings::get_config_path() const
{
    return config_path;
}


std::string Settings::get_config_dir() const
{
    return Utils::path_to_utf8(config_dir);
}
