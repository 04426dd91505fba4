#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/common.h>


class Settings
{
public:
    // An empty path selects the per-user config.ini.
    explicit Settings(std::string config_file = "");

    // Returns false when no config file exists; defaults stay in place.
    // Throws ErrorCodes::AppException for an unsupported media kind or log level.
    bool load();
    bool save();

    bool get_support_multi_version() const;
    void set_support_multi_version(bool value);

    bool get_parse_name() const;
    void set_parse_name(bool value);

    std::optional<MediaKind> get_media_kind() const;
    void set_media_kind(std::optional<MediaKind> value);

    std::string get_library_root() const;
    void set_library_root(const std::string& path);

    bool get_recursive_scan() const;
    void set_recursive_scan(bool value);

    std::vector<std::string> get_extra_video_extensions() const;
    void set_extra_video_extensions(std::vector<std::string> values);

    spdlog::level::level_enum get_log_level() const;
    void set_log_level(spdlog::level::level_enum level);

    std::string define_config_path();
    std::string get_config_path() const;
    std::string get_config_dir() const;

private:
    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    bool support_multi_version{true};
    bool parse_name{true};
    std::optional<MediaKind> media_kind;
    std::string library_root;
    bool recursive_scan{false};
    std::vector<std::string> extra_video_extensions;
    spdlog::level::level_enum log_level{spdlog::level::info};
};

#endif
