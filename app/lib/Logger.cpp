#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {

constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

const std::vector<std::string>& logger_names()
{
    static const std::vector<std::string> names = {"core_logger", "cli_logger"};
    return names;
}

}


std::string Logger::get_cache_directory()
{
    if (const char* xdg_cache = std::getenv("XDG_CACHE_HOME")) {
        if (*xdg_cache != '\0') {
            return xdg_cache;
        }
    }
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / ".cache").string();
    }
    return std::filesystem::temp_directory_path().string();
}


std::string Logger::get_log_directory()
{
    const std::filesystem::path dir =
        std::filesystem::path(get_cache_directory()) / "video-list-resolver" / "logs";
    return Utils::path_to_utf8(dir);
}


std::optional<spdlog::level::level_enum> Logger::parse_level(const std::string& value)
{
    const std::string lowered = Utils::to_lower_copy(Utils::trim_copy(value));
    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "info") return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical") return spdlog::level::critical;
    if (lowered == "off") return spdlog::level::off;
    return std::nullopt;
}


void Logger::setup_loggers(spdlog::level::level_enum level)
{
    const std::filesystem::path log_dir = Utils::utf8_to_path(get_log_directory());
    std::filesystem::create_directories(log_dir);

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level);

    for (const auto& name : logger_names()) {
        if (spdlog::get(name)) {
            spdlog::get(name)->set_level(level);
            continue;
        }
        const auto file_path = log_dir / (name + ".log");
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            Utils::path_to_utf8(file_path), kMaxLogFileSize, kMaxLogFiles);
        file_sink->set_level(spdlog::level::trace);

        auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink, file_sink});
        logger->set_level(level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
