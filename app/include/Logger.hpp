#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

class Logger {
public:
    // Registers "core_logger" and "cli_logger" with a stderr and a rotating file sink.
    static void setup_loggers(spdlog::level::level_enum level = spdlog::level::info);

    // Returns nullptr when the logger has not been registered.
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static std::optional<spdlog::level::level_enum> parse_level(const std::string& value);
    static std::string get_log_directory();

private:
    static std::string get_cache_directory();
};

#endif
