#include "ErrorCode.hpp"

#include <fmt/format.h>

namespace ErrorCodes {

namespace {

ErrorInfo make_info(Code code, const char* message, const char* resolution, const std::string& context)
{
    return ErrorInfo(code, message, resolution, context);
}

}

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return fmt::format("{}\n\n{}", message, resolution);
}

std::string ErrorInfo::get_full_details() const
{
    std::string details = fmt::format("Error {}: {}", static_cast<int>(code), message);
    if (!context.empty()) {
        details += fmt::format("\nDetails: {}", context);
    }
    if (!resolution.empty()) {
        details += fmt::format("\nResolution: {}", resolution);
    }
    return details;
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    switch (code) {
        case Code::FILE_NOT_FOUND:
            return make_info(code, "The file could not be found.",
                             "Check that the path exists and try again.", context);
        case Code::FILE_ACCESS_DENIED:
            return make_info(code, "Access to the file was denied.",
                             "Check the file permissions.", context);
        case Code::DIRECTORY_NOT_FOUND:
            return make_info(code, "The directory could not be found.",
                             "Check that the directory exists and try again.", context);
        case Code::DIRECTORY_INVALID:
            return make_info(code, "The path is not a directory.",
                             "Pass the folder that contains the video files.", context);
        case Code::DIRECTORY_ACCESS_DENIED:
            return make_info(code, "The directory could not be read.",
                             "Check the directory permissions.", context);
        case Code::PATH_INVALID:
            return make_info(code, "Invalid directory path.",
                             "Pass an existing folder.", context);
        case Code::CONFIG_INVALID:
            return make_info(code, "The configuration is invalid.",
                             "Review config.ini or remove it to restore the defaults.", context);
        case Code::CONFIG_MISSING:
            return make_info(code, "The configuration file is missing.",
                             "A default configuration will be created on the next save.", context);
        case Code::CONFIG_PARSE_ERROR:
            return make_info(code, "A configuration value could not be parsed.",
                             "Correct the value in config.ini.", context);
        case Code::CONFIG_SAVE_FAILED:
            return make_info(code, "The configuration could not be saved.",
                             "Check that the configuration directory is writable.", context);
        case Code::CONFIG_LOAD_FAILED:
            return make_info(code, "The configuration could not be loaded.",
                             "Check that config.ini is readable.", context);
        case Code::CONFIG_INVALID_VALUE:
            return make_info(code, "A configuration value is not supported.",
                             "Use one of the documented values.", context);
        case Code::VALIDATION_INVALID_INPUT:
            return make_info(code, "The input is invalid.",
                             "Check the command-line arguments.", context);
        case Code::VALIDATION_INVALID_FORMAT:
            return make_info(code, "The input has an invalid format.",
                             "Check the command-line arguments.", context);
        case Code::VALIDATION_EMPTY_FIELD:
            return make_info(code, "A required value is empty.",
                             "Provide a value and try again.", context);
        case Code::SYSTEM_INIT_FAILED:
            return make_info(code, "Initialization failed.",
                             "Restart the application.", context);
        case Code::SYSTEM_ENVIRONMENT_VARIABLE_NOT_SET:
            return make_info(code, "A required environment variable is not set.",
                             "Set HOME or VIDEO_LIST_RESOLVER_CONFIG_DIR.", context);
        case Code::UNKNOWN_ERROR:
        default:
            return make_info(Code::UNKNOWN_ERROR, "An unknown error occurred.", "", context);
    }
}

} // namespace ErrorCodes
