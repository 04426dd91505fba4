#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

enum class Code {
    UNKNOWN_ERROR = 0,

    // File system (1200-1299)
    FILE_NOT_FOUND = 1200,
    FILE_ACCESS_DENIED = 1201,
    DIRECTORY_NOT_FOUND = 1210,
    DIRECTORY_INVALID = 1211,
    DIRECTORY_ACCESS_DENIED = 1212,
    PATH_INVALID = 1220,

    // Configuration (1500-1599)
    CONFIG_INVALID = 1500,
    CONFIG_MISSING = 1501,
    CONFIG_PARSE_ERROR = 1502,
    CONFIG_SAVE_FAILED = 1503,
    CONFIG_LOAD_FAILED = 1504,
    CONFIG_INVALID_VALUE = 1505,

    // Validation (1600-1699)
    VALIDATION_INVALID_INPUT = 1600,
    VALIDATION_INVALID_FORMAT = 1601,
    VALIDATION_EMPTY_FIELD = 1602,

    // System (1700-1799)
    SYSTEM_INIT_FAILED = 1700,
    SYSTEM_ENVIRONMENT_VARIABLE_NOT_SET = 1701
};

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message followed by the resolution hint
    std::string get_user_message() const;

    // Everything including the numeric code and technical context
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
