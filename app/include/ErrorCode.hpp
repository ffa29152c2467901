#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>

namespace ErrorCodes {

enum class Code {
    SUCCESS = 0,
    UNKNOWN_ERROR = 1,

    // File system (1200-1299)
    FILE_NOT_FOUND = 1200,
    FILE_WRITE_FAILED = 1202,
    DIRECTORY_SCAN_FAILED = 1203,

    // Configuration (1500-1599)
    CONFIG_INVALID = 1500,
    CONFIG_SAVE_FAILED = 1501,
    LOGGER_INIT_FAILED = 1502,

    // Manifest and plan documents (1600-1699)
    MANIFEST_INVALID = 1600,

    // Naming (1700-1799)
    NAME_COLLISION_EXHAUSTED = 1700
};

struct ErrorInfo {
    Code code;
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "");

    // Message followed by the resolution hint
    std::string get_user_message() const;

    // "Error <code>: ..." with resolution and technical context
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
