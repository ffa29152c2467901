#include "ErrorCode.hpp"

#include <sstream>
#include <utility>

namespace ErrorCodes {

ErrorInfo::ErrorInfo(Code code, std::string message, std::string resolution, std::string context)
    : code(code),
      message(std::move(message)),
      resolution(std::move(resolution)),
      context(std::move(context))
{
}


std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + "\n" + resolution;
}


std::string ErrorInfo::get_full_details() const
{
    std::ostringstream oss;
    oss << "Error " << static_cast<int>(code) << ": " << message;
    if (!resolution.empty()) {
        oss << "\nResolution: " << resolution;
    }
    if (!context.empty()) {
        oss << "\nDetails: " << context;
    }
    return oss.str();
}


ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    switch (code) {
        case Code::SUCCESS:
            return ErrorInfo(code, "Operation completed successfully.", "", context);
        case Code::FILE_NOT_FOUND:
            return ErrorInfo(code, "The requested file could not be found.",
                             "Check that the path exists and is spelled correctly.", context);
        case Code::FILE_WRITE_FAILED:
            return ErrorInfo(code, "The file could not be written.",
                             "Check that the destination folder exists and is writable.", context);
        case Code::DIRECTORY_SCAN_FAILED:
            return ErrorInfo(code, "The destination directory could not be scanned.",
                             "Check the directory permissions and try again.", context);
        case Code::CONFIG_INVALID:
            return ErrorInfo(code, "The configuration file contains an invalid value.",
                             "Fix or remove the offending entry in config.ini.", context);
        case Code::CONFIG_SAVE_FAILED:
            return ErrorInfo(code, "The configuration could not be saved.",
                             "Check that the configuration directory is writable.", context);
        case Code::LOGGER_INIT_FAILED:
            return ErrorInfo(code, "Logging could not be initialized.",
                             "Check that the log directory is writable.", context);
        case Code::MANIFEST_INVALID:
            return ErrorInfo(code, "The metadata manifest is not valid.",
                             "The manifest must be a JSON object with an \"items\" array; every item needs a \"file\".",
                             context);
        case Code::NAME_COLLISION_EXHAUSTED:
            return ErrorInfo(code, "No free filename could be found for an item.",
                             "The existence check reports every candidate as taken; verify the destination probe.",
                             context);
        case Code::UNKNOWN_ERROR:
        default:
            return ErrorInfo(Code::UNKNOWN_ERROR, "An unexpected error occurred.", "", context);
    }
}

} // namespace ErrorCodes
