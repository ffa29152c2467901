#ifndef APPEXCEPTION_HPP
#define APPEXCEPTION_HPP

#include "ErrorCode.hpp"
#include <stdexcept>
#include <string>

namespace ErrorCodes {

// Exception thrown outside the pure naming transforms: config, manifest, plan I/O, collisions
class AppException : public std::runtime_error {
public:
    // Catalog message for the code; context names the offending file, key or candidate
    explicit AppException(Code code, const std::string& context = "")
        : std::runtime_error(ErrorCatalog::get_error_info(code, context).get_user_message()),
          error_code_(code),
          error_info_(ErrorCatalog::get_error_info(code, context)) {}

    // Custom message replaces the catalog text; the catalog resolution hint is kept
    AppException(Code code, const std::string& custom_message, const std::string& context)
        : std::runtime_error(custom_message),
          error_code_(code),
          error_info_(code, custom_message, ErrorCatalog::get_error_info(code).resolution, context) {}

    // Code the tool maps to its exit status
    Code get_error_code() const noexcept { return error_code_; }

    // Message, resolution and context as built from the catalog
    const ErrorInfo& get_error_info() const noexcept { return error_info_; }

    // Printed on stderr by ebook-renamer-plan
    std::string get_user_message() const { return error_info_.get_user_message(); }

    // "Error <code>: ..." with resolution and details, written to the log file
    std::string get_full_details() const { return error_info_.get_full_details(); }

    // Numeric code, e.g. 1500 for CONFIG_INVALID
    int get_error_code_int() const noexcept { return static_cast<int>(error_code_); }

private:
    Code error_code_;
    ErrorInfo error_info_;
};

} // namespace ErrorCodes

// Throw with the catalog message; context is the path, config key or name involved
#define THROW_APP_ERROR(code, context) \
    throw ErrorCodes::AppException(code, context)

// Throw with a message of the caller's own
#define THROW_APP_ERROR_MSG(code, message, context) \
    throw ErrorCodes::AppException(code, message, context)

#endif // APPEXCEPTION_HPP
