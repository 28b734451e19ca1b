/**
 * @file error_codes.h
 * @brief Standardized error codes for the shell backend
 *
 * Format: COMPONENT_ERROR_TYPE_DETAIL
 *
 * @date 2026-10-17
 */

#pragma once

#include <string>
#include <json/json.h>

namespace common {

/**
 * @brief Error code enumeration
 */
enum class ErrorCode {
    // Success
    SUCCESS = 0,

    // Command Errors (4000-4999)
    COMMAND_INVALID_ARGUMENTS = 4001,
    COMMAND_NOT_FOUND = 4004,

    // Validation Errors (5000-5999)
    VALIDATION_LENGTH_EXCEEDED = 5001,
    VALIDATION_EMPTY_AFTER_SANITIZATION = 5002,

    // System Errors (9000-9999)
    SYSTEM_INTERNAL_ERROR = 9001,
};

/**
 * @brief Convert error code to string
 */
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";

        // Command
        case ErrorCode::COMMAND_INVALID_ARGUMENTS: return "COMMAND_INVALID_ARGUMENTS";
        case ErrorCode::COMMAND_NOT_FOUND: return "COMMAND_NOT_FOUND";

        // Validation
        case ErrorCode::VALIDATION_LENGTH_EXCEEDED: return "VALIDATION_LENGTH_EXCEEDED";
        case ErrorCode::VALIDATION_EMPTY_AFTER_SANITIZATION: return "VALIDATION_EMPTY_AFTER_SANITIZATION";

        // System
        case ErrorCode::SYSTEM_INTERNAL_ERROR: return "SYSTEM_INTERNAL_ERROR";

        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Convert error code to HTTP status code
 */
inline int errorCodeToHttpStatus(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:
            return 200;
        case ErrorCode::COMMAND_NOT_FOUND:
            return 404;
        case ErrorCode::COMMAND_INVALID_ARGUMENTS:
        case ErrorCode::VALIDATION_LENGTH_EXCEEDED:
        case ErrorCode::VALIDATION_EMPTY_AFTER_SANITIZATION:
            return 400;  // Caller input -> Bad Request
        default:
            return 500;
    }
}

/**
 * @brief Error response builder
 */
class ErrorResponse {
private:
    ErrorCode code_;
    std::string message_;

public:
    ErrorResponse(ErrorCode code, const std::string& message)
        : code_(code), message_(message) {}

    /**
     * @brief Convert to JSON response body
     */
    Json::Value toJson() const {
        Json::Value json;
        json["success"] = false;
        json["error"]["code"] = errorCodeToString(code_);
        json["error"]["numericCode"] = static_cast<int>(code_);
        json["error"]["message"] = message_;
        return json;
    }

    int getHttpStatus() const {
        return errorCodeToHttpStatus(code_);
    }

    ErrorCode getCode() const {
        return code_;
    }

    const std::string& getMessage() const {
        return message_;
    }
};

} // namespace common
