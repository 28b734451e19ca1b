/**
 * @file input_validator.h
 * @brief Input length validation and allow-list sanitization
 *
 * Pure functions, no I/O. Safe to call concurrently.
 *
 * Allow-list: Unicode letters and numbers (Alphabetic or Numeric), Unicode
 * White_Space, '-', '_', '.'. Every other code point is dropped, and so is
 * every byte that is not part of a well-formed UTF-8 sequence.
 */

#pragma once

#include <cstddef>
#include <string>

namespace tiptv::validation {

/// @brief Validation failure kind
enum class InputError {
    NONE,                       ///< Validation succeeded
    LENGTH_EXCEEDED,            ///< Character count > maximum
    EMPTY_AFTER_SANITIZATION    ///< Nothing but whitespace left after filtering
};

/// @brief Outcome of a validation call
struct ValidationResult {
    bool valid = true;
    InputError error = InputError::NONE;
    std::string message;        ///< Human-readable reason on failure
    std::string value;          ///< Output of the composed flow on success
};

/// @brief Caller policy for the composed validate-and-sanitize flow
struct InputPolicy {
    size_t maxLength = 100;
    std::string fieldName = "Input";       ///< Used in error messages
    std::string messageTemplate = "{}";    ///< "{}" is replaced by the sanitized value
};

/**
 * @brief Fail if input has more than maxLength characters
 *
 * Characters are Unicode code points of the UTF-8 input.
 *
 * @param input Raw input
 * @param maxLength Maximum character count (inclusive)
 * @param fieldName Name used in the error message
 * @return ValidationResult, message "<field> exceeds maximum length of N characters" on failure
 */
ValidationResult validateStringLength(
    const std::string& input,
    size_t maxLength,
    const std::string& fieldName = "Input");

/**
 * @brief Keep only allow-listed characters, in original order
 *
 * Works on whole code points, so the output is always valid UTF-8.
 * Total: never fails, "" maps to "". Idempotent.
 */
std::string sanitizeString(const std::string& input);

/**
 * @brief Check one code point against the allow-list
 */
bool isAllowedCodePoint(char32_t codePoint);

/**
 * @brief Length check on raw input, then sanitize, then reject empty result
 *
 * The returned value is the sanitized (untrimmed) string substituted into
 * policy.messageTemplate.
 *
 * @param input Raw input
 * @param policy Length limit, field name and output template
 * @return ValidationResult with value set on success
 */
ValidationResult validateAndSanitize(const std::string& input, const InputPolicy& policy);

/// @brief Convert InputError to string
inline std::string inputErrorToString(InputError e) {
    switch (e) {
        case InputError::NONE: return "NONE";
        case InputError::LENGTH_EXCEEDED: return "LENGTH_EXCEEDED";
        case InputError::EMPTY_AFTER_SANITIZATION: return "EMPTY_AFTER_SANITIZATION";
    }
    return "UNKNOWN";
}

} // namespace tiptv::validation
