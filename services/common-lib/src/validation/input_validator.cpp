/**
 * @file input_validator.cpp
 * @brief Input validation and sanitization implementation
 */

#include "tiptv/validation/input_validator.h"
#include "tiptv/utils/string_utils.h"

#include <unicode/uchar.h>

namespace tiptv::validation {

ValidationResult validateStringLength(
    const std::string& input,
    size_t maxLength,
    const std::string& fieldName) {

    ValidationResult result;

    if (utils::utf8Length(input) > maxLength) {
        result.valid = false;
        result.error = InputError::LENGTH_EXCEEDED;
        result.message = fieldName + " exceeds maximum length of " +
                         std::to_string(maxLength) + " characters";
    }

    return result;
}

bool isAllowedCodePoint(char32_t codePoint) {
    if (codePoint == U'-' || codePoint == U'_' || codePoint == U'.') {
        return true;
    }

    auto c = static_cast<UChar32>(codePoint);

    // Alphabetic or Numeric (Nd, Nl, No), plus White_Space
    return u_hasBinaryProperty(c, UCHAR_ALPHABETIC) ||
           (U_GET_GC_MASK(c) & (U_GC_ND_MASK | U_GC_NL_MASK | U_GC_NO_MASK)) != 0 ||
           utils::isWhitespace(codePoint);
}

std::string sanitizeString(const std::string& input) {
    std::string sanitized;
    sanitized.reserve(input.length());

    size_t pos = 0;
    while (pos < input.length()) {
        char32_t codePoint = 0;
        size_t len = utils::decodeUtf8(input, pos, codePoint);

        // Malformed bytes are dropped one at a time
        if (len == 0) {
            ++pos;
            continue;
        }

        if (isAllowedCodePoint(codePoint)) {
            sanitized.append(input, pos, len);
        }
        pos += len;
    }

    return sanitized;
}

ValidationResult validateAndSanitize(const std::string& input, const InputPolicy& policy) {
    // Length is checked against the raw input, before any filtering
    ValidationResult result = validateStringLength(input, policy.maxLength, policy.fieldName);
    if (!result.valid) {
        return result;
    }

    std::string sanitized = sanitizeString(input);

    if (utils::trim(sanitized).empty()) {
        result.valid = false;
        result.error = InputError::EMPTY_AFTER_SANITIZATION;
        result.message = policy.fieldName + " cannot be empty";
        return result;
    }

    result.value = utils::replaceAll(policy.messageTemplate, "{}", sanitized);
    return result;
}

} // namespace tiptv::validation
