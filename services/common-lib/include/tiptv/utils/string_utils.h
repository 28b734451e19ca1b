/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used by the TIPTV shell backend.
 *
 * @version 1.0.0
 * @date 2026-10-17
 */

#pragma once

#include <string>
#include <cstddef>

namespace tiptv {
namespace utils {

/**
 * @brief Trim whitespace from both ends
 *
 * Whitespace is the Unicode White_Space set (see isWhitespace()), so
 * U+00A0 and U+3000 are trimmed as well as ASCII space, \\t and \\n.
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Replace all occurrences of substring
 *
 * @param str Input string
 * @param from Substring to replace (empty = no replacement)
 * @param to Replacement string
 * @return String with replacements
 */
std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);

/**
 * @brief Decode the UTF-8 sequence starting at pos
 *
 * Overlong encodings, surrogates and values past U+10FFFF are malformed.
 *
 * @param str UTF-8 encoded input
 * @param pos Byte offset, must be < str.length()
 * @param codePoint Set to the decoded code point on success
 * @return Sequence length in bytes (1-4), or 0 if malformed
 */
size_t decodeUtf8(const std::string& str, size_t pos, char32_t& codePoint);

/**
 * @brief Check a code point against the Unicode White_Space property
 */
bool isWhitespace(char32_t codePoint);

/**
 * @brief Count characters (Unicode code points) in a UTF-8 string
 *
 * Each well-formed UTF-8 sequence counts as one character. A byte that does
 * not start a well-formed sequence counts as one character on its own.
 *
 * @param str UTF-8 encoded input
 * @return Number of characters
 */
size_t utf8Length(const std::string& str);

/**
 * @brief Check if string is valid UTF-8
 *
 * @param str Input string
 * @return true if every byte belongs to a well-formed sequence
 */
bool isValidUtf8(const std::string& str);

} // namespace utils
} // namespace tiptv
