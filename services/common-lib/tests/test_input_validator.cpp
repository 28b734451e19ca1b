/**
 * @file test_input_validator.cpp
 * @brief Unit tests for input length validation and allow-list sanitization
 */

#include <gtest/gtest.h>
#include <tiptv/utils/string_utils.h>
#include <tiptv/validation/input_validator.h>

#include <string>
#include <utility>
#include <vector>

using namespace tiptv::validation;

namespace {

// Split well-formed UTF-8 into code points, skipping malformed bytes
std::vector<std::pair<char32_t, std::string>> codePoints(const std::string& s) {
    std::vector<std::pair<char32_t, std::string>> result;
    size_t pos = 0;
    while (pos < s.length()) {
        char32_t cp = 0;
        size_t len = tiptv::utils::decodeUtf8(s, pos, cp);
        if (len == 0) {
            ++pos;
            continue;
        }
        result.emplace_back(cp, s.substr(pos, len));
        pos += len;
    }
    return result;
}

} // anonymous namespace

class InputValidatorTest : public ::testing::Test {
protected:
    InputPolicy policy_;

    void SetUp() override {
        policy_.maxLength = 100;
    }

    // Mixed inputs used by the property checks below
    const std::vector<std::string> samples_ = {
        "Test User",
        "test-name_123",
        "Test<script>alert('xss')</script>User",
        "  padded  ",
        "a.b.c",
        "caf\xC3\xA9 au lait",
        "line\nbreak\ttab",
        "semi;colon|pipe&amp",
        "../../etc/passwd",
        "Jos\xC3\xA9 M\xC3\xBCller",
        "\xE5\xBC\xA0\xE4\xBC\x9F",
        "\xD0\x98\xD0\xB2\xD0\xB0\xD0\xBD <admin>",
        "price \xE2\x82\xAC" "5",
        "bad\xFF\xC0" "byte",
    };
};

// ============================================================================
// validateStringLength
// ============================================================================

TEST_F(InputValidatorTest, Length_UnderLimit) {
    EXPECT_TRUE(validateStringLength("short", 10).valid);
}

TEST_F(InputValidatorTest, Length_ExactlyAtLimit) {
    auto result = validateStringLength("exactly10!", 10);
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.error, InputError::NONE);
}

TEST_F(InputValidatorTest, Length_OverLimit) {
    auto result = validateStringLength("too long string", 5);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, InputError::LENGTH_EXCEEDED);
    EXPECT_EQ(result.message, "Input exceeds maximum length of 5 characters");
}

TEST_F(InputValidatorTest, Length_FieldNameInMessage) {
    auto result = validateStringLength("abcdef", 3, "Name");
    EXPECT_EQ(result.message, "Name exceeds maximum length of 3 characters");
}

TEST_F(InputValidatorTest, Length_CountsCharactersNotBytes) {
    // 100 x "é" is 200 bytes but 100 characters
    std::string accented;
    for (int i = 0; i < 100; ++i) {
        accented += "\xC3\xA9";
    }
    EXPECT_TRUE(validateStringLength(accented, 100).valid);
    EXPECT_FALSE(validateStringLength(accented + "\xC3\xA9", 100).valid);
}

TEST_F(InputValidatorTest, Length_EmptyAlwaysFits) {
    EXPECT_TRUE(validateStringLength("", 0).valid);
}

// ============================================================================
// sanitizeString
// ============================================================================

TEST_F(InputValidatorTest, Sanitize_NormalText) {
    EXPECT_EQ(sanitizeString("normal text"), "normal text");
}

TEST_F(InputValidatorTest, Sanitize_AllowedPunctuation) {
    EXPECT_EQ(sanitizeString("test-name_123"), "test-name_123");
    EXPECT_EQ(sanitizeString("v1.2.3"), "v1.2.3");
}

TEST_F(InputValidatorTest, Sanitize_Brackets) {
    EXPECT_EQ(sanitizeString("test<>{}[]"), "test");
}

TEST_F(InputValidatorTest, Sanitize_Symbols) {
    EXPECT_EQ(sanitizeString("test@#$%"), "test");
}

TEST_F(InputValidatorTest, Sanitize_ScriptInjection) {
    EXPECT_EQ(sanitizeString("Test<script>alert('xss')</script>User"),
              "TestscriptalertxssscriptUser");
}

TEST_F(InputValidatorTest, Sanitize_Empty) {
    EXPECT_EQ(sanitizeString(""), "");
}

TEST_F(InputValidatorTest, Sanitize_WhitespaceKept) {
    EXPECT_EQ(sanitizeString("a\tb\nc d"), "a\tb\nc d");
}

TEST_F(InputValidatorTest, Sanitize_AccentedLettersKept) {
    EXPECT_EQ(sanitizeString("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(sanitizeString("Jos\xC3\xA9 M\xC3\xBCller"), "Jos\xC3\xA9 M\xC3\xBCller");
}

TEST_F(InputValidatorTest, Sanitize_NonLatinScriptsKept) {
    // "张伟" and "Иван"
    EXPECT_EQ(sanitizeString("\xE5\xBC\xA0\xE4\xBC\x9F"), "\xE5\xBC\xA0\xE4\xBC\x9F");
    EXPECT_EQ(sanitizeString("\xD0\x98\xD0\xB2\xD0\xB0\xD0\xBD"), "\xD0\x98\xD0\xB2\xD0\xB0\xD0\xBD");
}

TEST_F(InputValidatorTest, Sanitize_NonAsciiDigitsKept) {
    // Arabic-Indic three, superscript two
    EXPECT_EQ(sanitizeString("\xD9\xA3\xC2\xB2"), "\xD9\xA3\xC2\xB2");
}

TEST_F(InputValidatorTest, Sanitize_NonAsciiSymbolsDropped) {
    // Euro sign, emoji, left guillemet
    EXPECT_EQ(sanitizeString("a\xE2\x82\xAC" "b\xF0\x9F\x98\x80" "c\xC2\xAB"), "abc");
}

TEST_F(InputValidatorTest, Sanitize_UnicodeWhitespaceKept) {
    // No-break space and ideographic space
    EXPECT_EQ(sanitizeString("a\xC2\xA0" "b\xE3\x80\x80" "c"), "a\xC2\xA0" "b\xE3\x80\x80" "c");
}

TEST_F(InputValidatorTest, Sanitize_MalformedBytesDropped) {
    EXPECT_EQ(sanitizeString("ab\xFF\x80" "cd\xE2\x82"), "abcd");
}

TEST_F(InputValidatorTest, Sanitize_ControlCharactersDropped) {
    EXPECT_EQ(sanitizeString(std::string("a\0b\x1B[31mc", 9)), "ab31mc");
}

TEST_F(InputValidatorTest, Sanitize_StrippedTokensReassemble) {
    // Dropping, not rejecting: fragments join up
    EXPECT_EQ(sanitizeString("al<>ert"), "alert");
}

TEST_F(InputValidatorTest, Sanitize_Idempotent) {
    for (const auto& s : samples_) {
        std::string once = sanitizeString(s);
        EXPECT_EQ(sanitizeString(once), once) << "input: " << s;
    }
}

TEST_F(InputValidatorTest, Sanitize_OutputOnlyAllowedCharacters) {
    for (const auto& s : samples_) {
        std::string sanitized = sanitizeString(s);
        EXPECT_TRUE(tiptv::utils::isValidUtf8(sanitized)) << "input: " << s;
        for (const auto& cp : codePoints(sanitized)) {
            EXPECT_TRUE(isAllowedCodePoint(cp.first)) << "input: " << s;
        }
    }
}

TEST_F(InputValidatorTest, Sanitize_PreservesOrderAndCount) {
    for (const auto& s : samples_) {
        std::string expected;
        for (const auto& cp : codePoints(s)) {
            if (isAllowedCodePoint(cp.first)) {
                expected += cp.second;
            }
        }
        EXPECT_EQ(sanitizeString(s), expected) << "input: " << s;
    }
}

// ============================================================================
// validateAndSanitize
// ============================================================================

TEST_F(InputValidatorTest, Flow_ValidInput) {
    auto result = validateAndSanitize("Test User", policy_);
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.value, "Test User");
}

TEST_F(InputValidatorTest, Flow_EmptyInput) {
    auto result = validateAndSanitize("", policy_);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, InputError::EMPTY_AFTER_SANITIZATION);
    EXPECT_NE(result.message.find("empty"), std::string::npos);
}

TEST_F(InputValidatorTest, Flow_WhitespaceOnly) {
    auto result = validateAndSanitize("   \t ", policy_);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, InputError::EMPTY_AFTER_SANITIZATION);
}

TEST_F(InputValidatorTest, Flow_OnlyDisallowedCharacters) {
    for (const std::string s : {"<>{}[]", "@#$%^&*", "'\"();", "\xE2\x82\xAC\xE2\x82\xAC"}) {
        auto result = validateAndSanitize(s, policy_);
        EXPECT_FALSE(result.valid) << "input: " << s;
        EXPECT_EQ(result.error, InputError::EMPTY_AFTER_SANITIZATION) << "input: " << s;
    }
}

TEST_F(InputValidatorTest, Flow_UnicodeWhitespaceOnly) {
    auto result = validateAndSanitize("\xC2\xA0\xE3\x80\x80 ", policy_);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, InputError::EMPTY_AFTER_SANITIZATION);
}

TEST_F(InputValidatorTest, Flow_InternationalNames) {
    policy_.fieldName = "Name";
    policy_.messageTemplate = "Hello, {}! Welcome to TIPTV.";

    auto accented = validateAndSanitize("Jos\xC3\xA9 M\xC3\xBCller", policy_);
    ASSERT_TRUE(accented.valid);
    EXPECT_EQ(accented.value, "Hello, Jos\xC3\xA9 M\xC3\xBCller! Welcome to TIPTV.");

    auto chinese = validateAndSanitize("\xE5\xBC\xA0\xE4\xBC\x9F", policy_);
    ASSERT_TRUE(chinese.valid) << chinese.message;
    EXPECT_EQ(chinese.value, "Hello, \xE5\xBC\xA0\xE4\xBC\x9F! Welcome to TIPTV.");

    auto cyrillic = validateAndSanitize("\xD0\x98\xD0\xB2\xD0\xB0\xD0\xBD", policy_);
    ASSERT_TRUE(cyrillic.valid) << cyrillic.message;
    EXPECT_EQ(cyrillic.value, "Hello, \xD0\x98\xD0\xB2\xD0\xB0\xD0\xBD! Welcome to TIPTV.");
}

TEST_F(InputValidatorTest, Flow_TooLong) {
    auto result = validateAndSanitize(std::string(101, 'a'), policy_);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, InputError::LENGTH_EXCEEDED);
    EXPECT_NE(result.message.find("maximum length"), std::string::npos);
}

TEST_F(InputValidatorTest, Flow_LengthCheckedBeforeSanitizing) {
    // 101 characters that would shrink to 1 after filtering still fail
    std::string input = "a" + std::string(100, '<');
    auto result = validateAndSanitize(input, policy_);
    EXPECT_EQ(result.error, InputError::LENGTH_EXCEEDED);
}

TEST_F(InputValidatorTest, Flow_TooLongRegardlessOfContent) {
    for (char c : {'a', '<', ' ', '.'}) {
        auto result = validateAndSanitize(std::string(150, c), policy_);
        EXPECT_EQ(result.error, InputError::LENGTH_EXCEEDED) << "char: " << c;
    }
}

TEST_F(InputValidatorTest, Flow_AtMaxLength) {
    auto result = validateAndSanitize(std::string(100, 'a'), policy_);
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.value, std::string(100, 'a'));
}

TEST_F(InputValidatorTest, Flow_ScriptInjection) {
    auto result = validateAndSanitize("Test<script>alert('xss')</script>User", policy_);
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.value, "TestscriptalertxssscriptUser");
}

TEST_F(InputValidatorTest, Flow_ResultNotTrimmed) {
    auto result = validateAndSanitize("  Ann  ", policy_);
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.value, "  Ann  ");
}

TEST_F(InputValidatorTest, Flow_TemplateApplied) {
    policy_.messageTemplate = "Hello, {}! Welcome to TIPTV.";
    auto result = validateAndSanitize("Test User", policy_);
    EXPECT_EQ(result.value, "Hello, Test User! Welcome to TIPTV.");
}

TEST_F(InputValidatorTest, Flow_FieldNameInEmptyMessage) {
    policy_.fieldName = "Name";
    auto result = validateAndSanitize("<>", policy_);
    EXPECT_EQ(result.message, "Name cannot be empty");
}

TEST_F(InputValidatorTest, Flow_SuccessOutputUsesAllowList) {
    for (const auto& s : samples_) {
        auto result = validateAndSanitize(s, policy_);
        ASSERT_TRUE(result.valid) << "input: " << s;
        for (const auto& cp : codePoints(result.value)) {
            EXPECT_TRUE(isAllowedCodePoint(cp.first)) << "input: " << s;
        }
    }
}

TEST_F(InputValidatorTest, InputErrorToString) {
    EXPECT_EQ(inputErrorToString(InputError::LENGTH_EXCEEDED), "LENGTH_EXCEEDED");
    EXPECT_EQ(inputErrorToString(InputError::EMPTY_AFTER_SANITIZATION), "EMPTY_AFTER_SANITIZATION");
}
