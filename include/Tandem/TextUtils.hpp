// =================================================================
// include/Tandem/TextUtils.hpp
// =================================================================
// UTF-8 aware clipping and cleanup for text that ends up in prompts.

#pragma once

#include <string>

namespace Tandem {

/**
 * @brief Helpers for prompt-bound text
 *
 * Prompts are sent as JSON, which must be valid UTF-8. File contents and
 * command output are arbitrary bytes, and byte-based truncation can split
 * a multi-byte character, so every clip goes through these helpers.
 */
class TextUtils {
public:
    /**
     * @brief Longest prefix of at most max_bytes that ends on a character boundary
     */
    static std::string truncateUtf8(const std::string& text, size_t max_bytes);

    /**
     * @brief Longest suffix of at most max_bytes that starts on a character boundary
     */
    static std::string tailUtf8(const std::string& text, size_t max_bytes);

    /**
     * @brief Replace every invalid UTF-8 sequence with U+FFFD
     *
     * Valid input is returned unchanged.
     */
    static std::string sanitizeUtf8(const std::string& text);

    static bool isValidUtf8(const std::string& text);

    /**
     * @brief ASCII-only case mapping; bytes >= 0x80 are left alone
     */
    static std::string toLower(std::string text);
    static std::string toUpper(std::string text);

private:
    /**
     * @brief Length of the valid sequence starting at pos, 0 if invalid
     */
    static size_t sequenceLength(const std::string& text, size_t pos);
};

} // namespace Tandem
