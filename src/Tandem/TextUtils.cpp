// =================================================================
// src/Tandem/TextUtils.cpp
// =================================================================
// Implementation of the UTF-8 text helpers.

#include "Tandem/TextUtils.hpp"
#include <algorithm>
#include <cctype>

namespace Tandem {

namespace {

const char* const REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

bool isContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

} // anonymous namespace

size_t TextUtils::sequenceLength(const std::string& text, size_t pos) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t length = 0;
    unsigned int code_point = 0;

    if (lead < 0x80) {
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        code_point = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + length > text.size()) {
        return 0;
    }
    for (size_t i = 1; i < length; ++i) {
        unsigned char byte = static_cast<unsigned char>(text[pos + i]);
        if (!isContinuation(byte)) {
            return 0;
        }
        code_point = (code_point << 6) | (byte & 0x3F);
    }

    // Overlong forms, surrogates and values past U+10FFFF
    if ((length == 2 && code_point < 0x80) ||
        (length == 3 && code_point < 0x800) ||
        (length == 4 && code_point < 0x10000) ||
        (code_point >= 0xD800 && code_point <= 0xDFFF) ||
        code_point > 0x10FFFF) {
        return 0;
    }
    return length;
}

std::string TextUtils::truncateUtf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    size_t end = max_bytes;
    while (end > 0 && isContinuation(static_cast<unsigned char>(text[end]))) {
        end--;
    }
    return text.substr(0, end);
}

std::string TextUtils::tailUtf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    size_t start = text.size() - max_bytes;
    while (start < text.size() && isContinuation(static_cast<unsigned char>(text[start]))) {
        start++;
    }
    return text.substr(start);
}

bool TextUtils::isValidUtf8(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t length = sequenceLength(text, pos);
        if (length == 0) {
            return false;
        }
        pos += length;
    }
    return true;
}

std::string TextUtils::sanitizeUtf8(const std::string& text) {
    if (isValidUtf8(text)) {
        return text;
    }

    std::string clean;
    clean.reserve(text.size() + 16);
    size_t pos = 0;
    while (pos < text.size()) {
        size_t length = sequenceLength(text, pos);
        if (length == 0) {
            clean += REPLACEMENT_CHARACTER;
            pos++;
            // One replacement per broken sequence
            while (pos < text.size() && isContinuation(static_cast<unsigned char>(text[pos]))) {
                pos++;
            }
            continue;
        }
        clean.append(text, pos, length);
        pos += length;
    }
    return clean;
}

std::string TextUtils::toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string TextUtils::toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace Tandem
