// =================================================================
// src/Jiff/TextUtils.cpp
// =================================================================
// Implementation for line and character tokenization.

#include "Jiff/TextUtils.hpp"

namespace Jiff {

// Length of the UTF-8 sequence introduced by a lead byte, or 0 if the
// byte cannot start a sequence.
static size_t sequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

static bool isContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// Number of bytes making up the code point at `pos`. Malformed input
// always advances by a single byte.
static size_t codePointSize(const std::string& text, size_t pos) {
    size_t length = sequenceLength(static_cast<unsigned char>(text[pos]));
    if (length == 0 || pos + length > text.size()) {
        return 1;
    }
    for (size_t k = 1; k < length; k++) {
        if (!isContinuation(static_cast<unsigned char>(text[pos + k]))) {
            return 1;
        }
    }
    return length;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;

    while (true) {
        size_t newline = text.find('\n', start);
        if (newline == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, newline - start));
        start = newline + 1;
    }

    return lines;
}

std::vector<std::string> splitCharacters(const std::string& text) {
    std::vector<std::string> characters;
    characters.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t size = codePointSize(text, pos);
        characters.push_back(text.substr(pos, size));
        pos += size;
    }

    return characters;
}

size_t characterLength(const std::string& text) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        pos += codePointSize(text, pos);
        count++;
    }
    return count;
}

std::string joinTokens(const std::vector<std::string>& tokens, size_t begin, size_t end,
                       const std::string& separator) {
    std::string joined;
    for (size_t i = begin; i < end && i < tokens.size(); i++) {
        if (i > begin) {
            joined += separator;
        }
        joined += tokens[i];
    }
    return joined;
}

} // namespace Jiff
