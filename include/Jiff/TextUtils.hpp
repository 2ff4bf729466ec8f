// =================================================================
// include/Jiff/TextUtils.hpp
// =================================================================
// Helpers for cutting text into the token sequences the diff engine
// works on: lines and UTF-8 characters.

#pragma once

#include <string>
#include <vector>

namespace Jiff {

/**
 * @brief Splits text on every newline character.
 *
 * A trailing newline produces a trailing empty line and empty text
 * produces a single empty line, so joining the result with "\n" gives
 * back the original text.
 */
std::vector<std::string> splitLines(const std::string& text);

/**
 * @brief Splits UTF-8 text into one token per code point.
 * @param text The text to split.
 * @return Code points as strings. Malformed bytes become single-byte tokens.
 */
std::vector<std::string> splitCharacters(const std::string& text);

/**
 * @brief Counts the code points of a UTF-8 string.
 */
size_t characterLength(const std::string& text);

/**
 * @brief Joins tokens[begin, end) with a separator.
 */
std::string joinTokens(const std::vector<std::string>& tokens, size_t begin, size_t end,
                       const std::string& separator);

} // namespace Jiff
