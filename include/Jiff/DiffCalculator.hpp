// =================================================================
// include/Jiff/DiffCalculator.hpp
// =================================================================
// Line-level and character-level diffs expressed as a list of changes
// ready for rendering.

#pragma once

#include <string>
#include <vector>

namespace Jiff {

enum class DiffType {
    SAME,
    ADD,
    REMOVE,
    REPLACE
};

/**
 * @brief A contiguous change between the two inputs.
 *
 * `left` holds the text of SAME, ADD and REMOVE changes. For REPLACE it
 * holds the "before" text and `right` the "after" text. Tokens are joined
 * with the separator they were split on, so a line diff change contains
 * newline-separated lines.
 */
struct Diff {
    DiffType type;
    std::string left;
    std::string right;
};

/**
 * @brief Diffs two texts token by token.
 * @param left The "before" text.
 * @param right The "after" text.
 * @param separator Token separator; empty means one token per character.
 */
std::vector<Diff> calculateDiff(const std::string& left, const std::string& right,
                                const std::string& separator);

/**
 * @brief Diffs two texts line by line.
 */
std::vector<Diff> calculateLineDiff(const std::string& left, const std::string& right);

/**
 * @brief Diffs two strings character by character.
 */
std::vector<Diff> calculateCharDiff(const std::string& left, const std::string& right);

std::string getDiffTypeName(DiffType type);

/**
 * @brief One-line description of a change for debug logging
 */
std::string describeDiff(const Diff& diff);

} // namespace Jiff
