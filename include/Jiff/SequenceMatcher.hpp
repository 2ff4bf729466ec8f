// =================================================================
// include/Jiff/SequenceMatcher.hpp
// =================================================================
// Opcode-level sequence matching on top of the dtl library. This is the
// diff primitive shared by the line diff, the character diff and the
// line cost model.

#pragma once

#include <string>
#include <vector>

namespace Jiff {

/**
 * @brief Kind of change an opcode describes
 */
enum class OpcodeTag {
    EQUAL,      ///< a[a_begin, a_end) == b[b_begin, b_end)
    INSERT,     ///< b[b_begin, b_end) added, a range is empty
    DELETE,     ///< a[a_begin, a_end) removed, b range is empty
    REPLACE     ///< a range replaced by b range, both non-empty
};

/**
 * @brief One contiguous step of the edit script.
 *
 * Consecutive opcodes partition both inputs: each a_begin equals the
 * previous a_end (likewise for b), starting at 0 and ending at the
 * sequence sizes.
 */
struct Opcode {
    OpcodeTag tag;
    size_t a_begin;
    size_t a_end;
    size_t b_begin;
    size_t b_end;
};

/**
 * @brief Computes the opcodes turning sequence a into sequence b.
 * @param a The "before" tokens.
 * @param b The "after" tokens.
 * @return Opcodes in increasing order. Empty if both inputs are empty.
 */
std::vector<Opcode> matchSequences(const std::vector<std::string>& a,
                                   const std::vector<std::string>& b);

/**
 * @brief Get a short name for an opcode tag ("equal", "insert", ...)
 */
std::string getOpcodeTagName(OpcodeTag tag);

} // namespace Jiff
