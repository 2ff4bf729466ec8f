// =================================================================
// include/Jiff/LineCost.hpp
// =================================================================
// Cost model used by the line aligner: what it costs to show a line on
// its own, and what it costs to pair two lines for character-level
// highlighting.

#pragma once

#include <string>

namespace Jiff {

/**
 * @brief Character-level edit profile of a pair of lines
 */
struct EditProfile {
    size_t disruption = 0;   ///< Non-equal tokens emitted by the character diff (D)
    size_t operations = 0;   ///< Tokens that are strictly insertions or deletions (K)
};

/**
 * @brief Cost of leaving a line unpaired: its length in characters.
 */
size_t gapCost(const std::string& line);

/**
 * @brief Runs the character diff between two lines and tallies its tokens.
 *
 * Every deleted and every inserted character counts as one token. The
 * dtl-based matcher never emits hint markers, so both counters are equal.
 */
EditProfile characterEditProfile(const std::string& before, const std::string& after);

/**
 * @brief Cost of pairing `before` with `after`: D * ceil(K / 2).
 *
 * Zero only for identical lines. Symmetric in its arguments.
 */
size_t substitutionCost(const std::string& before, const std::string& after);

} // namespace Jiff
