// =================================================================
// src/Jiff/LineCost.cpp
// =================================================================
// Implementation for the gap and substitution costs.

#include "Jiff/LineCost.hpp"
#include "Jiff/SequenceMatcher.hpp"
#include "Jiff/TextUtils.hpp"

namespace Jiff {

size_t gapCost(const std::string& line) {
    return characterLength(line);
}

EditProfile characterEditProfile(const std::string& before, const std::string& after) {
    EditProfile profile;
    if (before == after) {
        return profile;
    }

    auto opcodes = matchSequences(splitCharacters(before), splitCharacters(after));
    for (const auto& op : opcodes) {
        if (op.tag == OpcodeTag::EQUAL) {
            continue;
        }
        size_t changed = (op.a_end - op.a_begin) + (op.b_end - op.b_begin);
        profile.disruption += changed;
        profile.operations += changed;
    }

    return profile;
}

size_t substitutionCost(const std::string& before, const std::string& after) {
    EditProfile profile = characterEditProfile(before, after);
    return profile.disruption * ((profile.operations + 1) / 2);
}

} // namespace Jiff
