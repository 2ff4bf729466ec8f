// =================================================================
// src/Jiff/SequenceMatcher.cpp
// =================================================================
// Groups dtl's shortest edit script into equal/insert/delete/replace
// opcodes.

#include "Jiff/SequenceMatcher.hpp"
#include "dtl/dtl.hpp"

namespace Jiff {

std::vector<Opcode> matchSequences(const std::vector<std::string>& a,
                                   const std::vector<std::string>& b) {
    std::vector<Opcode> opcodes;

    if (a.empty() && b.empty()) {
        return opcodes;
    }
    if (a.empty()) {
        opcodes.push_back({OpcodeTag::INSERT, 0, 0, 0, b.size()});
        return opcodes;
    }
    if (b.empty()) {
        opcodes.push_back({OpcodeTag::DELETE, 0, a.size(), 0, 0});
        return opcodes;
    }

    using elem = std::string;
    using sequence = std::vector<elem>;
    dtl::Diff<elem, sequence> diff(a, b);
    diff.compose();

    auto ses = diff.getSes().getSequence();

    size_t ia = 0;
    size_t ib = 0;
    for (size_t k = 0; k < ses.size(); ) {
        size_t a_begin = ia;
        size_t b_begin = ib;

        if (ses[k].second.type == dtl::SES_COMMON) {
            while (k < ses.size() && ses[k].second.type == dtl::SES_COMMON) {
                ia++;
                ib++;
                k++;
            }
            opcodes.push_back({OpcodeTag::EQUAL, a_begin, ia, b_begin, ib});
            continue;
        }

        // A run of changes; dtl may interleave deletions and additions.
        while (k < ses.size() && ses[k].second.type != dtl::SES_COMMON) {
            if (ses[k].second.type == dtl::SES_DELETE) {
                ia++;
            } else {
                ib++;
            }
            k++;
        }

        OpcodeTag tag;
        if (ia > a_begin && ib > b_begin) {
            tag = OpcodeTag::REPLACE;
        } else if (ia > a_begin) {
            tag = OpcodeTag::DELETE;
        } else {
            tag = OpcodeTag::INSERT;
        }
        opcodes.push_back({tag, a_begin, ia, b_begin, ib});
    }

    return opcodes;
}

std::string getOpcodeTagName(OpcodeTag tag) {
    switch (tag) {
        case OpcodeTag::EQUAL: return "equal";
        case OpcodeTag::INSERT: return "insert";
        case OpcodeTag::DELETE: return "delete";
        case OpcodeTag::REPLACE: return "replace";
        default: return "unknown";
    }
}

} // namespace Jiff
