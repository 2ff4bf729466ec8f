// =================================================================
// src/Jiff/DiffCalculator.cpp
// =================================================================
// Implementation for the line and character diff calculation.

#include "Jiff/DiffCalculator.hpp"
#include "Jiff/SequenceMatcher.hpp"
#include "Jiff/TextUtils.hpp"
#include <sstream>

namespace Jiff {

// Splits on every occurrence of a non-empty separator.
static std::vector<std::string> splitOn(const std::string& text, const std::string& separator) {
    if (separator == "\n") {
        return splitLines(text);
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t found = text.find(separator, start);
        if (found == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, found - start));
        start = found + separator.size();
    }
    return parts;
}

std::vector<Diff> calculateDiff(const std::string& left, const std::string& right,
                                const std::string& separator) {
    std::vector<std::string> left_parts;
    std::vector<std::string> right_parts;
    if (separator.empty()) {
        left_parts = splitCharacters(left);
        right_parts = splitCharacters(right);
    } else {
        left_parts = splitOn(left, separator);
        right_parts = splitOn(right, separator);
    }

    std::vector<Diff> diffs;
    for (const auto& op : matchSequences(left_parts, right_parts)) {
        std::string l = joinTokens(left_parts, op.a_begin, op.a_end, separator);
        std::string r = joinTokens(right_parts, op.b_begin, op.b_end, separator);

        switch (op.tag) {
            case OpcodeTag::EQUAL:
                diffs.push_back({DiffType::SAME, l, ""});
                break;
            case OpcodeTag::INSERT:
                diffs.push_back({DiffType::ADD, r, ""});
                break;
            case OpcodeTag::DELETE:
                diffs.push_back({DiffType::REMOVE, l, ""});
                break;
            case OpcodeTag::REPLACE:
                diffs.push_back({DiffType::REPLACE, l, r});
                break;
        }
    }

    return diffs;
}

std::vector<Diff> calculateLineDiff(const std::string& left, const std::string& right) {
    return calculateDiff(left, right, "\n");
}

std::vector<Diff> calculateCharDiff(const std::string& left, const std::string& right) {
    return calculateDiff(left, right, "");
}

std::string getDiffTypeName(DiffType type) {
    switch (type) {
        case DiffType::SAME: return "SAME";
        case DiffType::ADD: return "ADD";
        case DiffType::REMOVE: return "REMOVE";
        case DiffType::REPLACE: return "REPLACE";
        default: return "UNKNOWN";
    }
}

std::string describeDiff(const Diff& diff) {
    std::ostringstream out;
    out << getDiffTypeName(diff.type) << " " << splitLines(diff.left).size() << " line(s)";
    if (diff.type == DiffType::REPLACE) {
        out << " -> " << splitLines(diff.right).size() << " line(s)";
    }
    return out.str();
}

} // namespace Jiff
