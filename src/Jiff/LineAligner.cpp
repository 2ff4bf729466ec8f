// =================================================================
// src/Jiff/LineAligner.cpp
// =================================================================
// Implementation for the replace-block line aligner.

#include "Jiff/LineAligner.hpp"
#include "Jiff/LineCost.hpp"
#include "Jiff/Logger.hpp"
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace Jiff {

static const size_t INFINITE_DISTANCE = std::numeric_limits<size_t>::max();

// Predecessor of the moves leaving state (0, 0).
static const size_t ORIGIN = std::numeric_limits<size_t>::max();

static const MoveKind MOVE_KINDS[] = {MoveKind::DELETE, MoveKind::INSERT, MoveKind::SUBSTITUTE};

// Order in which the moves landing on one state relax their successors.
// Relaxation keeps the first of equal distances, so on ties a successor
// prefers a substitute predecessor, then a delete, then an insert.
static const MoveKind SWEEP_ORDER[] = {MoveKind::SUBSTITUTE, MoveKind::DELETE, MoveKind::INSERT};

AlignmentMatrix::AlignmentMatrix(const std::vector<std::string>& lines_before,
                                 const std::vector<std::string>& lines_after,
                                 bool debug)
    : m_before_count(lines_before.size()),
      m_after_count(lines_after.size()),
      m_debug(debug) {
    if (lines_before.empty() && lines_after.empty()) {
        throw std::invalid_argument("Cannot align an empty replace block");
    }

    // Baseline costs of showing every line unaligned. Any pairing has to
    // do no worse than these.
    std::vector<size_t> gap_before;
    gap_before.reserve(m_before_count);
    for (const auto& line : lines_before) {
        gap_before.push_back(gapCost(line));
    }
    std::vector<size_t> gap_after;
    gap_after.reserve(m_after_count);
    for (const auto& line : lines_after) {
        gap_after.push_back(gapCost(line));
    }

    m_nodes.assign((m_before_count + 1) * (m_after_count + 1) * 3,
                   MoveNode{0, INFINITE_DISTANCE, ORIGIN});

    for (size_t i = 0; i <= m_before_count; i++) {
        for (size_t j = 0; j <= m_after_count; j++) {
            if (exists(i, j, MoveKind::DELETE)) {
                m_nodes[nodeIndex(i, j, MoveKind::DELETE)].weight = gap_before[i - 1];
            }
            if (exists(i, j, MoveKind::INSERT)) {
                m_nodes[nodeIndex(i, j, MoveKind::INSERT)].weight = gap_after[j - 1];
            }
            if (exists(i, j, MoveKind::SUBSTITUTE)) {
                m_nodes[nodeIndex(i, j, MoveKind::SUBSTITUTE)].weight =
                    substitutionCost(lines_before[i - 1], lines_after[j - 1]);
            }
        }
    }
}

bool AlignmentMatrix::exists(size_t i, size_t j, MoveKind kind) const {
    if (i > m_before_count || j > m_after_count) {
        return false;
    }
    switch (kind) {
        case MoveKind::DELETE: return i > 0;
        case MoveKind::INSERT: return j > 0;
        case MoveKind::SUBSTITUTE: return i > 0 && j > 0;
    }
    return false;
}

size_t AlignmentMatrix::nodeIndex(size_t i, size_t j, MoveKind kind) const {
    return (i * (m_after_count + 1) + j) * 3 + static_cast<size_t>(kind);
}

size_t AlignmentMatrix::getWeight(size_t i, size_t j, MoveKind kind) const {
    if (!exists(i, j, kind)) {
        throw std::out_of_range("No " + getMoveKindName(kind) + " move lands on (" +
                                std::to_string(i) + "," + std::to_string(j) + ")");
    }
    return m_nodes[nodeIndex(i, j, kind)].weight;
}

void AlignmentMatrix::relax(size_t target, size_t source, size_t source_distance) {
    MoveNode& node = m_nodes[target];
    size_t candidate = source_distance + node.weight;
    // Strict comparison: the first predecessor found keeps ties.
    if (candidate < node.distance) {
        node.distance = candidate;
        node.predecessor = source;
    }
}

void AlignmentMatrix::relaxSuccessors(size_t i, size_t j, size_t source, size_t source_distance) {
    bool can_advance_before = i < m_before_count;
    bool can_advance_after = j < m_after_count;

    if (can_advance_before) {
        relax(nodeIndex(i + 1, j, MoveKind::DELETE), source, source_distance);
    }
    if (can_advance_after) {
        relax(nodeIndex(i, j + 1, MoveKind::INSERT), source, source_distance);
    }
    if (can_advance_before && can_advance_after) {
        relax(nodeIndex(i + 1, j + 1, MoveKind::SUBSTITUTE), source, source_distance);
    }
}

std::vector<AlignmentMove> AlignmentMatrix::shortestPath() {
    for (auto& node : m_nodes) {
        node.distance = INFINITE_DISTANCE;
        node.predecessor = ORIGIN;
    }

    // Moves leaving the origin start at their own weight.
    relaxSuccessors(0, 0, ORIGIN, 0);

    // Row-major over landing states is a topological order: every
    // predecessor of a move landing on (i, j) lands on (i-1, j), (i, j-1)
    // or (i-1, j-1). Each node relaxes at most three successors, so the
    // sweep is linear in the number of nodes.
    for (size_t i = 0; i <= m_before_count; i++) {
        for (size_t j = 0; j <= m_after_count; j++) {
            for (MoveKind kind : SWEEP_ORDER) {
                if (!exists(i, j, kind)) {
                    continue;
                }
                size_t source = nodeIndex(i, j, kind);
                relaxSuccessors(i, j, source, m_nodes[source].distance);
            }
        }
    }

    // Three moves can complete the alignment. Pairing wins all ties.
    size_t m = m_before_count;
    size_t n = m_after_count;
    size_t exit_delete = exists(m, n, MoveKind::DELETE)
        ? m_nodes[nodeIndex(m, n, MoveKind::DELETE)].distance : INFINITE_DISTANCE;
    size_t exit_insert = exists(m, n, MoveKind::INSERT)
        ? m_nodes[nodeIndex(m, n, MoveKind::INSERT)].distance : INFINITE_DISTANCE;
    size_t exit_substitute = exists(m, n, MoveKind::SUBSTITUTE)
        ? m_nodes[nodeIndex(m, n, MoveKind::SUBSTITUTE)].distance : INFINITE_DISTANCE;

    MoveKind exit_kind;
    if (exit_delete < exit_insert && exit_delete < exit_substitute) {
        exit_kind = MoveKind::DELETE;
    } else if (exit_insert < exit_substitute) {
        exit_kind = MoveKind::INSERT;
    } else {
        exit_kind = MoveKind::SUBSTITUTE;
    }

    auto path = walkPath(nodeIndex(m, n, exit_kind));

    if (m_debug) {
        LOG_DEBUG("LineAligner", toString(true));
        std::ostringstream summary;
        summary << "Exit via " << getMoveKindName(exit_kind) << ", cost "
                << (path.empty() ? 0 : path.back().distance) << ", " << path.size() << " moves";
        LOG_DEBUG("LineAligner", summary.str());
    }

    return path;
}

AlignmentMove AlignmentMatrix::describeNode(size_t index) const {
    size_t cell = index / 3;
    size_t i = cell / (m_after_count + 1);
    size_t j = cell % (m_after_count + 1);
    MoveKind kind = static_cast<MoveKind>(index % 3);
    const MoveNode& node = m_nodes[index];

    AlignmentMove move;
    move.kind = kind;
    move.before_index = (kind == MoveKind::INSERT) ? i : i - 1;
    move.after_index = (kind == MoveKind::DELETE) ? j : j - 1;
    move.weight = node.weight;
    move.distance = node.distance;
    return move;
}

std::vector<AlignmentMove> AlignmentMatrix::walkPath(size_t exit) const {
    std::vector<AlignmentMove> path;
    path.reserve(m_before_count + m_after_count);

    size_t pos = exit;
    while (pos != ORIGIN) {
        path.push_back(describeNode(pos));
        pos = m_nodes[pos].predecessor;
    }

    return std::vector<AlignmentMove>(path.rbegin(), path.rend());
}

std::string AlignmentMatrix::toString(bool verbose) const {
    std::ostringstream out;
    out << "Alignment matrix (" << (m_before_count + 1) << " x " << (m_after_count + 1) << "):\n";

    for (size_t i = 0; i <= m_before_count; i++) {
        for (size_t j = 0; j <= m_after_count; j++) {
            out << " [";
            for (MoveKind kind : MOVE_KINDS) {
                if (kind != MoveKind::DELETE) out << "/";
                if (!exists(i, j, kind)) {
                    out << std::setw(4) << "-";
                    continue;
                }
                const MoveNode& node = m_nodes[nodeIndex(i, j, kind)];
                out << std::setw(4) << node.weight;
                if (verbose) {
                    out << ":";
                    if (node.distance == INFINITE_DISTANCE) {
                        out << "inf";
                    } else {
                        out << node.distance;
                    }
                }
            }
            out << "]";
        }
        out << "\n";
    }

    return out.str();
}

std::vector<AlignedPair> alignLines(const std::vector<std::string>& lines_before,
                                    const std::vector<std::string>& lines_after,
                                    bool debug) {
    AlignmentMatrix matrix(lines_before, lines_after, debug);
    auto path = matrix.shortestPath();

    std::vector<AlignedPair> alignment;
    alignment.reserve(path.size());
    for (const auto& move : path) {
        AlignedPair pair;
        if (move.kind != MoveKind::INSERT) {
            pair.before = lines_before[move.before_index];
        }
        if (move.kind != MoveKind::DELETE) {
            pair.after = lines_after[move.after_index];
        }
        alignment.push_back(std::move(pair));
    }

    return alignment;
}

std::string getMoveKindName(MoveKind kind) {
    switch (kind) {
        case MoveKind::DELETE: return "delete";
        case MoveKind::INSERT: return "insert";
        case MoveKind::SUBSTITUTE: return "substitute";
        default: return "unknown";
    }
}

} // namespace Jiff
