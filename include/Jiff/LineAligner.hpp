// =================================================================
// include/Jiff/LineAligner.hpp
// =================================================================
// Pairs up the lines of a replace block so that character-level
// highlighting inside the block lines up visually.

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Jiff {

/**
 * @brief The three ways of advancing through a replace block
 */
enum class MoveKind {
    DELETE,      ///< Consume one "before" line on its own
    INSERT,      ///< Consume one "after" line on its own
    SUBSTITUTE   ///< Consume one line from each side, paired
};

/**
 * @brief One step of a solved alignment path
 */
struct AlignmentMove {
    MoveKind kind;
    size_t before_index;   ///< Consumed "before" line (DELETE, SUBSTITUTE)
    size_t after_index;    ///< Consumed "after" line (INSERT, SUBSTITUTE)
    size_t weight;         ///< Cost of this move alone
    size_t distance;       ///< Total cost from the origin up to and including this move
};

/**
 * @brief Output pair of the aligner. Never both absent.
 */
struct AlignedPair {
    std::optional<std::string> before;
    std::optional<std::string> after;
};

/**
 * @brief Shortest-path lattice over the consumption states of two line blocks
 *
 * State (i, j) means i "before" lines and j "after" lines have been
 * consumed. Every cell of the (m+1) x (n+1) state array holds up to three
 * move nodes, one per move kind landing on that state. Every move strictly
 * advances i, j or both, so the lattice is a DAG and a single row-major
 * sweep relaxes every edge in topological order.
 */
class AlignmentMatrix {
public:
    /**
     * @brief Builds the lattice and precomputes every move weight.
     * @param lines_before Lines removed by the replace block
     * @param lines_after Lines added by the replace block
     * @param debug Log the weight table and the solved path
     * @throws std::invalid_argument if both blocks are empty
     */
    AlignmentMatrix(const std::vector<std::string>& lines_before,
                    const std::vector<std::string>& lines_after,
                    bool debug = false);

    /**
     * @brief Solves the lattice and returns the cheapest path.
     * @return Moves from the origin to the chosen terminal, in order.
     */
    std::vector<AlignmentMove> shortestPath();

    /**
     * @brief Get the intrinsic weight of a move landing on (i, j)
     * @throws std::out_of_range if no such move exists
     */
    size_t getWeight(size_t i, size_t j, MoveKind kind) const;

    size_t getBeforeCount() const { return m_before_count; }
    size_t getAfterCount() const { return m_after_count; }

    /**
     * @brief Render the weight table, one row per "before" state
     * @param verbose Also print relaxed distances
     */
    std::string toString(bool verbose = false) const;

private:
    struct MoveNode {
        size_t weight;
        size_t distance;
        size_t predecessor;
    };

    bool exists(size_t i, size_t j, MoveKind kind) const;
    size_t nodeIndex(size_t i, size_t j, MoveKind kind) const;
    void relax(size_t target, size_t source, size_t source_distance);
    void relaxSuccessors(size_t i, size_t j, size_t source, size_t source_distance);
    std::vector<AlignmentMove> walkPath(size_t exit) const;
    AlignmentMove describeNode(size_t index) const;

    size_t m_before_count;
    size_t m_after_count;
    std::vector<MoveNode> m_nodes;
    bool m_debug;
};

/**
 * @brief Aligns the two sides of a replace block.
 * @param lines_before Lines on the "before" side
 * @param lines_after Lines on the "after" side
 * @param debug Log the lattice while solving
 * @return Ordered pairs covering every line of both sides exactly once
 * @throws std::invalid_argument if both sides are empty
 */
std::vector<AlignedPair> alignLines(const std::vector<std::string>& lines_before,
                                    const std::vector<std::string>& lines_after,
                                    bool debug = false);

/**
 * @brief Get a short name for a move kind
 */
std::string getMoveKindName(MoveKind kind);

} // namespace Jiff
