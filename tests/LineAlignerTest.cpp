// =================================================================
// tests/LineAlignerTest.cpp
// =================================================================
// Unit tests for the replace-block line aligner.

#include "Jiff/LineAligner.hpp"
#include "Jiff/LineCost.hpp"
#include <iostream>
#include <cassert>
#include <algorithm>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using Jiff::AlignedPair;
using Jiff::AlignmentMatrix;
using Jiff::AlignmentMove;
using Jiff::MoveKind;

using Lines = std::vector<std::string>;

class LineAlignerTest {
private:
    std::vector<std::pair<Lines, Lines>> m_samples = {
        {{"foo", "bar"}, {"foo", "baz"}},
        {{"alpha", "beta"}, {"alpha", "gamma", "beta"}},
        {{"int a = 1;", "return a;"}, {"int b = 2;", "log(b);", "return b;"}},
        {{"abc"}, {"xyz"}},
        {{"one", "two", "three", "four"}, {"zero", "two!", "four"}},
        {{"", "x"}, {"y", ""}},
        {{"same"}, {"same", "same", "same"}},
    };

    bool isPair(const AlignedPair& pair, const char* before, const char* after) {
        bool before_ok = before ? (pair.before && *pair.before == before) : !pair.before;
        bool after_ok = after ? (pair.after && *pair.after == after) : !pair.after;
        return before_ok && after_ok;
    }

    // Reference minimum computed with a plain edit-distance recurrence.
    size_t optimalCost(const Lines& before, const Lines& after) {
        size_t m = before.size();
        size_t n = after.size();
        std::vector<std::vector<size_t>> best(m + 1, std::vector<size_t>(n + 1, 0));
        for (size_t i = 1; i <= m; i++) {
            best[i][0] = best[i - 1][0] + Jiff::gapCost(before[i - 1]);
        }
        for (size_t j = 1; j <= n; j++) {
            best[0][j] = best[0][j - 1] + Jiff::gapCost(after[j - 1]);
        }
        for (size_t i = 1; i <= m; i++) {
            for (size_t j = 1; j <= n; j++) {
                best[i][j] = std::min({
                    best[i - 1][j] + Jiff::gapCost(before[i - 1]),
                    best[i][j - 1] + Jiff::gapCost(after[j - 1]),
                    best[i - 1][j - 1] + Jiff::substitutionCost(before[i - 1], after[j - 1])
                });
            }
        }
        return best[m][n];
    }

    size_t pathCost(const std::vector<AlignmentMove>& path) {
        size_t total = 0;
        for (const auto& move : path) {
            total += move.weight;
        }
        return total;
    }

public:
    void testDegenerateCases() {
        std::cout << "Testing degenerate blocks..." << std::endl;

        auto inserted = Jiff::alignLines({}, {"x"});
        assert(inserted.size() == 1 && isPair(inserted[0], nullptr, "x"));

        auto removed = Jiff::alignLines({"x"}, {});
        assert(removed.size() == 1 && isPair(removed[0], "x", nullptr));

        auto same = Jiff::alignLines({"a"}, {"a"});
        assert(same.size() == 1 && isPair(same[0], "a", "a"));

        AlignmentMatrix matrix({"a"}, {"a"});
        assert(matrix.getWeight(1, 1, MoveKind::SUBSTITUTE) == 0);

        std::cout << "✓ Degenerate blocks test passed" << std::endl;
    }

    void testEmptyBlockRejected() {
        std::cout << "Testing empty block rejection..." << std::endl;

        bool threw = false;
        try {
            Jiff::alignLines({}, {});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Aligning two empty sides must fail");

        std::cout << "✓ Empty block rejection test passed" << std::endl;
    }

    void testSingleSidedChains() {
        std::cout << "Testing single-sided chains..." << std::endl;

        auto removed = Jiff::alignLines({"a", "b", "c"}, {});
        assert(removed.size() == 3);
        assert(isPair(removed[0], "a", nullptr));
        assert(isPair(removed[2], "c", nullptr));

        AlignmentMatrix matrix({}, {"one", "two"});
        auto path = matrix.shortestPath();
        assert(path.size() == 2);
        assert(path[0].kind == MoveKind::INSERT && path[0].after_index == 0);
        assert(path[1].kind == MoveKind::INSERT && path[1].after_index == 1);
        assert(path[1].distance == 6);

        std::cout << "✓ Single-sided chains test passed" << std::endl;
    }

    void testConcreteScenario() {
        std::cout << "Testing foo/bar scenario..." << std::endl;

        auto alignment = Jiff::alignLines({"foo", "bar"}, {"foo", "baz"});
        assert(alignment.size() == 2);
        assert(isPair(alignment[0], "foo", "foo"));
        assert(isPair(alignment[1], "bar", "baz"));

        AlignmentMatrix matrix({"foo", "bar"}, {"foo", "baz"});
        assert(matrix.getWeight(1, 0, MoveKind::DELETE) == 3);
        assert(matrix.getWeight(0, 2, MoveKind::INSERT) == 3);
        assert(matrix.getWeight(1, 1, MoveKind::SUBSTITUTE) == 0);
        assert(matrix.getWeight(2, 2, MoveKind::SUBSTITUTE) == 2);

        auto path = matrix.shortestPath();
        assert(path.size() == 2);
        assert(path[0].weight == 0 && "Identical first lines pair for free");
        assert(path.back().distance == 2);

        std::cout << "✓ foo/bar scenario test passed" << std::endl;
    }

    void testTieBreakPrefersPairing() {
        std::cout << "Testing tie-break..." << std::endl;

        // Pairing "x" with "y" costs exactly as much as two gaps
        assert(Jiff::substitutionCost("x", "y") == Jiff::gapCost("x") + Jiff::gapCost("y"));

        auto alignment = Jiff::alignLines({"x"}, {"y"});
        assert(alignment.size() == 1 && isPair(alignment[0], "x", "y"));

        std::cout << "✓ Tie-break test passed" << std::endl;
    }

    void testTieBreakInsideBlock() {
        std::cout << "Testing tie-break inside a block..." << std::endl;

        // Several paths cost 6. On equal distances a move keeps a substitute
        // predecessor over a delete, and a delete over an insert.
        auto alignment = Jiff::alignLines({"", "ab"}, {"y", "x", "yx"});
        assert(alignment.size() == 4);
        assert(isPair(alignment[0], nullptr, "y"));
        assert(isPair(alignment[1], "", "x") && "Tied paths keep the pairing");
        assert(isPair(alignment[2], "ab", nullptr));
        assert(isPair(alignment[3], nullptr, "yx"));

        // All three moves landing on (1, 1) cost 1; the delete landing on
        // (2, 1) must continue from the substitute.
        AlignmentMatrix matrix({"", "ab"}, {"x", "yx"});
        auto path = matrix.shortestPath();
        assert(path.size() == 3);
        assert(path[0].kind == MoveKind::SUBSTITUTE);
        assert(path[0].before_index == 0 && path[0].after_index == 0);
        assert(path[0].distance == 1);
        assert(path[1].kind == MoveKind::DELETE && path[1].before_index == 1);
        assert(path[1].distance == 3);
        assert(path[2].kind == MoveKind::INSERT && path[2].after_index == 1);
        assert(path[2].distance == 5);

        std::cout << "✓ Tie-break inside a block test passed" << std::endl;
    }

    void testGapsBeatExpensivePairing() {
        std::cout << "Testing unrelated lines stay unpaired..." << std::endl;

        auto alignment = Jiff::alignLines({"abc"}, {"xyz"});
        assert(alignment.size() == 2);
        assert(isPair(alignment[0], "abc", nullptr));
        assert(isPair(alignment[1], nullptr, "xyz"));

        std::cout << "✓ Unrelated lines test passed" << std::endl;
    }

    void testInsertedLineInMiddle() {
        std::cout << "Testing inserted line in the middle..." << std::endl;

        auto alignment = Jiff::alignLines({"alpha", "beta"}, {"alpha", "gamma", "beta"});
        assert(alignment.size() == 3);
        assert(isPair(alignment[0], "alpha", "alpha"));
        assert(isPair(alignment[1], nullptr, "gamma"));
        assert(isPair(alignment[2], "beta", "beta"));

        std::cout << "✓ Inserted line test passed" << std::endl;
    }

    void testCoverageAndMonotonicity() {
        std::cout << "Testing coverage and monotonicity..." << std::endl;

        for (const auto& sample : m_samples) {
            AlignmentMatrix matrix(sample.first, sample.second);
            auto path = matrix.shortestPath();

            size_t consumed_before = 0;
            size_t consumed_after = 0;
            for (const auto& move : path) {
                switch (move.kind) {
                    case MoveKind::DELETE:
                        assert(move.before_index == consumed_before);
                        consumed_before++;
                        break;
                    case MoveKind::INSERT:
                        assert(move.after_index == consumed_after);
                        consumed_after++;
                        break;
                    case MoveKind::SUBSTITUTE:
                        assert(move.before_index == consumed_before);
                        assert(move.after_index == consumed_after);
                        consumed_before++;
                        consumed_after++;
                        break;
                }
            }
            assert(consumed_before == sample.first.size() && "Every before line used once");
            assert(consumed_after == sample.second.size() && "Every after line used once");

            auto alignment = Jiff::alignLines(sample.first, sample.second);
            for (const auto& pair : alignment) {
                assert((pair.before || pair.after) && "A pair is never empty on both sides");
            }
        }

        std::cout << "✓ Coverage and monotonicity test passed" << std::endl;
    }

    void testOptimality() {
        std::cout << "Testing optimality..." << std::endl;

        for (const auto& sample : m_samples) {
            AlignmentMatrix matrix(sample.first, sample.second);
            auto path = matrix.shortestPath();

            size_t baseline = 0;
            for (const auto& line : sample.first) baseline += Jiff::gapCost(line);
            for (const auto& line : sample.second) baseline += Jiff::gapCost(line);

            size_t total = pathCost(path);
            assert(total == path.back().distance && "Distances accumulate move weights");
            assert(total <= baseline && "Never worse than leaving every line unpaired");
            assert(total == optimalCost(sample.first, sample.second) && "Path must be a shortest path");
        }

        std::cout << "✓ Optimality test passed" << std::endl;
    }

    void testDeterminism() {
        std::cout << "Testing determinism..." << std::endl;

        for (const auto& sample : m_samples) {
            auto first = Jiff::alignLines(sample.first, sample.second);
            auto second = Jiff::alignLines(sample.first, sample.second);
            assert(first.size() == second.size());
            for (size_t k = 0; k < first.size(); k++) {
                assert(first[k].before == second[k].before);
                assert(first[k].after == second[k].after);
            }
        }

        // Solving the same matrix twice gives the same path
        AlignmentMatrix matrix({"one", "two"}, {"one!", "two!"});
        auto first_path = matrix.shortestPath();
        auto second_path = matrix.shortestPath();
        assert(first_path.size() == second_path.size());
        assert(first_path.back().distance == second_path.back().distance);

        std::cout << "✓ Determinism test passed" << std::endl;
    }

    void testSymmetry() {
        std::cout << "Testing symmetry..." << std::endl;

        Lines before = {"alpha", "beta"};
        Lines after = {"alpha", "gamma", "beta"};

        std::set<std::pair<std::string, std::string>> forward;
        for (const auto& pair : Jiff::alignLines(before, after)) {
            forward.insert({pair.before.value_or("<none>"), pair.after.value_or("<none>")});
        }

        std::set<std::pair<std::string, std::string>> swapped;
        for (const auto& pair : Jiff::alignLines(after, before)) {
            swapped.insert({pair.after.value_or("<none>"), pair.before.value_or("<none>")});
        }

        assert(forward == swapped && "Swapping sides must give the same pairings");

        std::cout << "✓ Symmetry test passed" << std::endl;
    }

    void testWeightBounds() {
        std::cout << "Testing weight lookups..." << std::endl;

        AlignmentMatrix matrix({"a", "b"}, {"c"});
        assert(matrix.getBeforeCount() == 2);
        assert(matrix.getAfterCount() == 1);

        bool threw = false;
        try {
            matrix.getWeight(0, 0, MoveKind::DELETE);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        assert(threw && "No move lands on the origin");

        threw = false;
        try {
            matrix.getWeight(3, 1, MoveKind::SUBSTITUTE);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        assert(threw && "Indices beyond the block are rejected");

        assert(matrix.toString().find("Alignment matrix (3 x 2)") != std::string::npos);

        std::cout << "✓ Weight lookups test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running LineAligner unit tests..." << std::endl;

        testDegenerateCases();
        testEmptyBlockRejected();
        testSingleSidedChains();
        testConcreteScenario();
        testTieBreakPrefersPairing();
        testTieBreakInsideBlock();
        testGapsBeatExpensivePairing();
        testInsertedLineInMiddle();
        testCoverageAndMonotonicity();
        testOptimality();
        testDeterminism();
        testSymmetry();
        testWeightBounds();

        std::cout << "All LineAligner tests passed!" << std::endl;
    }
};

int main() {
    try {
        LineAlignerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
