// =================================================================
// include/Jiff/DiffPrinter.hpp
// =================================================================
// Renders line diffs as colored unified or side-by-side output, with
// character-level highlighting inside aligned replace blocks.

#pragma once

#include "Jiff/DiffCalculator.hpp"
#include "Jiff/LineAligner.hpp"
#include "Jiff/StyledText.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace Jiff {

/**
 * @brief Options for diff display
 */
struct DiffDisplayOptions {
    bool color_output;           ///< Emit ANSI escape codes (default: true)
    size_t context_lines;        ///< Unchanged lines kept around changes, 0 keeps all (default: 0)
    size_t terminal_width;       ///< Total output width for side-by-side (default: 120)
    size_t tab_size;             ///< Tab stop distance for side-by-side (default: 4)
    size_t max_alignment_cells;  ///< Largest before*after block that gets aligned (default: 250000)
    bool debug;                  ///< Log every change and aligned pair (default: false)

    DiffDisplayOptions() : color_output(true), context_lines(0), terminal_width(120),
                           tab_size(4), max_alignment_cells(250000), debug(false) {}
};

/**
 * @brief Styles for each kind of changed text
 */
struct DiffStyling {
    Style same;
    Style add;
    Style add_highlight;
    Style remove;
    Style remove_highlight;
};

class DiffPrinter {
public:
    /**
     * @brief Construct a printer writing to `out`
     * @param options Display options
     * @param out Destination stream
     */
    DiffPrinter(const DiffDisplayOptions& options, std::ostream& out);

    /**
     * @brief Print changes one above the other.
     *
     * Inside a replace block every removed line is printed before every
     * added line; aligned pairs get character-level highlighting.
     */
    void printUnified(const std::vector<Diff>& diffs);

    /**
     * @brief Print changes in two columns with line numbers.
     * @param diffs Line diff to print
     * @param max_line_count Larger of the two inputs' line counts, sizes the number margin
     */
    void printSideBySide(const std::vector<Diff>& diffs, size_t max_line_count);

    /**
     * @brief Print a bold header line, e.g. the file name in git mode.
     */
    void printHeader(const std::string& text);

    /**
     * @brief Column width used by side-by-side output for a line-number width.
     */
    size_t computeLineWidth(size_t lineno_width) const;

    /**
     * @brief Number of digits needed for line numbers up to `max_line_count`.
     */
    static size_t computeLinenoWidth(size_t max_line_count);

private:
    std::vector<AlignedPair> alignBlock(const std::vector<std::string>& lines_before,
                                        const std::vector<std::string>& lines_after) const;

    void styleDiffLine(const std::string& before, const std::string& after,
                       const DiffStyling& styling,
                       StyledText& before_text, StyledText& after_text) const;

    void printSideBySideLine(const StyledText& lineno_l, const StyledText& lineno_r,
                             const StyledText& wrapno_l, const StyledText& wrapno_r,
                             const StyledText& line_l, const StyledText& line_r,
                             size_t line_width);

    /**
     * @brief Decide how much of an unchanged block to show.
     * @param line_count Lines in the block
     * @param head Set to the number of leading lines to print
     * @param tail Set to the number of trailing lines to print
     * @return True if the lines in between are elided
     */
    bool collapseContext(size_t line_count, size_t& head, size_t& tail) const;

    void printLine(const StyledText& text);

    DiffDisplayOptions m_options;
    std::ostream& m_out;
};

} // namespace Jiff
