// =================================================================
// src/Jiff/DiffPrinter.cpp
// =================================================================
// Implementation for unified and side-by-side diff rendering.

#include "Jiff/DiffPrinter.hpp"
#include "Jiff/Logger.hpp"
#include "Jiff/TextUtils.hpp"
#include <algorithm>
#include <sstream>

namespace Jiff {

static const std::string SEPARATOR = "│";
static const size_t SEPARATOR_WIDTH = 1;
static const std::string ELLIPSIS = "...";

static std::string formatLineno(size_t lineno, size_t width) {
    std::string number = std::to_string(lineno);
    std::string padded(width > number.size() ? width - number.size() : 0, ' ');
    return padded + number + ":";
}

static std::string describeLine(const std::optional<std::string>& line) {
    return line ? "'" + *line + "'" : "None";
}

DiffPrinter::DiffPrinter(const DiffDisplayOptions& options, std::ostream& out)
    : m_options(options), m_out(out) {
}

size_t DiffPrinter::computeLinenoWidth(size_t max_line_count) {
    size_t width = 1;
    while (max_line_count >= 10) {
        max_line_count /= 10;
        width++;
    }
    return width;
}

size_t DiffPrinter::computeLineWidth(size_t lineno_width) const {
    long long half = (static_cast<long long>(m_options.terminal_width) -
                      static_cast<long long>(SEPARATOR_WIDTH)) / 2;
    long long width = half - static_cast<long long>(lineno_width + 2);
    if (width < 1) {
        LOG_WARNING("DiffPrinter", "Terminal too narrow for side-by-side output, wrapping every character");
        return 1;
    }
    return static_cast<size_t>(width);
}

bool DiffPrinter::collapseContext(size_t line_count, size_t& head, size_t& tail) const {
    size_t context = m_options.context_lines;
    if (context > 0 && line_count > context * 2) {
        head = context;
        tail = context;
        return true;
    }
    head = line_count;
    tail = 0;
    return false;
}

std::vector<AlignedPair> DiffPrinter::alignBlock(const std::vector<std::string>& lines_before,
                                                 const std::vector<std::string>& lines_after) const {
    size_t cells = lines_before.size() * lines_after.size();
    if (cells <= m_options.max_alignment_cells) {
        return alignLines(lines_before, lines_after, m_options.debug);
    }

    std::ostringstream context;
    context << lines_before.size() << " x " << lines_after.size() << " lines";
    Logger::getInstance().info("DiffPrinter", "Replace block too large to align, printing unaligned",
                               context.str());

    std::vector<AlignedPair> unaligned;
    unaligned.reserve(lines_before.size() + lines_after.size());
    for (const auto& line : lines_before) {
        unaligned.push_back({line, std::nullopt});
    }
    for (const auto& line : lines_after) {
        unaligned.push_back({std::nullopt, line});
    }
    return unaligned;
}

void DiffPrinter::styleDiffLine(const std::string& before, const std::string& after,
                                const DiffStyling& styling,
                                StyledText& before_text, StyledText& after_text) const {
    for (const auto& change : calculateCharDiff(before, after)) {
        switch (change.type) {
            case DiffType::SAME:
                before_text.append(change.left, styling.remove);
                after_text.append(change.left, styling.add);
                break;
            case DiffType::ADD:
                after_text.append(change.left, styling.add_highlight);
                break;
            case DiffType::REMOVE:
                before_text.append(change.left, styling.remove_highlight);
                break;
            case DiffType::REPLACE:
                before_text.append(change.left, styling.remove_highlight);
                after_text.append(change.right, styling.add_highlight);
                break;
        }
    }
}

void DiffPrinter::printLine(const StyledText& text) {
    m_out << text.render(m_options.color_output) << "\n";
}

void DiffPrinter::printHeader(const std::string& text) {
    printLine(StyledText(text, Style(Colors::NONE, Colors::NONE, true)));
}

// =================================================================
// Unified
// =================================================================

void DiffPrinter::printUnified(const std::vector<Diff>& diffs) {
    DiffStyling margin_styling;
    DiffStyling line_styling;
    line_styling.add = Style(Colors::GREEN);
    line_styling.add_highlight = Style(Colors::BLACK, Colors::GREEN);
    line_styling.remove = Style(Colors::RED);
    line_styling.remove_highlight = Style(Colors::BLACK, Colors::RED);

    for (const auto& change : diffs) {
        if (m_options.debug) {
            LOG_DEBUG("DiffPrinter", "Diff: " + describeDiff(change));
        }

        switch (change.type) {
            case DiffType::SAME: {
                auto lines = splitLines(change.left);
                size_t head = 0;
                size_t tail = 0;
                bool collapsed = collapseContext(lines.size(), head, tail);
                for (size_t i = 0; i < head; i++) {
                    printLine(StyledText("  " + lines[i], line_styling.same));
                }
                if (collapsed) {
                    printLine(StyledText("  " + ELLIPSIS, line_styling.same));
                }
                for (size_t i = lines.size() - tail; i < lines.size(); i++) {
                    printLine(StyledText("  " + lines[i], line_styling.same));
                }
                break;
            }

            case DiffType::ADD:
                for (const auto& line : splitLines(change.left)) {
                    StyledText text("+ ", margin_styling.add);
                    text.append(line, line_styling.add);
                    printLine(text);
                }
                break;

            case DiffType::REMOVE:
                for (const auto& line : splitLines(change.left)) {
                    StyledText text("- ", margin_styling.remove);
                    text.append(line, line_styling.remove);
                    printLine(text);
                }
                break;

            case DiffType::REPLACE: {
                auto alignment = alignBlock(splitLines(change.left), splitLines(change.right));
                std::vector<StyledText> text_b;
                std::vector<StyledText> text_a;
                for (const auto& pair : alignment) {
                    if (m_options.debug) {
                        LOG_DEBUG("DiffPrinter", "  Aligned: " + describeLine(pair.before) + ", " +
                                  describeLine(pair.after));
                    }
                    if (pair.before && pair.after) {
                        StyledText before_text("- ", margin_styling.remove_highlight);
                        StyledText after_text("+ ", margin_styling.add_highlight);
                        styleDiffLine(*pair.before, *pair.after, line_styling, before_text, after_text);
                        text_b.push_back(before_text);
                        text_a.push_back(after_text);
                    } else if (pair.before) {
                        StyledText before_text("- ", margin_styling.remove_highlight);
                        before_text.append(*pair.before, line_styling.remove_highlight);
                        text_b.push_back(before_text);
                    } else if (pair.after) {
                        StyledText after_text("+ ", margin_styling.add_highlight);
                        after_text.append(*pair.after, line_styling.add_highlight);
                        text_a.push_back(after_text);
                    }
                }
                for (const auto& text : text_b) {
                    printLine(text);
                }
                for (const auto& text : text_a) {
                    printLine(text);
                }
                break;
            }
        }
    }
}

// =================================================================
// Side-by-side
// =================================================================

void DiffPrinter::printSideBySide(const std::vector<Diff>& diffs, size_t max_line_count) {
    DiffStyling lineno_styling;
    lineno_styling.same = Style(Colors::BLACK, Colors::NONE, true);
    lineno_styling.add = Style(Colors::GREEN, Colors::NONE, true);
    lineno_styling.add_highlight = Style(Colors::GREEN, Colors::NONE, true);
    lineno_styling.remove = Style(Colors::RED, Colors::NONE, true);
    lineno_styling.remove_highlight = Style(Colors::RED, Colors::NONE, true);

    DiffStyling line_styling;
    line_styling.same = Style(Colors::BLACK);
    line_styling.add = Style(157);
    line_styling.add_highlight = Style(157, Colors::NONE, false, true);
    line_styling.remove = Style(217);
    line_styling.remove_highlight = Style(217, Colors::NONE, false, true);

    size_t lineno_width = computeLinenoWidth(max_line_count);
    size_t line_width = computeLineWidth(lineno_width);
    std::string empty_lineno(lineno_width + 1, ' ');

    size_t lineno_l = 1;
    size_t lineno_r = 1;

    auto printAdded = [&](const std::string& line) {
        printSideBySideLine(
            StyledText(empty_lineno, lineno_styling.same),
            StyledText(formatLineno(lineno_r, lineno_width), lineno_styling.add_highlight),
            StyledText(empty_lineno, lineno_styling.same),
            StyledText(empty_lineno, lineno_styling.add_highlight),
            StyledText("", line_styling.same),
            StyledText(line, line_styling.add_highlight),
            line_width);
        lineno_r++;
    };

    auto printRemoved = [&](const std::string& line) {
        printSideBySideLine(
            StyledText(formatLineno(lineno_l, lineno_width), lineno_styling.remove_highlight),
            StyledText(empty_lineno, lineno_styling.same),
            StyledText(empty_lineno, lineno_styling.remove_highlight),
            StyledText(empty_lineno, lineno_styling.same),
            StyledText(line, line_styling.remove_highlight),
            StyledText("", line_styling.same),
            line_width);
        lineno_l++;
    };

    auto printSame = [&](const std::string& line) {
        printSideBySideLine(
            StyledText(formatLineno(lineno_l, lineno_width), lineno_styling.same),
            StyledText(formatLineno(lineno_r, lineno_width), lineno_styling.same),
            StyledText(empty_lineno, lineno_styling.same),
            StyledText(empty_lineno, lineno_styling.same),
            StyledText(line, line_styling.same),
            StyledText(line, line_styling.same),
            line_width);
        lineno_l++;
        lineno_r++;
    };

    for (const auto& change : diffs) {
        if (m_options.debug) {
            LOG_DEBUG("DiffPrinter", "Diff: " + describeDiff(change));
        }

        switch (change.type) {
            case DiffType::SAME: {
                auto lines = splitLines(change.left);
                size_t head = 0;
                size_t tail = 0;
                bool collapsed = collapseContext(lines.size(), head, tail);
                for (size_t i = 0; i < head; i++) {
                    printSame(lines[i]);
                }
                if (collapsed) {
                    size_t skipped = lines.size() - head - tail;
                    printSideBySideLine(
                        StyledText(empty_lineno, lineno_styling.same),
                        StyledText(empty_lineno, lineno_styling.same),
                        StyledText(empty_lineno, lineno_styling.same),
                        StyledText(empty_lineno, lineno_styling.same),
                        StyledText(ELLIPSIS, line_styling.same),
                        StyledText(ELLIPSIS, line_styling.same),
                        line_width);
                    lineno_l += skipped;
                    lineno_r += skipped;
                }
                for (size_t i = lines.size() - tail; i < lines.size(); i++) {
                    printSame(lines[i]);
                }
                break;
            }

            case DiffType::ADD:
                for (const auto& line : splitLines(change.left)) {
                    printAdded(line);
                }
                break;

            case DiffType::REMOVE:
                for (const auto& line : splitLines(change.left)) {
                    printRemoved(line);
                }
                break;

            case DiffType::REPLACE: {
                auto alignment = alignBlock(splitLines(change.left), splitLines(change.right));
                for (const auto& pair : alignment) {
                    if (m_options.debug) {
                        LOG_DEBUG("DiffPrinter", "  Aligned: " + describeLine(pair.before) + ", " +
                                  describeLine(pair.after));
                    }
                    if (pair.before && pair.after) {
                        StyledText line_l_text;
                        StyledText line_r_text;
                        styleDiffLine(*pair.before, *pair.after, line_styling, line_l_text, line_r_text);
                        printSideBySideLine(
                            StyledText(formatLineno(lineno_l, lineno_width), lineno_styling.remove),
                            StyledText(formatLineno(lineno_r, lineno_width), lineno_styling.add),
                            StyledText(empty_lineno, lineno_styling.remove),
                            StyledText(empty_lineno, lineno_styling.add),
                            line_l_text,
                            line_r_text,
                            line_width);
                        lineno_l++;
                        lineno_r++;
                    } else if (pair.before) {
                        printRemoved(*pair.before);
                    } else if (pair.after) {
                        printAdded(*pair.after);
                    }
                }
                break;
            }
        }
    }
}

void DiffPrinter::printSideBySideLine(const StyledText& lineno_l, const StyledText& lineno_r,
                                      const StyledText& wrapno_l, const StyledText& wrapno_r,
                                      const StyledText& line_l, const StyledText& line_r,
                                      size_t line_width) {
    auto lines_l = line_l.expandTabs(m_options.tab_size).wrap(line_width);
    auto lines_r = line_r.expandTabs(m_options.tab_size).wrap(line_width);
    size_t rows = std::max(lines_l.size(), lines_r.size());

    for (size_t row = 0; row < rows; row++) {
        const StyledText& margin_l = (row == 0) ? lineno_l : wrapno_l;
        const StyledText& margin_r = (row == 0) ? lineno_r : wrapno_r;
        StyledText wrapped_l = row < lines_l.size() ? lines_l[row] : StyledText();
        StyledText wrapped_r = row < lines_r.size() ? lines_r[row] : StyledText();
        size_t padding = line_width > wrapped_l.length() ? line_width - wrapped_l.length() : 0;

        m_out << margin_l.render(m_options.color_output) << " "
              << wrapped_l.render(m_options.color_output) << std::string(padding, ' ')
              << SEPARATOR
              << margin_r.render(m_options.color_output) << " "
              << wrapped_r.render(m_options.color_output) << "\n";
    }
}

} // namespace Jiff
