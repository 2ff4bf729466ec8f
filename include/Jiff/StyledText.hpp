// =================================================================
// include/Jiff/StyledText.hpp
// =================================================================
// Text made of styled spans, with hard wrapping and ANSI rendering.

#pragma once

#include <string>
#include <vector>

namespace Jiff {

/**
 * @brief Terminal colors. 0-7 are the basic ANSI colors, anything else
 * is an index into the 256-color palette.
 */
namespace Colors {
    const int NONE = -1;
    const int BLACK = 0;
    const int RED = 1;
    const int GREEN = 2;
    const int YELLOW = 3;
    const int BLUE = 4;
    const int MAGENTA = 5;
    const int CYAN = 6;
    const int WHITE = 7;
}

/**
 * @brief Display attributes of a span of text
 */
struct Style {
    int foreground = Colors::NONE;
    int background = Colors::NONE;
    bool bold = false;
    bool reverse = false;

    Style() = default;
    Style(int fg, int bg = Colors::NONE, bool is_bold = false, bool is_reverse = false)
        : foreground(fg), background(bg), bold(is_bold), reverse(is_reverse) {}

    /**
     * @brief True if rendering this style emits no escape codes
     */
    bool isPlain() const;

    /**
     * @brief ANSI SGR sequence switching this style on ("" for a plain style)
     */
    std::string toAnsi() const;

    bool operator==(const Style& other) const;
    bool operator!=(const Style& other) const { return !(*this == other); }
};

struct StyledSpan {
    std::string text;
    Style style;
};

/**
 * @brief Sequence of styled spans treated as one line of output
 */
class StyledText {
public:
    StyledText() = default;
    StyledText(const std::string& text, const Style& style = Style());

    /**
     * @brief Appends text; merges into the last span when the style matches.
     */
    void append(const std::string& text, const Style& style = Style());
    void append(const StyledText& other);

    /**
     * @brief Length in characters, ignoring styling
     */
    size_t length() const;

    bool empty() const;

    /**
     * @brief The text with all styling dropped
     */
    std::string plain() const;

    const std::vector<StyledSpan>& getSpans() const;

    /**
     * @brief Replaces tabs with spaces up to the next tab stop.
     * @param tab_size Distance between tab stops; 0 leaves tabs alone.
     */
    StyledText expandTabs(size_t tab_size) const;

    /**
     * @brief Cuts the text into chunks of at most `width` characters.
     *
     * Styles carry across cuts. Always returns at least one chunk, which
     * is empty for empty text. A width of 0 disables wrapping.
     */
    std::vector<StyledText> wrap(size_t width) const;

    /**
     * @brief Renders the text, with ANSI escape codes when `color` is set.
     */
    std::string render(bool color) const;

private:
    std::vector<StyledSpan> m_spans;
};

} // namespace Jiff
