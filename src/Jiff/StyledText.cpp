// =================================================================
// src/Jiff/StyledText.cpp
// =================================================================
// Implementation for styled text.

#include "Jiff/StyledText.hpp"
#include "Jiff/TextUtils.hpp"

namespace Jiff {

static const char* const RESET = "\033[0m";

static std::string colorCode(int color, bool background) {
    if (color >= 0 && color < 8) {
        return std::to_string((background ? 40 : 30) + color);
    }
    return std::string(background ? "48;5;" : "38;5;") + std::to_string(color);
}

bool Style::isPlain() const {
    return foreground == Colors::NONE && background == Colors::NONE && !bold && !reverse;
}

std::string Style::toAnsi() const {
    if (isPlain()) {
        return "";
    }

    std::vector<std::string> codes;
    if (bold) codes.push_back("1");
    if (reverse) codes.push_back("7");
    if (foreground != Colors::NONE) codes.push_back(colorCode(foreground, false));
    if (background != Colors::NONE) codes.push_back(colorCode(background, true));

    return "\033[" + joinTokens(codes, 0, codes.size(), ";") + "m";
}

bool Style::operator==(const Style& other) const {
    return foreground == other.foreground && background == other.background &&
           bold == other.bold && reverse == other.reverse;
}

StyledText::StyledText(const std::string& text, const Style& style) {
    append(text, style);
}

void StyledText::append(const std::string& text, const Style& style) {
    if (text.empty()) {
        return;
    }
    if (!m_spans.empty() && m_spans.back().style == style) {
        m_spans.back().text += text;
        return;
    }
    m_spans.push_back({text, style});
}

void StyledText::append(const StyledText& other) {
    for (const auto& span : other.m_spans) {
        append(span.text, span.style);
    }
}

size_t StyledText::length() const {
    size_t total = 0;
    for (const auto& span : m_spans) {
        total += characterLength(span.text);
    }
    return total;
}

bool StyledText::empty() const {
    return m_spans.empty();
}

std::string StyledText::plain() const {
    std::string text;
    for (const auto& span : m_spans) {
        text += span.text;
    }
    return text;
}

const std::vector<StyledSpan>& StyledText::getSpans() const {
    return m_spans;
}

StyledText StyledText::expandTabs(size_t tab_size) const {
    if (tab_size == 0) {
        return *this;
    }

    StyledText expanded;
    size_t column = 0;
    for (const auto& span : m_spans) {
        std::string text;
        for (const auto& character : splitCharacters(span.text)) {
            if (character == "\t") {
                size_t spaces = tab_size - (column % tab_size);
                text.append(spaces, ' ');
                column += spaces;
            } else {
                text += character;
                column++;
            }
        }
        expanded.append(text, span.style);
    }
    return expanded;
}

std::vector<StyledText> StyledText::wrap(size_t width) const {
    std::vector<StyledText> chunks;
    if (width == 0 || length() <= width) {
        chunks.push_back(*this);
        return chunks;
    }

    StyledText current;
    size_t current_length = 0;
    for (const auto& span : m_spans) {
        for (const auto& character : splitCharacters(span.text)) {
            if (current_length == width) {
                chunks.push_back(current);
                current = StyledText();
                current_length = 0;
            }
            current.append(character, span.style);
            current_length++;
        }
    }
    chunks.push_back(current);

    return chunks;
}

std::string StyledText::render(bool color) const {
    std::string rendered;
    for (const auto& span : m_spans) {
        if (!color || span.style.isPlain()) {
            rendered += span.text;
            continue;
        }
        rendered += span.style.toAnsi();
        rendered += span.text;
        rendered += RESET;
    }
    return rendered;
}

} // namespace Jiff
