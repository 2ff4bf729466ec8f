// =================================================================
// tests/TextUtilsTest.cpp
// =================================================================
// Unit tests for line and character tokenization.

#include "Jiff/TextUtils.hpp"
#include <iostream>
#include <cassert>
#include <vector>
#include <string>

class TextUtilsTest {
public:
    void testSplitLines() {
        std::cout << "Testing line splitting..." << std::endl;

        auto lines = Jiff::splitLines("one\ntwo\nthree");
        assert(lines.size() == 3 && "Should split on every newline");
        assert(lines[0] == "one" && lines[1] == "two" && lines[2] == "three");

        auto trailing = Jiff::splitLines("one\n");
        assert(trailing.size() == 2 && "Trailing newline should yield a trailing empty line");
        assert(trailing[1].empty());

        auto empty = Jiff::splitLines("");
        assert(empty.size() == 1 && empty[0].empty() && "Empty text is one empty line");

        auto blank_lines = Jiff::splitLines("\n\n");
        assert(blank_lines.size() == 3);

        std::cout << "✓ Line splitting test passed" << std::endl;
    }

    void testSplitCharacters() {
        std::cout << "Testing UTF-8 character splitting..." << std::endl;

        // 1, 2, 3 and 4 byte sequences
        auto characters = Jiff::splitCharacters("a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
        assert(characters.size() == 4 && "Should split into code points");
        assert(characters[0] == "a");
        assert(characters[1] == "\xC3\xA9");
        assert(characters[2] == "\xE2\x82\xAC");
        assert(characters[3] == "\xF0\x9F\x98\x80");

        assert(Jiff::splitCharacters("").empty());

        std::cout << "✓ UTF-8 character splitting test passed" << std::endl;
    }

    void testMalformedUtf8() {
        std::cout << "Testing malformed UTF-8..." << std::endl;

        auto stray = Jiff::splitCharacters("a\xFF" "b");
        assert(stray.size() == 3 && "Invalid lead byte should be its own token");
        assert(stray[1] == "\xFF");

        // Truncated three-byte sequence at the end of the string
        auto truncated = Jiff::splitCharacters("\xE2\x82");
        assert(truncated.size() == 2 && "Truncated sequence should fall back to single bytes");

        // Lead byte followed by a non-continuation byte
        auto broken = Jiff::splitCharacters("\xC3" "a");
        assert(broken.size() == 2);

        std::cout << "✓ Malformed UTF-8 test passed" << std::endl;
    }

    void testCharacterLength() {
        std::cout << "Testing character length..." << std::endl;

        assert(Jiff::characterLength("") == 0);
        assert(Jiff::characterLength("abc") == 3);
        assert(Jiff::characterLength("h\xC3\xA9llo") == 5 && "Multi-byte characters count once");
        assert(Jiff::characterLength("\t") == 1);

        std::cout << "✓ Character length test passed" << std::endl;
    }

    void testJoinTokens() {
        std::cout << "Testing token joining..." << std::endl;

        std::vector<std::string> tokens = {"a", "b", "c", "d"};
        assert(Jiff::joinTokens(tokens, 0, 4, "\n") == "a\nb\nc\nd");
        assert(Jiff::joinTokens(tokens, 1, 3, "") == "bc");
        assert(Jiff::joinTokens(tokens, 2, 2, "\n").empty() && "Empty range joins to nothing");
        assert(Jiff::joinTokens(tokens, 3, 10, ",") == "d" && "Range is clamped to the tokens");

        std::cout << "✓ Token joining test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running TextUtils unit tests..." << std::endl;

        testSplitLines();
        testSplitCharacters();
        testMalformedUtf8();
        testCharacterLength();
        testJoinTokens();

        std::cout << "All TextUtils tests passed!" << std::endl;
    }
};

int main() {
    try {
        TextUtilsTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
