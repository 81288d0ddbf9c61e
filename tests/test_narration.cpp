#include <gtest/gtest.h>
#include "mathtext/narration.h"
#include <random>
#include <vector>

using namespace mathtext;

// MARK: - Spacing rules

TEST(NarrationTest, ParenthesisAfterLetter) {
    EXPECT_EQ(normalizeNarrationText("f(x)=x^2"), "f (x)=x^2");
}

TEST(NarrationTest, CamelCaseSplit) {
    EXPECT_EQ(normalizeNarrationText("firstSolveForX"), "first Solve For X");
}

TEST(NarrationTest, SpaceAfterPunctuation) {
    EXPECT_EQ(normalizeNarrationText("Done.Next,then!Go?Yes:no;maybe"),
              "Done. Next, then! Go? Yes: no; maybe");
}

TEST(NarrationTest, PunctuationBeforeDigitUntouched) {
    EXPECT_EQ(normalizeNarrationText("x equals 3.5"), "x equals 3.5");
}

TEST(NarrationTest, ClosingParenthesisBeforeLetter) {
    EXPECT_EQ(normalizeNarrationText("(a+b)squared"), "(a+b) squared");
}

TEST(NarrationTest, CollapseAndTrim) {
    EXPECT_EQ(normalizeNarrationText("  two   spaces\n\tand\ttabs  "), "two spaces and tabs");
}

TEST(NarrationTest, RulesCombine) {
    EXPECT_EQ(normalizeNarrationText("theSlope(m)is2.Thenb=3"),
              "the Slope (m) is2. Thenb=3");
}

TEST(NarrationTest, EmptyInput) {
    EXPECT_EQ(normalizeNarrationText(""), "");
    EXPECT_EQ(normalizeNarrationText("   "), "");
}

TEST(NarrationTest, NonAsciiPassesThrough) {
    EXPECT_EQ(normalizeNarrationText("caf\xc3\xa9(x)"), "caf\xc3\xa9(x)");
}

TEST(NarrationTest, Idempotent) {
    static const std::vector<std::string> fragments = {
        "a", "B", "x", "Q", ".", ",", "!", "?", ":", ";", "(", ")", " ", "  ",
        "\n", "\t", "=", "2", "^", "\xc3\xa9",
    };
    std::mt19937 rng(17);
    std::uniform_int_distribution<size_t> pick(0, fragments.size() - 1);
    for (int i = 0; i < 2000; ++i) {
        std::string s;
        for (int j = 0; j < 16; ++j) s += fragments[pick(rng)];
        std::string once = normalizeNarrationText(s);
        EXPECT_EQ(normalizeNarrationText(once), once) << "input: " << s;
    }
}
