#include <gtest/gtest.h>
#include "mathtext/latex_normalizer.h"
#include "mathtext/assembler.h"
#include <random>
#include <vector>

using namespace mathtext;

// MARK: - Unicode symbols

TEST(LatexNormalizerTest, UnicodeOperatorsBecomeCommands) {
    EXPECT_EQ(convertUnicodeSymbols("a±b"), "a\\pm b");
    EXPECT_EQ(convertUnicodeSymbols("x≤5"), "x\\leq 5");
    EXPECT_EQ(convertUnicodeSymbols("3×4÷2"), "3\\times 4\\div 2");
    EXPECT_EQ(convertUnicodeSymbols("A∪B"), "A\\cup B");
    EXPECT_EQ(convertUnicodeSymbols("x→∞"), "x\\rightarrow \\infty ");
}

TEST(LatexNormalizerTest, SuperscriptAndSubscriptDigits) {
    EXPECT_EQ(convertUnicodeSymbols("x²+y³"), "x^2+y^3");
    EXPECT_EQ(convertUnicodeSymbols("a₁+a₂"), "a_1+a_2");
}

TEST(LatexNormalizerTest, GreekLetters) {
    EXPECT_EQ(convertUnicodeSymbols("2π"), "2\\pi ");
    EXPECT_EQ(convertUnicodeSymbols("Σ"), "\\Sigma ");
}

TEST(LatexNormalizerTest, UnknownUnicodePassesThrough) {
    EXPECT_EQ(convertUnicodeSymbols("caf\xc3\xa9 x"), "caf\xc3\xa9 x");
    EXPECT_EQ(convertUnicodeSymbols(""), "");
}

// MARK: - Corrupted commands

TEST(LatexNormalizerTest, StrippedBackslashRestored) {
    EXPECT_EQ(repairCorruptedCommands("rac{1}{2}"), "\\frac{1}{2}");
    EXPECT_EQ(repairCorruptedCommands("frac{1}{2}"), "\\frac{1}{2}");
    EXPECT_EQ(repairCorruptedCommands("qrt{x}"), "\\sqrt{x}");
    EXPECT_EQ(repairCorruptedCommands("sqrt[3]{8}"), "\\sqrt[3]{8}");
    EXPECT_EQ(repairCorruptedCommands("sin{x}"), "\\sin{x}");
}

TEST(LatexNormalizerTest, EscapeCharactersRestored) {
    EXPECT_EQ(repairCorruptedCommands("\x0c" "rac{3}{4}"), "\\frac{3}{4}");
    EXPECT_EQ(repairCorruptedCommands("2\t" "imes 3"), "2\\times 3");
}

TEST(LatexNormalizerTest, StrayFormFeedPrefixRemoved) {
    EXPECT_EQ(repairCorruptedCommands("\\f\\frac{1}{2}"), "\\frac{1}{2}");
    EXPECT_EQ(repairCorruptedCommands("\\f\\sqrt{2}"), "\\sqrt{2}");
}

TEST(LatexNormalizerTest, IntactCommandsAndProseUntouched) {
    EXPECT_EQ(repairCorruptedCommands("\\frac{1}{2} + \\sqrt[3]{8}"), "\\frac{1}{2} + \\sqrt[3]{8}");
    EXPECT_EQ(repairCorruptedCommands("Fractions are fun"), "Fractions are fun");
    EXPECT_EQ(repairCorruptedCommands("\\arcsin{x}"), "\\arcsin{x}");
    EXPECT_EQ(repairCorruptedCommands("asin{x}"), "asin{x}");
    EXPECT_EQ(repairCorruptedCommands("2 times 3"), "2 times 3");
}

TEST(LatexNormalizerTest, CorruptedRepairIdempotent) {
    std::string once = repairCorruptedCommands("rac{1}{2} + qrt{x} + \\f\\frac{a}{b}");
    EXPECT_EQ(once, "\\frac{1}{2} + \\sqrt{x} + \\frac{a}{b}");
    EXPECT_EQ(repairCorruptedCommands(once), once);
}

// MARK: - Bare command words

TEST(LatexNormalizerTest, BareWordsGetBackslash) {
    EXPECT_EQ(repairBareCommands("x leq 5"), "x \\leq 5");
    EXPECT_EQ(repairBareCommands("a pm b"), "a \\pm b");
    EXPECT_EQ(repairBareCommands("2 imes 3"), "2 \\times 3");
    EXPECT_EQ(repairBareCommands("\\alpha + beta"), "\\alpha + \\beta");
    EXPECT_EQ(repairBareCommands("x neq infty"), "x \\neq \\infty");
}

TEST(LatexNormalizerTest, BareWordsInsideLongerWordsUntouched) {
    EXPECT_EQ(repairBareCommands("alphabet"), "alphabet");
    EXPECT_EQ(repairBareCommands("\\cdots"), "\\cdots");
    EXPECT_EQ(repairBareCommands("\\vartheta"), "\\vartheta");
    EXPECT_EQ(repairBareCommands("\\pmod{3}"), "\\pmod{3}");
    EXPECT_EQ(repairBareCommands("\\times"), "\\times");
}

TEST(LatexNormalizerTest, MathContentNormalizationIdempotent) {
    static const std::vector<std::string> fragments = {
        "x", "2", " ", "±", "²", "₁", "≤", "π", "√", "leq", "pm", "imes",
        "alpha", "\\beta", "{", "}", "=", "+", "\\frac{1}{2}", "\xc3\xa9",
    };
    std::mt19937 rng(23);
    std::uniform_int_distribution<size_t> pick(0, fragments.size() - 1);
    for (int i = 0; i < 1000; ++i) {
        std::string s;
        for (int j = 0; j < 10; ++j) s += fragments[pick(rng)];
        std::string once = normalizeMathContent(s);
        EXPECT_EQ(normalizeMathContent(once), once) << "input: " << s;
    }
}

// MARK: - Undelimited systems

TEST(LatexNormalizerTest, CommaSeparatedSystem) {
    EXPECT_EQ(convertEquationSystem("x+y=10, x-y=2"), "$x+y=10$, $x-y=2$");
}

TEST(LatexNormalizerTest, RunTogetherSystemWithSolvePrefix) {
    EXPECT_EQ(convertEquationSystem("Solve: 8x+3y=28 2x+y=8"),
              "Solve: $8x+3y=28$, $2x+y=8$");
}

TEST(LatexNormalizerTest, SemicolonAndNewlineSeparatedSystems) {
    EXPECT_EQ(convertEquationSystem("a + b = 3; a - b = 1"), "$a + b = 3$, $a - b = 1$");
    EXPECT_EQ(convertEquationSystem("System of equations:\nx + y = 10\nx - y = 2"),
              "System of equations:\n$x + y = 10$, $x - y = 2$");
}

TEST(LatexNormalizerTest, FullWidthCommaSeparates) {
    EXPECT_EQ(convertEquationSystem("x+y=10，x-y=2"), "$x+y=10$, $x-y=2$");
}

TEST(LatexNormalizerTest, NonSystemsUnchanged) {
    EXPECT_EQ(convertEquationSystem("Solve: $x^2 = 4$"), "Solve: $x^2 = 4$");
    EXPECT_EQ(convertEquationSystem("x = 3"), "x = 3");
    EXPECT_EQ(convertEquationSystem("Read the chapter."), "Read the chapter.");
    EXPECT_EQ(convertEquationSystem("\\begin{cases} x=1 \\\\ y=2 \\end{cases}"),
              "\\begin{cases} x=1 \\\\ y=2 \\end{cases}");
    EXPECT_EQ(convertEquationSystem(""), "");
}

TEST(LatexNormalizerTest, SegmentsOnlyMathTouched) {
    auto out = normalizeMathSegments({ContentSegment::text("x ≤ 4"), ContentSegment::math("x≤4")});
    ASSERT_EQ(out.size(), 2);
    EXPECT_EQ(out[0], ContentSegment::text("x ≤ 4"));
    EXPECT_EQ(out[1], ContentSegment::math("x\\leq 4"));
}

// MARK: - Pipeline

TEST(LatexNormalizerTest, UndelimitedSystemAssembledAsAlignedBlock) {
    auto segments = assembleSegments("Solve: x+y=10, x-y=2");
    ASSERT_EQ(segments.size(), 2);
    EXPECT_EQ(segments[0], ContentSegment::text("Solve:"));
    EXPECT_TRUE(segments[1].alignedSystem);
    EXPECT_TRUE(segments[1].displayMode);
    EXPECT_EQ(segments[1].content,
              "\\left\\{\\begin{aligned} x+y&=10 \\\\ x-y&=2 \\end{aligned}\\right.");
}

TEST(LatexNormalizerTest, UnicodeConvertedInMathOnly) {
    auto segments = assembleSegments("Since y ≥ 0, $y²≥0$");
    ASSERT_EQ(segments.size(), 2);
    EXPECT_EQ(segments[0], ContentSegment::text("Since y ≥ 0,"));
    EXPECT_EQ(segments[1], ContentSegment::math("y^2\\geq 0"));
}

TEST(LatexNormalizerTest, RestoredCommandTriggersMath) {
    auto segments = assembleSegments("Simplify rac{1}{2}x + 3");
    ASSERT_EQ(segments.size(), 2);
    EXPECT_EQ(segments[0], ContentSegment::text("Simplify"));
    EXPECT_EQ(segments[1], ContentSegment::math("\\frac{1}{2}x + 3"));
}

TEST(LatexNormalizerTest, RepairCanBeDisabled) {
    AssemblerOptions options;
    options.repairLatex = false;
    auto segments = assembleSegments("Simplify rac{1}{2}x + 3", options);
    ASSERT_EQ(segments.size(), 1);
    EXPECT_EQ(segments[0], ContentSegment::text("Simplify rac{1}{2}x + 3"));
}
