#include <gtest/gtest.h>

#include "canvas/text/font_manager.h"
#include "canvas/text/text_measure.h"

#include <cmath>

using namespace canvas;
using namespace canvas::text;

namespace {

const char* kFontPaths[] = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
    "/usr/share/fonts/liberation-sans/LiberationSans-Regular.ttf",
    "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
};

std::vector<std::string> lineTexts(const TextMeasurement& m) {
    std::vector<std::string> out;
    for (const MeasuredLine& line : m.lines) out.push_back(line.text);
    return out;
}

class TextMeasureFontTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(fontManager.initialize());
        for (const char* path : kFontPaths) {
            fontId = fontManager.loadFontFromFile(path, "Gallery Sans");
            if (fontId != 0) break;
        }
        if (fontId == 0) {
            GTEST_SKIP() << "No system font available for testing";
        }
    }

    void TearDown() override {
        fontManager.shutdown();
    }

    FontManager fontManager;
    std::uint32_t fontId = 0;
};

} // namespace

// Without any loaded font advances are fontSize * 0.6 per codepoint.

TEST(TextMeasureTest, EstimatesWithoutFonts) {
    FontManager fonts;
    TextMeasurer measurer(fonts);

    EXPECT_FLOAT_EQ(measurer.measureRun("hello", 0, 10.0f), 30.0f);
    EXPECT_FLOAT_EQ(measurer.measureRun("h\xC3\xA9llo", 0, 10.0f), 30.0f);
    EXPECT_FLOAT_EQ(measurer.measureRun("", 0, 10.0f), 0.0f);
    EXPECT_FLOAT_EQ(measurer.measureRun("abc", 0, 0.0f), 0.0f);

    const TextMeasurement m = measurer.measure("hello", "Arial", 10.0f, std::nullopt);
    EXPECT_EQ(m.fontId, 0u);
    ASSERT_EQ(m.lines.size(), 1u);
    EXPECT_FLOAT_EQ(m.width, 30.0f);
    EXPECT_FLOAT_EQ(m.lineHeight, 12.0f);
    EXPECT_FLOAT_EQ(m.height, 12.0f);
}

TEST(TextMeasureTest, WrapsGreedilyAtSpaces) {
    FontManager fonts;
    TextMeasurer measurer(fonts);

    const TextMeasurement m = measurer.measure("the quick brown fox", "Arial", 10.0f, 60.0f);
    EXPECT_EQ(lineTexts(m), (std::vector<std::string>{"the quick", "brown fox"}));
    EXPECT_FLOAT_EQ(m.width, 54.0f);
    EXPECT_FLOAT_EQ(m.height, 24.0f);
}

TEST(TextMeasureTest, LongWordGetsItsOwnLine) {
    FontManager fonts;
    TextMeasurer measurer(fonts);

    const TextMeasurement m = measurer.measure("a extraordinarily b", "Arial", 10.0f, 30.0f);
    EXPECT_EQ(lineTexts(m), (std::vector<std::string>{"a", "extraordinarily", "b"}));
    EXPECT_FLOAT_EQ(m.width, 90.0f);
}

TEST(TextMeasureTest, ExplicitNewlinesAlwaysBreak) {
    FontManager fonts;
    TextMeasurer measurer(fonts);

    const TextMeasurement m = measurer.measure("one\n\nthree", "Arial", 10.0f, std::nullopt);
    EXPECT_EQ(lineTexts(m), (std::vector<std::string>{"one", "", "three"}));
    EXPECT_FLOAT_EQ(m.height, 36.0f);
}

TEST(TextMeasureTest, MeasuresTextShape) {
    FontManager fonts;
    TextMeasurer measurer(fonts);

    TextShape shape{};
    shape.text = "aa bb cc";
    shape.fontSize = 10.0f;
    shape.width = 30.0f;
    const TextMeasurement m = measurer.measure(shape);
    EXPECT_EQ(lineTexts(m), (std::vector<std::string>{"aa bb", "cc"}));
}

TEST(TextMeasureTest, ParsesFontStyle) {
    bool bold = true;
    bool italic = true;
    parseFontStyle("normal", bold, italic);
    EXPECT_FALSE(bold);
    EXPECT_FALSE(italic);

    parseFontStyle("Bold  Italic", bold, italic);
    EXPECT_TRUE(bold);
    EXPECT_TRUE(italic);

    parseFontStyle("oblique", bold, italic);
    EXPECT_FALSE(bold);
    EXPECT_TRUE(italic);

    parseFontStyle("bolder", bold, italic);
    EXPECT_FALSE(bold);
}

TEST_F(TextMeasureFontTest, ResolvesFamilyAndFallsBackToDefault) {
    EXPECT_EQ(fontManager.getDefaultFontId(), fontId);
    EXPECT_EQ(fontManager.resolveFont("gallery sans", false, false), fontId);
    EXPECT_EQ(fontManager.resolveFont("'Gallery Sans', serif", true, false), fontId);
    EXPECT_EQ(fontManager.resolveFont("Unknown Family", false, true), fontId);

    const auto families = fontManager.getFamilies();
    ASSERT_EQ(families.size(), 1u);
}

TEST_F(TextMeasureFontTest, ShapedAdvanceGrowsWithText) {
    TextMeasurer measurer(fontManager);
    const float shortRun = measurer.measureRun("Hi", fontId, 16.0f);
    const float longRun = measurer.measureRun("Hi there, gallery", fontId, 16.0f);
    EXPECT_GT(shortRun, 0.0f);
    EXPECT_GT(longRun, shortRun);

    // Doubling the size roughly doubles the advance.
    const float doubled = measurer.measureRun("Hi there, gallery", fontId, 32.0f);
    EXPECT_NEAR(doubled, longRun * 2.0f, longRun * 0.15f);
}

TEST_F(TextMeasureFontTest, MeasureUsesLoadedFont) {
    TextMeasurer measurer(fontManager);
    const TextMeasurement m = measurer.measure("Spring show opening night", "Gallery Sans", 20.0f, 120.0f);
    EXPECT_EQ(m.fontId, fontId);
    EXPECT_GT(m.lines.size(), 1u);
    for (const MeasuredLine& line : m.lines) {
        if (line.text.find(' ') != std::string::npos) {
            EXPECT_LE(line.width, 120.0f) << line.text;
        }
    }
    EXPECT_FLOAT_EQ(m.height, static_cast<float>(m.lines.size()) * 24.0f);
}

TEST_F(TextMeasureFontTest, ScaledMetricsFollowFontSize) {
    const FontMetrics m = fontManager.getScaledMetrics(fontId, 20.0f);
    EXPECT_GT(m.ascender, 0.0f);
    EXPECT_LT(m.descender, 0.0f);
    EXPECT_LT(m.ascender, 40.0f);
}

TEST_F(TextMeasureFontTest, UnloadResetsDefault) {
    EXPECT_TRUE(fontManager.unloadFont(fontId));
    EXPECT_FALSE(fontManager.hasFont(fontId));
    EXPECT_EQ(fontManager.getDefaultFontId(), 0u);
    EXPECT_EQ(fontManager.resolveFont("Gallery Sans", false, false), 0u);
}
