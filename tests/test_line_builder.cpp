#include <gtest/gtest.h>

#include "fake_document.hpp"
#include "line_builder.hpp"

namespace {

Char_Record glyph(const std::string& text, double x0, double y0, double size = 10, const std::string& font = "Times") {
    Char_Record ch;
    ch.text = text;
    ch.x0 = x0;
    ch.y0 = y0;
    ch.size = size;
    ch.font_name = font;
    return ch;
}

}

TEST(LineBuilder, GroupsByRoundedBaselineAndSortsLeftToRight) {
    std::vector<Char_Record> chars = {
        glyph("b", 20, 100.4),
        glyph("a", 10, 99.6),
        glyph("c", 30, 100.0),
    };

    std::vector<Text_Line> lines = build_text_lines(chars, 3);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "abc");
    EXPECT_DOUBLE_EQ(lines[0].y_position, 100);
    EXPECT_DOUBLE_EQ(lines[0].left_margin, 10);
    EXPECT_EQ(lines[0].page, 3u);
}

TEST(LineBuilder, EmitsTopOfPageFirst) {
    std::vector<Char_Record> chars = {
        glyph("z", 10, 500),
        glyph("y", 10, 300),
        glyph("x", 10, 100),
    };

    std::vector<Text_Line> lines = build_text_lines(chars, 1);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].text, "x");
    EXPECT_EQ(lines[1].text, "y");
    EXPECT_EQ(lines[2].text, "z");
}

TEST(LineBuilder, ComputesFontStatistics) {
    std::vector<Char_Record> chars = {
        glyph("A", 10, 50, 10, "Arial-BoldMT"),
        glyph("B", 20, 50, 14, "ArialMT"),
    };

    std::vector<Text_Line> lines = build_text_lines(chars, 1);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_DOUBLE_EQ(lines[0].avg_font_size, 12);
    EXPECT_DOUBLE_EQ(lines[0].max_font_size, 14);
    EXPECT_TRUE(lines[0].is_bold);
}

TEST(LineBuilder, DropsBlankLinesAndTrims) {
    std::vector<Char_Record> chars = {
        glyph(" ", 10, 50),
        glyph(" ", 20, 50),
        glyph(" ", 5, 80),
        glyph("x", 10, 80),
        glyph(" ", 15, 80),
    };

    std::vector<Text_Line> lines = build_text_lines(chars, 1);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "x");
    EXPECT_FALSE(lines[0].is_bold);
}

TEST(LineBuilder, EmptyPageHasNoLines) {
    EXPECT_TRUE(build_text_lines({}, 1).empty());
    EXPECT_EQ(lines_to_text({}), "");
}

TEST(PageRegionText, KeepsLinesInsideHalfOpenRange) {
    Fake_Document document;
    document.add_line(1, "first", 100)
            .add_line(1, "second", 200)
            .add_line(1, "third", 300);

    EXPECT_EQ(page_region_text(document, 0, 100, 300), "first\nsecond");
    EXPECT_EQ(page_region_text(document, 0, 150, 1000), "second\nthird");
    EXPECT_EQ(page_full_text(document, 0), "first\nsecond\nthird");
    EXPECT_EQ(page_region_text(document, 0, 310, 400), "");
}
