#include <gtest/gtest.h>

#include "fake_document.hpp"
#include "section_extractor.hpp"
#include "string_utils.hpp"

namespace {

Outline_Item heading(const std::string& text, unsigned int page, double position,
                     Heading_Level level = Heading_Level::H1) {
    Outline_Item item;
    item.level = level;
    item.text = text;
    item.page = page;
    item.position = position;
    return item;
}

Fake_Document three_sections() {
    Fake_Document document(2);
    document.add_line(1, "1. Alpha", 100, 18)
            .add_line(1, "alpha body", 150)
            .add_line(1, "2. Beta", 400, 18)
            .add_line(1, "beta body", 450)
            .add_line(2, "middle text", 100)
            .add_line(2, "3. Gamma", 300, 18)
            .add_line(2, "gamma body", 350);
    return document;
}

const std::vector<Outline_Item> OUTLINE = {
    heading("1. Alpha", 1, 100),
    heading("2. Beta", 1, 400),
    heading("3. Gamma", 2, 300),
};

}

TEST(SectionExtractor, StopsAtNextHeadingOnSamePage) {
    Fake_Document document = three_sections();
    EXPECT_EQ(extract_section_content(document, OUTLINE[0], OUTLINE), "1. Alpha alpha body");
}

TEST(SectionExtractor, SpansPagesUntilNextHeading) {
    Fake_Document document = three_sections();
    EXPECT_EQ(extract_section_content(document, OUTLINE[1], OUTLINE), "2. Beta beta body middle text");
}

TEST(SectionExtractor, SpansWholeIntermediatePages) {
    Fake_Document document(5);
    document.add_line(1, "1. Alpha", 100, 18)
            .add_line(2, "page two text", 100)
            .add_line(3, "page three above beta", 200)
            .add_line(3, "2. Beta", 300, 18)
            .add_line(3, "page three below beta", 400)
            .add_line(4, "page four top", 50)
            .add_line(4, "page four bottom", 700)
            .add_line(5, "page five above gamma", 100)
            .add_line(5, "3. Gamma", 400, 18)
            .add_line(5, "page five below gamma", 500);

    std::vector<Outline_Item> outline = {
        heading("1. Alpha", 1, 100),
        heading("2. Beta", 3, 300),
        heading("3. Gamma", 5, 400),
    };

    const std::string content = extract_section_content(document, outline[1], outline);
    EXPECT_EQ(content, "2. Beta page three below beta page four top page four bottom page five above gamma");
    EXPECT_EQ(content.find("page two text"), std::string::npos);
    EXPECT_EQ(content.find("page three above beta"), std::string::npos);
    EXPECT_EQ(content.find("3. Gamma"), std::string::npos);
    EXPECT_EQ(content.find("page five below gamma"), std::string::npos);

    EXPECT_EQ(extract_section_content(document, outline[0], outline),
              "1. Alpha page two text page three above beta");
}

TEST(SectionExtractor, LastHeadingRunsToEndOfDocument) {
    Fake_Document document = three_sections();
    EXPECT_EQ(extract_section_content(document, OUTLINE[2], OUTLINE), "3. Gamma gamma body");
}

TEST(SectionExtractor, EmptyCropUsesHeadingPage) {
    Fake_Document document = three_sections();
    std::vector<Outline_Item> outline = {heading("2. Beta", 1, 400), heading("Beta Notes", 1, 400)};

    EXPECT_EQ(extract_section_content(document, outline[0], outline),
              "1. Alpha\nalpha body\n2. Beta\nbeta body");
}

TEST(SectionExtractor, UnknownHeadingTakesLeadingSentences) {
    Fake_Document document;
    document.add_line(1, "One. Two. Three. Four. Five. Six.", 100);

    std::vector<Outline_Item> outline = {heading("Other", 1, 10)};
    EXPECT_EQ(extract_section_content(document, heading("Missing Heading", 1, 50), outline),
              "One. Two. Three. Four. Five.");
}

TEST(SectionExtractor, NeighbourPageExcerpt) {
    const std::string text = "A neighbouring page carries enough words to stand in for this section";
    Fake_Document document(3);
    document.add_line(2, text, 100);

    EXPECT_EQ(fallback_section_content(document, heading("Summary", 3, 50)), text);
}

TEST(SectionExtractor, AnyPageExcerptIsShortened) {
    Fake_Document document(5);
    document.add_line(1, "The opening page describes the purpose of the whole collection", 100)
            .add_line(1, "and it continues on a second line so the excerpt is long enough", 120);

    std::string text = fallback_section_content(document, heading("Appendix", 5, 50));
    EXPECT_TRUE(starts_with(text, "The opening page describes the purpose of the whole collection and it"));
    EXPECT_TRUE(ends_with(text, "..."));
}

TEST(SectionExtractor, SynthesizedWhenDocumentHasNoText) {
    Fake_Document document(3);
    EXPECT_EQ(extract_section_content(document, heading("Summary", 3, 50), {}),
              "This section covers summary and contains relevant information (from page 3).");
}

TEST(SectionExtractor, NeverEmpty) {
    Fake_Document document(2);
    document.add_line(1, "Lonely Heading", 700, 18);
    std::vector<Outline_Item> outline = {heading("Lonely Heading", 2, 100)};

    EXPECT_FALSE(trim_copy(extract_section_content(document, outline[0], outline)).empty());
}

TEST(SectionExtractor, UnreadableFileIsSynthesized) {
    EXPECT_EQ(extract_section_content("/nonexistent/document.pdf", heading("Budget", 4, 10), {}),
              "This section covers budget and contains relevant information (from page 4).");
}
