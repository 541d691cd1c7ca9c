#include <gtest/gtest.h>

#include "fake_document.hpp"
#include "outline_extractor.hpp"

namespace {

const std::string BODY = "This document describes the overall approach taken by the project team in detail.";

Ocr_Word word(const std::string& text, double confidence, int top) {
    Ocr_Word w;
    w.text = text;
    w.confidence = confidence;
    w.top = top;
    w.height = 30;
    return w;
}

}

TEST(OutlineExtractor, NumberedHeadingAboveBodyText) {
    Fake_Document document;
    document.add_line(1, "1. Introduction", 72, 18)
            .add_line(1, BODY, 120, 11);

    Document_Outline outline = extract_outline(document, nullptr, nullptr, Outline_Config());
    ASSERT_EQ(outline.outline.size(), 1u);
    EXPECT_EQ(outline.outline[0].level, Heading_Level::H1);
    EXPECT_EQ(outline.outline[0].text, "1. Introduction");
    EXPECT_EQ(outline.outline[0].page, 1u);
    EXPECT_DOUBLE_EQ(outline.outline[0].position, 72);
}

TEST(OutlineExtractor, HeadingsOfSeveralPagesInReadingOrder) {
    Fake_Document document(2);
    document.add_line(1, "1. Introduction", 72, 18)
            .add_line(1, BODY, 120, 11)
            .add_line(2, "2. Background Work", 72, 18)
            .add_line(2, BODY, 120, 11);

    std::vector<Hierarchy_Decision> trace;
    Document_Outline outline = extract_outline(document, nullptr, nullptr, Outline_Config(), &trace);
    ASSERT_EQ(outline.outline.size(), 2u);
    EXPECT_EQ(outline.outline[0].text, "1. Introduction");
    EXPECT_EQ(outline.outline[1].text, "2. Background Work");
    EXPECT_EQ(outline.outline[1].page, 2u);
    EXPECT_EQ(trace.size(), 2u);
}

TEST(OutlineExtractor, SameInputSameOutline) {
    Fake_Document document(2);
    document.add_line(1, "1. Introduction", 72, 18)
            .add_line(1, BODY, 120, 11)
            .add_line(2, "2. Background Work", 72, 18);

    Document_Outline first = extract_outline(document, nullptr, nullptr, Outline_Config());
    Document_Outline second = extract_outline(document, nullptr, nullptr, Outline_Config());
    EXPECT_EQ(first.title, second.title);
    EXPECT_EQ(first.outline, second.outline);
}

TEST(OutlineExtractor, ScanWithoutConfidentWordsIsUntitledAndEmpty) {
    Fake_Document document(1);
    document.set_image(1, blank_image());
    Fake_Ocr_Engine engine({word("smudge", 12, 100), word("blur", 25, 200)});

    Document_Outline outline = extract_outline(document, &engine, nullptr, Outline_Config());
    EXPECT_EQ(outline.title, "Untitled");
    EXPECT_TRUE(outline.outline.empty());
    EXPECT_FALSE(engine.languages.empty());
}

TEST(OutlineExtractor, ScannedPageHeadingsComeFromOcr) {
    Fake_Document document(2);
    document.add_line(1, "1. Introduction", 72, 18)
            .add_line(1, BODY, 120, 11)
            .set_image(2, blank_image());
    Fake_Ocr_Engine engine({word("Summary", 92, 300)});

    Document_Outline outline = extract_outline(document, &engine, nullptr, Outline_Config());
    ASSERT_EQ(outline.outline.size(), 2u);
    EXPECT_EQ(outline.outline[1].text, "Summary");
    EXPECT_EQ(outline.outline[1].level, Heading_Level::H3);
    EXPECT_EQ(outline.outline[1].page, 2u);
}

TEST(OutlineExtractor, ImagePagesSkippedWithoutOcr) {
    Fake_Document document(1);
    document.set_image(1, blank_image());

    Document_Outline outline = extract_outline(document, nullptr, nullptr, Outline_Config());
    EXPECT_EQ(outline.title, "Untitled");
    EXPECT_TRUE(outline.outline.empty());
}

TEST(OutlineExtractor, UnreadableFile) {
    EXPECT_FALSE(extract_outline("/nonexistent/document.pdf", nullptr, nullptr, Outline_Config()));
}
