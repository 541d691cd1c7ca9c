#include <gtest/gtest.h>

#include "fake_document.hpp"
#include "title_extractor.hpp"

TEST(TitleExtractor, JoinsRequestForProposalLines) {
    std::vector<std::string> lines = {
        "RFP: Request for Proposal",
        "To Present a Proposal for Developing",
        "the Business Plan for the Ontario",
        "Digital Library",
        "The deadline for submissions is noted below.",
    };

    EXPECT_EQ(extract_title(lines, Outline_Config()),
              "RFP: Request for Proposal To Present a Proposal for Developing "
              "the Business Plan for the Ontario Digital Library");
}

TEST(TitleExtractor, DatedLinesAreLeftOut) {
    std::vector<std::string> lines = {
        "September 12, 2023",
        "RFP: Request for Proposal",
        "Digital Library Services",
        "The deadline for submissions is noted below.",
    };

    EXPECT_EQ(extract_title(lines, Outline_Config()), "RFP: Request for Proposal Digital Library Services");
}

TEST(TitleExtractor, BusinessPlanLine) {
    std::vector<std::string> lines = {"Cover", "Ontario Business Plan for 2024"};
    EXPECT_EQ(extract_title(lines, Outline_Config()), "Ontario Business Plan for 2024");
}

TEST(TitleExtractor, SubjectLineBeforeFirstLine) {
    std::vector<std::string> lines = {"Overview", "A Digital Library Roadmap"};
    EXPECT_EQ(extract_title(lines, Outline_Config()), "A Digital Library Roadmap");
}

TEST(TitleExtractor, FirstLineOtherwise) {
    EXPECT_EQ(extract_title({"Annual Report", "2024 Edition"}, Outline_Config()), "Annual Report");
    EXPECT_EQ(extract_title({}, Outline_Config()), TITLE_UNTITLED);
}

TEST(TitleExtractor, FirstPageOfDocument) {
    Fake_Document document(2);
    document.add_line(1, "Annual Report", 50, 20)
            .add_line(1, "Prepared by the finance office.", 100)
            .add_line(2, "Ontario Digital Library", 50, 20);

    EXPECT_EQ(extract_document_title(document, Outline_Config()), "Annual Report");
}

TEST(TitleExtractor, UntitledWithoutFirstPageText) {
    Fake_Document document(2);
    document.add_line(2, "Annual Report", 50, 20);
    EXPECT_EQ(extract_document_title(document, Outline_Config()), "Untitled");

    Fake_Document empty(0);
    EXPECT_EQ(extract_document_title(empty, Outline_Config()), "Untitled");
}
