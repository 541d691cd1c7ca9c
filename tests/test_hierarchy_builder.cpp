#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>

#include "hierarchy_builder.hpp"
#include "string_utils.hpp"

namespace {

Heading_Candidate candidate(const std::string& text, Heading_Level level, unsigned int page,
                            double position, double confidence = 0.9) {
    Heading_Candidate c;
    c.text = text;
    c.level = level;
    c.page = page;
    c.position = position;
    c.confidence = confidence;
    c.font_size = 14;
    return c;
}

}

TEST(HierarchyPath, EnteringALevelClosesDeeperSlots) {
    Hierarchy_Path path;
    path.enter(Heading_Level::H1, "Alpha", 50);
    path.enter(Heading_Level::H2, "Beta", 50);
    path.enter(Heading_Level::H3, "Gamma", 50);
    EXPECT_EQ(path.depth(), 3u);

    path.enter(Heading_Level::H2, "Delta", 50);
    EXPECT_EQ(path.depth(), 2u);
    EXPECT_EQ(*path.slot(0), "Alpha");
    EXPECT_EQ(*path.slot(1), "Delta");
    EXPECT_FALSE(path.slot(2));
    EXPECT_FALSE(path.slot(3));

    path.enter(Heading_Level::H1, "Epsilon", 50);
    EXPECT_EQ(path.labels(), std::vector<std::string>{"Epsilon"});
}

TEST(HierarchyPath, LabelsAreTruncated) {
    Hierarchy_Path path;
    path.enter(Heading_Level::H4, std::string(80, 'x'), 50);
    EXPECT_EQ(path.depth(), 4u);
    EXPECT_EQ(path.slot(3)->size(), 50u);
}

TEST(HierarchyBuilder, NearDuplicateSummaryYieldsOneEntry) {
    Outline_Config config;
    Hierarchy_Builder builder(config);
    EXPECT_TRUE(builder.consider(candidate("Summary", Heading_Level::H2, 1, 100, 0.9)));
    EXPECT_FALSE(builder.consider(candidate("Summary ", Heading_Level::H2, 1, 120, 0.9)));

    ASSERT_EQ(builder.outline().size(), 1u);
    EXPECT_EQ(builder.outline()[0].text, "Summary");
    EXPECT_EQ(builder.trace().back().reason, "duplicate");
}

TEST(HierarchyBuilder, RejectionReasonsAreTraced) {
    Outline_Config config;
    Hierarchy_Builder builder(config);

    EXPECT_FALSE(builder.consider(candidate("Project Scope", Heading_Level::H2, 1, 10, 0.58)));
    EXPECT_FALSE(builder.consider(candidate("results will be shown", Heading_Level::H2, 1, 20)));
    EXPECT_FALSE(builder.consider(candidate("2023 - Launch", Heading_Level::H3, 1, 30)));
    EXPECT_FALSE(builder.consider(candidate("Email: info@x.com", Heading_Level::H2, 1, 40)));
    EXPECT_TRUE(builder.consider(candidate("Beach Activities", Heading_Level::H2, 1, 50)));

    const std::vector<Hierarchy_Decision>& trace = builder.trace();
    ASSERT_EQ(trace.size(), 5u);
    EXPECT_EQ(trace[0].reason, "low_confidence");
    EXPECT_EQ(trace[1].reason, "fragment:lowercase_start");
    EXPECT_EQ(trace[2].reason, "breaks_path:timeline_entry");
    EXPECT_EQ(trace[3].reason, "not_meaningful:email_or_url");
    EXPECT_TRUE(trace[4].accepted);
    EXPECT_EQ(trace[4].path, std::vector<std::string>{"Beach Activities"});
}

TEST(HierarchyBuilder, ContextualDuplicateOfRecentHeading) {
    Outline_Config config;
    Hierarchy_Builder builder(config);
    EXPECT_TRUE(builder.consider(candidate("Regional Travel Planning Guide", Heading_Level::H1, 1, 10)));
    EXPECT_FALSE(builder.consider(candidate("Regional Travel Planning", Heading_Level::H2, 1, 20)));
    EXPECT_EQ(builder.trace().back().reason, "contextual_duplicate");

    // outside the recent window the overlap no longer matters
    EXPECT_TRUE(builder.consider(candidate("Coastal Walks", Heading_Level::H2, 2, 10)));
    EXPECT_TRUE(builder.consider(candidate("Mountain Trails", Heading_Level::H2, 2, 20)));
    EXPECT_TRUE(builder.consider(candidate("Local Cuisine", Heading_Level::H2, 2, 30)));
    EXPECT_TRUE(builder.consider(candidate("Regional Travel Planning", Heading_Level::H2, 3, 10)));
}

TEST(HierarchyBuilder, CaseInsensitiveDuplicatesAreSuppressed) {
    std::vector<Heading_Candidate> candidates = {
        candidate("BACKGROUND", Heading_Level::H1, 1, 10),
        candidate("Coastal Walks", Heading_Level::H2, 1, 20),
        candidate("Mountain Trails", Heading_Level::H2, 2, 20),
        candidate("Local Cuisine", Heading_Level::H2, 3, 20),
        candidate("Background", Heading_Level::H1, 4, 10),
    };

    std::vector<Outline_Item> outline = build_document_hierarchy(candidates, Outline_Config());
    std::set<std::string> seen;
    for (const Outline_Item& item : outline) {
        EXPECT_TRUE(seen.insert(to_lower_copy(item.text)).second) << item.text;
    }
    EXPECT_EQ(outline.size(), 4u);
}

TEST(HierarchyBuilder, AccentedHeadingsAndCaseVariants) {
    Outline_Config config;
    Hierarchy_Builder builder(config);
    EXPECT_TRUE(builder.consider(candidate("\xc3\x89TAT G\xc3\x89N\xc3\x89RAL", Heading_Level::H1, 1, 10)));
    EXPECT_TRUE(builder.consider(candidate("R\xc3\xa9sum\xc3\xa9 Overview", Heading_Level::H2, 1, 20)));
    EXPECT_FALSE(builder.consider(candidate("\xc3\x89tat G\xc3\xa9n\xc3\xa9ral", Heading_Level::H1, 2, 10)));
    EXPECT_EQ(builder.trace().back().reason, "duplicate");
    EXPECT_FALSE(builder.consider(candidate("\xc3\xa9lan of the team", Heading_Level::H2, 2, 30)));
    EXPECT_EQ(builder.trace().back().reason, "fragment:lowercase_start");

    ASSERT_EQ(builder.outline().size(), 2u);
    EXPECT_EQ(builder.outline()[1].text, "R\xc3\xa9sum\xc3\xa9 Overview");
}

TEST(HierarchyBuilder, OutlineFollowsReadingOrder) {
    std::vector<Heading_Candidate> candidates = {
        candidate("3. Results", Heading_Level::H1, 3, 100),
        candidate("1. Introduction", Heading_Level::H1, 1, 300),
        candidate("2. Methods", Heading_Level::H1, 1, 500),
        candidate("2.1 Sampling Plan", Heading_Level::H2, 2, 50),
    };

    std::vector<Outline_Item> outline = build_document_hierarchy(candidates, Outline_Config());
    ASSERT_EQ(outline.size(), 4u);
    for (size_t i = 1; i < outline.size(); ++i) {
        const bool ordered = outline[i - 1].page < outline[i].page ||
                             (outline[i - 1].page == outline[i].page && outline[i - 1].position <= outline[i].position);
        EXPECT_TRUE(ordered) << outline[i - 1] << " before " << outline[i];
    }
    EXPECT_EQ(outline[0].text, "1. Introduction");
    EXPECT_EQ(outline[3].text, "3. Results");
}

TEST(HierarchyBuilder, OutlineIsCapped) {
    std::vector<Heading_Candidate> candidates;
    for (unsigned int i = 1; i <= 50; ++i) {
        candidates.push_back(candidate(std::to_string(i) + ". Chapter", Heading_Level::H1, i, 100));
    }

    std::vector<Hierarchy_Decision> trace;
    std::vector<Outline_Item> outline = build_document_hierarchy(candidates, Outline_Config(), &trace);
    EXPECT_EQ(outline.size(), 40u);
    EXPECT_EQ(outline.back().text, "40. Chapter");
    EXPECT_EQ(trace.size(), 50u);
}

TEST(HierarchyBuilder, NoCandidatesNoOutline) {
    EXPECT_TRUE(build_document_hierarchy({}, Outline_Config()).empty());
}
