#pragma once

#include <ostream>
#include <string>
#include <vector>

enum class Heading_Level {H1, H2, H3, H4};

const char* level_name(Heading_Level level);

// ancestor slots retained above a heading of this level (H1 = 0 ... H4 = 3)
unsigned int level_depth(Heading_Level level);

std::ostream& operator<<(std::ostream& os, Heading_Level level);

/* One glyph as reported by the page geometry provider. Coordinates are in
 * page space with the origin at the top-left corner, y growing downward.
 */
struct Char_Record {
    std::string text;
    double x0 = 0;
    double y0 = 0;
    double size = 0;
    std::string font_name;
};

struct Page_Geometry {
    std::vector<Char_Record> chars;
    double width = 0;
    double height = 0;
};

/* A visual line rebuilt from the characters sharing a rounded y. */
struct Text_Line {
    std::string text;
    double avg_font_size = 0;
    double max_font_size = 0;
    double left_margin = 0;
    bool is_bold = false;
    double y_position = 0;
    unsigned int page = 0;
};

struct Heading_Candidate {
    std::string text;
    Heading_Level level = Heading_Level::H4;
    unsigned int page = 0;
    double confidence = 0;
    double font_size = 0;
    double position = 0;
};

/* position is not serialized but the section extractor needs it to crop
 * the page between two consecutive headings.
 */
struct Outline_Item {
    Heading_Level level = Heading_Level::H4;
    std::string text;
    unsigned int page = 0;
    double position = 0;

    bool operator==(const Outline_Item& other) const;
    bool operator!=(const Outline_Item& other) const;
};

struct Document_Outline {
    std::string title;
    std::vector<Outline_Item> outline;
};

struct Ranked_Section {
    Outline_Item item;
    std::string document;
    double relevance_score = 0;
};

std::ostream& operator<<(std::ostream& os, const Outline_Item& item);
