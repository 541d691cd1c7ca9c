#include "outline_types.hpp"

const char* level_name(Heading_Level level) {
    switch (level) {
        case Heading_Level::H1: return "H1";
        case Heading_Level::H2: return "H2";
        case Heading_Level::H3: return "H3";
        case Heading_Level::H4: return "H4";
    }
    return "H4";
}

unsigned int level_depth(Heading_Level level) {
    return static_cast<unsigned int>(level);
}

std::ostream& operator<<(std::ostream& os, Heading_Level level) {
    return os << level_name(level);
}

bool Outline_Item::operator==(const Outline_Item& other) const {
    return level == other.level &&
           text == other.text &&
           page == other.page &&
           position == other.position;
}

bool Outline_Item::operator!=(const Outline_Item& other) const {
    return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const Outline_Item& item) {
    os << item.level << " \"" << item.text << "\" page " << item.page << " @" << item.position;
    return os;
}
