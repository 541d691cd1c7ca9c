#include "document_source.hpp"
#include "line_builder.hpp"

#include <cmath>
#include <limits>

std::string page_region_text(const Document_Source& source, unsigned int index, double top, double bottom) {
    Page_Geometry geometry = source.page_geometry(index);

    std::vector<Char_Record> region;
    region.reserve(geometry.chars.size());
    for (Char_Record& ch : geometry.chars) {
        // same rounding as the line grouping so a line is never split by the crop
        const double line_y = static_cast<double>(std::lround(ch.y0));
        if (line_y >= top && line_y < bottom) {
            region.push_back(std::move(ch));
        }
    }

    return lines_to_text(build_text_lines(region, index + 1));
}

std::string page_full_text(const Document_Source& source, unsigned int index) {
    return page_region_text(source, index,
                            -std::numeric_limits<double>::infinity(),
                            std::numeric_limits<double>::infinity());
}
