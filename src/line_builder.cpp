#include "line_builder.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>

std::vector<Text_Line> build_text_lines(const std::vector<Char_Record>& chars, unsigned int page) {
    std::map<long, std::vector<const Char_Record*>> y_groups;
    for (const Char_Record& ch : chars) {
        y_groups[std::lround(ch.y0)].push_back(&ch);
    }

    std::vector<Text_Line> lines;
    lines.reserve(y_groups.size());

    // page space grows downward, so ascending y is top of page first
    for (auto& group : y_groups) {
        std::vector<const Char_Record*>& line_chars = group.second;
        std::stable_sort(line_chars.begin(), line_chars.end(),
                         [](const Char_Record* a, const Char_Record* b) { return a->x0 < b->x0; });

        std::string text;
        double size_sum = 0;
        double max_size = 0;
        double left_margin = line_chars.front()->x0;
        bool is_bold = false;

        for (const Char_Record* ch : line_chars) {
            text += ch->text;
            size_sum += ch->size;
            max_size = std::max(max_size, ch->size);
            left_margin = std::min(left_margin, ch->x0);
            if (!is_bold && to_lower_copy(ch->font_name).find("bold") != std::string::npos) {
                is_bold = true;
            }
        }

        text = trim_copy(text);
        if (text.empty()) {
            continue;
        }

        Text_Line line;
        line.text = std::move(text);
        line.avg_font_size = size_sum / static_cast<double>(line_chars.size());
        line.max_font_size = max_size;
        line.left_margin = left_margin;
        line.is_bold = is_bold;
        line.y_position = static_cast<double>(group.first);
        line.page = page;
        lines.push_back(std::move(line));
    }

    return lines;
}

std::string lines_to_text(const std::vector<Text_Line>& lines) {
    std::string text;
    for (const Text_Line& line : lines) {
        if (!text.empty()) {
            text += '\n';
        }
        text += line.text;
    }
    return text;
}
