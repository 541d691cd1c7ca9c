#include "title_extractor.hpp"
#include "line_builder.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace {

const size_t RFP_SCAN_LINES = 20;
const size_t PROPOSAL_SCAN_LINES = 15;
const size_t COMPOSE_SCAN_LINES = 10;
const size_t FALLBACK_SCAN_LINES = 8;

bool starts_with_digit(const std::string& line) {
    return !line.empty() && std::isdigit(static_cast<unsigned char>(line[0]));
}

bool starts_with_month(const std::string& lower) {
    return starts_with_any(lower, {"january", "february", "march", "april", "may ", "june", "july",
                                   "august", "september", "october", "november", "december"});
}

bool has_continuation_keyword(const std::string& lower) {
    return contains_any(lower, {"proposal", "developing", "business", "plan", "ontario", "digital", "library"});
}

bool has_subject_keyword(const std::string& lower) {
    return contains_any(lower, {"ontario", "digital", "library"});
}

bool is_rfp_line(const std::string& lower) {
    return (lower.find("rfp") != std::string::npos && lower.find("request") != std::string::npos) ||
           lower.find("request for proposal") != std::string::npos;
}

bool is_proposal_opener(const std::string& lower) {
    return lower.find("to present") != std::string::npos && lower.find("proposal") != std::string::npos;
}

// Method 1: explicit request for proposal language, widened a few lines back and forward
void rfp_titles(const std::vector<std::string>& lines, std::vector<std::string>& candidates) {
    const size_t limit = std::min(lines.size(), RFP_SCAN_LINES);
    for (size_t i = 0; i < limit; ++i) {
        if (!is_rfp_line(to_lower_copy(lines[i]))) {
            continue;
        }

        std::vector<std::string> parts;
        for (size_t j = (i >= 3 ? i - 3 : 0); j <= i; ++j) {
            const std::string& line = lines[j];
            if (utf8_length(line) > 5 && !starts_with_digit(line) && !starts_with_month(to_lower_copy(line))) {
                parts.push_back(line);
            }
        }

        for (size_t j = i + 1; j < std::min(i + 8, lines.size()); ++j) {
            const std::string& next_line = lines[j];
            const std::string lower = to_lower_copy(next_line);
            if (!next_line.empty() && utf8_length(next_line) > 5 && has_continuation_keyword(lower) && !starts_with_month(lower)) {
                parts.push_back(next_line);
            } else if (!next_line.empty() && utf8_length(next_line) < 80 && !ends_with(next_line, ".")) {
                parts.push_back(next_line);
            } else {
                break;
            }
        }

        if (!parts.empty()) {
            std::string title = collapse_whitespace(join(parts, " "));
            if (utf8_length(title) > 20) {
                candidates.push_back(title);
            }
        }
    }
}

// Method 2: "to present a proposal" opener followed by its continuation lines
void proposal_titles(const std::vector<std::string>& lines, std::vector<std::string>& candidates) {
    const size_t limit = std::min(lines.size(), PROPOSAL_SCAN_LINES);
    for (size_t i = 0; i < limit; ++i) {
        if (!is_proposal_opener(to_lower_copy(lines[i]))) {
            continue;
        }

        std::vector<std::string> parts{lines[i]};
        for (size_t j = i + 1; j < std::min(i + 5, lines.size()); ++j) {
            const std::string lower = to_lower_copy(lines[j]);
            if (contains_any(lower, {"developing", "business", "plan", "ontario", "digital", "library"})) {
                parts.push_back(lines[j]);
            } else {
                break;
            }
        }

        if (parts.size() > 1) {
            candidates.push_back(join(parts, " "));
        }
    }
}

// Method 3: a single business plan line naming its subject
void business_plan_titles(const std::vector<std::string>& lines, std::vector<std::string>& candidates) {
    const size_t limit = std::min(lines.size(), COMPOSE_SCAN_LINES);
    for (size_t i = 0; i < limit; ++i) {
        const std::string lower = to_lower_copy(lines[i]);
        if (utf8_length(lines[i]) > 20 && lower.find("business plan") != std::string::npos && has_subject_keyword(lower)) {
            candidates.push_back(lines[i]);
        }
    }
}

// Method 4: glue together the components scattered over the first lines
void composed_titles(const std::vector<std::string>& lines, std::vector<std::string>& candidates) {
    const std::string* rfp_line = nullptr;
    const std::string* proposal_line = nullptr;
    const std::string* business_line = nullptr;

    const size_t limit = std::min(lines.size(), COMPOSE_SCAN_LINES);
    for (size_t i = 0; i < limit; ++i) {
        const std::string lower = to_lower_copy(lines[i]);
        if (lower.find("rfp") != std::string::npos || lower.find("request for proposal") != std::string::npos) {
            rfp_line = &lines[i];
        } else if (is_proposal_opener(lower)) {
            proposal_line = &lines[i];
        } else if (lower.find("business plan") != std::string::npos && lower.find("ontario") != std::string::npos) {
            business_line = &lines[i];
        }
    }

    if (rfp_line && (proposal_line || business_line)) {
        std::vector<std::string> components{*rfp_line};
        if (proposal_line) {
            components.push_back(*proposal_line);
        }
        if (business_line) {
            components.push_back(*business_line);
        }
        candidates.push_back(join(components, " "));
    }
}

}

std::string extract_title(const std::vector<std::string>& lines, const Outline_Config& config) {
    std::vector<std::string> candidates;

    rfp_titles(lines, candidates);
    if (candidates.empty()) {
        proposal_titles(lines, candidates);
    }
    if (candidates.empty()) {
        business_plan_titles(lines, candidates);
    }
    if (candidates.empty()) {
        composed_titles(lines, candidates);
    }

    if (!candidates.empty()) {
        // the longest candidate is assumed to be the most complete one
        auto best = std::max_element(candidates.begin(), candidates.end(),
                                     [](const std::string& a, const std::string& b) { return utf8_length(a) < utf8_length(b); });
        std::string title = collapse_whitespace(*best);

        if (utf8_length(title) > config.title_max_length) {
            std::vector<std::string> sentences = split_on(title, ".");
            if (sentences.size() > 1 && utf8_length(sentences[0]) > 30) {
                title = trim_copy(sentences[0]);
            }
        }
        return title;
    }

    const size_t limit = std::min(lines.size(), FALLBACK_SCAN_LINES);
    for (size_t i = 0; i < limit; ++i) {
        if (utf8_length(lines[i]) > 15 && has_subject_keyword(to_lower_copy(lines[i])) && !starts_with_digit(lines[i])) {
            return lines[i];
        }
    }

    return lines.empty() ? TITLE_UNTITLED : lines.front();
}

std::string extract_document_title(const Document_Source& source, const Outline_Config& config) {
    if (source.page_count() == 0) {
        return TITLE_UNTITLED;
    }

    Page_Geometry geometry = source.page_geometry(0);
    if (geometry.chars.empty()) {
        return TITLE_UNTITLED;
    }

    std::vector<std::string> lines;
    for (Text_Line& line : build_text_lines(geometry.chars, 1)) {
        lines.push_back(std::move(line.text));
    }
    return extract_title(lines, config);
}
