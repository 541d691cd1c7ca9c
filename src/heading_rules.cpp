#include "heading_rules.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <regex>

namespace {

bool search(const std::string& s, const std::regex& pattern) {
    return std::regex_search(s, pattern);
}

bool one_of(const std::string& s, std::initializer_list<const char*> values) {
    return std::any_of(values.begin(), values.end(), [&s](const char* v) { return s == v; });
}

// section names that are headings on their own even though they are a single word
bool is_structural_single_word(const Heading_Text& t) {
    return one_of(t.lower_trimmed, {"summary", "background", "timeline", "milestones", "preamble",
                                    "membership", "chair", "term", "meetings", "acknowledgements",
                                    "references", "content", "trademarks"});
}

bool has_document_header(const Heading_Text& t) {
    return contains_any(t.lower, {"revision history", "table of contents", "acknowledgements",
                                  "references", "trademarks", "documents and web sites"});
}

const std::regex numbered_section_title("^\\d+\\.\\s+[A-Z][a-z]");
const std::regex numbered_subsection_title("^\\d+\\.\\d+\\s+[A-Z][a-z]");
const std::regex numbered_section_any("^\\d+\\.\\s+[A-Za-z]");
const std::regex numbered_subsection_any("^\\d+\\.\\d+\\s+[A-Za-z]");
const std::regex appendix_label("^appendix [a-z]:", std::regex::icase);
const std::regex phase_label("^phase [ivx]+:", std::regex::icase);
const std::regex date_prefix("^\\w+\\s+\\d{1,2},?\\s+\\d{4}");
const std::regex numeric_data("^[\\d\\$,.\\s%\\-]+$");
const std::regex numeric_data_with_parens("^[\\d\\$,.\\s%\\-\\(\\)]+$");
const std::regex numeric_only("^[\\d\\s\\-\\.\\(\\)]+$");
const std::regex timeline_fragment("^\\w+ \\d{4}\\s*-?\\s*$");
const std::regex year_prefix("^\\d{4}[\\s\\-]");
const std::regex page_marker("^page \\d+");
const std::regex named_section("^(Summary|Background|Introduction|Overview|Conclusion)$", std::regex::icase);
const std::regex title_case_colon("^[A-Z][a-z]+(\\s+[A-Z][a-z]*)*:$", std::regex::icase);
const std::regex numbered_section_word("^\\d+\\.\\s+[A-Z][a-z]+", std::regex::icase);
const std::regex section_names(
    "^(Summary|Background|Introduction|Overview|Conclusion|Timeline|Milestones|Acknowledgements|References)$|"
    "^(Chair|Term|Meetings|Membership|Preamble|Content|Audience|Duration|Outcomes|Trademarks)$",
    std::regex::icase);

bool is_url(const Heading_Text& t) {
    return starts_with_any(t.text, {"http://", "https://", "www."});
}

}

Heading_Text::Heading_Text(const std::string& raw) :
    text(raw),
    lower(to_lower_copy(raw)),
    lower_trimmed(trim_copy(lower)),
    words(split_words(raw)),
    length(utf8_length(raw)) {

}

Rule_Outcome evaluate_rules(const std::vector<Text_Rule>& rules, const Heading_Text& text, bool default_verdict) {
    for (const Text_Rule& rule : rules) {
        if (rule.matches(text)) {
            return Rule_Outcome{rule.verdict, rule.name};
        }
    }
    return Rule_Outcome{default_verdict, nullptr};
}

const std::vector<Text_Rule>& non_heading_rules() {
    static const std::vector<Text_Rule> rules = {
        {"date", [](const Heading_Text& t) { return search(t.text, date_prefix); }, true},
        {"email", [](const Heading_Text& t) { return t.text.find('@') != std::string::npos && t.text.find('.') != std::string::npos; }, true},
        {"url", is_url, true},
        {"sentence", [](const Heading_Text& t) { return ends_with(t.text, ".") && t.length > 40 && t.text.find(' ') != std::string::npos; }, true},
        {"numeric_data", [](const Heading_Text& t) { return search(t.text, numeric_data); }, true},
        {"short_token", [](const Heading_Text& t) { return t.words.size() == 1 && t.length < 8; }, true},
    };
    return rules;
}

Rule_Outcome check_non_heading(const Heading_Text& text) {
    return evaluate_rules(non_heading_rules(), text, false);
}

const std::vector<Text_Rule>& content_fragment_rules() {
    static const std::vector<Text_Rule> rules = {
        {"leading_connective", [](const Heading_Text& t) {
            return starts_with_any(t.text, {"and ", "or ", "but ", "the ", "a ", "an ", "of ", "in ", "to ", "for "});
        }, true},
        {"trailing_connective", [](const Heading_Text& t) {
            return ends_with_any(t.text, {" and", " or", " of", " in", " to", " for", " the", " a"});
        }, true},
        {"timeline_fragment", [](const Heading_Text& t) {
            return search(t.text, timeline_fragment) || t.lower.find("timeline:") != std::string::npos;
        }, true},
        {"too_few_words", [](const Heading_Text& t) {
            return t.words.size() < 2 && !ends_with(t.text, ":") && !is_upper_text(t.text);
        }, true},
    };
    return rules;
}

Rule_Outcome check_content_fragment(const Heading_Text& text) {
    return evaluate_rules(content_fragment_rules(), text, false);
}

Rule_Outcome check_definitely_not_heading(const Heading_Text& text) {
    Rule_Outcome outcome = check_non_heading(text);
    if (outcome) {
        return outcome;
    }

    outcome = check_content_fragment(text);
    if (outcome) {
        return outcome;
    }

    if (text.words.size() == 1 && text.length < 4) {
        return Rule_Outcome{true, "tiny_token"};
    }

    if (std::count(text.text.begin(), text.text.end(), '.') > 1 && text.length > 60) {
        return Rule_Outcome{true, "multiple_sentences"};
    }

    return Rule_Outcome{false, nullptr};
}

const std::vector<Pattern_Rule>& heading_pattern_rules() {
    static const std::vector<Pattern_Rule> rules = {
        {"numbered_section", [](const Heading_Text& t) { return search(t.text, numbered_section_title); }, 0.9, Heading_Level::H1},
        {"numbered_subsection", [](const Heading_Text& t) { return search(t.text, numbered_subsection_title); }, 0.8, Heading_Level::H2},
        {"appendix", [](const Heading_Text& t) { return search(t.text, appendix_label); }, 0.8, Heading_Level::H2},
        {"phase", [](const Heading_Text& t) { return search(t.text, phase_label); }, 0.7, Heading_Level::H3},
        {"document_structure", [](const Heading_Text& t) {
            return contains_any(t.lower, {"revision history", "table of contents", "acknowledgements", "references",
                                          "introduction to the foundation", "overview of the foundation"});
        }, 0.9, Heading_Level::H1},
        {"major_section", [](const Heading_Text& t) {
            return one_of(t.lower_trimmed, {"summary", "background", "introduction", "overview", "methodology",
                                            "conclusion", "timeline", "milestones"});
        }, 0.8, Heading_Level::H2},
        {"audience_section", [](const Heading_Text& t) {
            return contains_any(t.lower, {"intended audience", "career paths", "learning objectives", "entry requirements",
                                          "structure and course", "keeping it current", "business outcomes", "content",
                                          "trademarks", "documents and web"});
        }, 0.8, Heading_Level::H2},
        {"scoped_subsection", [](const Heading_Text& t) {
            return starts_with_any(t.text, {"What could", "For each", "For the"});
        }, 0.6, Heading_Level::H3},
        {"plan_section", [](const Heading_Text& t) {
            return contains_any(t.lower, {"business plan", "approach and specific", "evaluation and awarding",
                                          "milestones", "requirements", "terms of reference"});
        }, 0.7, Heading_Level::H2},
        {"structural_single_word", is_structural_single_word, 0.8, Heading_Level::H1},
        {"principle_colon", [](const Heading_Text& t) {
            return ends_with(t.text, ":") && t.length > 3 && t.length < 80 &&
                   contains_any(t.lower, {"funding", "governance", "decision-making", "access", "support", "training"});
        }, 0.6, Heading_Level::H3},
        {"colon_terminated", [](const Heading_Text& t) {
            return ends_with(t.text, ":") && t.length > 3 && t.length < 80;
        }, 0.5, Heading_Level::H3},
        {"all_caps", [](const Heading_Text& t) { return is_upper_text(t.text) && t.length > 3 && t.length < 60; }, 0.6, Heading_Level::H2},
        {"question", [](const Heading_Text& t) {
            return starts_with_any(t.text, {"What ", "How ", "Why "}) && ends_with(t.text, "?");
        }, 0.3, std::nullopt},
    };
    return rules;
}

Pattern_Match analyze_heading_pattern(const Heading_Text& text) {
    for (const Pattern_Rule& rule : heading_pattern_rules()) {
        if (rule.matches(text)) {
            return Pattern_Match{rule.name, rule.boost, rule.level};
        }
    }
    return Pattern_Match{};
}

const std::vector<Text_Rule>& well_formed_rules() {
    static const std::vector<Text_Rule> rules = {
        {"complete_question", [](const Heading_Text& t) {
            return starts_with_any(t.text, {"What ", "How ", "Why "}) && ends_with(t.text, "?");
        }, true},
        {"named_section", [](const Heading_Text& t) { return search(t.text, named_section); }, true},
        {"appendix_label", [](const Heading_Text& t) { return search(t.text, appendix_label); }, true},
        {"phase_label", [](const Heading_Text& t) { return search(t.text, phase_label); }, true},
        {"title_case_colon", [](const Heading_Text& t) { return search(t.text, title_case_colon); }, true},
        {"numbered_section", [](const Heading_Text& t) { return search(t.text, numbered_section_word); }, true},
        {"scoped_colon", [](const Heading_Text& t) {
            return starts_with_any(t.text, {"For each ", "For the "}) && ends_with(t.text, ":");
        }, true},
    };
    return rules;
}

Rule_Outcome check_well_formed_heading(const Heading_Text& text) {
    return evaluate_rules(well_formed_rules(), text, false);
}

const std::vector<Text_Rule>& incomplete_rules() {
    static const std::vector<Text_Rule> rules = {
        {"trailing_connective", [](const Heading_Text& t) {
            return ends_with_any(t.text, {" to", " and", " or", " of", " in", " for", " the", " a", " an"});
        }, true},
        {"leading_connective", [](const Heading_Text& t) {
            return starts_with_any(t.text, {"to ", "and ", "or ", "of ", "in ", "for "});
        }, true},
        {"ellipsis", [](const Heading_Text& t) { return t.text.find("...") != std::string::npos; }, true},
        {"too_many_words", [](const Heading_Text& t) { return std::count(t.text.begin(), t.text.end(), ' ') > 12; }, true},
    };
    return rules;
}

Rule_Outcome check_incomplete_heading(const Heading_Text& text) {
    return evaluate_rules(incomplete_rules(), text, false);
}

const std::vector<Text_Rule>& sentence_fragment_rules() {
    static const std::vector<Text_Rule> rules = {
        {"structural_single_word", is_structural_single_word, false},
        {"document_header", has_document_header, false},
        {"numbered_section", [](const Heading_Text& t) {
            return search(t.text, numbered_section_any) || search(t.text, numbered_subsection_any);
        }, false},
        {"lowercase_start", [](const Heading_Text& t) {
            return starts_lowercase(t.text) &&
                   !contains_any(t.lower, {"intended audience", "career paths", "learning objectives"});
        }, true},
        {"connective_phrase", [](const Heading_Text& t) {
            return contains_any(t.lower, {" is to ", " are to ", " will be ", " has been ", " have been ",
                                          " can be ", " should be ", " must be ", " to be ", " that ",
                                          " which ", " where ", " when ", " while ", " during "});
        }, true},
        {"trailing_incomplete", [](const Heading_Text& t) {
            return ends_with_any(t.text, {" to", " and", " or", " of", " in", " for", " the", " a", " an", " that", " which"});
        }, true},
        {"too_few_words", [](const Heading_Text& t) {
            return t.words.size() < 2 && !ends_with(t.text, ":") && !is_upper_text(t.text);
        }, true},
    };
    return rules;
}

Rule_Outcome check_sentence_fragment(const Heading_Text& text) {
    return evaluate_rules(sentence_fragment_rules(), text, false);
}

const std::vector<Text_Rule>& hierarchy_break_rules() {
    static const std::vector<Text_Rule> rules = {
        {"timeline_entry", [](const Heading_Text& t) {
            return search(t.text, year_prefix) || t.lower.find("timeline:") != std::string::npos;
        }, true},
        {"numeric_data", [](const Heading_Text& t) { return search(t.text, numeric_data_with_parens); }, true},
        {"page_marker", [](const Heading_Text& t) {
            return t.length < 10 && (is_digits(t.text) || search(t.lower, page_marker));
        }, true},
    };
    return rules;
}

Rule_Outcome check_breaks_hierarchy_path(const Heading_Text& text) {
    return evaluate_rules(hierarchy_break_rules(), text, false);
}

const std::vector<Text_Rule>& meaningful_heading_rules() {
    static const std::vector<Text_Rule> rules = {
        {"too_short", [](const Heading_Text& t) { return utf8_length(trim_copy(t.text)) < 2; }, false},
        {"numeric_only", [](const Heading_Text& t) { return search(t.text, numeric_only); }, false},
        {"email_or_url", [](const Heading_Text& t) { return t.text.find('@') != std::string::npos || is_url(t); }, false},
        {"document_header", has_document_header, true},
        {"colon_terminated", [](const Heading_Text& t) { return ends_with(t.text, ":"); }, true},
        {"question", [](const Heading_Text& t) {
            return starts_with_any(t.text, {"What ", "How ", "Why ", "When ", "Where "}) && ends_with(t.text, "?");
        }, true},
        {"numbered_section", [](const Heading_Text& t) { return search(t.text, numbered_section_any); }, true},
        {"numbered_subsection", [](const Heading_Text& t) { return search(t.text, numbered_subsection_any); }, true},
        {"appendix_label", [](const Heading_Text& t) { return search(t.text, appendix_label); }, true},
        {"phase_label", [](const Heading_Text& t) { return search(t.text, phase_label); }, true},
        {"section_name", [](const Heading_Text& t) { return search(t.text, section_names); }, true},
        {"scoped_subsection", [](const Heading_Text& t) { return starts_with_any(t.text, {"For each ", "For the "}); }, true},
        {"business_term", [](const Heading_Text& t) {
            return t.length < 120 &&
                   contains_any(t.lower, {"business plan", "requirements", "evaluation", "approach",
                                          "implementation", "methodology", "milestones", "funding",
                                          "terms of reference", "accountability", "communication",
                                          "intended audience", "career paths", "learning objectives",
                                          "entry requirements", "structure and course", "keeping it current",
                                          "business outcomes", "documents and web sites"});
        }, true},
        {"structural_single_word", is_structural_single_word, true},
        {"leading_article", [](const Heading_Text& t) {
            return starts_with_any(t.lower, {"the ", "a ", "an ", "and ", "or ", "but ", "to ", "of ", "in ", "for "});
        }, false},
        {"title_case", [](const Heading_Text& t) { return is_title_text(t.text) && t.length >= 2 && t.length <= 80; }, true},
        {"all_caps", [](const Heading_Text& t) { return is_upper_text(t.text) && t.length >= 2 && t.length <= 60; }, true},
    };
    return rules;
}

Rule_Outcome check_meaningful_heading(const Heading_Text& text) {
    return evaluate_rules(meaningful_heading_rules(), text, false);
}
