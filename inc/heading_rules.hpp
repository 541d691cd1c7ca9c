#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "outline_types.hpp"

/* A line of text with the derived forms every rule looks at, computed once. */
struct Heading_Text {
    explicit Heading_Text(const std::string& raw);

    std::string text;
    std::string lower;
    std::string lower_trimmed;
    std::vector<std::string> words;
    size_t length;  // in code points
};

using Text_Predicate = std::function<bool(const Heading_Text&)>;

/* Ordered rule tables: the first rule whose predicate matches decides the
 * verdict, and its name is kept so callers can report why a line was
 * accepted or dropped.
 */
struct Text_Rule {
    const char* name;
    Text_Predicate matches;
    bool verdict;
};

struct Rule_Outcome {
    bool verdict = false;
    const char* rule = nullptr;  // nullptr when no rule matched

    explicit operator bool() const { return verdict; }
};

Rule_Outcome evaluate_rules(const std::vector<Text_Rule>& rules, const Heading_Text& text, bool default_verdict);

struct Pattern_Rule {
    const char* name;
    Text_Predicate matches;
    double boost;
    std::optional<Heading_Level> level;
};

struct Pattern_Match {
    const char* rule = nullptr;
    double boost = 0;
    std::optional<Heading_Level> level;
};

// ===== page level rules, used by the candidate scorer =====

// dates, e-mails, urls, long sentences, numeric data, single short tokens
const std::vector<Text_Rule>& non_heading_rules();
Rule_Outcome check_non_heading(const Heading_Text& text);

// text that starts or stops in the middle of a sentence
const std::vector<Text_Rule>& content_fragment_rules();
Rule_Outcome check_content_fragment(const Heading_Text& text);

// non heading, content fragment, tiny tokens and multi sentence text
Rule_Outcome check_definitely_not_heading(const Heading_Text& text);

const std::vector<Pattern_Rule>& heading_pattern_rules();
Pattern_Match analyze_heading_pattern(const Heading_Text& text);

const std::vector<Text_Rule>& well_formed_rules();
Rule_Outcome check_well_formed_heading(const Heading_Text& text);

const std::vector<Text_Rule>& incomplete_rules();
Rule_Outcome check_incomplete_heading(const Heading_Text& text);

// ===== document level rules, used by the hierarchy builder =====

const std::vector<Text_Rule>& sentence_fragment_rules();
Rule_Outcome check_sentence_fragment(const Heading_Text& text);

const std::vector<Text_Rule>& hierarchy_break_rules();
Rule_Outcome check_breaks_hierarchy_path(const Heading_Text& text);

const std::vector<Text_Rule>& meaningful_heading_rules();
Rule_Outcome check_meaningful_heading(const Heading_Text& text);
