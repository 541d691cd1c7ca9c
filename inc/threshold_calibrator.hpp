#pragma once

#include <optional>
#include <vector>

#include "outline_config.hpp"
#include "outline_types.hpp"

/* Font size floors of the H1..H3 bands of one page; anything below h3 is H4. */
struct Font_Thresholds {
    double h1 = 12;
    double h2 = 12;
    double h3 = 12;
};

// distinct sizes (descending) whose lines are short on average or carry a structural keyword
std::vector<double> heading_candidate_sizes(const std::vector<Text_Line>& lines, const Outline_Config& config);

// return nullopt if no line of the page has a positive font size
std::optional<Font_Thresholds> calibrate_thresholds(const std::vector<Text_Line>& lines, const Outline_Config& config);
