#pragma once

#include <optional>
#include <vector>

#include "outline_config.hpp"
#include "outline_types.hpp"
#include "threshold_calibrator.hpp"

// contributions of the independent signals, summed then clamped to [0, 1]
struct Scoring_Weights {
    static const double FONT_BAND[4];      // H1 .. H4 band
    static const double BOLD;
    static const double LEFT_ALIGNED;
    static const double UNDER_100_CHARS;
    static const double UNDER_50_CHARS;
    static const double WELL_FORMED;
    static const double INCOMPLETE;
};

// return nullopt when the line is rejected or its confidence does not pass the page threshold
std::optional<Heading_Candidate> score_line(const Text_Line& line, const Font_Thresholds& thresholds, const Outline_Config& config);

std::vector<Heading_Candidate> extract_page_candidates(const std::vector<Text_Line>& lines, const Outline_Config& config);
