#include "candidate_scorer.hpp"
#include "heading_rules.hpp"
#include "logging.hpp"

#include <algorithm>

const double Scoring_Weights::FONT_BAND[4] = {0.4, 0.3, 0.2, 0.1};
const double Scoring_Weights::BOLD = 0.2;
const double Scoring_Weights::LEFT_ALIGNED = 0.1;
const double Scoring_Weights::UNDER_100_CHARS = 0.1;
const double Scoring_Weights::UNDER_50_CHARS = 0.1;
const double Scoring_Weights::WELL_FORMED = 0.2;
const double Scoring_Weights::INCOMPLETE = -0.3;

namespace {

Heading_Level font_band(double size, const Font_Thresholds& thresholds) {
    if (size >= thresholds.h1) return Heading_Level::H1;
    if (size >= thresholds.h2) return Heading_Level::H2;
    if (size >= thresholds.h3) return Heading_Level::H3;
    return Heading_Level::H4;
}

}

std::optional<Heading_Candidate> score_line(const Text_Line& line, const Font_Thresholds& thresholds, const Outline_Config& config) {
    Heading_Text text(line.text);

    if (text.length < config.min_line_length || text.length > config.max_line_length) {
        return std::nullopt;
    }

    Rule_Outcome rejection = check_definitely_not_heading(text);
    if (rejection) {
        LOG_CHANNEL_TRACE("outline") << "page " << line.page << " drop \"" << line.text << "\": " << rejection.rule;
        return std::nullopt;
    }

    Heading_Level level = font_band(line.avg_font_size, thresholds);
    double confidence = Scoring_Weights::FONT_BAND[level_depth(level)];

    Pattern_Match pattern = analyze_heading_pattern(text);
    confidence += pattern.boost;
    if (pattern.level && pattern.boost > config.pattern_significance) {
        level = *pattern.level;
    }

    if (line.is_bold) {
        confidence += Scoring_Weights::BOLD;
    }

    if (line.left_margin < config.left_margin_threshold) {
        confidence += Scoring_Weights::LEFT_ALIGNED;
    }

    if (text.length < 100) {
        confidence += Scoring_Weights::UNDER_100_CHARS;
    }
    if (text.length < 50) {
        confidence += Scoring_Weights::UNDER_50_CHARS;
    }

    if (check_well_formed_heading(text)) {
        confidence += Scoring_Weights::WELL_FORMED;
    }

    if (check_incomplete_heading(text)) {
        confidence += Scoring_Weights::INCOMPLETE;
    }

    confidence = std::clamp(confidence, 0.0, 1.0);
    if (confidence <= config.page_accept_threshold) {
        LOG_CHANNEL_TRACE("outline") << "page " << line.page << " drop \"" << line.text << "\": confidence " << confidence;
        return std::nullopt;
    }

    Heading_Candidate candidate;
    candidate.text = line.text;
    candidate.level = level;
    candidate.page = line.page;
    candidate.confidence = confidence;
    candidate.font_size = line.avg_font_size;
    candidate.position = line.y_position;
    return candidate;
}

std::vector<Heading_Candidate> extract_page_candidates(const std::vector<Text_Line>& lines, const Outline_Config& config) {
    std::vector<Heading_Candidate> candidates;

    std::optional<Font_Thresholds> thresholds = calibrate_thresholds(lines, config);
    if (!thresholds) {
        return candidates;
    }

    for (const Text_Line& line : lines) {
        std::optional<Heading_Candidate> candidate = score_line(line, *thresholds, config);
        if (candidate) {
            candidates.push_back(std::move(*candidate));
        }
    }
    return candidates;
}
