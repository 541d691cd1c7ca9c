#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#ifndef OUTLINE_PAGE_ACCEPT_THRESHOLD
#define OUTLINE_PAGE_ACCEPT_THRESHOLD 0.55
#endif

#ifndef OUTLINE_PATH_ACCEPT_THRESHOLD
#define OUTLINE_PATH_ACCEPT_THRESHOLD 0.6
#endif

#ifndef OUTLINE_PATTERN_SIGNIFICANCE
#define OUTLINE_PATTERN_SIGNIFICANCE 0.3
#endif

#ifndef OUTLINE_DUPLICATE_OVERLAP_RATIO
#define OUTLINE_DUPLICATE_OVERLAP_RATIO 0.8
#endif

#ifndef OUTLINE_RECENT_HEADING_WINDOW
#define OUTLINE_RECENT_HEADING_WINDOW 3
#endif

#ifndef OUTLINE_MAX_ITEMS
#define OUTLINE_MAX_ITEMS 40
#endif

#ifndef OUTLINE_PATH_TEXT_LIMIT
#define OUTLINE_PATH_TEXT_LIMIT 50
#endif

#ifndef OUTLINE_LEFT_MARGIN_THRESHOLD
#define OUTLINE_LEFT_MARGIN_THRESHOLD 80.0
#endif

#ifndef OUTLINE_HEADING_AVG_LENGTH
#define OUTLINE_HEADING_AVG_LENGTH 60.0
#endif

#ifndef OUTLINE_MIN_LINE_LENGTH
#define OUTLINE_MIN_LINE_LENGTH 3
#endif

#ifndef OUTLINE_MAX_LINE_LENGTH
#define OUTLINE_MAX_LINE_LENGTH 200
#endif

#ifndef OUTLINE_OCR_MIN_CONFIDENCE
#define OUTLINE_OCR_MIN_CONFIDENCE 30.0
#endif

#ifndef OUTLINE_OCR_MAX_CONFIDENCE
#define OUTLINE_OCR_MAX_CONFIDENCE 0.8
#endif

#ifndef OUTLINE_OCR_RESOLUTION
#define OUTLINE_OCR_RESOLUTION 150
#endif

#ifndef OUTLINE_LANGUAGE_SAMPLE_LENGTH
#define OUTLINE_LANGUAGE_SAMPLE_LENGTH 200
#endif

#ifndef OUTLINE_TITLE_MAX_LENGTH
#define OUTLINE_TITLE_MAX_LENGTH 150
#endif

#ifndef OUTLINE_TOP_SECTIONS
#define OUTLINE_TOP_SECTIONS 10
#endif

#ifndef OUTLINE_EMBEDDING_MAX_LENGTH
#define OUTLINE_EMBEDDING_MAX_LENGTH 256
#endif

/* Tuned constants of the heading classifier. The values are empirical;
 * changing one is a tuning decision, so every field may be overridden from
 * a JSON file with the same key names.
 */
struct Outline_Config {
    double page_accept_threshold = OUTLINE_PAGE_ACCEPT_THRESHOLD;
    double path_accept_threshold = OUTLINE_PATH_ACCEPT_THRESHOLD;
    double pattern_significance = OUTLINE_PATTERN_SIGNIFICANCE;
    double duplicate_overlap_ratio = OUTLINE_DUPLICATE_OVERLAP_RATIO;
    unsigned int recent_heading_window = OUTLINE_RECENT_HEADING_WINDOW;
    unsigned int max_outline_items = OUTLINE_MAX_ITEMS;
    unsigned int path_text_limit = OUTLINE_PATH_TEXT_LIMIT;
    double left_margin_threshold = OUTLINE_LEFT_MARGIN_THRESHOLD;
    double heading_avg_length = OUTLINE_HEADING_AVG_LENGTH;
    unsigned int min_line_length = OUTLINE_MIN_LINE_LENGTH;
    unsigned int max_line_length = OUTLINE_MAX_LINE_LENGTH;
    double ocr_min_confidence = OUTLINE_OCR_MIN_CONFIDENCE;
    double ocr_max_confidence = OUTLINE_OCR_MAX_CONFIDENCE;
    unsigned int ocr_resolution = OUTLINE_OCR_RESOLUTION;
    unsigned int language_sample_length = OUTLINE_LANGUAGE_SAMPLE_LENGTH;
    unsigned int title_max_length = OUTLINE_TITLE_MAX_LENGTH;
    unsigned int top_sections = OUTLINE_TOP_SECTIONS;
    unsigned int embedding_max_length = OUTLINE_EMBEDDING_MAX_LENGTH;
};

void to_json(nlohmann::json& j, const Outline_Config& config);

// throws nlohmann::json::exception when a present key has the wrong type,
// std::out_of_range when a count or length is negative
void from_json(const nlohmann::json& j, Outline_Config& config);

// return nullopt if the file cant be read or is not a valid config object
std::optional<Outline_Config> load_outline_config(const std::string& file_path);
