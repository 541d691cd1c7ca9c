#include "outline_config.hpp"
#include "logging.hpp"

#include <fstream>
#include <stdexcept>
#include <type_traits>

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& field) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if constexpr (std::is_unsigned<T>::value) {
        // get<unsigned>() wraps negative numbers around
        const bool negative = (it->is_number_integer() && !it->is_number_unsigned() && it->template get<long long>() < 0) ||
                              (it->is_number_float() && it->template get<double>() < 0);
        if (negative) {
            throw std::out_of_range(std::string(key) + " must not be negative");
        }
    }
    field = it->template get<T>();
}

}

void to_json(nlohmann::json& j, const Outline_Config& config) {
    j = nlohmann::json{
        {"page_accept_threshold", config.page_accept_threshold},
        {"path_accept_threshold", config.path_accept_threshold},
        {"pattern_significance", config.pattern_significance},
        {"duplicate_overlap_ratio", config.duplicate_overlap_ratio},
        {"recent_heading_window", config.recent_heading_window},
        {"max_outline_items", config.max_outline_items},
        {"path_text_limit", config.path_text_limit},
        {"left_margin_threshold", config.left_margin_threshold},
        {"heading_avg_length", config.heading_avg_length},
        {"min_line_length", config.min_line_length},
        {"max_line_length", config.max_line_length},
        {"ocr_min_confidence", config.ocr_min_confidence},
        {"ocr_max_confidence", config.ocr_max_confidence},
        {"ocr_resolution", config.ocr_resolution},
        {"language_sample_length", config.language_sample_length},
        {"title_max_length", config.title_max_length},
        {"top_sections", config.top_sections},
        {"embedding_max_length", config.embedding_max_length}
    };
}

void from_json(const nlohmann::json& j, Outline_Config& config) {
    read_field(j, "page_accept_threshold", config.page_accept_threshold);
    read_field(j, "path_accept_threshold", config.path_accept_threshold);
    read_field(j, "pattern_significance", config.pattern_significance);
    read_field(j, "duplicate_overlap_ratio", config.duplicate_overlap_ratio);
    read_field(j, "recent_heading_window", config.recent_heading_window);
    read_field(j, "max_outline_items", config.max_outline_items);
    read_field(j, "path_text_limit", config.path_text_limit);
    read_field(j, "left_margin_threshold", config.left_margin_threshold);
    read_field(j, "heading_avg_length", config.heading_avg_length);
    read_field(j, "min_line_length", config.min_line_length);
    read_field(j, "max_line_length", config.max_line_length);
    read_field(j, "ocr_min_confidence", config.ocr_min_confidence);
    read_field(j, "ocr_max_confidence", config.ocr_max_confidence);
    read_field(j, "ocr_resolution", config.ocr_resolution);
    read_field(j, "language_sample_length", config.language_sample_length);
    read_field(j, "title_max_length", config.title_max_length);
    read_field(j, "top_sections", config.top_sections);
    read_field(j, "embedding_max_length", config.embedding_max_length);
}

std::optional<Outline_Config> load_outline_config(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in.is_open()) {
        LOG_CHANNEL_ERROR("config") << "cannot open config file " << file_path;
        return std::nullopt;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(in);
        if (!j.is_object()) {
            LOG_CHANNEL_ERROR("config") << file_path << ": top level value is not an object";
            return std::nullopt;
        }
        Outline_Config config = j.get<Outline_Config>();
        LOG_CHANNEL_INFO("config") << "loaded " << file_path << ": " << nlohmann::json(config).dump();
        return config;
    } catch (const nlohmann::json::exception& e) {
        LOG_CHANNEL_ERROR("config") << file_path << ": " << e.what();
        return std::nullopt;
    } catch (const std::out_of_range& e) {
        LOG_CHANNEL_ERROR("config") << file_path << ": " << e.what();
        return std::nullopt;
    }
}
