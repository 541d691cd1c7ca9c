#include "threshold_calibrator.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <functional>
#include <map>

namespace {

struct Size_Usage {
    unsigned int count = 0;
    size_t total_chars = 0;
    unsigned int heading_indicators = 0;
};

const double DEFAULT_FONT_SIZE = 12;

}

std::vector<double> heading_candidate_sizes(const std::vector<Text_Line>& lines, const Outline_Config& config) {
    std::map<double, Size_Usage, std::greater<double>> usage;
    for (const Text_Line& line : lines) {
        if (line.avg_font_size <= 0) {
            continue;
        }

        Size_Usage& size_usage = usage[line.avg_font_size];
        size_usage.count++;
        size_usage.total_chars += utf8_length(line.text);
        if (contains_any(to_lower_copy(line.text), {"summary", "background", "appendix", "phase", "section"})) {
            size_usage.heading_indicators++;
        }
    }

    std::vector<double> sizes;
    for (const auto& entry : usage) {
        const Size_Usage& size_usage = entry.second;
        double avg_length = static_cast<double>(size_usage.total_chars) / std::max(size_usage.count, 1u);
        if (avg_length < config.heading_avg_length || size_usage.heading_indicators > 0) {
            sizes.push_back(entry.first);
        }
    }
    return sizes;
}

std::optional<Font_Thresholds> calibrate_thresholds(const std::vector<Text_Line>& lines, const Outline_Config& config) {
    std::vector<double> unique_sizes;
    for (const Text_Line& line : lines) {
        if (line.avg_font_size > 0) {
            unique_sizes.push_back(line.avg_font_size);
        }
    }
    if (unique_sizes.empty()) {
        return std::nullopt;
    }
    std::sort(unique_sizes.begin(), unique_sizes.end(), std::greater<double>());
    unique_sizes.erase(std::unique(unique_sizes.begin(), unique_sizes.end()), unique_sizes.end());

    std::vector<double> heading_sizes = heading_candidate_sizes(lines, config);

    Font_Thresholds thresholds;
    if (heading_sizes.size() >= 3) {
        thresholds.h1 = heading_sizes[0];
        thresholds.h2 = heading_sizes[1];
        thresholds.h3 = heading_sizes[2];
    } else if (heading_sizes.size() == 2) {
        thresholds.h1 = heading_sizes[0];
        thresholds.h2 = heading_sizes[1];
        thresholds.h3 = heading_sizes[1];
    } else if (heading_sizes.size() == 1) {
        thresholds.h1 = heading_sizes[0];
        thresholds.h2 = heading_sizes[0];
        thresholds.h3 = heading_sizes[0];
    } else {
        // nothing looks like a heading size, fall back to the largest sizes on the page
        thresholds.h1 = unique_sizes[0];
        thresholds.h2 = unique_sizes.size() > 1 ? unique_sizes[1] : DEFAULT_FONT_SIZE;
        thresholds.h3 = unique_sizes.size() > 2 ? unique_sizes[2] : DEFAULT_FONT_SIZE;
    }
    return thresholds;
}
