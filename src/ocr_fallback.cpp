#include "ocr_fallback.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <map>

std::string tesseract_language_code(const std::string& iso_code) {
    static const std::map<std::string, std::string> language_map = {
        {"ja", "jpn"},
        {"zh", "chi_sim"},
        {"zh-cn", "chi_sim"},
        {"fr", "fra"},
        {"de", "deu"},
        {"en", "eng"}
    };

    auto it = language_map.find(to_lower_copy(iso_code));
    return it == language_map.end() ? "eng" : it->second;
}

std::string choose_ocr_language(const Raster_Image& image, Ocr_Engine& engine,
                                const Language_Detector* detector, const Outline_Config& config) {
    if (!detector) {
        return "eng";
    }

    std::optional<std::string> sample = engine.recognize_text(image, "eng");
    if (!sample || trim_copy(*sample).empty()) {
        return "eng";
    }

    std::optional<std::string> language = detector->detect(utf8_prefix(*sample, config.language_sample_length));
    if (!language) {
        LOG_CHANNEL_DEBUG("ocr") << "language not detected, using eng";
        return "eng";
    }
    return tesseract_language_code(*language);
}

std::vector<Heading_Candidate> ocr_page_candidates(const Document_Source& source, unsigned int index,
                                                   Ocr_Engine& engine, const Language_Detector* detector,
                                                   const Outline_Config& config) {
    std::vector<Heading_Candidate> candidates;

    std::optional<Raster_Image> image = source.render_page(index, config.ocr_resolution);
    if (!image || image->width <= 0 || image->height <= 0) {
        return candidates;
    }

    std::string language = choose_ocr_language(*image, engine, detector, config);

    std::optional<std::vector<Ocr_Word>> words = engine.recognize(*image, language);
    if (!words && language != "eng") {
        LOG_CHANNEL_WARNING("ocr") << "page " << index + 1 << ": OCR with " << language << " failed, retrying with eng";
        words = engine.recognize(*image, "eng");
    }
    if (!words) {
        LOG_CHANNEL_WARNING("ocr") << "page " << index + 1 << ": OCR failed";
        return candidates;
    }

    const double scale = image->scale > 0 ? image->scale : 1.0;
    for (const Ocr_Word& word : *words) {
        std::string text = trim_copy(word.text);
        if (word.confidence <= config.ocr_min_confidence || text.empty()) {
            continue;
        }

        Heading_Candidate candidate;
        candidate.text = std::move(text);
        candidate.level = Heading_Level::H3;
        candidate.page = index + 1;
        candidate.confidence = std::min(config.ocr_max_confidence, word.confidence / 100.0);
        candidate.font_size = word.height / scale;
        candidate.position = word.top / scale;
        candidates.push_back(std::move(candidate));
    }

    LOG_CHANNEL_DEBUG("ocr") << "page " << index + 1 << " (" << language << "): "
                             << words->size() << " words, " << candidates.size() << " candidates";
    return candidates;
}
