#pragma once

#include <optional>
#include <string>
#include <vector>

#include "document_source.hpp"
#include "outline_config.hpp"
#include "outline_types.hpp"

/* One recognized word. confidence is 0..100, top and height are raster pixels. */
struct Ocr_Word {
    std::string text;
    double confidence = 0;
    int top = 0;
    int height = 0;
};

class Ocr_Engine {
  public:
    virtual ~Ocr_Engine() = default;

    // return nullopt if the engine cant run for this language
    virtual std::optional<std::vector<Ocr_Word>> recognize(const Raster_Image& image, const std::string& language) = 0;

    virtual std::optional<std::string> recognize_text(const Raster_Image& image, const std::string& language) = 0;
};

class Language_Detector {
  public:
    virtual ~Language_Detector() = default;

    // ISO 639-1 code (zh-cn for simplified Chinese), nullopt for empty or ambiguous samples
    virtual std::optional<std::string> detect(const std::string& sample) const = 0;
};

// maps a detected language to the OCR engine's traineddata name, English by default
std::string tesseract_language_code(const std::string& iso_code);

// samples the page with English OCR and guesses the language to run the full pass with
std::string choose_ocr_language(const Raster_Image& image, Ocr_Engine& engine,
                                const Language_Detector* detector, const Outline_Config& config);

/* Heading candidates of an image-only page. Every word recognized with more
 * than the configured confidence becomes an H3 candidate. Rendering, language
 * detection and OCR failures never propagate; the worst case is no candidate.
 */
std::vector<Heading_Candidate> ocr_page_candidates(const Document_Source& source, unsigned int index,
                                                   Ocr_Engine& engine, const Language_Detector* detector,
                                                   const Outline_Config& config);
