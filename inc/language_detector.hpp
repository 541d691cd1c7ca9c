#pragma once

#include <optional>
#include <string>

#include "ocr_fallback.hpp"

#ifndef LANGUAGE_MIN_STOPWORD_HITS
#define LANGUAGE_MIN_STOPWORD_HITS 2
#endif

/* Guesses the language of an OCR sample. Han and Kana characters decide
 * between Chinese and Japanese; Latin text is scored by how many English,
 * French and German stop words it contains. Ties and samples with too few
 * hits are reported as undetected.
 */
class Stopword_Language_Detector : public Language_Detector {
  public:
    std::optional<std::string> detect(const std::string& sample) const override;
};
