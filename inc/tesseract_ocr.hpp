#pragma once

#include <string>

#include "ocr_fallback.hpp"

/* Ocr_Engine running Tesseract on the rendered page. A fresh TessBaseAPI is
 * initialized per call, the engine keeps no state between pages.
 */
class Tesseract_Ocr_Engine : public Ocr_Engine {
  public:
    // empty data_path lets tesseract use TESSDATA_PREFIX or its built in location
    explicit Tesseract_Ocr_Engine(std::string data_path = std::string());

    std::optional<std::vector<Ocr_Word>> recognize(const Raster_Image& image, const std::string& language) override;

    std::optional<std::string> recognize_text(const Raster_Image& image, const std::string& language) override;

  private:
    std::string data_path_;
};
