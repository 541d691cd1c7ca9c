#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "document_source.hpp"
#include "embedding_model.hpp"
#include "ocr_fallback.hpp"

// in-memory document: every line is laid out glyph by glyph at a fixed y
class Fake_Document : public Document_Source {
  public:
    struct Line {
        std::string text;
        double y = 0;
        double size = 11;
        double x = 72;
        std::string font = "Helvetica";
    };

    explicit Fake_Document(unsigned int pages = 1) : pages_(pages) {}

    // page is 1-based
    Fake_Document& add_line(unsigned int page, const std::string& text, double y, double size = 11,
                            const std::string& font = "Helvetica", double x = 72) {
        if (page > pages_.size()) {
            pages_.resize(page);
        }
        pages_[page - 1].push_back(Line{text, y, size, x, font});
        return *this;
    }

    Fake_Document& set_image(unsigned int page, Raster_Image image) {
        images_[page - 1] = std::move(image);
        return *this;
    }

    unsigned int page_count() const override {
        return static_cast<unsigned int>(pages_.size());
    }

    Page_Geometry page_geometry(unsigned int index) const override {
        Page_Geometry geometry;
        geometry.width = 612;
        geometry.height = 792;
        if (index >= pages_.size()) {
            return geometry;
        }

        for (const Line& line : pages_[index]) {
            double x = line.x;
            for (char c : line.text) {
                Char_Record ch;
                ch.text = std::string(1, c);
                ch.x0 = x;
                ch.y0 = line.y;
                ch.size = line.size;
                ch.font_name = line.font;
                geometry.chars.push_back(std::move(ch));
                x += line.size * 0.5;
            }
        }
        return geometry;
    }

    std::optional<Raster_Image> render_page(unsigned int index, unsigned int dpi) const override {
        auto it = images_.find(index);
        if (it == images_.end()) {
            return std::nullopt;
        }
        Raster_Image image = it->second;
        image.scale = dpi / 72.0;
        return image;
    }

  private:
    std::vector<std::vector<Line>> pages_;
    std::map<unsigned int, Raster_Image> images_;
};

inline Raster_Image blank_image(int width = 100, int height = 100) {
    Raster_Image image;
    image.width = width;
    image.height = height;
    image.stride = width;
    image.pixels.assign(static_cast<size_t>(width) * height, 255);
    return image;
}

// returns the same words for every call, optionally failing for some languages
class Fake_Ocr_Engine : public Ocr_Engine {
  public:
    explicit Fake_Ocr_Engine(std::vector<Ocr_Word> words, std::string sample = std::string()) :
        words_(std::move(words)),
        sample_(std::move(sample)) {}

    std::optional<std::vector<Ocr_Word>> recognize(const Raster_Image&, const std::string& language) override {
        languages.push_back(language);
        if (failing_languages.count(language)) {
            return std::nullopt;
        }
        return words_;
    }

    std::optional<std::string> recognize_text(const Raster_Image&, const std::string&) override {
        sample_calls++;
        return sample_;
    }

    std::vector<std::string> languages;
    std::map<std::string, bool> failing_languages;
    unsigned int sample_calls = 0;

  private:
    std::vector<Ocr_Word> words_;
    std::string sample_;
};

class Fake_Language_Detector : public Language_Detector {
  public:
    explicit Fake_Language_Detector(std::optional<std::string> language) : language_(std::move(language)) {}

    std::optional<std::string> detect(const std::string&) const override {
        return language_;
    }

  private:
    std::optional<std::string> language_;
};

// looks the vector up by exact text; unknown texts map to the zero vector
class Fake_Embedding_Model : public Embedding_Model {
  public:
    explicit Fake_Embedding_Model(std::map<std::string, Embedding> vectors) : vectors_(std::move(vectors)) {}

    std::optional<std::vector<Embedding>> embed_batch(const std::vector<std::string>& texts) const override {
        batches++;
        if (fail) {
            return std::nullopt;
        }
        std::vector<Embedding> result;
        for (const std::string& text : texts) {
            auto it = vectors_.find(text);
            result.push_back(it == vectors_.end() ? Embedding{0, 0, 0} : it->second);
        }
        return result;
    }

    bool fail = false;
    mutable unsigned int batches = 0;

  private:
    std::map<std::string, Embedding> vectors_;
};
