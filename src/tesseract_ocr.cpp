#include "tesseract_ocr.hpp"
#include "logging.hpp"

#include <memory>
#include <utility>

#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>

namespace {

// the API is released by its destructor, End() is called on every exit path
struct Tesseract_Session {
    tesseract::TessBaseAPI api;

    ~Tesseract_Session() {
        api.End();
    }
};

bool start_session(Tesseract_Session& session, const std::string& data_path,
                   const Raster_Image& image, const std::string& language) {
    if (session.api.Init(data_path.empty() ? nullptr : data_path.c_str(), language.c_str()) != 0) {
        LOG_CHANNEL_WARNING("ocr") << "tesseract init failed for language " << language;
        return false;
    }

    session.api.SetImage(image.pixels.data(), image.width, image.height, 1, image.stride);
    session.api.SetSourceResolution(static_cast<int>(image.scale * 72.0 + 0.5));
    return true;
}

}

Tesseract_Ocr_Engine::Tesseract_Ocr_Engine(std::string data_path) :
    data_path_(std::move(data_path)) {

}

std::optional<std::vector<Ocr_Word>> Tesseract_Ocr_Engine::recognize(const Raster_Image& image, const std::string& language) {
    Tesseract_Session session;
    if (!start_session(session, data_path_, image, language)) {
        return std::nullopt;
    }

    if (session.api.Recognize(nullptr) != 0) {
        LOG_CHANNEL_WARNING("ocr") << "tesseract recognition failed";
        return std::nullopt;
    }

    std::vector<Ocr_Word> words;
    std::unique_ptr<tesseract::ResultIterator> it(session.api.GetIterator());
    if (!it) {
        return words;
    }

    const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
    do {
        std::unique_ptr<char[]> text(it->GetUTF8Text(level));
        if (!text) {
            continue;
        }

        int left = 0, top = 0, right = 0, bottom = 0;
        it->BoundingBox(level, &left, &top, &right, &bottom);

        Ocr_Word word;
        word.text = text.get();
        word.confidence = it->Confidence(level);
        word.top = top;
        word.height = bottom - top;
        words.push_back(std::move(word));
    } while (it->Next(level));

    return words;
}

std::optional<std::string> Tesseract_Ocr_Engine::recognize_text(const Raster_Image& image, const std::string& language) {
    Tesseract_Session session;
    if (!start_session(session, data_path_, image, language)) {
        return std::nullopt;
    }

    std::unique_ptr<char[]> text(session.api.GetUTF8Text());
    if (!text) {
        return std::nullopt;
    }
    return std::string(text.get());
}
