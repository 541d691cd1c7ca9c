#include <gtest/gtest.h>

#include "fake_document.hpp"
#include "ocr_fallback.hpp"

namespace {

Ocr_Word word(const std::string& text, double confidence, int top = 300, int height = 40) {
    Ocr_Word w;
    w.text = text;
    w.confidence = confidence;
    w.top = top;
    w.height = height;
    return w;
}

Fake_Document scanned_document() {
    Fake_Document document(1);
    document.set_image(1, blank_image());
    return document;
}

}

TEST(OcrFallback, TesseractLanguageCodes) {
    EXPECT_EQ(tesseract_language_code("ja"), "jpn");
    EXPECT_EQ(tesseract_language_code("zh-cn"), "chi_sim");
    EXPECT_EQ(tesseract_language_code("ZH"), "chi_sim");
    EXPECT_EQ(tesseract_language_code("fr"), "fra");
    EXPECT_EQ(tesseract_language_code("de"), "deu");
    EXPECT_EQ(tesseract_language_code("en"), "eng");
    EXPECT_EQ(tesseract_language_code("ko"), "eng");
}

TEST(OcrFallback, ConfidentWordsBecomeH3Candidates) {
    Fake_Document document = scanned_document();
    Fake_Ocr_Engine engine({
        word("Heading", 95),
        word("noise", 20),
        word("edge", 30),
        word("   ", 90),
        word("Second", 55, 600),
    });

    Outline_Config config;
    std::vector<Heading_Candidate> candidates = ocr_page_candidates(document, 0, engine, nullptr, config);
    ASSERT_EQ(candidates.size(), 2u);

    EXPECT_EQ(candidates[0].text, "Heading");
    EXPECT_EQ(candidates[0].level, Heading_Level::H3);
    EXPECT_EQ(candidates[0].page, 1u);
    EXPECT_DOUBLE_EQ(candidates[0].confidence, 0.8);
    EXPECT_NEAR(candidates[0].position, 300 * 72.0 / config.ocr_resolution, 1e-9);

    EXPECT_EQ(candidates[1].text, "Second");
    EXPECT_DOUBLE_EQ(candidates[1].confidence, 0.55);
}

TEST(OcrFallback, NoDetectorMeansEnglish) {
    Fake_Document document = scanned_document();
    Fake_Ocr_Engine engine({word("Heading", 95)}, "Bonjour le monde");

    ocr_page_candidates(document, 0, engine, nullptr, Outline_Config());
    EXPECT_EQ(engine.sample_calls, 0u);
    ASSERT_EQ(engine.languages.size(), 1u);
    EXPECT_EQ(engine.languages[0], "eng");
}

TEST(OcrFallback, DetectedLanguageIsUsed) {
    Fake_Document document = scanned_document();
    Fake_Ocr_Engine engine({word("Titre", 95)}, "Le chat et la souris");
    Fake_Language_Detector detector(std::string("fr"));

    std::vector<Heading_Candidate> candidates = ocr_page_candidates(document, 0, engine, &detector, Outline_Config());
    EXPECT_EQ(engine.sample_calls, 1u);
    EXPECT_EQ(engine.languages, std::vector<std::string>{"fra"});
    EXPECT_EQ(candidates.size(), 1u);
}

TEST(OcrFallback, FailedLanguageRetriesEnglish) {
    Fake_Document document = scanned_document();
    Fake_Ocr_Engine engine({word("Titre", 95)}, "Le chat et la souris");
    engine.failing_languages["fra"] = true;
    Fake_Language_Detector detector(std::string("fr"));

    std::vector<Heading_Candidate> candidates = ocr_page_candidates(document, 0, engine, &detector, Outline_Config());
    EXPECT_EQ(engine.languages, (std::vector<std::string>{"fra", "eng"}));
    EXPECT_EQ(candidates.size(), 1u);
}

TEST(OcrFallback, UndetectedLanguageOrEmptySampleMeansEnglish) {
    Fake_Document document = scanned_document();
    Fake_Language_Detector undetected(std::nullopt);
    Fake_Ocr_Engine engine({}, "???");
    EXPECT_EQ(choose_ocr_language(*document.render_page(0, 150), engine, &undetected, Outline_Config()), "eng");

    Fake_Language_Detector japanese(std::string("ja"));
    Fake_Ocr_Engine silent({}, "   ");
    EXPECT_EQ(choose_ocr_language(*document.render_page(0, 150), silent, &japanese, Outline_Config()), "eng");

    Fake_Ocr_Engine sampled({}, "日本語のテキスト");
    EXPECT_EQ(choose_ocr_language(*document.render_page(0, 150), sampled, &japanese, Outline_Config()), "jpn");
}

TEST(OcrFallback, FailuresYieldNoCandidates) {
    Fake_Document unrendered(1);
    Fake_Ocr_Engine engine({word("Heading", 95)});
    EXPECT_TRUE(ocr_page_candidates(unrendered, 0, engine, nullptr, Outline_Config()).empty());
    EXPECT_TRUE(engine.languages.empty());

    Fake_Document document = scanned_document();
    Fake_Ocr_Engine failing({word("Heading", 95)});
    failing.failing_languages["eng"] = true;
    EXPECT_TRUE(ocr_page_candidates(document, 0, failing, nullptr, Outline_Config()).empty());
}
