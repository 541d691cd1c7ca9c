#include "outline_extractor.hpp"
#include "candidate_scorer.hpp"
#include "line_builder.hpp"
#include "logging.hpp"
#include "pdf_utils.hpp"
#include "title_extractor.hpp"

#include <iterator>
#include <memory>

Document_Outline extract_outline(const Document_Source& source,
                                 Ocr_Engine* ocr_engine,
                                 const Language_Detector* language_detector,
                                 const Outline_Config& config,
                                 std::vector<Hierarchy_Decision>* trace) {
    Document_Outline result;
    result.title = TITLE_UNTITLED;

    std::vector<Heading_Candidate> candidates;
    const unsigned int page_count = source.page_count();
    for (unsigned int index = 0; index < page_count; ++index) {
        Page_Geometry geometry = source.page_geometry(index);

        std::vector<Heading_Candidate> page_candidates;
        if (geometry.chars.empty()) {
            if (!ocr_engine) {
                LOG_CHANNEL_DEBUG("outline") << "page " << index + 1 << " has no text and OCR is disabled";
                continue;
            }
            page_candidates = ocr_page_candidates(source, index, *ocr_engine, language_detector, config);
        } else {
            page_candidates = extract_page_candidates(build_text_lines(geometry.chars, index + 1), config);
        }

        LOG_CHANNEL_TRACE("outline") << "page " << index + 1 << ": " << page_candidates.size() << " candidates";
        candidates.insert(candidates.end(),
                          std::make_move_iterator(page_candidates.begin()),
                          std::make_move_iterator(page_candidates.end()));
    }

    result.outline = build_document_hierarchy(std::move(candidates), config, trace);
    result.title = extract_document_title(source, config);
    return result;
}

std::optional<Document_Outline> extract_outline(const std::string& file_path,
                                                Ocr_Engine* ocr_engine,
                                                const Language_Detector* language_detector,
                                                const Outline_Config& config,
                                                std::vector<Hierarchy_Decision>* trace) {
    std::unique_ptr<Mupdf_Document> document = open_pdf_document(file_path);
    if (!document) {
        return std::nullopt;
    }

    Document_Outline outline = extract_outline(*document, ocr_engine, language_detector, config, trace);
    LOG_CHANNEL_INFO("outline") << file_path << ": " << document->page_count() << " pages, "
                                << outline.outline.size() << " headings";
    return outline;
}
