#include "section_extractor.hpp"
#include "logging.hpp"
#include "pdf_utils.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <exception>
#include <limits>
#include <memory>

namespace {

const char* SENTENCE_SEPARATOR = ". ";

std::string first_sentences(const std::vector<std::string>& sentences, size_t count) {
    std::vector<std::string> kept(sentences.begin(), sentences.begin() + std::min(count, sentences.size()));
    return join(kept, SENTENCE_SEPARATOR) + ".";
}

std::optional<std::string> heading_page_excerpt(const Document_Source& source, const Outline_Item& heading) {
    if (heading.page == 0 || heading.page > source.page_count()) {
        return std::nullopt;
    }

    const std::string text = page_full_text(source, heading.page - 1);
    if (trim_copy(text).empty()) {
        return std::nullopt;
    }

    std::vector<std::string> sentences = split_on(text, SENTENCE_SEPARATOR);
    if (sentences.size() > 3) {
        return first_sentences(sentences, SECTION_FALLBACK_PAGE_SENTENCES);
    }
    return trim_copy(text);
}

std::optional<std::string> nearby_page_excerpt(const Document_Source& source, const Outline_Item& heading) {
    const unsigned int first = heading.page > 2 ? heading.page - 2 : 0;
    const unsigned int last = std::min(source.page_count(), heading.page + 2);

    for (unsigned int index = first; index < last; ++index) {
        const std::string text = page_full_text(source, index);
        const std::string trimmed = trim_copy(text);
        if (utf8_length(trimmed) <= SECTION_FALLBACK_NEARBY_MIN_LENGTH) {
            continue;
        }

        std::vector<std::string> sentences = split_on(text, SENTENCE_SEPARATOR);
        if (sentences.size() > 2) {
            return first_sentences(sentences, SECTION_FALLBACK_NEARBY_SENTENCES);
        }
        return utf8_prefix(trimmed, SECTION_FALLBACK_NEARBY_MAX_LENGTH);
    }
    return std::nullopt;
}

std::optional<std::string> any_page_excerpt(const Document_Source& source) {
    const unsigned int page_count = source.page_count();
    for (unsigned int index = 0; index < page_count; ++index) {
        const std::string text = page_full_text(source, index);
        if (utf8_length(trim_copy(text)) <= SECTION_FALLBACK_ANY_MIN_LENGTH) {
            continue;
        }

        std::string clean = collapse_whitespace(text);
        if (utf8_length(clean) > 100) {
            return utf8_prefix(clean, SECTION_FALLBACK_ANY_MAX_LENGTH) + "...";
        }
        return clean;
    }
    return std::nullopt;
}

// empty when nothing lies between the two positions
std::string bounded_section_text(const Document_Source& source,
                                 const Outline_Item& heading,
                                 const Outline_Item* next_heading) {
    const unsigned int page_count = source.page_count();
    const unsigned int end_page = next_heading ? next_heading->page : page_count;
    const double infinity = std::numeric_limits<double>::infinity();

    std::vector<std::string> content;
    for (unsigned int index = heading.page > 0 ? heading.page - 1 : 0; index < std::min(end_page, page_count); ++index) {
        const double top = index == heading.page - 1 ? std::max(0.0, heading.position) : -infinity;
        const double bottom = next_heading && index == end_page - 1 ? next_heading->position : infinity;

        if (bottom <= top) {
            LOG_CHANNEL_DEBUG("section") << "empty crop on page " << index + 1 << " for '" << heading.text << "'";
            std::optional<std::string> text = page_fallback_content(source, heading);
            if (text) {
                return *text;
            }
            continue;
        }

        std::string text = trim_copy(page_region_text(source, index, top, bottom));
        if (!text.empty()) {
            content.push_back(std::move(text));
        }
    }

    return collapse_whitespace(join(content, " "));
}

}

std::optional<std::string> page_fallback_content(const Document_Source& source, const Outline_Item& heading) {
    std::optional<std::string> text = heading_page_excerpt(source, heading);
    if (!text) {
        text = nearby_page_excerpt(source, heading);
    }
    if (!text) {
        text = any_page_excerpt(source);
    }
    return text;
}

std::string synthesized_section_content(const Outline_Item& heading) {
    return "This section covers " + to_lower_copy(heading.text) +
           " and contains relevant information (from page " + std::to_string(heading.page) + ").";
}

std::string fallback_section_content(const Document_Source& source, const Outline_Item& heading) {
    std::optional<std::string> text = page_fallback_content(source, heading);
    if (text && !trim_copy(*text).empty()) {
        return *text;
    }
    return synthesized_section_content(heading);
}

std::string extract_section_content(const Document_Source& source,
                                    const Outline_Item& heading,
                                    const std::vector<Outline_Item>& all_headings) {
    auto it = std::find(all_headings.begin(), all_headings.end(), heading);
    if (it == all_headings.end()) {
        LOG_CHANNEL_DEBUG("section") << "'" << heading.text << "' is not in the outline, using fallback";
        return fallback_section_content(source, heading);
    }

    const Outline_Item* next_heading = (it + 1) != all_headings.end() ? &*(it + 1) : nullptr;

    std::string text;
    try {
        text = bounded_section_text(source, heading, next_heading);
    } catch (const std::exception& e) {
        LOG_CHANNEL_WARNING("section") << "extraction of '" << heading.text << "' failed: " << e.what();
    }

    if (trim_copy(text).empty()) {
        return fallback_section_content(source, heading);
    }
    return text;
}

std::string extract_section_content(const std::string& file_path,
                                    const Outline_Item& heading,
                                    const std::vector<Outline_Item>& all_headings) {
    std::unique_ptr<Mupdf_Document> document = open_pdf_document(file_path);
    if (!document) {
        LOG_CHANNEL_WARNING("section") << file_path << ": cannot open document";
        return synthesized_section_content(heading);
    }
    return extract_section_content(*document, heading, all_headings);
}
