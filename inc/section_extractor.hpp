#pragma once

#include <optional>
#include <string>
#include <vector>

#include "document_source.hpp"
#include "outline_types.hpp"

#ifndef SECTION_FALLBACK_PAGE_SENTENCES
#define SECTION_FALLBACK_PAGE_SENTENCES 5
#endif

#ifndef SECTION_FALLBACK_NEARBY_SENTENCES
#define SECTION_FALLBACK_NEARBY_SENTENCES 3
#endif

#ifndef SECTION_FALLBACK_NEARBY_MIN_LENGTH
#define SECTION_FALLBACK_NEARBY_MIN_LENGTH 50
#endif

#ifndef SECTION_FALLBACK_NEARBY_MAX_LENGTH
#define SECTION_FALLBACK_NEARBY_MAX_LENGTH 500
#endif

#ifndef SECTION_FALLBACK_ANY_MIN_LENGTH
#define SECTION_FALLBACK_ANY_MIN_LENGTH 20
#endif

#ifndef SECTION_FALLBACK_ANY_MAX_LENGTH
#define SECTION_FALLBACK_ANY_MAX_LENGTH 300
#endif

/* Text between a heading and the next heading of the same document,
 * whitespace normalized. all_headings must be in reading order. Falls back
 * to page level excerpts when the heading is not in the list or nothing is
 * found between the two positions. Never returns an empty string.
 */
std::string extract_section_content(const Document_Source& source,
                                    const Outline_Item& heading,
                                    const std::vector<Outline_Item>& all_headings);

// opens the PDF itself; an unreadable file gives the synthesized description
std::string extract_section_content(const std::string& file_path,
                                    const Outline_Item& heading,
                                    const std::vector<Outline_Item>& all_headings);

// excerpt of the heading's page, then of its neighbours, then of any page with text
std::optional<std::string> page_fallback_content(const Document_Source& source, const Outline_Item& heading);

// page excerpt when there is one, the synthesized description otherwise
std::string fallback_section_content(const Document_Source& source, const Outline_Item& heading);

std::string synthesized_section_content(const Outline_Item& heading);
