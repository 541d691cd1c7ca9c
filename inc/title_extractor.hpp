#pragma once

#include <string>
#include <vector>

#include "document_source.hpp"
#include "outline_config.hpp"

#ifndef TITLE_UNTITLED
#define TITLE_UNTITLED "Untitled"
#endif

/* Rebuilds a possibly multi-line document title from the first page's text
 * lines (trimmed, non-empty, top to bottom).
 */
std::string extract_title(const std::vector<std::string>& lines, const Outline_Config& config);

// title of the first page, TITLE_UNTITLED when the document has no text on it
std::string extract_document_title(const Document_Source& source, const Outline_Config& config);
