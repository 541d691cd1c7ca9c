#pragma once

#include <optional>
#include <string>
#include <vector>

#include "document_source.hpp"
#include "hierarchy_builder.hpp"
#include "ocr_fallback.hpp"
#include "outline_config.hpp"
#include "outline_types.hpp"

/* Title and heading outline of an opened document. Pages without character
 * geometry go through the OCR engine when one is given and are skipped
 * otherwise. Never throws on malformed geometry; the worst case is
 * {"Untitled", []}.
 */
Document_Outline extract_outline(const Document_Source& source,
                                 Ocr_Engine* ocr_engine,
                                 const Language_Detector* language_detector,
                                 const Outline_Config& config,
                                 std::vector<Hierarchy_Decision>* trace = nullptr);

// return nullopt if the PDF file cant be opened
std::optional<Document_Outline> extract_outline(const std::string& file_path,
                                                Ocr_Engine* ocr_engine,
                                                const Language_Detector* language_detector,
                                                const Outline_Config& config,
                                                std::vector<Hierarchy_Decision>* trace = nullptr);
