#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "outline_types.hpp"

struct Collection_Request {
    std::string persona;
    std::string job_to_be_done;
    std::vector<std::string> documents;
};

struct Extracted_Section {
    std::string document;
    std::string section_title;
    unsigned int importance_rank = 0;  // 1-based
    unsigned int page_number = 0;
    std::string refined_text;
};

struct Collection_Result {
    Collection_Request request;
    std::string processing_timestamp;
    std::vector<Extracted_Section> sections;
};

// {"level", "text", "page"}, position is internal and never serialized
nlohmann::json outline_item_to_json(const Outline_Item& item);

nlohmann::json outline_to_json(const Document_Outline& outline);

std::string format_document_outline(const Document_Outline& outline, int indent = 4);

nlohmann::json collection_to_json(const Collection_Result& result);

std::string format_collection_result(const Collection_Result& result, int indent = 2);

// persona as string or {"role"}, job as string or {"task"}, documents as strings or {"filename"}
std::optional<Collection_Request> parse_collection_request(const nlohmann::json& j);

// return nullopt if the file cant be read or has no document list
std::optional<Collection_Request> load_collection_request(const std::string& file_path);

// current UTC time, ISO 8601 with microseconds and offset
std::string utc_timestamp();
