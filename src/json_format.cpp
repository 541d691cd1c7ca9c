#include "json_format.hpp"
#include "logging.hpp"

#include <fstream>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace {

std::optional<std::string> string_or_field(const nlohmann::json& j, const char* field) {
    if (j.is_string()) {
        return j.get<std::string>();
    }
    if (j.is_object() && j.contains(field) && j.at(field).is_string()) {
        return j.at(field).get<std::string>();
    }
    return std::nullopt;
}

}

nlohmann::json outline_item_to_json(const Outline_Item& item) {
    nlohmann::json json_item;
    json_item["level"] = level_name(item.level);
    json_item["text"] = item.text;
    json_item["page"] = item.page;
    return json_item;
}

nlohmann::json outline_to_json(const Document_Outline& outline) {
    nlohmann::json json_outline;
    json_outline["title"] = outline.title;
    json_outline["outline"] = nlohmann::json::array();
    for (const Outline_Item& item : outline.outline) {
        json_outline["outline"] += outline_item_to_json(item);
    }
    return json_outline;
}

std::string format_document_outline(const Document_Outline& outline, int indent) {
    return outline_to_json(outline).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json collection_to_json(const Collection_Result& result) {
    nlohmann::json json_result;

    nlohmann::json& metadata = json_result["metadata"];
    metadata["input_documents"] = result.request.documents;
    metadata["persona"] = result.request.persona;
    metadata["job_to_be_done"] = result.request.job_to_be_done;
    metadata["processing_timestamp"] = result.processing_timestamp;

    json_result["extracted_sections"] = nlohmann::json::array();
    json_result["subsection_analysis"] = nlohmann::json::array();
    for (const Extracted_Section& section : result.sections) {
        nlohmann::json json_section;
        json_section["document"] = section.document;
        json_section["section_title"] = section.section_title;
        json_section["importance_rank"] = section.importance_rank;
        json_section["page_number"] = section.page_number;
        json_result["extracted_sections"] += json_section;

        nlohmann::json json_analysis;
        json_analysis["document"] = section.document;
        json_analysis["refined_text"] = section.refined_text;
        json_analysis["page_number"] = section.page_number;
        json_result["subsection_analysis"] += json_analysis;
    }

    return json_result;
}

std::string format_collection_result(const Collection_Result& result, int indent) {
    return collection_to_json(result).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<Collection_Request> parse_collection_request(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("documents") || !j.at("documents").is_array()) {
        LOG_CHANNEL_ERROR("config") << "collection input has no document list";
        return std::nullopt;
    }

    Collection_Request request;
    if (j.contains("persona")) {
        request.persona = string_or_field(j.at("persona"), "role").value_or("");
    }
    if (j.contains("job_to_be_done")) {
        request.job_to_be_done = string_or_field(j.at("job_to_be_done"), "task").value_or("");
    }

    for (const nlohmann::json& document : j.at("documents")) {
        std::optional<std::string> name = string_or_field(document, "filename");
        if (!name) {
            LOG_CHANNEL_WARNING("config") << "skipping document entry " << document.dump();
            continue;
        }
        request.documents.push_back(std::move(*name));
    }
    return request;
}

std::optional<Collection_Request> load_collection_request(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in) {
        LOG_CHANNEL_ERROR("config") << "cannot open " << file_path;
        return std::nullopt;
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        LOG_CHANNEL_ERROR("config") << file_path << " is not valid JSON";
        return std::nullopt;
    }
    return parse_collection_request(j);
}

std::string utc_timestamp() {
    return boost::posix_time::to_iso_extended_string(boost::posix_time::microsec_clock::universal_time()) + "+00:00";
}
