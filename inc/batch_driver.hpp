#pragma once

#include <string>
#include <utility>
#include <vector>

#include <boost/filesystem.hpp>

#include "document_source.hpp"
#include "json_format.hpp"
#include "ocr_fallback.hpp"
#include "outline_config.hpp"
#include "semantic_ranker.hpp"

#ifndef BATCH_COLLECTION_INPUT
#define BATCH_COLLECTION_INPUT "challenge1b_input.json"
#endif

#ifndef BATCH_COLLECTION_OUTPUT
#define BATCH_COLLECTION_OUTPUT "challenge1b_output.json"
#endif

#ifndef BATCH_DEFAULT_MODEL
#define BATCH_DEFAULT_MODEL "models/all-MiniLM-L6-v2/model.onnx"
#endif

#ifndef BATCH_DEFAULT_VOCAB
#define BATCH_DEFAULT_VOCAB "models/all-MiniLM-L6-v2/vocab.txt"
#endif

struct Batch_Options {
    Outline_Config config;
    unsigned int jobs = 1;
    bool enable_ocr = true;
    std::string tessdata_path;

    std::string collection_input = BATCH_COLLECTION_INPUT;
    std::string collection_output = BATCH_COLLECTION_OUTPUT;
    std::string model_path = BATCH_DEFAULT_MODEL;
    std::string vocab_path = BATCH_DEFAULT_VOCAB;
};

// writes next to the target then renames, so readers never see a partial file
bool write_file_atomically(const boost::filesystem::path& path, const std::string& content);

// *.pdf (any case) directly inside the directory, sorted by name
std::vector<boost::filesystem::path> list_pdf_files(const boost::filesystem::path& directory);

// outline of one PDF written as <output_dir>/<stem>.json; false if the document cant be read
bool process_outline_document(const boost::filesystem::path& pdf_path,
                              const boost::filesystem::path& output_dir,
                              const Batch_Options& options);

// exit status of the outline mode
int run_outline_batch(const boost::filesystem::path& input_dir,
                      const boost::filesystem::path& output_dir,
                      const Batch_Options& options);

// the single H1 standing in for a document without detected headings
Outline_Item overview_heading(const std::string& document_name);

using Named_Document = std::pair<std::string, const Document_Source*>;

/* Ranks the headings of every document against the request's persona and
 * task and extracts the text of the top sections.
 */
std::vector<Extracted_Section> rank_collection(const Collection_Request& request,
                                               const std::vector<Named_Document>& documents,
                                               const Semantic_Ranker& ranker,
                                               Ocr_Engine* ocr_engine,
                                               const Language_Detector* language_detector,
                                               const Outline_Config& config);

// exit status of the collection mode
int run_collection(const boost::filesystem::path& input_dir,
                   const boost::filesystem::path& output_dir,
                   const Batch_Options& options);
